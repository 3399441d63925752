// papermake/storage/memory_storage.h
#ifndef PAPERMAKE_STORAGE_MEMORY_STORAGE_H
#define PAPERMAKE_STORAGE_MEMORY_STORAGE_H

#include "papermake/storage/storage.h"
#include <map>
#include <mutex>

namespace papermake {

class MemoryStorage : public Storage {
public:
    Template get_template(const TemplateId& id) override;
    void save_template(const Template& tpl) override;
    void delete_template(const TemplateId& id) override;
    std::vector<Template> list_templates() override;

    std::vector<std::string> list_template_files(const TemplateId& id) override;
    Bytes get_template_file(const TemplateId& id, const std::string& path) override;
    void save_template_file(const TemplateId& id, const std::string& path, const Bytes& content) override;

private:
    std::mutex mutex_;
    std::map<TemplateId, Template> templates_;
    std::map<TemplateId, std::map<std::string, Bytes>> files_;
};

} // namespace papermake

#endif // PAPERMAKE_STORAGE_MEMORY_STORAGE_H
