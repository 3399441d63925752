// papermake/storage/file_storage.h
#ifndef PAPERMAKE_STORAGE_FILE_STORAGE_H
#define PAPERMAKE_STORAGE_FILE_STORAGE_H

#include "papermake/storage/storage.h"
#include <filesystem>
#include <mutex>

namespace papermake {

// Directory-backed storage:
//   <root>/templates/<id>/template.json
//   <root>/templates/<id>/files/<path>
// Writes within one instance are serialized; separate instances or processes
// sharing a root are not coordinated.
class FileStorage : public Storage {
public:
    explicit FileStorage(std::filesystem::path root);

    Template get_template(const TemplateId& id) override;
    void save_template(const Template& tpl) override;
    void delete_template(const TemplateId& id) override;
    std::vector<Template> list_templates() override;

    std::vector<std::string> list_template_files(const TemplateId& id) override;
    Bytes get_template_file(const TemplateId& id, const std::string& path) override;
    void save_template_file(const TemplateId& id, const std::string& path, const Bytes& content) override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path template_dir(const TemplateId& id) const;
    std::filesystem::path existing_template_dir(const TemplateId& id) const;

    std::filesystem::path root_;
    std::mutex write_mutex_;
};

} // namespace papermake

#endif // PAPERMAKE_STORAGE_FILE_STORAGE_H
