// papermake/storage/storage.h
#ifndef PAPERMAKE_STORAGE_STORAGE_H
#define PAPERMAKE_STORAGE_STORAGE_H

#include "papermake/common/types.h"
#include "papermake/template/template.h"
#include <string>
#include <vector>

namespace papermake {

// Persistence port for templates and their auxiliary files (fonts, images).
// Missing items throw NotFoundError, other failures StorageError.
class Storage {
public:
    virtual ~Storage() = default;

    virtual Template get_template(const TemplateId& id) = 0;
    // Create-or-replace keyed by id
    virtual void save_template(const Template& tpl) = 0;
    virtual void delete_template(const TemplateId& id) = 0;
    // Sorted by id
    virtual std::vector<Template> list_templates() = 0;

    virtual std::vector<std::string> list_template_files(const TemplateId& id) = 0;
    virtual Bytes get_template_file(const TemplateId& id, const std::string& path) = 0;
    virtual void save_template_file(const TemplateId& id, const std::string& path, const Bytes& content) = 0;

    // Persistence semantics are not defined for removing files; the default
    // implementation only logs a warning and leaves the file in place.
    virtual void delete_template_file(const TemplateId& id, const std::string& path);
};

// Rejects empty ids and ids that are not usable as a single path component
void check_template_id(const TemplateId& id);

// Returns the path with '\' turned into '/' and leading "./" removed; throws
// StorageError for empty, absolute, or ".." paths
std::string normalize_file_path(const std::string& path);

} // namespace papermake

#endif // PAPERMAKE_STORAGE_STORAGE_H
