// src/storage/memory_storage.cpp
#include "papermake/storage/memory_storage.h"
#include "papermake/common/error.h"

namespace papermake {

Template MemoryStorage::get_template(const TemplateId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        throw NotFoundError("Template '" + id.value + "' not found");
    }
    return it->second;
}

void MemoryStorage::save_template(const Template& tpl) {
    check_template_id(tpl.id());
    std::lock_guard<std::mutex> lock(mutex_);
    templates_.insert_or_assign(tpl.id(), tpl);
}

void MemoryStorage::delete_template(const TemplateId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (templates_.erase(id) == 0) {
        throw NotFoundError("Template '" + id.value + "' not found");
    }
    files_.erase(id);
}

std::vector<Template> MemoryStorage::list_templates() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Template> result;
    result.reserve(templates_.size());
    for (const auto& [id, tpl] : templates_) {
        result.push_back(tpl);
    }
    return result;
}

std::vector<std::string> MemoryStorage::list_template_files(const TemplateId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (templates_.find(id) == templates_.end()) {
        throw NotFoundError("Template '" + id.value + "' not found");
    }
    std::vector<std::string> paths;
    auto it = files_.find(id);
    if (it != files_.end()) {
        for (const auto& [path, content] : it->second) {
            paths.push_back(path);
        }
    }
    return paths;
}

Bytes MemoryStorage::get_template_file(const TemplateId& id, const std::string& path) {
    const std::string key = normalize_file_path(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(id);
    if (it != files_.end()) {
        auto file = it->second.find(key);
        if (file != it->second.end()) return file->second;
    }
    throw NotFoundError("File '" + key + "' of template '" + id.value + "' not found");
}

void MemoryStorage::save_template_file(const TemplateId& id, const std::string& path, const Bytes& content) {
    const std::string key = normalize_file_path(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (templates_.find(id) == templates_.end()) {
        throw NotFoundError("Template '" + id.value + "' not found");
    }
    files_[id][key] = content;
}

} // namespace papermake
