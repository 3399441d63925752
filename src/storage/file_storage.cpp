// src/storage/file_storage.cpp
#include "papermake/storage/file_storage.h"
#include "papermake/common/error.h"
#include "papermake/common/log.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace papermake {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTemplateFile = "template.json";
constexpr const char* kFilesDir = "files";

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError("Cannot open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Writes next to the target and renames, so readers never see partial content
void write_file(const fs::path& path, const char* data, size_t size) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("Cannot write file: " + tmp.string());
        }
        file.write(data, static_cast<std::streamsize>(size));
        if (!file) {
            throw StorageError("Failed writing file: " + tmp.string());
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        throw StorageError("Cannot move " + tmp.string() + " to " + path.string() + ": " + ec.message());
    }
}

Template load_template(const fs::path& file) {
    try {
        return Template::from_json(nlohmann::json::parse(read_file(file)));
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt template file " + file.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw StorageError("Corrupt template file " + file.string() + ": " + e.what());
    } catch (const SchemaError& e) {
        throw StorageError("Corrupt template file " + file.string() + ": " + e.what());
    }
}

} // namespace

FileStorage::FileStorage(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_ / "templates", ec);
    if (ec) {
        throw StorageError("Cannot create storage root " + root_.string() + ": " + ec.message());
    }
}

fs::path FileStorage::template_dir(const TemplateId& id) const {
    check_template_id(id);
    return root_ / "templates" / id.value;
}

fs::path FileStorage::existing_template_dir(const TemplateId& id) const {
    fs::path dir = template_dir(id);
    std::error_code ec;
    if (!fs::exists(dir / kTemplateFile, ec)) {
        if (ec) throw StorageError("Cannot access template '" + id.value + "': " + ec.message());
        throw NotFoundError("Template '" + id.value + "' not found");
    }
    return dir;
}

Template FileStorage::get_template(const TemplateId& id) {
    return load_template(existing_template_dir(id) / kTemplateFile);
}

void FileStorage::save_template(const Template& tpl) {
    const std::string text = tpl.to_json().dump(2);
    std::lock_guard<std::mutex> lock(write_mutex_);
    write_file(template_dir(tpl.id()) / kTemplateFile, text.data(), text.size());
}

void FileStorage::delete_template(const TemplateId& id) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    fs::path dir = existing_template_dir(id);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        throw StorageError("Cannot delete template '" + id.value + "': " + ec.message());
    }
}

std::vector<Template> FileStorage::list_templates() {
    std::vector<Template> result;
    const fs::path dir = root_ / "templates";
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        fs::path file = it->path() / kTemplateFile;
        if (!it->is_directory(entry_ec) || !fs::exists(file, entry_ec)) continue;
        try {
            result.push_back(load_template(file));
        } catch (const StorageError& e) {
            log_warning(std::string("Skipping template: ") + e.what());
        }
    }
    if (ec) {
        throw StorageError("Cannot list templates in " + dir.string() + ": " + ec.message());
    }
    std::sort(result.begin(), result.end(),
              [](const Template& a, const Template& b) { return a.id() < b.id(); });
    return result;
}

std::vector<std::string> FileStorage::list_template_files(const TemplateId& id) {
    fs::path files_dir = existing_template_dir(id) / kFilesDir;
    std::vector<std::string> paths;
    std::error_code ec;
    if (!fs::exists(files_dir, ec)) {
        if (ec) throw StorageError("Cannot access " + files_dir.string() + ": " + ec.message());
        return paths;
    }

    fs::recursive_directory_iterator it(files_dir, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        const std::string rel = it->path().lexically_relative(files_dir).generic_string();
        // Skip leftovers of interrupted writes
        if (rel.size() > 4 && rel.compare(rel.size() - 4, 4, ".tmp") == 0) continue;
        paths.push_back(rel);
    }
    if (ec) {
        throw StorageError("Cannot list files of template '" + id.value + "': " + ec.message());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

Bytes FileStorage::get_template_file(const TemplateId& id, const std::string& path) {
    fs::path file = existing_template_dir(id) / kFilesDir / normalize_file_path(path);
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        throw NotFoundError("File '" + path + "' of template '" + id.value + "' not found");
    }
    const std::string content = read_file(file);
    return Bytes(content.begin(), content.end());
}

void FileStorage::save_template_file(const TemplateId& id, const std::string& path, const Bytes& content) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    fs::path file = existing_template_dir(id) / kFilesDir / normalize_file_path(path);
    write_file(file, reinterpret_cast<const char*>(content.data()), content.size());
}

} // namespace papermake
