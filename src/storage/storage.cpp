// src/storage/storage.cpp
#include "papermake/storage/storage.h"
#include "papermake/common/error.h"
#include "papermake/common/log.h"
#include <regex>

namespace papermake {

void Storage::delete_template_file(const TemplateId& id, const std::string& path) {
    log_warning("delete_template_file('" + id.value + "', '" + path +
                "') is not supported by this storage; file kept");
}

void check_template_id(const TemplateId& id) {
    static const std::regex valid(R"(^[A-Za-z0-9_][A-Za-z0-9_.\-]*$)");
    if (!std::regex_match(id.value, valid)) {
        throw StorageError("Invalid template id '" + id.value + "'");
    }
}

std::string normalize_file_path(const std::string& path) {
    std::string normalized = path;
    for (auto& c : normalized) {
        if (c == '\\') c = '/';
    }
    while (normalized.rfind("./", 0) == 0) normalized.erase(0, 2);

    if (normalized.empty() || normalized.front() == '/') {
        throw StorageError("Invalid template file path '" + path + "'");
    }

    size_t start = 0;
    while (start <= normalized.size()) {
        size_t slash = normalized.find('/', start);
        if (slash == std::string::npos) slash = normalized.size();
        std::string segment = normalized.substr(start, slash - start);
        if (segment.empty() || segment == "." || segment == "..") {
            throw StorageError("Invalid template file path '" + path + "'");
        }
        start = slash + 1;
    }
    return normalized;
}

} // namespace papermake
