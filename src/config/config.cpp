// src/config/config.cpp
#include "papermake/config/config.h"
#include "papermake/common/error.h"
#include "papermake/common/yaml_json.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace papermake {

namespace {

const nlohmann::json* section(const nlohmann::json& j, const char* name) {
    if (!j.contains(name) || j[name].is_null()) return nullptr;
    if (!j[name].is_object()) {
        throw ConfigError(std::string("Config section '") + name + "' must be a mapping");
    }
    return &j[name];
}

size_t get_count(const nlohmann::json& section, const char* key) {
    const auto& value = section.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigError(std::string("Config value '") + key + "' must be a non-negative integer");
    }
    return value.get<size_t>();
}

} // namespace

Config Config::from_json(const nlohmann::json& j) {
    Config config;
    if (j.is_null()) return config;
    if (!j.is_object()) {
        throw ConfigError("Config root must be a mapping");
    }

    try {
        if (const auto* storage = section(j, "storage")) {
            if (storage->contains("path")) {
                config.storage_path = storage->at("path").get<std::string>();
            }
        }
        if (const auto* render = section(j, "render")) {
            if (render->contains("paper_size")) {
                config.render.paper_size = render->at("paper_size").get<std::string>();
            }
            if (render->contains("compress")) {
                config.render.compress = render->at("compress").get<bool>();
            }
            if (render->contains("max_pages")) {
                config.render.max_pages = get_count(*render, "max_pages");
            }
        }
        if (const auto* cache = section(j, "cache")) {
            if (cache->contains("max_idle_worlds")) {
                config.max_idle_worlds = get_count(*cache, "max_idle_worlds");
            }
            if (cache->contains("max_idle_total")) {
                config.max_idle_worlds_total = get_count(*cache, "max_idle_total");
            }
        }
        if (const auto* log = section(j, "log")) {
            if (log->contains("level")) {
                config.log_level = parse_log_level(log->at("level").get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }
    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (std::filesystem::exists(path)) {
            throw ConfigError("Cannot read config file: " + path);
        }
        return Config{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return from_json(parse_yaml_or_json(buffer.str()));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
}

void Config::apply_env_overrides() {
    if (const char* storage = std::getenv("PAPERMAKE_STORAGE_PATH")) {
        storage_path = storage;
    }
    if (const char* level = std::getenv("PAPERMAKE_LOG_LEVEL")) {
        try {
            log_level = parse_log_level(level);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("PAPERMAKE_LOG_LEVEL: ") + e.what());
        }
    }
}

} // namespace papermake
