// papermake/config/config.h
#ifndef PAPERMAKE_CONFIG_CONFIG_H
#define PAPERMAKE_CONFIG_CONFIG_H

#include "papermake/common/log.h"
#include "papermake/render/render.h"
#include <nlohmann/json.hpp>
#include <string>

namespace papermake {

struct Config {
    std::string storage_path = "./data";
    RenderOptions render;             // defaults applied when a caller passes no options
    size_t max_idle_worlds = 4;       // per template
    size_t max_idle_worlds_total = 64;
    LogLevel log_level = LogLevel::INFO;

    // Missing keys keep their defaults; throws ConfigError on wrong types
    static Config from_json(const nlohmann::json& j);
    // A missing file yields defaults; malformed YAML throws ConfigError
    static Config load(const std::string& path = "papermake.yaml");

    // PAPERMAKE_STORAGE_PATH, PAPERMAKE_LOG_LEVEL
    void apply_env_overrides();
};

} // namespace papermake

#endif // PAPERMAKE_CONFIG_CONFIG_H
