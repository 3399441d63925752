// papermake/common/yaml_json.h
#ifndef PAPERMAKE_COMMON_YAML_JSON_H
#define PAPERMAKE_COMMON_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace papermake {

// Converts a YAML::Node into nlohmann::json. Plain scalars resolve to nulls,
// booleans and numbers by the YAML 1.2 core schema; quoted scalars stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses YAML (a superset of JSON) text; throws YAML::Exception on malformed input
nlohmann::json parse_yaml_or_json(const std::string& text);

} // namespace papermake

#endif // PAPERMAKE_COMMON_YAML_JSON_H
