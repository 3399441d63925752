// src/common/yaml_json.cpp
#include "papermake/common/yaml_json.h"
#include <regex>
#include <stdexcept>
#include <string>

namespace papermake {

namespace {

// Plain scalars are resolved with the YAML 1.2 core schema. Infinities and
// NaN have no JSON form and are left as strings.
nlohmann::json resolve_plain_scalar(const std::string& s) {
    static const std::regex null_pattern(R"(^(~|null|Null|NULL)?$)");
    static const std::regex true_pattern(R"(^(true|True|TRUE)$)");
    static const std::regex false_pattern(R"(^(false|False|FALSE)$)");
    static const std::regex decimal_pattern(R"(^[-+]?[0-9]+$)");
    static const std::regex octal_pattern(R"(^0o[0-7]+$)");
    static const std::regex hex_pattern(R"(^0x[0-9a-fA-F]+$)");
    static const std::regex float_pattern(R"(^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)");

    if (std::regex_match(s, null_pattern)) return nullptr;
    if (std::regex_match(s, true_pattern)) return true;
    if (std::regex_match(s, false_pattern)) return false;

    try {
        if (std::regex_match(s, decimal_pattern)) return std::stoll(s);
        if (std::regex_match(s, octal_pattern)) return std::stoll(s.substr(2), nullptr, 8);
        if (std::regex_match(s, hex_pattern)) return std::stoll(s.substr(2), nullptr, 16);
        if (std::regex_match(s, float_pattern)) return std::stod(s);
    } catch (const std::out_of_range&) {
        // Too large for a JSON number; kept verbatim
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            // Quoted scalars ("42", 'true') carry the non-specific tag and stay strings
            if (node.Tag() == "!") return node.Scalar();
            return resolve_plain_scalar(node.Scalar());
        case YAML::NodeType::Sequence: {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& item : node) items.push_back(yaml_to_json(item));
            return items;
        }
        case YAML::NodeType::Map: {
            nlohmann::json members = nlohmann::json::object();
            for (const auto& kv : node) {
                members[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return members;
        }
    }
    return nullptr;
}

nlohmann::json parse_yaml_or_json(const std::string& text) {
    return yaml_to_json(YAML::Load(text));
}

} // namespace papermake
