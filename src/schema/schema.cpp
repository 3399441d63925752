// src/schema/schema.cpp
#include "papermake/schema/schema.h"
#include "papermake/common/error.h"
#include "papermake/common/yaml_json.h"
#include <regex>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace papermake {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

bool is_iso_date(const std::string& s) {
    static const std::regex date_pattern(
        R"(^\d{4}-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])(T\d{2}:\d{2}(:\d{2}(\.\d+)?)?(Z|[+-]\d{2}:\d{2})?)?$)");
    return std::regex_match(s, date_pattern);
}

std::string json_kind(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::object: return "object";
        case Value::value_t::array: return "array";
        case Value::value_t::string: return "string";
        case Value::value_t::boolean: return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float: return "number";
        default: return "unknown";
    }
}

std::string join_path(const std::string& prefix, const std::string& name) {
    return prefix.empty() ? name : prefix + "." + name;
}

ValidationError mismatch(const std::string& path, const FieldType& expected, const Value& actual) {
    return {ValidationError::Kind::TYPE_MISMATCH, path,
            "Field '" + path + "' expected " + type_name(expected) + ", got " + json_kind(actual)};
}

std::optional<ValidationError> check_value(const FieldType& type, const Value& value, const std::string& path) {
    return std::visit(overloaded{
        [&](const TextType&) -> std::optional<ValidationError> {
            if (!value.is_string()) return mismatch(path, type, value);
            return std::nullopt;
        },
        [&](const NumberType&) -> std::optional<ValidationError> {
            if (!value.is_number()) return mismatch(path, type, value);
            return std::nullopt;
        },
        [&](const BooleanType&) -> std::optional<ValidationError> {
            if (!value.is_boolean()) return mismatch(path, type, value);
            return std::nullopt;
        },
        [&](const DateType&) -> std::optional<ValidationError> {
            if (!value.is_string()) return mismatch(path, type, value);
            if (!is_iso_date(value.get_ref<const std::string&>())) {
                return ValidationError{ValidationError::Kind::TYPE_MISMATCH, path,
                                       "Field '" + path + "' is not an ISO 8601 date: " + value.dump()};
            }
            return std::nullopt;
        },
        [&](const ListType& list) -> std::optional<ValidationError> {
            if (!value.is_array()) return mismatch(path, type, value);
            if (!list.item) return std::nullopt;
            for (size_t i = 0; i < value.size(); ++i) {
                auto err = check_value(*list.item, value[i], path + "[" + std::to_string(i) + "]");
                if (err) return err;
            }
            return std::nullopt;
        },
        [&](const ObjectType& object) -> std::optional<ValidationError> {
            if (!value.is_object()) return mismatch(path, type, value);
            if (!object.schema) return std::nullopt;
            // Nested errors are re-rooted under this field's path
            auto err = object.schema->validate(value);
            if (err) {
                err->path = err->path.empty() ? path : join_path(path, err->path);
                err->message = "In '" + path + "': " + err->message;
            }
            return err;
        },
    }, type.kind);
}

FieldType type_from_json(const nlohmann::json& j, const std::string& where) {
    std::string tag;
    if (j.is_string()) {
        tag = j.get<std::string>();
    } else if (j.is_object() && j.contains("type") && j["type"].is_string()) {
        tag = j["type"].get<std::string>();
    } else {
        throw SchemaError("Missing 'type' for " + where);
    }

    if (tag == "text" || tag == "string") return FieldType::text();
    if (tag == "number") return FieldType::number();
    if (tag == "boolean") return FieldType::boolean();
    if (tag == "date") return FieldType::date();
    if (tag == "list" || tag == "array") {
        if (j.is_object() && j.contains("items") && !j["items"].is_null()) {
            return FieldType::list(type_from_json(j["items"], where + "[]"));
        }
        return FieldType::list();
    }
    if (tag == "object") {
        if (j.is_object() && j.contains("fields")) {
            return FieldType::object(Schema::from_json(j));
        }
        return FieldType{ObjectType{}};
    }
    throw SchemaError("Unknown field type '" + tag + "' for " + where);
}

void type_to_json(const FieldType& type, nlohmann::json& out) {
    out["type"] = type_name(type);
    if (const auto* list = std::get_if<ListType>(&type.kind)) {
        if (list->item) {
            nlohmann::json item;
            type_to_json(*list->item, item);
            out["items"] = std::move(item);
        }
    } else if (const auto* object = std::get_if<ObjectType>(&type.kind)) {
        if (object->schema) {
            nlohmann::json nested = object->schema->to_json();
            out["fields"] = std::move(nested["fields"]);
            if (object->schema->strict()) out["strict"] = true;
        }
    }
}

} // namespace

FieldType FieldType::list(std::optional<FieldType> item) {
    ListType list;
    if (item) list.item = std::make_shared<const FieldType>(std::move(*item));
    return {std::move(list)};
}

FieldType FieldType::object(Schema schema) {
    return {ObjectType{std::make_shared<const Schema>(std::move(schema))}};
}

std::string type_name(const FieldType& type) {
    return std::visit(overloaded{
        [](const TextType&) { return std::string("text"); },
        [](const NumberType&) { return std::string("number"); },
        [](const BooleanType&) { return std::string("boolean"); },
        [](const DateType&) { return std::string("date"); },
        [](const ListType&) { return std::string("list"); },
        [](const ObjectType&) { return std::string("object"); },
    }, type.kind);
}

Schema::Schema(std::vector<SchemaField> fields, bool strict)
    : fields_(std::move(fields)), strict_(strict) {
    std::unordered_set<std::string> seen;
    for (const auto& field : fields_) {
        if (field.name.empty()) {
            throw SchemaError("Schema field with empty name");
        }
        if (!seen.insert(field.name).second) {
            throw SchemaError("Duplicate schema field '" + field.name + "'");
        }
    }
}

const SchemaField* Schema::find_field(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.name == name) return &field;
    }
    return nullptr;
}

std::optional<ValidationError> Schema::validate(const Value& data) const {
    if (!data.is_object()) {
        return ValidationError{ValidationError::Kind::NOT_AN_OBJECT, "",
                               "Data must be an object, got " + json_kind(data)};
    }
    return validate_object(data, "");
}

std::optional<ValidationError> Schema::validate_object(const Value& data, const std::string& prefix) const {
    for (const auto& field : fields_) {
        const std::string path = join_path(prefix, field.name);
        auto it = data.find(field.name);
        if (it == data.end() || it->is_null()) {
            if (field.required) {
                return ValidationError{ValidationError::Kind::MISSING_FIELD, path,
                                       "Missing required field '" + path + "'"};
            }
            continue;
        }
        if (auto err = check_value(field.type, *it, path)) {
            return err;
        }
    }

    if (strict_) {
        for (auto it = data.begin(); it != data.end(); ++it) {
            if (!find_field(it.key())) {
                const std::string path = join_path(prefix, it.key());
                return ValidationError{ValidationError::Kind::UNKNOWN_FIELD, path,
                                       "Unknown field '" + path + "'"};
            }
        }
    }
    return std::nullopt;
}

nlohmann::json Schema::to_json() const {
    nlohmann::json j;
    j["fields"] = nlohmann::json::array();
    for (const auto& field : fields_) {
        nlohmann::json fj;
        fj["name"] = field.name;
        type_to_json(field.type, fj);
        fj["required"] = field.required;
        if (field.description) fj["description"] = *field.description;
        j["fields"].push_back(std::move(fj));
    }
    if (strict_) j["strict"] = true;
    return j;
}

Schema Schema::from_json(const nlohmann::json& j) {
    if (j.is_null()) return Schema{};
    if (!j.is_object()) {
        throw SchemaError("Schema must be an object");
    }

    std::vector<SchemaField> fields;
    if (j.contains("fields")) {
        const auto& fj = j["fields"];
        if (!fj.is_array()) {
            throw SchemaError("'fields' must be an array");
        }
        for (const auto& entry : fj) {
            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
                throw SchemaError("Schema field must be an object with a string 'name'");
            }
            SchemaField field;
            field.name = entry["name"].get<std::string>();
            field.type = type_from_json(entry, "field '" + field.name + "'");
            if (entry.contains("required")) {
                if (!entry["required"].is_boolean()) {
                    throw SchemaError("'required' must be a boolean for field '" + field.name + "'");
                }
                field.required = entry["required"].get<bool>();
            }
            if (entry.contains("description") && entry["description"].is_string()) {
                field.description = entry["description"].get<std::string>();
            }
            fields.push_back(std::move(field));
        }
    }

    bool strict = false;
    if (j.contains("strict") && !j["strict"].is_null()) {
        if (!j["strict"].is_boolean()) {
            throw SchemaError("'strict' must be a boolean");
        }
        strict = j["strict"].get<bool>();
    }
    return Schema(std::move(fields), strict);
}

Schema Schema::from_yaml(const std::string& yaml_text) {
    try {
        return from_json(parse_yaml_or_json(yaml_text));
    } catch (const YAML::Exception& e) {
        throw SchemaError(std::string("Invalid schema YAML: ") + e.what());
    }
}

} // namespace papermake
