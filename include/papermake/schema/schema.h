// papermake/schema/schema.h
#ifndef PAPERMAKE_SCHEMA_SCHEMA_H
#define PAPERMAKE_SCHEMA_SCHEMA_H

#include "papermake/common/types.h"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace papermake {

class Schema;
struct FieldType;

struct TextType {};
struct NumberType {};
struct BooleanType {};
// ISO 8601 date string: YYYY-MM-DD, optionally followed by 'T' and a time
struct DateType {};
struct ListType {
    std::shared_ptr<const FieldType> item; // null accepts any element
};
struct ObjectType {
    std::shared_ptr<const Schema> schema;
};

struct FieldType {
    std::variant<TextType, NumberType, BooleanType, DateType, ListType, ObjectType> kind;

    static FieldType text() { return {TextType{}}; }
    static FieldType number() { return {NumberType{}}; }
    static FieldType boolean() { return {BooleanType{}}; }
    static FieldType date() { return {DateType{}}; }
    static FieldType list(std::optional<FieldType> item = std::nullopt);
    static FieldType object(Schema schema);
};

// "text", "number", "boolean", "date", "list", "object"
std::string type_name(const FieldType& type);

struct SchemaField {
    std::string name;
    FieldType type;
    bool required = false;
    std::optional<std::string> description;
};

struct ValidationError {
    enum class Kind : uint8_t {
        NOT_AN_OBJECT,
        MISSING_FIELD,
        TYPE_MISMATCH,
        UNKNOWN_FIELD
    };

    Kind kind;
    std::string path;    // e.g. "address.city", "items[2]"; empty for the root value
    std::string message;
};

class Schema {
public:
    Schema() = default;
    // Throws SchemaError on duplicate field names
    explicit Schema(std::vector<SchemaField> fields, bool strict = false);

    // First violation wins; std::nullopt means the data is valid
    std::optional<ValidationError> validate(const Value& data) const;

    const std::vector<SchemaField>& fields() const { return fields_; }
    const SchemaField* find_field(const std::string& name) const;
    bool strict() const { return strict_; }
    bool empty() const { return fields_.empty(); }

    nlohmann::json to_json() const;
    // Throws SchemaError on malformed definitions
    static Schema from_json(const nlohmann::json& j);
    static Schema from_yaml(const std::string& yaml_text);

private:
    std::optional<ValidationError> validate_object(const Value& data, const std::string& prefix) const;

    std::vector<SchemaField> fields_;
    bool strict_ = false;
};

} // namespace papermake

#endif // PAPERMAKE_SCHEMA_SCHEMA_H
