// papermake/template/template.h
#ifndef PAPERMAKE_TEMPLATE_TEMPLATE_H
#define PAPERMAKE_TEMPLATE_TEMPLATE_H

#include "papermake/common/types.h"
#include "papermake/schema/schema.h"
#include <optional>
#include <string>

namespace papermake {

struct TemplateId {
    std::string value;

    bool operator==(const TemplateId& other) const { return value == other.value; }
    bool operator!=(const TemplateId& other) const { return value != other.value; }
    bool operator<(const TemplateId& other) const { return value < other.value; }
};

// Fields left empty are not touched by Template::update
struct TemplateUpdate {
    std::optional<std::string> name;
    std::optional<std::string> content;
    std::optional<Schema> schema;
    std::optional<std::string> description;
};

class Template {
public:
    // Throws SchemaError if the schema declares a top-level field named kDataInputName
    Template(TemplateId id, std::string name, std::string content, Schema schema);

    Template with_description(std::string description) const;

    // Applies the present fields and refreshes updated_at; a schema that declares
    // kDataInputName is rejected with SchemaError before anything changes
    void update(const TemplateUpdate& changes);

    std::optional<ValidationError> validate_data(const Value& data) const {
        return schema_.validate(data);
    }

    const TemplateId& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& content() const { return content_; }
    const Schema& schema() const { return schema_; }
    const std::optional<std::string>& description() const { return description_; }
    Timestamp created_at() const { return created_at_; }
    Timestamp updated_at() const { return updated_at_; }

    nlohmann::json to_json() const;
    // Throws SchemaError / nlohmann::json::exception on malformed input
    static Template from_json(const nlohmann::json& j);

private:
    void touch();

    TemplateId id_;
    std::string name_;
    std::string content_;
    Schema schema_;
    std::optional<std::string> description_;
    Timestamp created_at_;
    Timestamp updated_at_;
};

// RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.125Z
std::string format_timestamp(Timestamp ts);
// Accepts the output of format_timestamp; throws std::invalid_argument otherwise
Timestamp parse_timestamp(const std::string& text);

} // namespace papermake

#endif // PAPERMAKE_TEMPLATE_TEMPLATE_H
