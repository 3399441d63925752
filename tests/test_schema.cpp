// tests/test_schema.cpp
#include <catch2/catch_test_macros.hpp>
#include "papermake/common/error.h"
#include "papermake/schema/schema.h"

using namespace papermake;

namespace {

Schema required_ab() {
    return Schema({
        {"a", FieldType::number(), true, std::nullopt},
        {"b", FieldType::number(), true, std::nullopt},
    });
}

} // namespace

TEST_CASE("Required fields must be present", "[schema]") {
    Schema schema = required_ab();

    auto missing = schema.validate(nlohmann::json{{"a", 1}});
    REQUIRE(missing.has_value());
    REQUIRE(missing->kind == ValidationError::Kind::MISSING_FIELD);
    REQUIRE(missing->path == "b");

    REQUIRE_FALSE(schema.validate(nlohmann::json{{"a", 1}, {"b", 2}}).has_value());
}

TEST_CASE("Unknown fields are ignored unless strict", "[schema]") {
    nlohmann::json data = {{"a", 1}, {"b", 2}, {"c", 3}};
    REQUIRE_FALSE(required_ab().validate(data).has_value());

    Schema strict(required_ab().fields(), true);
    auto err = strict.validate(data);
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ValidationError::Kind::UNKNOWN_FIELD);
    REQUIRE(err->path == "c");
}

TEST_CASE("First violation is reported in declaration order", "[schema]") {
    auto err = required_ab().validate(nlohmann::json::object());
    REQUIRE(err.has_value());
    REQUIRE(err->path == "a");
}

TEST_CASE("Data must be an object", "[schema]") {
    auto err = required_ab().validate(nlohmann::json::array({1, 2}));
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ValidationError::Kind::NOT_AN_OBJECT);
    REQUIRE(err->path.empty());
}

TEST_CASE("Type tags check runtime shapes", "[schema]") {
    Schema schema({
        {"title", FieldType::text(), true, std::nullopt},
        {"count", FieldType::number(), true, std::nullopt},
        {"draft", FieldType::boolean(), true, std::nullopt},
        {"issued", FieldType::date(), true, std::nullopt},
    });
    nlohmann::json valid = {{"title", "Invoice"}, {"count", 2.5}, {"draft", false}, {"issued", "2024-02-29"}};
    REQUIRE_FALSE(schema.validate(valid).has_value());

    SECTION("number rejects numeric strings") {
        auto data = valid;
        data["count"] = "2";
        auto err = schema.validate(data);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ValidationError::Kind::TYPE_MISMATCH);
        REQUIRE(err->path == "count");
    }
    SECTION("boolean rejects numbers") {
        auto data = valid;
        data["draft"] = 0;
        REQUIRE(schema.validate(data).has_value());
    }
    SECTION("date accepts a time part") {
        auto data = valid;
        data["issued"] = "2024-02-29T13:45:00Z";
        REQUIRE_FALSE(schema.validate(data).has_value());
    }
    SECTION("date rejects other formats") {
        auto data = valid;
        data["issued"] = "29.02.2024";
        auto err = schema.validate(data);
        REQUIRE(err.has_value());
        REQUIRE(err->path == "issued");
    }
    SECTION("null counts as missing") {
        auto data = valid;
        data["title"] = nullptr;
        auto err = schema.validate(data);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ValidationError::Kind::MISSING_FIELD);
    }
}

TEST_CASE("Optional fields are type checked when present", "[schema]") {
    Schema schema({{"note", FieldType::text(), false, std::nullopt}});
    REQUIRE_FALSE(schema.validate(nlohmann::json::object()).has_value());
    REQUIRE_FALSE(schema.validate(nlohmann::json{{"note", nullptr}}).has_value());
    REQUIRE(schema.validate(nlohmann::json{{"note", 42}}).has_value());
}

TEST_CASE("Nested lists and objects report full paths", "[schema]") {
    Schema address({{"city", FieldType::text(), true, std::nullopt}});
    Schema schema({
        {"items", FieldType::list(FieldType::number()), true, std::nullopt},
        {"address", FieldType::object(address), false, std::nullopt},
    });

    auto bad_item = schema.validate(nlohmann::json{{"items", {1, "two", 3}}});
    REQUIRE(bad_item.has_value());
    REQUIRE(bad_item->path == "items[1]");

    auto bad_city = schema.validate(nlohmann::json{{"items", nlohmann::json::array()},
                                                   {"address", {{"zip", "1000"}}}});
    REQUIRE(bad_city.has_value());
    REQUIRE(bad_city->kind == ValidationError::Kind::MISSING_FIELD);
    REQUIRE(bad_city->path == "address.city");

    REQUIRE_FALSE(schema.validate(nlohmann::json{{"items", {1, 2}}, {"address", {{"city", "Oslo"}}}}).has_value());
}

TEST_CASE("Duplicate field names are rejected", "[schema]") {
    REQUIRE_THROWS_AS(Schema({
        {"a", FieldType::text(), false, std::nullopt},
        {"a", FieldType::number(), false, std::nullopt},
    }), SchemaError);

    nlohmann::json j = {{"fields", {{{"name", "x"}, {"type", "text"}}, {{"name", "x"}, {"type", "text"}}}}};
    REQUIRE_THROWS_AS(Schema::from_json(j), SchemaError);
}

TEST_CASE("Schema loads from JSON and YAML", "[schema]") {
    nlohmann::json j = nlohmann::json::parse(R"({
        "fields": [
            {"name": "name", "type": "text", "required": true, "description": "Customer"},
            {"name": "lines", "type": "list", "items": {"type": "object",
                "fields": [{"name": "amount", "type": "number", "required": true}]}}
        ]
    })");
    Schema schema = Schema::from_json(j);
    REQUIRE(schema.fields().size() == 2);
    REQUIRE(schema.find_field("name")->required);
    REQUIRE(schema.find_field("name")->description == std::optional<std::string>("Customer"));
    REQUIRE(type_name(schema.find_field("lines")->type) == "list");
    REQUIRE(Schema::from_json(schema.to_json()).to_json() == schema.to_json());

    auto err = schema.validate(nlohmann::json{{"name", "Ada"}, {"lines", {{{"amount", "ten"}}}}});
    REQUIRE(err.has_value());
    REQUIRE(err->path == "lines[0].amount");

    Schema from_yaml = Schema::from_yaml(R"(
strict: true
fields:
  - name: title
    type: text
    required: true
  - name: total
    type: number
)");
    REQUIRE(from_yaml.strict());
    REQUIRE(from_yaml.fields().size() == 2);
    REQUIRE_FALSE(from_yaml.find_field("total")->required);
}

TEST_CASE("Unknown type tags are rejected", "[schema]") {
    nlohmann::json j = {{"fields", {{{"name", "x"}, {"type", "currency"}}}}};
    REQUIRE_THROWS_AS(Schema::from_json(j), SchemaError);
}
