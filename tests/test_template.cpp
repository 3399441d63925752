// tests/test_template.cpp
#include <catch2/catch_test_macros.hpp>
#include "papermake/common/error.h"
#include "papermake/template/template.h"
#include <thread>

using namespace papermake;

namespace {

Template make_invoice() {
    Schema schema({{"name", FieldType::text(), true, std::nullopt}});
    return Template(TemplateId{"invoice"}, "Invoice", "= Invoice for {{ name }}", schema);
}

} // namespace

TEST_CASE("New templates start with equal timestamps and no description", "[template]") {
    Template tpl = make_invoice();
    REQUIRE(tpl.id().value == "invoice");
    REQUIRE(tpl.name() == "Invoice");
    REQUIRE(tpl.created_at() == tpl.updated_at());
    REQUIRE_FALSE(tpl.description().has_value());
}

TEST_CASE("with_description keeps identity and creation time", "[template]") {
    Template tpl = make_invoice();
    Template described = tpl.with_description("Monthly invoice");
    REQUIRE(described.description() == std::optional<std::string>("Monthly invoice"));
    REQUIRE(described.id() == tpl.id());
    REQUIRE(described.created_at() == tpl.created_at());
    REQUIRE_FALSE(tpl.description().has_value());
}

TEST_CASE("update applies only present fields", "[template]") {
    Template tpl = make_invoice();
    TemplateUpdate changes;
    changes.name = "Invoice v2";
    tpl.update(changes);

    REQUIRE(tpl.name() == "Invoice v2");
    REQUIRE(tpl.content() == "= Invoice for {{ name }}");
    REQUIRE(tpl.schema().find_field("name") != nullptr);
    REQUIRE_FALSE(tpl.description().has_value());
    REQUIRE(tpl.id().value == "invoice");
}

TEST_CASE("updated_at never decreases and never precedes created_at", "[template]") {
    Template tpl = make_invoice();
    auto previous = tpl.updated_at();
    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        TemplateUpdate changes;
        if (i % 2 == 0) changes.content = "= Version " + std::to_string(i);
        tpl.update(changes);
        REQUIRE(tpl.updated_at() >= previous);
        REQUIRE(tpl.updated_at() >= tpl.created_at());
        previous = tpl.updated_at();
    }
    REQUIRE(tpl.updated_at() > tpl.created_at());
}

TEST_CASE("validate_data delegates to the schema", "[template]") {
    Template tpl = make_invoice();
    REQUIRE_FALSE(tpl.validate_data(nlohmann::json{{"name", "Ada"}}).has_value());
    REQUIRE(tpl.validate_data(nlohmann::json::object()).has_value());
}

TEST_CASE("Templates survive a JSON round trip", "[template]") {
    Template tpl = make_invoice().with_description("Monthly");
    TemplateUpdate changes;
    changes.content = "Hello {{ name }}";
    tpl.update(changes);

    Template loaded = Template::from_json(tpl.to_json());
    REQUIRE(loaded.id() == tpl.id());
    REQUIRE(loaded.content() == "Hello {{ name }}");
    REQUIRE(loaded.description() == tpl.description());
    REQUIRE(loaded.created_at() == tpl.created_at());
    REQUIRE(loaded.updated_at() == tpl.updated_at());
    REQUIRE(loaded.schema().to_json() == tpl.schema().to_json());
}

TEST_CASE("Timestamps format as RFC 3339 UTC", "[template]") {
    Timestamp ts = Timestamp(std::chrono::milliseconds(1714566600125));
    REQUIRE(format_timestamp(ts) == "2024-05-01T12:30:00.125Z");
    REQUIRE(parse_timestamp("2024-05-01T12:30:00.125Z") == ts);
    REQUIRE(parse_timestamp("2024-05-01T12:30:00Z") == ts - std::chrono::milliseconds(125));
    REQUIRE_THROWS_AS(parse_timestamp("yesterday"), std::invalid_argument);
}

TEST_CASE("The input name cannot be declared as a field", "[template]") {
    Schema reserved({{"data", FieldType::text(), true, std::nullopt}});
    REQUIRE_THROWS_AS(Template(TemplateId{"t"}, "T", "{{ data }}", reserved), SchemaError);

    Template tpl = make_invoice();
    TemplateUpdate changes;
    changes.schema = reserved;
    changes.name = "Renamed";
    REQUIRE_THROWS_AS(tpl.update(changes), SchemaError);
    REQUIRE(tpl.name() == "Invoice");
    REQUIRE(tpl.schema().find_field("data") == nullptr);

    // Nested fields of that name are fine
    Schema nested({{"order", FieldType::object(reserved), true, std::nullopt}});
    REQUIRE_NOTHROW(Template(TemplateId{"t"}, "T", "{{ order.data }}", nested));
}
