// tests/test_world.cpp
#include <catch2/catch_test_macros.hpp>
#include "papermake/common/error.h"
#include "papermake/typeset/compiler.h"
#include "papermake/typeset/world.h"
#include <string>
#include <vector>

using namespace papermake;

TEST_CASE("Input is bound under its name and as top-level keys", "[world]") {
    World world(TemplateId{"greeting"}, "Hello {{ name }}", nlohmann::json{{"name", "Ada"}});
    REQUIRE(world.context()["name"] == "Ada");
    REQUIRE(world.context()[kDataInputName]["name"] == "Ada");
    REQUIRE(world.serialized_data() == R"({"name":"Ada"})");

    CompileOutput output = compile(world);
    REQUIRE(output.ok());
    REQUIRE(output.document->blocks.size() == 1);
    REQUIRE(output.document->blocks[0].text == "Hello Ada");
}

TEST_CASE("Non-object input is reachable only through the data name", "[world]") {
    World world(TemplateId{"list"}, "{% for x in data %}{{ x }} {% endfor %}", nlohmann::json{1, 2, 3});
    REQUIRE(world.context().size() == 1);
    CompileOutput output = compile(world);
    REQUIRE(output.ok());
    REQUIRE(output.document->blocks[0].text == "1 2 3");
}

TEST_CASE("update_data replaces the previous binding", "[world]") {
    World world(TemplateId{"t"}, "{{ data }}", nlohmann::json{{"a", 1}, {"b", 2}});
    world.update_data(nlohmann::json{{"a", 5}});
    REQUIRE(world.context().contains("a"));
    REQUIRE_FALSE(world.context().contains("b"));
    REQUIRE(world.context()[kDataInputName] == nlohmann::json{{"a", 5}});
}

TEST_CASE("Unserializable input is an adapter error and keeps the binding", "[world]") {
    nlohmann::json bad = {{"name", std::string("\xff\xfe")}};
    REQUIRE_THROWS_AS(World(TemplateId{"t"}, "x", bad), AdapterError);

    World world(TemplateId{"t"}, "{{ name }}", nlohmann::json{{"name", "Ada"}});
    REQUIRE_THROWS_AS(world.update_data(bad), AdapterError);
    REQUIRE(world.context()["name"] == "Ada");
}

TEST_CASE("Engine locations resolve to byte ranges", "[world]") {
    const std::string source = "= Title\nHello {{ customer.name }}!\n";
    World world(TemplateId{"t"}, source, nlohmann::json::object());

    SECTION("identifier at a location") {
        auto range = world.resolve(inja::SourceLocation{2, 10});
        REQUIRE(range.has_value());
        REQUIRE(source.substr(range->start, range->end - range->start) == "customer.name");
    }
    SECTION("non-identifier byte") {
        auto range = world.resolve(inja::SourceLocation{1, 1});
        REQUIRE(range == std::optional<SourceRange>(SourceRange{0, 1}));
    }
    SECTION("outside the source") {
        REQUIRE_FALSE(world.resolve(inja::SourceLocation{0, 0}).has_value());
        REQUIRE_FALSE(world.resolve(inja::SourceLocation{9, 1}).has_value());
        REQUIRE_FALSE(world.resolve(inja::SourceLocation{1, 40}).has_value());
    }
}

TEST_CASE("The parse of the source is cached", "[world]") {
    World world(TemplateId{"t"}, "{{ a }}", nlohmann::json{{"a", 1}});
    const inja::Template* first = &world.parsed();
    REQUIRE(&world.parsed() == first);

    compile(world);
    world.update_data(nlohmann::json{{"a", 2}});
    CompileOutput output = compile(world);
    REQUIRE(output.ok());
    REQUIRE(output.document->blocks[0].text == "2");
    REQUIRE(&world.parsed() == first);
    REQUIRE(world.compilations() == 2);
}

TEST_CASE("Missing variables are diagnostics at the reference", "[world]") {
    const std::string source = "Hello {{ missing }}";
    World world(TemplateId{"t"}, source, nlohmann::json{{"name", "Ada"}});
    CompileOutput output = compile(world);
    REQUIRE_FALSE(output.ok());
    REQUIRE(output.diagnostics.size() == 1);
    REQUIRE(output.diagnostics[0].message.find("missing") != std::string::npos);

    auto range = world.resolve(output.diagnostics[0].location);
    REQUIRE(range.has_value());
    REQUIRE(source.substr(range->start, range->end - range->start) == "missing");
}

TEST_CASE("Includes are not resolvable", "[world]") {
    World world(TemplateId{"t"}, "{% include \"header\" %}body", nlohmann::json::object());
    CompileOutput output = compile(world);
    REQUIRE_FALSE(output.ok());
    REQUIRE(output.diagnostics.size() == 1);
    REQUIRE(output.diagnostics[0].message.find("header") != std::string::npos);
}

TEST_CASE("matches compares id and source", "[world]") {
    Schema schema;
    Template tpl(TemplateId{"a"}, "A", "x", schema);
    World world(tpl, nlohmann::json::object());
    REQUIRE(world.matches(tpl));

    Template other(TemplateId{"b"}, "B", "x", schema);
    REQUIRE_FALSE(world.matches(other));

    TemplateUpdate changes;
    changes.content = "y";
    tpl.update(changes);
    REQUIRE_FALSE(world.matches(tpl));
}

TEST_CASE("An input key named data stays reachable under the input", "[world]") {
    nlohmann::json input = {{"data", "x"}, {"name", "Ada"}};
    World world(TemplateId{"t"}, "{{ data.data }} {{ name }}", input);
    REQUIRE(world.context()[kDataInputName] == input);

    CompileOutput output = compile(world);
    REQUIRE(output.ok());
    REQUIRE(output.document->blocks[0].text == "x Ada");
}

TEST_CASE("Parse errors resolve inside the source", "[world]") {
    const std::vector<std::string> sources = {
        "Hello {{ name",
        "{% for %}x{% endfor %}",
        "= Title\nline two\n{{ }}",
        "first\nsecond {% if name %}open",
        "{{ name }}\n{% endfor %}",
        "{{ 1 + }}",
    };
    for (const auto& source : sources) {
        CAPTURE(source);
        World world(TemplateId{"t"}, source, nlohmann::json{{"name", "Ada"}});
        CompileOutput output = compile(world);
        REQUIRE_FALSE(output.ok());
        REQUIRE_FALSE(output.diagnostics.empty());
        for (const auto& diagnostic : output.diagnostics) {
            auto range = world.resolve(diagnostic.location);
            if (!range) continue;
            REQUIRE(range->start <= range->end);
            REQUIRE(range->end <= source.size());
        }
    }
}

TEST_CASE("Locations at the end of the source resolve to an empty range", "[world]") {
    const std::string source = "ab\ncd";
    World world(TemplateId{"t"}, source, nlohmann::json::object());
    REQUIRE(world.resolve(inja::SourceLocation{2, 3}) == std::optional<SourceRange>(SourceRange{5, 5}));
    REQUIRE(world.resolve(inja::SourceLocation{1, 3}) == std::optional<SourceRange>(SourceRange{2, 3}));
    REQUIRE_FALSE(world.resolve(inja::SourceLocation{2, 4}).has_value());
}
