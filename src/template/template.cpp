// src/template/template.cpp
#include "papermake/template/template.h"
#include "papermake/common/error.h"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace papermake {

namespace {

// The input name is reserved in the template context, so a top-level field
// of that name could never be read by its own name
void check_reserved_fields(const Schema& schema) {
    if (schema.find_field(kDataInputName)) {
        throw SchemaError(std::string("Field name '") + kDataInputName +
                          "' is reserved for the whole render input");
    }
}

// Millisecond resolution so stored timestamps round-trip exactly
Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

} // namespace

std::string format_timestamp(Timestamp ts) {
    auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms_total / 1000);
    int ms = static_cast<int>(ms_total % 1000);
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

Timestamp parse_timestamp(const std::string& text) {
    std::tm tm{};
    int ms = 0;
    int consumed = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                             &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                             &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
    if (fields != 6) {
        throw std::invalid_argument("Invalid timestamp '" + text + "'");
    }
    std::string rest = text.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest[0] == '.') {
        int frac_len = 0;
        if (std::sscanf(rest.c_str(), ".%3d%n", &ms, &frac_len) != 1) {
            throw std::invalid_argument("Invalid timestamp '" + text + "'");
        }
        rest = rest.substr(static_cast<size_t>(frac_len));
    }
    if (rest != "Z") {
        throw std::invalid_argument("Timestamp must be UTC: '" + text + "'");
    }

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t secs = timegm(&tm);
    return Timestamp(std::chrono::seconds(secs) + std::chrono::milliseconds(ms));
}

Template::Template(TemplateId id, std::string name, std::string content, Schema schema)
    : id_(std::move(id)),
      name_(std::move(name)),
      content_(std::move(content)),
      schema_(std::move(schema)),
      created_at_(now()),
      updated_at_(created_at_) {
    check_reserved_fields(schema_);
}

Template Template::with_description(std::string description) const {
    Template copy = *this;
    copy.description_ = std::move(description);
    return copy;
}

void Template::update(const TemplateUpdate& changes) {
    if (changes.schema) check_reserved_fields(*changes.schema);
    if (changes.name) name_ = *changes.name;
    if (changes.content) content_ = *changes.content;
    if (changes.schema) schema_ = *changes.schema;
    if (changes.description) description_ = *changes.description;
    touch();
}

void Template::touch() {
    // The wall clock may step backwards; updated_at must not
    updated_at_ = std::max(now(), updated_at_);
}

nlohmann::json Template::to_json() const {
    nlohmann::json j;
    j["id"] = id_.value;
    j["name"] = name_;
    j["content"] = content_;
    j["schema"] = schema_.to_json();
    j["description"] = description_ ? nlohmann::json(*description_) : nlohmann::json(nullptr);
    j["created_at"] = format_timestamp(created_at_);
    j["updated_at"] = format_timestamp(updated_at_);
    return j;
}

Template Template::from_json(const nlohmann::json& j) {
    Template t(TemplateId{j.at("id").get<std::string>()},
               j.at("name").get<std::string>(),
               j.at("content").get<std::string>(),
               Schema::from_json(j.value("schema", nlohmann::json(nullptr))));
    if (j.contains("description") && j["description"].is_string()) {
        t.description_ = j["description"].get<std::string>();
    }
    if (j.contains("created_at")) {
        t.created_at_ = parse_timestamp(j["created_at"].get<std::string>());
        t.updated_at_ = t.created_at_;
    }
    if (j.contains("updated_at")) {
        t.updated_at_ = std::max(parse_timestamp(j["updated_at"].get<std::string>()), t.created_at_);
    }
    return t;
}

} // namespace papermake
