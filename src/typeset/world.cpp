// src/typeset/world.cpp
#include "papermake/typeset/world.h"
#include "papermake/common/error.h"
#include "papermake/common/log.h"
#include <cctype>
#include <filesystem>

namespace papermake {

namespace {

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

struct Binding {
    Value context;
    std::string serialized;
};

Binding bind(const Value& data) {
    Binding binding;
    try {
        binding.serialized = data.dump();
    } catch (const nlohmann::json::exception& e) {
        throw AdapterError(std::string("Cannot serialize render data: ") + e.what());
    }

    binding.context = Value::object();
    if (data.is_object()) {
        for (auto it = data.begin(); it != data.end(); ++it) {
            binding.context[it.key()] = it.value();
        }
        if (data.contains(kDataInputName)) {
            log_warning(std::string("Render input key '") + kDataInputName +
                        "' is shadowed by the whole input; use '" + kDataInputName + "." +
                        kDataInputName + "' to read it");
        }
    }
    binding.context[kDataInputName] = data;
    return binding;
}

} // namespace

World::World(TemplateId template_id, std::string source, const Value& data)
    : template_id_(std::move(template_id)), source_(std::move(source)) {
    Binding binding = bind(data);
    context_ = std::move(binding.context);
    serialized_data_ = std::move(binding.serialized);
    index_lines();
    configure_environment();
}

World::World(const Template& tpl, const Value& data)
    : World(tpl.id(), tpl.content(), data) {}

void World::configure_environment() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    // The source is the only document; includes never reach the filesystem
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string& name) -> inja::Template {
        throw inja::InjaError("parser_error", "Include of '" + name + "' is not supported", inja::SourceLocation{});
    });
}

void World::index_lines() {
    line_starts_.clear();
    line_starts_.push_back(0);
    for (size_t i = 0; i < source_.size(); ++i) {
        if (source_[i] == '\n') line_starts_.push_back(i + 1);
    }
}

void World::update_data(const Value& data) {
    Binding binding = bind(data);
    context_ = std::move(binding.context);
    serialized_data_ = std::move(binding.serialized);
}

void World::clear_data() {
    context_ = Value::object();
    context_[kDataInputName] = nullptr;
    serialized_data_ = "null";
}

bool World::matches(const Template& tpl) const {
    return template_id_ == tpl.id() && source_ == tpl.content();
}

std::optional<SourceRange> World::resolve(const inja::SourceLocation& location) const {
    if (location.line == 0 || location.column == 0 || location.line > line_starts_.size()) {
        return std::nullopt;
    }
    const size_t line_start = line_starts_[location.line - 1];
    const size_t line_end = (location.line < line_starts_.size()) ? line_starts_[location.line] : source_.size();
    const size_t start = line_start + (location.column - 1);
    if (start > line_end || start > source_.size()) {
        return std::nullopt;
    }

    size_t end = start;
    while (end < source_.size() && is_identifier_char(source_[end])) ++end;
    if (end == start && start < source_.size()) ++end;
    return SourceRange{start, end};
}

const inja::Template& World::parsed() {
    if (!parsed_) {
        parsed_.emplace(env_.parse(source_));
    }
    return *parsed_;
}

} // namespace papermake
