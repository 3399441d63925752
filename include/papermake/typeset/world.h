// papermake/typeset/world.h
#ifndef PAPERMAKE_TYPESET_WORLD_H
#define PAPERMAKE_TYPESET_WORLD_H

#include "papermake/common/types.h"
#include "papermake/template/template.h"
#include <inja/inja.hpp>
#include <optional>
#include <string>
#include <vector>

namespace papermake {

// Half-open byte range [start, end) into a template source
struct SourceRange {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const SourceRange& other) const { return start == other.start && end == other.end; }
};

// Compilation environment for one template: its source as the only resolvable
// document, the bound input data, and the cached parse of the source.
//
// A World is not thread-safe. Reuse is strictly sequential:
// update_data -> compile -> read diagnostics -> next update_data or discard.
class World {
public:
    // Throws AdapterError if data cannot be serialized
    World(TemplateId template_id, std::string source, const Value& data);
    World(const Template& tpl, const Value& data);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // Rebinds the input without re-parsing the source. On failure throws
    // AdapterError and keeps the previous binding.
    void update_data(const Value& data);
    // Drops the bound input; the next render must call update_data first
    void clear_data();

    // True if this World was built for the template's id and current source
    bool matches(const Template& tpl) const;

    // Maps an engine location (1-based line/column) to the identifier or byte
    // at that position. std::nullopt for locations outside the source.
    std::optional<SourceRange> resolve(const inja::SourceLocation& location) const;

    // Parses on first use; throws inja::InjaError on markup errors
    const inja::Template& parsed();
    inja::Environment& environment() { return env_; }

    const TemplateId& template_id() const { return template_id_; }
    const std::string& source() const { return source_; }
    // Template-visible values: top-level keys of the input plus the input under kDataInputName
    const Value& context() const { return context_; }
    const std::string& serialized_data() const { return serialized_data_; }

    size_t compilations() const { return compilations_; }
    void note_compilation() { ++compilations_; }

private:
    void configure_environment();
    void index_lines();

    TemplateId template_id_;
    std::string source_;
    std::vector<size_t> line_starts_;
    inja::Environment env_;
    std::optional<inja::Template> parsed_;
    Value context_;
    std::string serialized_data_;
    size_t compilations_ = 0;
};

} // namespace papermake

#endif // PAPERMAKE_TYPESET_WORLD_H
