// src/typeset/compiler.cpp
#include "papermake/typeset/compiler.h"
#include "papermake/common/log.h"

namespace papermake {

CompileOutput compile(World& world) {
    CompileOutput output;
    world.note_compilation();

    std::string expanded;
    try {
        const inja::Template& tpl = world.parsed();
        expanded = world.environment().render(tpl, world.context());
    } catch (const inja::InjaError& e) {
        output.diagnostics.push_back({e.message, e.location});
        return output;
    } catch (const nlohmann::json::exception& e) {
        // Raised by inja builtins applied to values of the wrong type; no position is known
        output.diagnostics.push_back({e.what(), inja::SourceLocation{}});
        return output;
    }

    output.document = typeset(expanded);
    log_debug("Compiled template '" + world.template_id().value + "' into " +
              std::to_string(output.document->blocks.size()) + " blocks");
    return output;
}

} // namespace papermake
