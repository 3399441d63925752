// papermake/typeset/compiler.h
#ifndef PAPERMAKE_TYPESET_COMPILER_H
#define PAPERMAKE_TYPESET_COMPILER_H

#include "papermake/typeset/document.h"
#include "papermake/typeset/world.h"
#include <inja/inja.hpp>
#include <optional>
#include <string>
#include <vector>

namespace papermake {

// Engine-level diagnostic; location is only meaningful through World::resolve
struct SourceDiagnostic {
    std::string message;
    inja::SourceLocation location{};
};

struct CompileOutput {
    std::optional<Document> document;
    std::vector<SourceDiagnostic> diagnostics;

    bool ok() const { return document.has_value(); }
};

// Expands the World's template against its bound data and typesets the result.
// Markup and data errors are reported as diagnostics, never thrown.
CompileOutput compile(World& world);

} // namespace papermake

#endif // PAPERMAKE_TYPESET_COMPILER_H
