// papermake/render/render.h
#ifndef PAPERMAKE_RENDER_RENDER_H
#define PAPERMAKE_RENDER_RENDER_H

#include "papermake/common/types.h"
#include "papermake/pdf/pdf_writer.h"
#include "papermake/render/world_pool.h"
#include "papermake/schema/schema.h"
#include "papermake/template/template.h"
#include "papermake/typeset/world.h"
#include <optional>
#include <string>
#include <vector>

namespace papermake {

struct RenderOptions {
    // a3, a4, a5, letter, legal; anything else falls back to a4
    std::string paper_size = "a4";
    bool compress = true;
    // 0 disables the limit
    size_t max_pages = 500;
};

// Diagnostic positioned in the template source: [start, end)
struct RenderError {
    std::string message;
    size_t start = 0;
    size_t end = 0;
};

enum class RenderStatus : uint8_t {
    SUCCEEDED, // pdf set, errors empty
    FAILED,    // errors non-empty, no pdf
    BAD_INPUT  // validation_error set; the engine was not invoked
};

struct RenderResult {
    RenderStatus status = RenderStatus::FAILED;
    std::optional<Bytes> pdf;
    std::vector<RenderError> errors;
    std::optional<ValidationError> validation_error;

    bool ok() const { return status == RenderStatus::SUCCEEDED; }
    // pdf is omitted; errors and validation details are included
    nlohmann::json to_json() const;
};

// "succeeded", "failed", "bad_input"
const char* status_name(RenderStatus status);

// Resolves paper size with fallback to a4; never fails
PdfOptions to_pdf_options(const RenderOptions& options);

// Validates, compiles in a fresh World and encodes.
// AdapterError and EncodeError propagate; everything else is in the result.
RenderResult render_pdf(const Template& tpl, const Value& data, const RenderOptions& options = {});

// Same, but reuses `cached` (rebinding its data) when given. A World built for a
// different template id or source is rejected with AdapterError.
RenderResult render_pdf_with_cache(const Template& tpl, const Value& data, World* cached,
                                   const RenderOptions& options = {});

// Uses the leased World, or builds one and hands it to the lease. The World is
// discarded if the render throws.
RenderResult render_pdf_with_lease(const Template& tpl, const Value& data, WorldLease& lease,
                                   const RenderOptions& options = {});

} // namespace papermake

#endif // PAPERMAKE_RENDER_RENDER_H
