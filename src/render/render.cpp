// src/render/render.cpp
#include "papermake/render/render.h"
#include "papermake/common/error.h"
#include "papermake/common/log.h"
#include "papermake/typeset/compiler.h"

namespace papermake {

namespace {

const char* validation_kind_name(ValidationError::Kind kind) {
    switch (kind) {
        case ValidationError::Kind::NOT_AN_OBJECT: return "not_an_object";
        case ValidationError::Kind::MISSING_FIELD: return "missing_field";
        case ValidationError::Kind::TYPE_MISMATCH: return "type_mismatch";
        case ValidationError::Kind::UNKNOWN_FIELD: return "unknown_field";
    }
    return "type_mismatch";
}

RenderResult bad_input(ValidationError error) {
    RenderResult result;
    result.status = RenderStatus::BAD_INPUT;
    result.validation_error = std::move(error);
    return result;
}

void check_world(const World& world, const Template& tpl) {
    if (!world.matches(tpl)) {
        throw AdapterError("World built for template '" + world.template_id().value +
                           "' cannot render template '" + tpl.id().value + "' (id or source differs)");
    }
}

// Unresolvable diagnostics are dropped; if none resolve, the first message is kept at [0, 0)
std::vector<RenderError> position_diagnostics(const World& world, const std::vector<SourceDiagnostic>& diagnostics) {
    std::vector<RenderError> errors;
    for (const auto& diagnostic : diagnostics) {
        auto range = world.resolve(diagnostic.location);
        if (!range) {
            log_debug("Dropping diagnostic without source position: " + diagnostic.message);
            continue;
        }
        errors.push_back({diagnostic.message, range->start, range->end});
    }
    if (errors.empty() && !diagnostics.empty()) {
        errors.push_back({diagnostics.front().message, 0, 0});
    }
    return errors;
}

RenderResult compile_and_encode(World& world, const RenderOptions& options) {
    RenderResult result;
    CompileOutput output = compile(world);

    if (output.ok()) {
        result.pdf = encode_pdf(*output.document, to_pdf_options(options));
        result.status = RenderStatus::SUCCEEDED;
        return result;
    }

    result.errors = position_diagnostics(world, output.diagnostics);
    result.status = RenderStatus::FAILED;
    log_debug("Render of template '" + world.template_id().value + "' failed with " +
              std::to_string(result.errors.size()) + " diagnostics");
    return result;
}

} // namespace

const char* status_name(RenderStatus status) {
    switch (status) {
        case RenderStatus::SUCCEEDED: return "succeeded";
        case RenderStatus::FAILED: return "failed";
        case RenderStatus::BAD_INPUT: return "bad_input";
    }
    return "failed";
}

nlohmann::json RenderResult::to_json() const {
    nlohmann::json j;
    j["status"] = status_name(status);
    j["errors"] = nlohmann::json::array();
    for (const auto& error : errors) {
        j["errors"].push_back(nlohmann::json{{"message", error.message}, {"start", error.start}, {"end", error.end}});
    }
    if (validation_error) {
        j["validation_error"] = {
            {"kind", validation_kind_name(validation_error->kind)},
            {"path", validation_error->path},
            {"message", validation_error->message}};
    }
    if (pdf) {
        j["pdf_size"] = pdf->size();
    }
    return j;
}

PdfOptions to_pdf_options(const RenderOptions& options) {
    PdfOptions pdf;
    auto paper = lookup_paper_size(options.paper_size);
    if (paper) {
        pdf.paper = *paper;
    } else {
        log_warning("Unsupported paper size '" + options.paper_size + "', using a4");
        pdf.paper = *lookup_paper_size("a4");
    }
    pdf.compress = options.compress;
    pdf.max_pages = options.max_pages;
    return pdf;
}

RenderResult render_pdf(const Template& tpl, const Value& data, const RenderOptions& options) {
    return render_pdf_with_cache(tpl, data, nullptr, options);
}

RenderResult render_pdf_with_cache(const Template& tpl, const Value& data, World* cached,
                                   const RenderOptions& options) {
    if (auto error = tpl.validate_data(data)) {
        return bad_input(std::move(*error));
    }

    if (cached) {
        check_world(*cached, tpl);
        cached->update_data(data);
        return compile_and_encode(*cached, options);
    }

    World world(tpl, data);
    return compile_and_encode(world, options);
}

RenderResult render_pdf_with_lease(const Template& tpl, const Value& data, WorldLease& lease,
                                   const RenderOptions& options) {
    if (auto error = tpl.validate_data(data)) {
        return bad_input(std::move(*error));
    }

    try {
        if (!lease) {
            lease.adopt(std::make_unique<World>(tpl, data));
            return compile_and_encode(*lease.get(), options);
        }
        check_world(*lease.get(), tpl);
        lease.get()->update_data(data);
        return compile_and_encode(*lease.get(), options);
    } catch (const std::exception&) {
        // State of an interrupted World is unspecified; never pool it
        lease.discard();
        throw;
    }
}

} // namespace papermake
