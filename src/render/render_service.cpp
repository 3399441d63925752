// src/render/render_service.cpp
#include "papermake/render/render_service.h"
#include "papermake/common/log.h"

namespace papermake {

RenderService::RenderService(Storage& storage, Config config)
    : storage_(storage), config_(std::move(config)), pool_(config_.max_idle_worlds, config_.max_idle_worlds_total) {}

RenderResult RenderService::render(const TemplateId& id, const Value& data,
                                   const std::optional<RenderOptions>& options) {
    return render(storage_.get_template(id), data, options);
}

RenderResult RenderService::render(const Template& tpl, const Value& data,
                                   const std::optional<RenderOptions>& options) {
    WorldLease lease = pool_.acquire(tpl);
    RenderResult result = render_pdf_with_lease(tpl, data, lease, options.value_or(config_.render));
    log_info("Rendered template '" + tpl.id().value + "': " + status_name(result.status));
    return result;
}

void RenderService::save_template(const Template& tpl) {
    storage_.save_template(tpl);
    pool_.invalidate(tpl.id());
}

void RenderService::update_template(const TemplateId& id, const TemplateUpdate& changes) {
    Template tpl = storage_.get_template(id);
    tpl.update(changes);
    save_template(tpl);
}

void RenderService::delete_template(const TemplateId& id) {
    storage_.delete_template(id);
    pool_.invalidate(id);
}

} // namespace papermake
