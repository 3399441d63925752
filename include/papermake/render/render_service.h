// papermake/render/render_service.h
#ifndef PAPERMAKE_RENDER_RENDER_SERVICE_H
#define PAPERMAKE_RENDER_RENDER_SERVICE_H

#include "papermake/config/config.h"
#include "papermake/render/render.h"
#include "papermake/render/world_pool.h"
#include "papermake/storage/storage.h"
#include <optional>

namespace papermake {

// Entry point for front ends: loads templates from storage and renders them
// through pooled Worlds. Safe to call from several threads if the Storage is.
class RenderService {
public:
    RenderService(Storage& storage, Config config);

    // Throws NotFoundError for unknown ids
    RenderResult render(const TemplateId& id, const Value& data,
                        const std::optional<RenderOptions>& options = std::nullopt);
    RenderResult render(const Template& tpl, const Value& data,
                        const std::optional<RenderOptions>& options = std::nullopt);

    // Template mutations go through the service so pooled Worlds stay current
    void save_template(const Template& tpl);
    void update_template(const TemplateId& id, const TemplateUpdate& changes);
    void delete_template(const TemplateId& id);

    Storage& storage() { return storage_; }
    WorldPool& pool() { return pool_; }
    const Config& config() const { return config_; }

private:
    Storage& storage_;
    Config config_;
    WorldPool pool_;
};

} // namespace papermake

#endif // PAPERMAKE_RENDER_RENDER_SERVICE_H
