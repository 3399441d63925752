// papermake/render/world_pool.h
#ifndef PAPERMAKE_RENDER_WORLD_POOL_H
#define PAPERMAKE_RENDER_WORLD_POOL_H

#include "papermake/template/template.h"
#include "papermake/typeset/world.h"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace papermake {

class WorldPool;

// Exclusive hold on one World. Returns it to the pool on destruction unless
// discarded. An empty lease means the pool had no reusable World.
class WorldLease {
public:
    WorldLease() = default;
    ~WorldLease();

    WorldLease(WorldLease&& other) noexcept;
    WorldLease& operator=(WorldLease&& other) noexcept;
    WorldLease(const WorldLease&) = delete;
    WorldLease& operator=(const WorldLease&) = delete;

    World* get() const { return world_.get(); }
    explicit operator bool() const { return world_ != nullptr; }

    // Takes ownership of a freshly built World so it is pooled on release
    void adopt(std::unique_ptr<World> world);
    // Drops the World instead of returning it, e.g. after an aborted render
    void discard();

private:
    friend class WorldPool;
    WorldLease(WorldPool* pool, std::unique_ptr<World> world, uint64_t epoch);
    void release();

    WorldPool* pool_ = nullptr;
    std::unique_ptr<World> world_;
    uint64_t epoch_ = 0; // pool epoch at acquire
};

// Idle Worlds keyed by template id; thread-safe. The pool must outlive its leases.
// Idle Worlds hold no input data. Worlds leased before an invalidate() or clear()
// of their template are dropped when the lease ends.
class WorldPool {
public:
    explicit WorldPool(size_t max_idle_per_template = 4, size_t max_idle_total = 64);

    WorldLease acquire(const Template& tpl);
    void invalidate(const TemplateId& id);
    void clear();

    size_t idle_count(const TemplateId& id) const;
    size_t total_idle() const;
    size_t max_idle_per_template() const { return max_idle_; }
    size_t max_idle_total() const { return max_total_; }

private:
    friend class WorldLease;
    // Ends a lease; world may be null when the lease was empty or discarded
    void give_back(std::unique_ptr<World> world, uint64_t epoch);

    size_t max_idle_;
    size_t max_total_;
    mutable std::mutex mutex_;
    std::map<TemplateId, std::vector<std::unique_ptr<World>>> idle_;
    size_t total_idle_ = 0;
    size_t outstanding_ = 0; // leases not yet released
    uint64_t epoch_ = 0;
    uint64_t cleared_at_ = 0;
    // Only needed while leases are outstanding; emptied when the last one ends
    std::map<TemplateId, uint64_t> invalidated_at_;
};

} // namespace papermake

#endif // PAPERMAKE_RENDER_WORLD_POOL_H
