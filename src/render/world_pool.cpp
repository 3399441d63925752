// src/render/world_pool.cpp
#include "papermake/render/world_pool.h"
#include "papermake/common/log.h"

namespace papermake {

WorldLease::WorldLease(WorldPool* pool, std::unique_ptr<World> world, uint64_t epoch)
    : pool_(pool), world_(std::move(world)), epoch_(epoch) {}

WorldLease::~WorldLease() {
    release();
}

WorldLease::WorldLease(WorldLease&& other) noexcept
    : pool_(other.pool_), world_(std::move(other.world_)), epoch_(other.epoch_) {
    other.pool_ = nullptr;
}

WorldLease& WorldLease::operator=(WorldLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        world_ = std::move(other.world_);
        epoch_ = other.epoch_;
        other.pool_ = nullptr;
    }
    return *this;
}

void WorldLease::adopt(std::unique_ptr<World> world) {
    world_ = std::move(world);
}

void WorldLease::discard() {
    world_.reset();
}

void WorldLease::release() {
    if (pool_) {
        pool_->give_back(std::move(world_), epoch_);
        pool_ = nullptr;
    }
    world_.reset();
}

WorldPool::WorldPool(size_t max_idle_per_template, size_t max_idle_total)
    : max_idle_(max_idle_per_template), max_total_(max_idle_total) {}

WorldLease WorldPool::acquire(const Template& tpl) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++outstanding_;
    auto it = idle_.find(tpl.id());
    if (it != idle_.end()) {
        auto& worlds = it->second;
        std::unique_ptr<World> found;
        while (!worlds.empty() && !found) {
            std::unique_ptr<World> world = std::move(worlds.back());
            worlds.pop_back();
            --total_idle_;
            if (world->matches(tpl)) {
                found = std::move(world);
            } else {
                log_debug("World pool: dropping stale world for template '" + tpl.id().value + "'");
            }
        }
        if (worlds.empty()) idle_.erase(it);
        if (found) return WorldLease(this, std::move(found), epoch_);
    }
    log_debug("World pool: no idle world for template '" + tpl.id().value + "'");
    return WorldLease(this, nullptr, epoch_);
}

void WorldPool::give_back(std::unique_ptr<World> world, uint64_t epoch) {
    // Input data must not outlive the render that bound it
    if (world) world->clear_data();

    std::lock_guard<std::mutex> lock(mutex_);
    if (outstanding_ > 0) --outstanding_;

    if (world) {
        const TemplateId& id = world->template_id();
        auto invalidated = invalidated_at_.find(id);
        if (epoch < cleared_at_ || (invalidated != invalidated_at_.end() && epoch < invalidated->second)) {
            log_debug("World pool: dropping world of invalidated template '" + id.value + "'");
        } else if (total_idle_ >= max_total_) {
            log_debug("World pool: at total capacity, dropping world for template '" + id.value + "'");
        } else {
            auto& worlds = idle_[id];
            if (worlds.size() >= max_idle_) {
                log_debug("World pool: at capacity for template '" + id.value + "', dropping world");
            } else {
                worlds.push_back(std::move(world));
                ++total_idle_;
            }
        }
    }

    if (outstanding_ == 0) invalidated_at_.clear();
}

void WorldPool::invalidate(const TemplateId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++epoch_;
    if (outstanding_ > 0) invalidated_at_[id] = epoch_;
    auto it = idle_.find(id);
    if (it != idle_.end()) {
        total_idle_ -= it->second.size();
        idle_.erase(it);
    }
}

void WorldPool::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++epoch_;
    cleared_at_ = epoch_;
    invalidated_at_.clear();
    idle_.clear();
    total_idle_ = 0;
}

size_t WorldPool::idle_count(const TemplateId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = idle_.find(id);
    return it == idle_.end() ? 0 : it->second.size();
}

size_t WorldPool::total_idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_idle_;
}

} // namespace papermake
