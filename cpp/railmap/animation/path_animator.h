#pragma once

#include "railmap/core/map_config.h"
#include "railmap/core/types.h"
#include "railmap/entity/entity_store.h"
#include "railmap/events/event_queue.h"
#include "railmap/geometry/polyline.h"
#include "railmap/network/path_registry.h"
#include "railmap/viewport/animation_loop.h"
#include <cstdint>
#include <unordered_map>

namespace railmap {

struct PathProgress {
    EntityId entityId;
    double progress; // [0, 1)
    WaypointId currentWaypoint;
    WaypointId nextWaypoint;
};

// Advances bound entities along their route at constant arc-length rate.
// Owns every PathProgress; nothing else writes them.
class PathAnimator {
public:
    PathAnimator(EntityStore& entities, const PathRegistry& registry, EventQueue& events);

    void configure(const AnimatorConfig& config) { config_ = config; }
    const AnimatorConfig& config() const noexcept { return config_; }

    // Periodic loop control. tick() is a no-op while stopped.
    std::uint32_t start() noexcept { return loop_.start(); }
    void stop() noexcept { loop_.cancel(); }
    bool isRunning() const noexcept { return loop_.isRunning(); }

    // One fixed tick for every bound entity. `dragSuppressedId` names the
    // entity currently held by a drag: its progress still advances but its
    // position is left to the drag.
    bool tick(EntityId dragSuppressedId = kInvalidEntityId);
    bool tick(std::uint32_t token, EntityId dragSuppressedId);

    // Progress record for `id`, created from the entity's route on first use.
    // nullptr when the entity is unknown, unbound, or has no route.
    const PathProgress* ensureProgress(EntityId id);
    const PathProgress* progressOf(EntityId id) const;

    // Re-seeds progress (clamped into [0, 1)) without moving along the route.
    bool setProgress(EntityId id, double progress);

    // Per-tick progress increment for `rec` under the current config.
    double incrementFor(const EntityRecord& rec) const;

    void forget(EntityId id) { progress_.erase(id); }
    void clear() { progress_.clear(); }

    std::size_t trackedCount() const noexcept { return progress_.size(); }
    std::uint32_t tickCount() const noexcept { return tickCount_; }
    std::uint32_t lastUnresolvedCount() const noexcept { return lastUnresolved_; }

private:
    EntityStore& entities_;
    const PathRegistry& registry_;
    EventQueue& events_;
    AnimatorConfig config_;
    AnimationLoop loop_;

    std::unordered_map<EntityId, PathProgress> progress_;
    Polyline scratchPath_;
    std::uint32_t tickCount_{0};
    std::uint32_t lastUnresolved_{0};

    void advance(EntityRecord& rec, PathProgress& prog, bool writePosition);
    void holdAtWaypoint(EntityRecord& rec, WaypointId waypoint, bool writePosition);
    Point2 laneOffset(const EntityRecord& rec, const Point2& tangent) const;
};

} // namespace railmap
