#pragma once

#include "railmap/core/types.h"
#include "railmap/network/route.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace railmap {

enum class EntityKind : std::uint8_t {
    Scheduled = 0, // follows its route, advanced by the animator
    Manual = 1,    // placed by the user, free-form, never advanced
};

// Consumer-facing entity record. The engine writes position/tangent; speed
// and delay are whatever the consumer last supplied.
struct EntityRecord {
    EntityId id;
    EntityKind kind;
    Point2 position;  // world space
    Point2 tangent;   // world space, not normalized
    Point2 laneOffset; // visual de-overlap shift, added only when drawing
    bool boundToPath;
    bool draggable;
    double speed;
    double maxSpeed;
    double delay;
    Route route;
    double initialProgress; // seeds the animator on first observation
    WaypointId homeWaypoint; // nearest waypoint at placement (manual entities)
    std::uint32_t laneIndex;
};

// Arena of entities addressed by id. Iteration order is insertion order.
class EntityStore {
public:
    EntityStore() = default;

    void clear() noexcept;

    EntityId allocateId() noexcept { return nextId_++; }

    // Inserts or replaces `record` (by record.id). A record with
    // kInvalidEntityId is rejected. New records get the next lane index.
    bool upsert(const EntityRecord& record);
    bool remove(EntityId id);

    EntityRecord* get(EntityId id);
    const EntityRecord* get(EntityId id) const;

    const std::vector<EntityId>& order() const noexcept { return order_; }
    std::size_t size() const noexcept { return order_.size(); }

    // Topmost (latest inserted) draggable entity whose drawn marker lies
    // within `radius` world units of `world`, or kInvalidEntityId.
    EntityId pick(const Point2& world, double radius) const;

private:
    std::vector<EntityRecord> records_;
    std::unordered_map<EntityId, std::size_t> index_;
    std::vector<EntityId> order_;
    EntityId nextId_{1};
    std::uint32_t nextLane_{0};
};

} // namespace railmap
