#pragma once

/**
 * Enums and POD structs exchanged between the map engine and its host
 * (renderer, dashboard panels, JS glue).
 */

#include "railmap/core/types.h"
#include <cstdint>

namespace railmap {
namespace protocol {

// =============================================================================
// Events
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    EntityCreated = 2,   // place mode: a manual entity was dropped on the map
    EntityMoved = 3,     // a drag wrote a new entity position
    WaypointReached = 4, // an entity rolled over onto its next leg
};

struct MapEvent {
    std::uint16_t type;
    std::uint16_t flags;
    EntityId entityId;
    WaypointId waypointId;
    double x; // world space
    double y;
};

// =============================================================================
// Gesture state
// =============================================================================

enum class GestureState : std::uint8_t {
    Idle = 0,
    Panning = 1,
    Pinching = 2,
    DraggingEntity = 3,
};

// =============================================================================
// Pose handed to marker rendering
// =============================================================================

struct EntityPose {
    Point2 position; // world space
    Point2 tangent;  // world space, not normalized
    Point2 laneOffset; // add to position when placing the marker
    std::uint32_t valid;
};

// =============================================================================
// Engine statistics
// =============================================================================

struct MapStats {
    std::uint32_t entityCount;
    std::uint32_t trackedProgressCount;
    std::uint32_t waypointCount;
    std::uint32_t lineCount;
    std::uint32_t topologyGeneration;
    std::uint32_t animationTickCount;
    std::uint32_t unresolvedPathCount; // holds during the last animator tick
    std::uint32_t pendingEventCount;
    double lastTickMs;
};

} // namespace protocol
} // namespace railmap
