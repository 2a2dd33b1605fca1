#pragma once

#include "railmap/animation/path_animator.h"
#include "railmap/core/map_config.h"
#include "railmap/core/types.h"
#include "railmap/entity/entity_store.h"
#include "railmap/events/event_queue.h"
#include "railmap/network/path_registry.h"
#include "railmap/protocol/protocol_types.h"
#include "railmap/viewport/viewport_controller.h"
#include <cstddef>

namespace railmap {

// Turns raw pointer/touch/wheel input into viewport and entity mutations.
// At most one session is active: starting any gesture cancels inertia and
// whatever session was running.
class GestureSessionManager {
public:
    GestureSessionManager(ViewportController& viewport, EntityStore& entities, const PathRegistry& registry,
                          PathAnimator& animator, EventQueue& events);

    void configure(const GestureConfig& config) { config_ = config; }

    void setPlaceMode(bool enabled) noexcept { placeMode_ = enabled; }
    bool placeMode() const noexcept { return placeMode_; }

    // ==============================================================================
    // Pointer (mouse, pen, single touch)
    // ==============================================================================
    void pointerDown(const Point2& screen, double timeMs);
    void pointerMove(const Point2& screen, double timeMs);
    void pointerUp(double timeMs);

    // ==============================================================================
    // Multi-touch. `touches` holds every finger currently on the surface.
    // ==============================================================================
    void touchStart(const Point2* touches, std::size_t count, double timeMs);
    void touchMove(const Point2* touches, std::size_t count, double timeMs);
    void touchEnd(std::size_t remaining, double timeMs);

    // ==============================================================================
    // Single-shot zoom gestures
    // ==============================================================================
    void wheel(const Point2& cursor, double deltaY);
    void doubleClick(const Point2& point);

    // Drops the active session without inertia.
    void cancel();

    // Drops an entity drag targeting `id` (entity removed).
    void releaseEntity(EntityId id);

    protocol::GestureState state() const noexcept { return session_.state; }
    EntityId draggedEntity() const noexcept {
        return session_.state == protocol::GestureState::DraggingEntity ? session_.entityId : kInvalidEntityId;
    }
    const Point2& velocity() const noexcept { return session_.velocity; }
    double pinchStartDistance() const noexcept { return session_.pinch.startDistance; }
    double pinchLastDistance() const noexcept { return session_.pinch.lastDistance; }
    const Point2& pinchCenter() const noexcept { return session_.pinch.lastCenter; }

private:
    ViewportController& viewport_;
    EntityStore& entities_;
    const PathRegistry& registry_;
    PathAnimator& animator_;
    EventQueue& events_;
    GestureConfig config_;
    bool placeMode_{false};

    struct PinchState {
        double startDistance = 0.0;
        double lastDistance = 0.0;
        Point2 lastCenter{0.0, 0.0};
    };

    struct SessionState {
        protocol::GestureState state = protocol::GestureState::Idle;
        EntityId entityId = kInvalidEntityId;
        Point2 lastPoint{0.0, 0.0};
        double lastTimeMs = 0.0;
        Point2 velocity{0.0, 0.0};
        PinchState pinch;
    };

    SessionState session_;
    Polyline scratchPath_;

    void beginSession(protocol::GestureState state, const Point2& screen, double timeMs);
    EntityId placeEntity(const Point2& world);
    void dragEntityTo(const Point2& screen);
    void beginPinch(const Point2& a, const Point2& b);
    void updatePinch(const Point2& a, const Point2& b);
};

} // namespace railmap
