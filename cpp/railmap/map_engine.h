#pragma once

#include "railmap/animation/path_animator.h"
#include "railmap/core/map_config.h"
#include "railmap/core/types.h"
#include "railmap/entity/entity_store.h"
#include "railmap/events/event_queue.h"
#include "railmap/interaction/gesture_session.h"
#include "railmap/network/path_registry.h"
#include "railmap/network/route.h"
#include "railmap/protocol/protocol_types.h"
#include "railmap/viewport/viewport_controller.h"

#include <cstdint>
#include <string>
#include <vector>

namespace railmap {

// Interactive network-map engine: one viewport, one gesture session, one
// path animator, all single-threaded and driven by the host's callbacks.
//
// The host forwards raw input, calls stepInertia() every animation frame
// while isInertiaActive(), calls tickAnimation() on its fixed animator
// timer, and reads getViewport()/getEntityPose() when drawing.
class MapEngine {
    friend class MapEngineTestAccessor;
public:
    MapEngine();
    explicit MapEngine(const MapConfig& config);
    ~MapEngine();

    MapEngine(const MapEngine&) = delete;
    MapEngine& operator=(const MapEngine&) = delete;

    // Rejects invalid configs (MapError::InvalidConfig) and keeps the old one.
    bool setConfig(const MapConfig& config);
    const MapConfig& getConfig() const { return config_; }

    // ==============================================================================
    // Topology
    // ==============================================================================
    void setProjection(const GeoBounds& bounds, const MapSize& size);
    bool addWaypoint(WaypointId id, const std::string& code, const std::string& name,
                     WaypointKind kind, std::uint32_t platforms, const Point2& position);
    bool addGeoWaypoint(WaypointId id, const std::string& code, const std::string& name,
                        WaypointKind kind, std::uint32_t platforms, const GeoCoord& coord);
    bool addLine(const RailLine& line);
    bool addGeoLine(const std::string& id, const std::string& name, LineKind kind, bool electrified,
                    const std::vector<WaypointId>& waypoints, const std::vector<GeoCoord>& coords);
    bool addFallbackSegment(WaypointId a, WaypointId b, const Point2& start, const Point2& end);
    void clearTopology();
    std::vector<WaypointId> getWaypointIds() const { return registry_.waypointIds(); }

    // ==============================================================================
    // Entities
    // ==============================================================================
    EntityId addScheduledEntity(const Route& route, double speed, double delay, double initialProgress);
    EntityId addManualEntity(const Point2& world);
    bool setEntityMotion(EntityId id, double speed, double delay);
    bool setEntityRoute(EntityId id, const Route& route);
    bool setEntityBound(EntityId id, bool bound);
    bool removeEntity(EntityId id);
    // Drops every entity and its progress, ending any drag.
    void clearEntities();

    protocol::EntityPose getEntityPose(EntityId id) const;
    const EntityRecord* getEntity(EntityId id) const { return entities_.get(id); }
    const PathProgress* getProgress(EntityId id) const { return animator_.progressOf(id); }
    std::vector<EntityId> getEntityIds() const { return entities_.order(); }

    // ==============================================================================
    // Viewport
    // ==============================================================================
    Viewport getViewport() const { return viewport_.viewport(); }
    Point2 worldToScreen(const Point2& world) const { return viewport_.worldToScreen(world); }
    Point2 screenToWorld(const Point2& screen) const { return viewport_.screenToWorld(screen); }
    void zoomAt(const Point2& anchorScreen, double factor);
    void panBy(const Point2& delta);
    void resetView();
    void setViewportSize(double width, double height) { viewport_.setViewportSize(width, height); }
    void zoomIn();
    void zoomOut();
    int getZoomPercent() const { return viewport_.zoomPercent(); }

    // ==============================================================================
    // Input
    // ==============================================================================
    void setPlaceMode(bool enabled) { gestures_.setPlaceMode(enabled); }
    bool isPlaceMode() const { return gestures_.placeMode(); }
    void pointerDown(const Point2& screen, double timeMs);
    void pointerMove(const Point2& screen, double timeMs);
    void pointerUp(double timeMs);
    void touchStart(const std::vector<Point2>& touches, double timeMs);
    void touchMove(const std::vector<Point2>& touches, double timeMs);
    void touchEnd(std::uint32_t remaining, double timeMs);
    void wheel(const Point2& cursor, double deltaY);
    void doubleClick(const Point2& point);

    protocol::GestureState getGestureState() const { return gestures_.state(); }
    EntityId getDraggedEntity() const { return gestures_.draggedEntity(); }

    // ==============================================================================
    // Animation loops
    // ==============================================================================
    bool stepInertia(double dtMs);
    bool isInertiaActive() const { return viewport_.isInertiaActive(); }

    void startAnimation();
    void stopAnimation();
    bool isAnimating() const { return animator_.isRunning(); }
    double getAnimationTickMs() const { return config_.animator.tickMs; }
    // One fixed animator tick. No-op (false) while the animation is stopped.
    bool tickAnimation();

    // Cancels every running loop and any active gesture. Called on view teardown.
    void teardown();

    // ==============================================================================
    // Events / errors / stats
    // ==============================================================================
    std::vector<protocol::MapEvent> pollEvents(std::uint32_t maxEvents);

    MapError getLastError() const { return lastError_; }
    void clearError() const { lastError_ = MapError::Ok; }

    protocol::MapStats getStats() const;

private:
    MapConfig config_;
    PathRegistry registry_;
    EntityStore entities_;
    EventQueue events_;
    ViewportController viewport_;
    PathAnimator animator_;
    GestureSessionManager gestures_;

    mutable MapError lastError_{MapError::Ok};
    double lastTickMs_{0.0};

    void setError(MapError err) const { lastError_ = err; }
    void applyConfig();
};

} // namespace railmap
