#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "railmap/map_engine.h"

#ifdef EMSCRIPTEN
using namespace railmap;

EMSCRIPTEN_BINDINGS(railmap_engine_module) {
    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<GeoCoord>("GeoCoord")
        .field("lat", &GeoCoord::lat)
        .field("lng", &GeoCoord::lng);

    emscripten::value_object<GeoBounds>("GeoBounds")
        .field("north", &GeoBounds::north)
        .field("south", &GeoBounds::south)
        .field("east", &GeoBounds::east)
        .field("west", &GeoBounds::west);

    emscripten::value_object<MapSize>("MapSize")
        .field("width", &MapSize::width)
        .field("height", &MapSize::height);

    emscripten::value_object<Viewport>("Viewport")
        .field("zoom", &Viewport::zoom)
        .field("pan", &Viewport::pan);

    emscripten::value_object<protocol::EntityPose>("EntityPose")
        .field("position", &protocol::EntityPose::position)
        .field("tangent", &protocol::EntityPose::tangent)
        .field("laneOffset", &protocol::EntityPose::laneOffset)
        .field("valid", &protocol::EntityPose::valid);

    emscripten::value_object<protocol::MapEvent>("MapEvent")
        .field("type", &protocol::MapEvent::type)
        .field("flags", &protocol::MapEvent::flags)
        .field("entityId", &protocol::MapEvent::entityId)
        .field("waypointId", &protocol::MapEvent::waypointId)
        .field("x", &protocol::MapEvent::x)
        .field("y", &protocol::MapEvent::y);

    emscripten::value_object<protocol::MapStats>("MapStats")
        .field("entityCount", &protocol::MapStats::entityCount)
        .field("trackedProgressCount", &protocol::MapStats::trackedProgressCount)
        .field("waypointCount", &protocol::MapStats::waypointCount)
        .field("lineCount", &protocol::MapStats::lineCount)
        .field("topologyGeneration", &protocol::MapStats::topologyGeneration)
        .field("animationTickCount", &protocol::MapStats::animationTickCount)
        .field("unresolvedPathCount", &protocol::MapStats::unresolvedPathCount)
        .field("pendingEventCount", &protocol::MapStats::pendingEventCount)
        .field("lastTickMs", &protocol::MapStats::lastTickMs);

    emscripten::enum_<protocol::EventType>("EventType")
        .value("Overflow", protocol::EventType::Overflow)
        .value("EntityCreated", protocol::EventType::EntityCreated)
        .value("EntityMoved", protocol::EventType::EntityMoved)
        .value("WaypointReached", protocol::EventType::WaypointReached);

    emscripten::enum_<protocol::GestureState>("GestureState")
        .value("Idle", protocol::GestureState::Idle)
        .value("Panning", protocol::GestureState::Panning)
        .value("Pinching", protocol::GestureState::Pinching)
        .value("DraggingEntity", protocol::GestureState::DraggingEntity);

    emscripten::enum_<WaypointKind>("WaypointKind")
        .value("Junction", WaypointKind::Junction)
        .value("Terminal", WaypointKind::Terminal)
        .value("Halt", WaypointKind::Halt);

    emscripten::enum_<LineKind>("LineKind")
        .value("Main", LineKind::Main)
        .value("Branch", LineKind::Branch)
        .value("Electrified", LineKind::Electrified);

    emscripten::enum_<MapError>("MapError")
        .value("Ok", MapError::Ok)
        .value("UnknownEntity", MapError::UnknownEntity)
        .value("UnknownWaypoint", MapError::UnknownWaypoint)
        .value("InvalidPath", MapError::InvalidPath)
        .value("InvalidRoute", MapError::InvalidRoute)
        .value("InvalidConfig", MapError::InvalidConfig)
        .value("InvalidOperation", MapError::InvalidOperation);

    emscripten::register_vector<Point2>("Point2Vector");
    emscripten::register_vector<GeoCoord>("GeoCoordVector");
    emscripten::register_vector<std::uint32_t>("IdVector");
    emscripten::register_vector<protocol::MapEvent>("MapEventVector");

    emscripten::function("makeCircularRoute", &makeCircularRoute);

    emscripten::class_<MapEngine>("MapEngine")
        .constructor<>()
        .function("setProjection", &MapEngine::setProjection)
        .function("addWaypoint", &MapEngine::addWaypoint)
        .function("addGeoWaypoint", &MapEngine::addGeoWaypoint)
        .function("addGeoLine", &MapEngine::addGeoLine)
        .function("addFallbackSegment", &MapEngine::addFallbackSegment)
        .function("clearTopology", &MapEngine::clearTopology)
        .function("getWaypointIds", &MapEngine::getWaypointIds)
        .function("addScheduledEntity", &MapEngine::addScheduledEntity)
        .function("addManualEntity", &MapEngine::addManualEntity)
        .function("setEntityMotion", &MapEngine::setEntityMotion)
        .function("setEntityRoute", &MapEngine::setEntityRoute)
        .function("setEntityBound", &MapEngine::setEntityBound)
        .function("removeEntity", &MapEngine::removeEntity)
        .function("clearEntities", &MapEngine::clearEntities)
        .function("getEntityPose", &MapEngine::getEntityPose)
        .function("getEntityIds", &MapEngine::getEntityIds)
        .function("getViewport", &MapEngine::getViewport)
        .function("worldToScreen", &MapEngine::worldToScreen)
        .function("screenToWorld", &MapEngine::screenToWorld)
        .function("zoomAt", &MapEngine::zoomAt)
        .function("panBy", &MapEngine::panBy)
        .function("resetView", &MapEngine::resetView)
        .function("setViewportSize", &MapEngine::setViewportSize)
        .function("zoomIn", &MapEngine::zoomIn)
        .function("zoomOut", &MapEngine::zoomOut)
        .function("getZoomPercent", &MapEngine::getZoomPercent)
        .function("setPlaceMode", &MapEngine::setPlaceMode)
        .function("isPlaceMode", &MapEngine::isPlaceMode)
        .function("pointerDown", &MapEngine::pointerDown)
        .function("pointerMove", &MapEngine::pointerMove)
        .function("pointerUp", &MapEngine::pointerUp)
        .function("touchStart", &MapEngine::touchStart)
        .function("touchMove", &MapEngine::touchMove)
        .function("touchEnd", &MapEngine::touchEnd)
        .function("wheel", &MapEngine::wheel)
        .function("doubleClick", &MapEngine::doubleClick)
        .function("getGestureState", &MapEngine::getGestureState)
        .function("getDraggedEntity", &MapEngine::getDraggedEntity)
        .function("stepInertia", &MapEngine::stepInertia)
        .function("isInertiaActive", &MapEngine::isInertiaActive)
        .function("startAnimation", &MapEngine::startAnimation)
        .function("stopAnimation", &MapEngine::stopAnimation)
        .function("isAnimating", &MapEngine::isAnimating)
        .function("getAnimationTickMs", &MapEngine::getAnimationTickMs)
        .function("tickAnimation", &MapEngine::tickAnimation)
        .function("teardown", &MapEngine::teardown)
        .function("pollEvents", &MapEngine::pollEvents)
        .function("getLastError", &MapEngine::getLastError)
        .function("clearError", &MapEngine::clearError)
        .function("getStats", &MapEngine::getStats);
}
#endif
