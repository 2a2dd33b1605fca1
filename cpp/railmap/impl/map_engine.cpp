// MapEngine lifecycle, configuration, topology and entity management.

#include "railmap/map_engine.h"
#include "railmap/core/logging.h"
#include <algorithm>
#include <cmath>

namespace railmap {

namespace {
bool validRoute(const Route& route) {
    return !route.empty()
        && std::find(route.begin(), route.end(), kInvalidWaypointId) == route.end();
}

double clampSpeed(double speed, double maxSpeed) {
    if (!std::isfinite(speed) || speed < 0.0) return 0.0;
    if (maxSpeed > 0.0 && speed > maxSpeed) return maxSpeed;
    return speed;
}
} // namespace

MapEngine::MapEngine()
    : MapEngine(MapConfig{}) {
}

MapEngine::MapEngine(const MapConfig& config)
    : config_(),
      events_(map_constants::EVENT_QUEUE_CAPACITY),
      animator_(entities_, registry_, events_),
      gestures_(viewport_, entities_, registry_, animator_, events_) {
    if (validateConfig(config)) {
        config_ = config;
    } else {
        RAILMAP_LOG_WARN("invalid map config, falling back to defaults");
        setError(MapError::InvalidConfig);
    }
    applyConfig();
}

MapEngine::~MapEngine() {
    teardown();
}

void MapEngine::applyConfig() {
    viewport_.configure(config_.viewport, config_.inertia);
    gestures_.configure(config_.gesture);
    animator_.configure(config_.animator);
}

bool MapEngine::setConfig(const MapConfig& config) {
    if (!validateConfig(config)) {
        setError(MapError::InvalidConfig);
        return false;
    }
    config_ = config;
    applyConfig();
    return true;
}

// ==============================================================================
// Topology
// ==============================================================================

void MapEngine::setProjection(const GeoBounds& bounds, const MapSize& size) {
    registry_.setProjection(bounds, size);
}

bool MapEngine::addWaypoint(WaypointId id, const std::string& code, const std::string& name,
                            WaypointKind kind, std::uint32_t platforms, const Point2& position) {
    Waypoint wp{};
    wp.id = id;
    wp.code = code;
    wp.name = name;
    wp.kind = kind;
    wp.platforms = platforms;
    wp.position = position;
    wp.hasGeo = false;
    if (!registry_.addWaypoint(wp)) {
        setError(MapError::UnknownWaypoint);
        return false;
    }
    return true;
}

bool MapEngine::addGeoWaypoint(WaypointId id, const std::string& code, const std::string& name,
                               WaypointKind kind, std::uint32_t platforms, const GeoCoord& coord) {
    if (!registry_.addGeoWaypoint(id, code, name, kind, platforms, coord)) {
        setError(MapError::UnknownWaypoint);
        return false;
    }
    return true;
}

bool MapEngine::addLine(const RailLine& line) {
    if (!registry_.addLine(line)) {
        setError(MapError::InvalidPath);
        return false;
    }
    return true;
}

bool MapEngine::addGeoLine(const std::string& id, const std::string& name, LineKind kind, bool electrified,
                           const std::vector<WaypointId>& waypoints, const std::vector<GeoCoord>& coords) {
    if (!registry_.addGeoLine(id, name, kind, electrified, waypoints, coords)) {
        setError(MapError::InvalidPath);
        return false;
    }
    return true;
}

bool MapEngine::addFallbackSegment(WaypointId a, WaypointId b, const Point2& start, const Point2& end) {
    if (!registry_.addFallbackSegment(a, b, start, end)) {
        setError(MapError::InvalidPath);
        return false;
    }
    return true;
}

void MapEngine::clearTopology() {
    registry_.clear();
}

// ==============================================================================
// Entities
// ==============================================================================

EntityId MapEngine::addScheduledEntity(const Route& route, double speed, double delay, double initialProgress) {
    if (!validRoute(route)) {
        setError(MapError::InvalidRoute);
        return kInvalidEntityId;
    }

    EntityRecord rec{};
    rec.id = entities_.allocateId();
    rec.kind = EntityKind::Scheduled;
    rec.tangent = Point2{1.0, 0.0};
    rec.boundToPath = true;
    rec.draggable = true;
    rec.speed = clampSpeed(speed, 0.0);
    rec.delay = std::isfinite(delay) ? delay : 0.0;
    rec.route = route;
    rec.initialProgress = initialProgress;
    rec.homeWaypoint = route.front();
    if (const Waypoint* wp = registry_.getWaypoint(route.front())) {
        rec.position = wp->position;
    }
    entities_.upsert(rec);
    return rec.id;
}

EntityId MapEngine::addManualEntity(const Point2& world) {
    if (!isFinite(world)) {
        setError(MapError::InvalidOperation);
        return kInvalidEntityId;
    }
    EntityRecord rec{};
    rec.id = entities_.allocateId();
    rec.kind = EntityKind::Manual;
    rec.position = world;
    rec.tangent = Point2{1.0, 0.0};
    rec.boundToPath = false;
    rec.draggable = true;
    rec.maxSpeed = map_constants::MANUAL_MAX_SPEED;
    rec.homeWaypoint = registry_.nearestWaypoint(world);
    entities_.upsert(rec);
    return rec.id;
}

bool MapEngine::setEntityMotion(EntityId id, double speed, double delay) {
    EntityRecord* rec = entities_.get(id);
    if (!rec) {
        setError(MapError::UnknownEntity);
        return false;
    }
    rec->speed = clampSpeed(speed, rec->maxSpeed);
    rec->delay = std::isfinite(delay) ? delay : 0.0;
    return true;
}

bool MapEngine::setEntityRoute(EntityId id, const Route& route) {
    EntityRecord* rec = entities_.get(id);
    if (!rec) {
        setError(MapError::UnknownEntity);
        return false;
    }
    if (!validRoute(route)) {
        setError(MapError::InvalidRoute);
        return false;
    }
    rec->route = route;
    rec->initialProgress = 0.0;
    animator_.forget(id);
    return true;
}

bool MapEngine::setEntityBound(EntityId id, bool bound) {
    EntityRecord* rec = entities_.get(id);
    if (!rec) {
        setError(MapError::UnknownEntity);
        return false;
    }
    if (bound && rec->route.empty()) {
        setError(MapError::InvalidRoute);
        return false;
    }
    rec->boundToPath = bound;
    return true;
}

bool MapEngine::removeEntity(EntityId id) {
    if (!entities_.remove(id)) {
        setError(MapError::UnknownEntity);
        return false;
    }
    gestures_.releaseEntity(id);
    animator_.forget(id);
    return true;
}

void MapEngine::clearEntities() {
    gestures_.cancel();
    animator_.clear();
    entities_.clear();
}

protocol::EntityPose MapEngine::getEntityPose(EntityId id) const {
    const EntityRecord* rec = entities_.get(id);
    if (!rec) {
        setError(MapError::UnknownEntity);
        return protocol::EntityPose{Point2{0.0, 0.0}, Point2{1.0, 0.0}, Point2{0.0, 0.0}, 0};
    }
    return protocol::EntityPose{rec->position, rec->tangent, rec->laneOffset, 1};
}

} // namespace railmap
