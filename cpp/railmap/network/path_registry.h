#pragma once

#include "railmap/core/types.h"
#include "railmap/geometry/polyline.h"
#include "railmap/network/geo.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace railmap {

enum class WaypointKind : std::uint8_t {
    Junction = 0,
    Terminal = 1,
    Halt = 2,
};

enum class LineKind : std::uint8_t {
    Main = 0,
    Branch = 1,
    Electrified = 2,
};

struct Waypoint {
    WaypointId id;
    std::string code;
    std::string name;
    WaypointKind kind;
    std::uint32_t platforms;
    Point2 position;   // world space
    bool hasGeo;
    GeoCoord geo;
};

struct RailLine {
    std::string id;
    std::string name;
    LineKind kind;
    bool electrified;
    std::vector<WaypointId> waypoints; // waypoints served, in path order
    Polyline points;                   // world space
};

struct NetworkStats {
    std::uint32_t waypointCount;
    std::uint32_t lineCount;
    std::uint32_t electrifiedLineCount;
    std::uint32_t junctionCount;
    std::uint32_t terminalCount;
    std::uint32_t haltCount;
    std::uint32_t totalPlatforms;
};

// Waypoint-pair -> polyline lookup. Lines are searched first, then the
// simplified fallback segments, then a straight leg between the two known
// waypoint positions.
class PathRegistry {
public:
    PathRegistry();

    void clear();

    // Projection applied by the *Geo registration helpers.
    void setProjection(const GeoBounds& bounds, const MapSize& size);

    bool addWaypoint(const Waypoint& waypoint);
    bool addGeoWaypoint(WaypointId id, const std::string& code, const std::string& name,
                        WaypointKind kind, std::uint32_t platforms, const GeoCoord& coord);
    bool addLine(const RailLine& line);
    bool addGeoLine(const std::string& id, const std::string& name, LineKind kind, bool electrified,
                    const std::vector<WaypointId>& waypoints, const std::vector<GeoCoord>& coords);
    bool addFallbackSegment(WaypointId a, WaypointId b, const Point2& start, const Point2& end);

    // Fills `out` with the path from `a` towards `b`. A line serving both
    // waypoints contributes only the stretch between them. Returns false when
    // the pair cannot be resolved; callers hold the entity where it is.
    bool resolvePath(WaypointId a, WaypointId b, Polyline& out) const;

    const Waypoint* getWaypoint(WaypointId id) const;
    const std::vector<Waypoint>& waypoints() const { return waypoints_; }
    const std::vector<RailLine>& lines() const { return lines_; }
    std::vector<WaypointId> waypointIds() const;

    // Nearest registered waypoint by world distance, kInvalidWaypointId if none.
    WaypointId nearestWaypoint(const Point2& world) const;

    std::vector<const Waypoint*> searchWaypoints(const std::string& query) const;
    std::vector<const Waypoint*> waypointsByKind(WaypointKind kind) const;
    std::vector<const RailLine*> linesByKind(LineKind kind) const;
    std::vector<const RailLine*> electrifiedLines() const;

    // 0 when either waypoint is unknown or carries no geographic coordinate.
    double greatCircleDistanceKm(WaypointId a, WaypointId b) const;

    NetworkStats networkStats() const;

    // Bumped on every topology mutation.
    std::uint32_t generation() const noexcept { return generation_; }

private:
    struct FallbackSegment {
        WaypointId a;
        WaypointId b;
        Point2 start;
        Point2 end;
    };

    GeoBounds bounds_;
    MapSize mapSize_;
    std::vector<Waypoint> waypoints_;
    std::unordered_map<WaypointId, std::size_t> waypointIndex_;
    std::vector<RailLine> lines_;
    std::vector<FallbackSegment> fallbacks_;
    std::uint32_t generation_{0};

    bool anchorOnLine(const RailLine& line, WaypointId id, Point2& out) const;
};

} // namespace railmap
