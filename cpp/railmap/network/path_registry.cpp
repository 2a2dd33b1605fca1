#include "railmap/network/path_registry.h"
#include "railmap/core/logging.h"
#include <algorithm>
#include <cctype>
#include <limits>

namespace railmap {

namespace {

// Default backdrop: the Gujarat network image, 800x800 px.
constexpr GeoBounds kDefaultBounds{24.5, 19.0, 77.5, 68.5};
constexpr MapSize kDefaultMapSize{800.0, 800.0};

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool containsWaypoint(const std::vector<WaypointId>& ids, WaypointId id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool allFinite(const Polyline& points) {
    return std::all_of(points.begin(), points.end(), [](const Point2& p) { return isFinite(p); });
}

bool projectsBefore(const PolylineProjection& a, const PolylineProjection& b) {
    return a.segmentIndex < b.segmentIndex || (a.segmentIndex == b.segmentIndex && a.t < b.t);
}

void appendDistinct(Polyline& out, const Point2& p) {
    if (out.empty() || out.back() != p) out.push_back(p);
}

// Part of `points` between the projections of `from` and `to`, running from `from`.
void slicePolyline(const Polyline& points, const Point2& from, const Point2& to, Polyline& out) {
    out.clear();
    const PolylineProjection pa = projectOntoPolyline(from, points);
    const PolylineProjection pb = projectOntoPolyline(to, points);
    const bool forward = !projectsBefore(pb, pa);
    const PolylineProjection& lo = forward ? pa : pb;
    const PolylineProjection& hi = forward ? pb : pa;

    appendDistinct(out, lo.point);
    for (std::size_t i = lo.segmentIndex + 1; i <= hi.segmentIndex; ++i) {
        appendDistinct(out, points[i]);
    }
    appendDistinct(out, hi.point);
    if (!forward) std::reverse(out.begin(), out.end());
}

} // namespace

PathRegistry::PathRegistry()
    : bounds_(kDefaultBounds), mapSize_(kDefaultMapSize) {
}

void PathRegistry::clear() {
    waypoints_.clear();
    waypointIndex_.clear();
    lines_.clear();
    fallbacks_.clear();
    generation_++;
}

void PathRegistry::setProjection(const GeoBounds& bounds, const MapSize& size) {
    bounds_ = bounds;
    mapSize_ = size;
}

bool PathRegistry::addWaypoint(const Waypoint& waypoint) {
    if (waypoint.id == kInvalidWaypointId || !isFinite(waypoint.position)) return false;

    const auto it = waypointIndex_.find(waypoint.id);
    if (it != waypointIndex_.end()) {
        waypoints_[it->second] = waypoint;
    } else {
        waypointIndex_[waypoint.id] = waypoints_.size();
        waypoints_.push_back(waypoint);
    }
    generation_++;
    return true;
}

bool PathRegistry::addGeoWaypoint(WaypointId id, const std::string& code, const std::string& name,
                                  WaypointKind kind, std::uint32_t platforms, const GeoCoord& coord) {
    Waypoint wp{};
    wp.id = id;
    wp.code = code;
    wp.name = name;
    wp.kind = kind;
    wp.platforms = platforms;
    wp.position = geoToMap(coord, bounds_, mapSize_);
    wp.hasGeo = true;
    wp.geo = coord;
    return addWaypoint(wp);
}

bool PathRegistry::addLine(const RailLine& line) {
    if (line.points.empty() || line.waypoints.size() < 2 || !allFinite(line.points)) {
        RAILMAP_LOG_WARN("ignoring line '%s': needs >= 2 waypoints and finite points", line.id.c_str());
        return false;
    }
    auto it = std::find_if(lines_.begin(), lines_.end(),
                           [&](const RailLine& l) { return l.id == line.id; });
    if (it != lines_.end()) {
        *it = line;
    } else {
        lines_.push_back(line);
    }
    generation_++;
    return true;
}

bool PathRegistry::addGeoLine(const std::string& id, const std::string& name, LineKind kind, bool electrified,
                              const std::vector<WaypointId>& waypoints, const std::vector<GeoCoord>& coords) {
    RailLine line{};
    line.id = id;
    line.name = name;
    line.kind = kind;
    line.electrified = electrified;
    line.waypoints = waypoints;
    line.points.reserve(coords.size());
    for (const GeoCoord& c : coords) {
        line.points.push_back(geoToMap(c, bounds_, mapSize_));
    }
    return addLine(line);
}

bool PathRegistry::addFallbackSegment(WaypointId a, WaypointId b, const Point2& start, const Point2& end) {
    if (a == kInvalidWaypointId || b == kInvalidWaypointId || !isFinite(start) || !isFinite(end)) return false;
    fallbacks_.push_back(FallbackSegment{a, b, start, end});
    generation_++;
    return true;
}

bool PathRegistry::resolvePath(WaypointId a, WaypointId b, Polyline& out) const {
    out.clear();

    for (const RailLine& line : lines_) {
        if (line.points.size() < 2) continue;
        if (!containsWaypoint(line.waypoints, a) || !containsWaypoint(line.waypoints, b)) continue;
        Point2 from;
        Point2 to;
        if (!anchorOnLine(line, a, from) || !anchorOnLine(line, b, to)) continue;
        // Only the stretch between the two waypoints, in travel order.
        slicePolyline(line.points, from, to, out);
        if (out.size() >= 2) return true;
    }
    out.clear();

    for (const FallbackSegment& seg : fallbacks_) {
        if (seg.a == a && seg.b == b) {
            out = {seg.start, seg.end};
            return true;
        }
        if (seg.a == b && seg.b == a) {
            out = {seg.end, seg.start};
            return true;
        }
    }

    const Waypoint* wa = getWaypoint(a);
    const Waypoint* wb = getWaypoint(b);
    if (wa && wb) {
        out = {wa->position, wb->position};
        return true;
    }

    RAILMAP_LOG_DEBUG("no path between waypoints %u and %u", a, b);
    return false;
}

bool PathRegistry::anchorOnLine(const RailLine& line, WaypointId id, Point2& out) const {
    if (const Waypoint* wp = getWaypoint(id)) {
        out = wp->position;
        return true;
    }
    // Unregistered terminus: the line's own end stands in for it.
    if (id == line.waypoints.front()) {
        out = line.points.front();
        return true;
    }
    if (id == line.waypoints.back()) {
        out = line.points.back();
        return true;
    }
    return false;
}

const Waypoint* PathRegistry::getWaypoint(WaypointId id) const {
    const auto it = waypointIndex_.find(id);
    if (it == waypointIndex_.end()) return nullptr;
    return &waypoints_[it->second];
}

std::vector<WaypointId> PathRegistry::waypointIds() const {
    std::vector<WaypointId> ids;
    ids.reserve(waypoints_.size());
    for (const Waypoint& wp : waypoints_) ids.push_back(wp.id);
    return ids;
}

WaypointId PathRegistry::nearestWaypoint(const Point2& world) const {
    WaypointId best = kInvalidWaypointId;
    double bestDist = std::numeric_limits<double>::infinity();
    for (const Waypoint& wp : waypoints_) {
        const double d = distance(world, wp.position);
        if (d < bestDist) {
            bestDist = d;
            best = wp.id;
        }
    }
    return best;
}

std::vector<const Waypoint*> PathRegistry::searchWaypoints(const std::string& query) const {
    const std::string needle = toLower(query);
    std::vector<const Waypoint*> out;
    for (const Waypoint& wp : waypoints_) {
        if (toLower(wp.name).find(needle) != std::string::npos
            || toLower(wp.code).find(needle) != std::string::npos) {
            out.push_back(&wp);
        }
    }
    return out;
}

std::vector<const Waypoint*> PathRegistry::waypointsByKind(WaypointKind kind) const {
    std::vector<const Waypoint*> out;
    for (const Waypoint& wp : waypoints_) {
        if (wp.kind == kind) out.push_back(&wp);
    }
    return out;
}

std::vector<const RailLine*> PathRegistry::linesByKind(LineKind kind) const {
    std::vector<const RailLine*> out;
    for (const RailLine& line : lines_) {
        if (line.kind == kind) out.push_back(&line);
    }
    return out;
}

std::vector<const RailLine*> PathRegistry::electrifiedLines() const {
    std::vector<const RailLine*> out;
    for (const RailLine& line : lines_) {
        if (line.electrified) out.push_back(&line);
    }
    return out;
}

double PathRegistry::greatCircleDistanceKm(WaypointId a, WaypointId b) const {
    const Waypoint* wa = getWaypoint(a);
    const Waypoint* wb = getWaypoint(b);
    if (!wa || !wb || !wa->hasGeo || !wb->hasGeo) return 0.0;
    return haversineKm(wa->geo, wb->geo);
}

NetworkStats PathRegistry::networkStats() const {
    NetworkStats stats{};
    stats.waypointCount = static_cast<std::uint32_t>(waypoints_.size());
    stats.lineCount = static_cast<std::uint32_t>(lines_.size());
    for (const RailLine& line : lines_) {
        if (line.electrified) stats.electrifiedLineCount++;
    }
    for (const Waypoint& wp : waypoints_) {
        switch (wp.kind) {
            case WaypointKind::Junction: stats.junctionCount++; break;
            case WaypointKind::Terminal: stats.terminalCount++; break;
            case WaypointKind::Halt: stats.haltCount++; break;
        }
        stats.totalPlatforms += wp.platforms;
    }
    return stats;
}

} // namespace railmap
