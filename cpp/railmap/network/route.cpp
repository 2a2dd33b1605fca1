#include "railmap/network/route.h"
#include <algorithm>

namespace railmap {

Route makeCircularRoute(const std::vector<WaypointId>& all, WaypointId start) {
    Route route;
    if (all.empty()) return route;

    auto it = std::find(all.begin(), all.end(), start);
    if (it == all.end()) it = all.begin();

    route.reserve(all.size() + 1);
    route.insert(route.end(), it, all.end());
    route.insert(route.end(), all.begin(), it);
    route.push_back(*it);
    return route;
}

WaypointId routeSuccessor(const Route& route, WaypointId waypoint) {
    if (route.empty()) return kInvalidWaypointId;
    const auto it = std::find(route.begin(), route.end(), waypoint);
    if (it == route.end()) return route.front();
    const auto next = std::next(it);
    return next == route.end() ? route.front() : *next;
}

} // namespace railmap
