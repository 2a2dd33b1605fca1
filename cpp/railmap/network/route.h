#pragma once

#include "railmap/core/types.h"
#include <vector>

namespace railmap {

// Ordered waypoints an entity cycles through. The last leg wraps to the first.
using Route = std::vector<WaypointId>;

// `all` rotated to begin at `start` and closed by repeating `start`.
// An unknown start closes the list on its first element. Empty in, empty out.
Route makeCircularRoute(const std::vector<WaypointId>& all, WaypointId start);

// Waypoint that follows `waypoint` in `route`, wrapping past the end.
// Returns route.front() when `waypoint` is not on the route, and
// kInvalidWaypointId for an empty route.
WaypointId routeSuccessor(const Route& route, WaypointId waypoint);

} // namespace railmap
