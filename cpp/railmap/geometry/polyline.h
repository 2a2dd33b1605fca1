#pragma once

#include "railmap/core/types.h"
#include <cstddef>
#include <vector>

namespace railmap {

// Ordered points of a piecewise-linear path.
using Polyline = std::vector<Point2>;

struct PathSample {
    Point2 position;
    Point2 tangent; // direction of the containing segment, not normalized
};

// Nearest point on a polyline plus where it was found.
struct PolylineProjection {
    Point2 point;
    std::size_t segmentIndex;
    double t;        // parametric position inside segmentIndex, in [0, 1]
    double distance; // from the query point to `point`
};

double polylineLength(const Polyline& path);

// Position/tangent at normalized arc length `progress` (clamped to [0, 1]).
// A progress landing exactly on an interior vertex resolves to the segment
// that ends there. Empty or zero-length paths return the first point (or the
// origin) with tangent (1, 0).
PathSample pointAlongPath(const Polyline& path, double progress);

// Closest point on any segment of `path`. Ties go to the earliest segment.
// An empty path returns `point` unchanged.
PolylineProjection projectOntoPolyline(const Point2& point, const Polyline& path);

inline Point2 projectPointOntoPolyline(const Point2& point, const Polyline& path) {
    return projectOntoPolyline(point, path).point;
}

} // namespace railmap
