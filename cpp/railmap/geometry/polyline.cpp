#include "railmap/geometry/polyline.h"
#include <limits>

namespace railmap {

namespace {
const Point2 kDefaultTangent{1.0, 0.0};
} // namespace

double polylineLength(const Polyline& path) {
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        total += distance(path[i], path[i + 1]);
    }
    return total;
}

PathSample pointAlongPath(const Polyline& path, double progress) {
    if (path.empty()) return PathSample{Point2{0.0, 0.0}, kDefaultTangent};
    if (path.size() == 1) return PathSample{path.front(), kDefaultTangent};

    std::vector<double> segmentLengths;
    segmentLengths.reserve(path.size() - 1);
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const double len = distance(path[i], path[i + 1]);
        segmentLengths.push_back(len);
        total += len;
    }
    if (!(total > 0.0) || !std::isfinite(total)) {
        return PathSample{path.front(), kDefaultTangent};
    }

    if (!std::isfinite(progress)) progress = 0.0;
    const double clamped = clampValue(progress, 0.0, 1.0);

    const double target = clamped * total;
    double acc = 0.0;
    for (std::size_t i = 0; i < segmentLengths.size(); ++i) {
        // Zero-length segments never supply the tangent.
        if (segmentLengths[i] == 0.0) continue;
        const double nextAcc = acc + segmentLengths[i];
        if (target <= nextAcc) {
            const Point2& p0 = path[i];
            const Point2& p1 = path[i + 1];
            const Point2 dir = p1 - p0;
            // Segment ends are returned exactly rather than through interpolation.
            if (target >= nextAcc) return PathSample{p1, dir};
            const double localT = (target - acc) / segmentLengths[i];
            if (localT >= 1.0) return PathSample{p1, dir};
            return PathSample{p0 + dir * localT, dir};
        }
        acc = nextAcc;
    }

    std::size_t seg = segmentLengths.size() - 1;
    while (seg > 0 && segmentLengths[seg] == 0.0) --seg;
    return PathSample{path.back(), path[seg + 1] - path[seg]};
}

PolylineProjection projectOntoPolyline(const Point2& point, const Polyline& path) {
    if (path.empty()) return PolylineProjection{point, 0, 0.0, 0.0};
    if (path.size() == 1) return PolylineProjection{path.front(), 0, 0.0, distance(point, path.front())};

    PolylineProjection best{path.front(), 0, 0.0, std::numeric_limits<double>::infinity()};
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const Point2& p0 = path[i];
        const Point2& p1 = path[i + 1];
        const Point2 v = p1 - p0;
        const double c2 = dot(v, v);
        const double t = c2 == 0.0 ? 0.0 : clampValue(dot(point - p0, v) / c2, 0.0, 1.0);
        const Point2 candidate = p0 + v * t;
        const double d = distance(point, candidate);
        if (d < best.distance) {
            best = PolylineProjection{candidate, i, t, d};
        }
    }
    return best;
}

} // namespace railmap
