#ifndef RAILMAP_CORE_TYPES_H
#define RAILMAP_CORE_TYPES_H

#include <cmath>
#include <cstdint>

// Lightweight value types shared by every railmap subsystem.

namespace railmap {

using EntityId = std::uint32_t;
using WaypointId = std::uint32_t;

static constexpr EntityId kInvalidEntityId = 0;
static constexpr WaypointId kInvalidWaypointId = 0;

// A 2D coordinate. Whether it is a world or a screen point is fixed by the
// signature that carries it.
struct Point2 {
    double x;
    double y;
};

inline Point2 operator+(const Point2& a, const Point2& b) { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 operator-(const Point2& a, const Point2& b) { return Point2{a.x - b.x, a.y - b.y}; }
inline Point2 operator*(const Point2& a, double s) { return Point2{a.x * s, a.y * s}; }
inline Point2 operator/(const Point2& a, double s) { return Point2{a.x / s, a.y / s}; }
inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

inline double dot(const Point2& a, const Point2& b) { return a.x * b.x + a.y * b.y; }
inline double length(const Point2& v) { return std::hypot(v.x, v.y); }
inline double distance(const Point2& a, const Point2& b) { return length(b - a); }

inline bool isFinite(const Point2& p) { return std::isfinite(p.x) && std::isfinite(p.y); }

// Unit-length copy of v, or (0,0) when v has no length.
inline Point2 normalized(const Point2& v) {
    const double len = length(v);
    if (len <= 0.0 || !std::isfinite(len)) return Point2{0.0, 0.0};
    return v / len;
}

// Left-hand normal in a y-down screen/world space.
inline Point2 perpendicular(const Point2& v) { return Point2{-v.y, v.x}; }

inline double clampValue(double v, double lo, double hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

enum class MapError : std::uint32_t {
    Ok = 0,
    UnknownEntity = 1,
    UnknownWaypoint = 2,
    InvalidPath = 3,
    InvalidRoute = 4,
    InvalidConfig = 5,
    InvalidOperation = 6,
};

} // namespace railmap

#endif // RAILMAP_CORE_TYPES_H
