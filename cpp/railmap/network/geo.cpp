#include "railmap/network/geo.h"
#include <cmath>

namespace railmap {

namespace {
constexpr double kEarthRadiusKm = 6371.0;
constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees) {
    return degrees * kPi / 180.0;
}
} // namespace

Point2 geoToMap(const GeoCoord& coord, const GeoBounds& bounds, const MapSize& size) {
    const double lngSpan = bounds.east - bounds.west;
    const double latSpan = bounds.north - bounds.south;
    const double x = lngSpan != 0.0 ? ((coord.lng - bounds.west) / lngSpan) * size.width : 0.0;
    const double y = latSpan != 0.0 ? ((bounds.north - coord.lat) / latSpan) * size.height : 0.0;
    return Point2{x, y};
}

double haversineKm(const GeoCoord& a, const GeoCoord& b) {
    const double dLat = toRadians(b.lat - a.lat);
    const double dLng = toRadians(b.lng - a.lng);
    const double sinLat = std::sin(dLat / 2.0);
    const double sinLng = std::sin(dLng / 2.0);
    const double h = sinLat * sinLat
        + std::cos(toRadians(a.lat)) * std::cos(toRadians(b.lat)) * sinLng * sinLng;
    const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return kEarthRadiusKm * c;
}

} // namespace railmap
