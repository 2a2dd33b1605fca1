#pragma once

#include "railmap/core/types.h"

namespace railmap {

struct GeoCoord {
    double lat;
    double lng;
};

struct GeoBounds {
    double north;
    double south;
    double east;
    double west;
};

struct MapSize {
    double width;
    double height;
};

// Linear bounds-to-pixels mapping used to place waypoints on the backdrop
// image. Not a cartographic projection. A zero-span axis maps to 0.
Point2 geoToMap(const GeoCoord& coord, const GeoBounds& bounds, const MapSize& size);

// Haversine distance on a sphere of radius 6371 km.
double haversineKm(const GeoCoord& a, const GeoCoord& b);

} // namespace railmap
