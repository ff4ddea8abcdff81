#pragma once

#include "Types.h"
#include "Geometry.h"

#include <cmath>
#include <optional>

namespace loginet {

/// Geodesic and planar geometry helpers
namespace geo {

/// Convert degrees to radians
inline double toRadians(double degrees) noexcept {
    return degrees * M_PI / 180.0;
}

/// Great-circle distance in meters (haversine, spherical Earth of radius
/// constants::EARTH_RADIUS_METERS). This is the weight function for every
/// geodesic edge in the network.
double haversineDistance(const GeoPoint& a, const GeoPoint& b);

/// Same as above on raw degree values
double haversineDistance(double lat1, double lon1, double lat2, double lon2);

/// Area-weighted planar centroid of a polygon in degree space
///
/// Holes subtract their area. A polygon whose net area is zero (collinear or
/// repeated vertices) resolves to the arithmetic mean of its exterior vertices.
/// @return std::nullopt when the exterior ring is empty
std::optional<GeoPoint> polygonCentroid(const PolygonGeometry& polygon);

/// Area-weighted centroid over all parts of a multi-polygon
/// @return std::nullopt when no part has any vertex
std::optional<GeoPoint> multiPolygonCentroid(const MultiPolygonGeometry& multiPolygon);

/// Single representative coordinate for any supported geometry:
/// the point itself, or the centroid of a (multi-)polygon.
/// @return std::nullopt for unsupported or empty geometries
std::optional<GeoPoint> representativePoint(const Geometry& geometry);

}  // namespace geo

namespace constants {

/// Mean Earth radius used by the haversine formula
constexpr double EARTH_RADIUS_METERS = 6371000.0;

/// Length of one degree of latitude on the haversine sphere
constexpr double METERS_PER_DEGREE = EARTH_RADIUS_METERS * M_PI / 180.0;

/// Twice-area threshold below which a ring is treated as degenerate (degrees^2)
constexpr double DEGENERATE_AREA_EPSILON = 1e-18;

/// Tolerance for comparing distances in meters
constexpr double DISTANCE_EPSILON = 1e-6;

}  // namespace constants

}  // namespace loginet
