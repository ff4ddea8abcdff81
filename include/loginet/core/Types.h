#pragma once

#include <algorithm>
#include <cstdint>
#include <cmath>
#include <string>

namespace loginet {

/// Index of a located point in the extracted sequence
using NodeId = uint32_t;
using EdgeId = uint32_t;

/// Identifier of a vertex in an external routable network (OSM node ids are 64-bit)
using RoadNodeId = int64_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

/// WGS84 coordinate in degrees
struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;

    constexpr GeoPoint() = default;
    constexpr GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}

    bool isFinite() const { return std::isfinite(latitude) && std::isfinite(longitude); }

    /// Finite and inside [-90,90] x [-180,180]
    bool isValid() const {
        return isFinite() &&
               latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }

    constexpr bool operator==(const GeoPoint& o) const {
        return latitude == o.latitude && longitude == o.longitude;
    }
    constexpr bool operator!=(const GeoPoint& o) const { return !(*this == o); }
};

/// Query region in degrees (west, south, east, north)
struct BoundingBox {
    double west = 0.0;
    double south = 0.0;
    double east = 0.0;
    double north = 0.0;

    constexpr BoundingBox() = default;
    constexpr BoundingBox(double w, double s, double e, double n)
        : west(w), south(s), east(e), north(n) {}

    /// Finite, ordered, inside WGS84 bounds
    bool isValid() const {
        return std::isfinite(west) && std::isfinite(south) &&
               std::isfinite(east) && std::isfinite(north) &&
               south <= north && west <= east &&
               south >= -90.0 && north <= 90.0 &&
               west >= -180.0 && east <= 180.0;
    }

    constexpr bool contains(const GeoPoint& p) const {
        return p.latitude >= south && p.latitude <= north &&
               p.longitude >= west && p.longitude <= east;
    }

    constexpr GeoPoint center() const {
        return {(south + north) / 2.0, (west + east) / 2.0};
    }

    /// Grow by a margin in degrees, clamped to WGS84 bounds
    BoundingBox expanded(double marginDegrees) const {
        return {std::max(-180.0, west - marginDegrees),
                std::max(-90.0, south - marginDegrees),
                std::min(180.0, east + marginDegrees),
                std::min(90.0, north + marginDegrees)};
    }

    /// Canonical "w,s,e,n" text form
    std::string toString() const;

    /// Parse "w,s,e,n"
    /// @throws std::invalid_argument on malformed or invalid input
    static BoundingBox parse(const std::string& text);

    constexpr bool operator==(const BoundingBox& o) const {
        return west == o.west && south == o.south && east == o.east && north == o.north;
    }
    constexpr bool operator!=(const BoundingBox& o) const { return !(*this == o); }
};

}  // namespace loginet
