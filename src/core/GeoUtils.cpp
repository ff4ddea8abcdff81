#include "loginet/core/GeoUtils.h"

#include <type_traits>

namespace loginet {

std::string geometryTypeName(const Geometry& geometry) {
    return std::visit([](const auto& g) -> std::string {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, PointGeometry>) return "Point";
        else if constexpr (std::is_same_v<T, PolygonGeometry>) return "Polygon";
        else if constexpr (std::is_same_v<T, MultiPolygonGeometry>) return "MultiPolygon";
        else return g.typeName.empty() ? "Unknown" : g.typeName;
    }, geometry);
}

namespace geo {

namespace {

/// Running sums for the shoelace centroid, relative to a shared origin
struct AreaMoments {
    double area = 0.0;  ///< Net area (degrees^2)
    double sumX = 0.0;  ///< Area-weighted x
    double sumY = 0.0;  ///< Area-weighted y
};

/// Signed twice-area and first moments of one ring (x = longitude, y = latitude)
void ringMoments(const LinearRing& ring, const GeoPoint& origin,
                 double& area2, double& momentX, double& momentY) {
    area2 = 0.0;
    momentX = 0.0;
    momentY = 0.0;
    const size_t n = ring.size();
    if (n < 3) return;

    for (size_t i = 0; i < n; ++i) {
        const GeoPoint& p = ring[i];
        const GeoPoint& q = ring[(i + 1) % n];
        double x0 = p.longitude - origin.longitude;
        double y0 = p.latitude - origin.latitude;
        double x1 = q.longitude - origin.longitude;
        double y1 = q.latitude - origin.latitude;
        double cross = x0 * y1 - x1 * y0;
        area2 += cross;
        momentX += (x0 + x1) * cross;
        momentY += (y0 + y1) * cross;
    }
}

/// Adds a ring to the accumulator with the given sign, using |area| so that
/// ring orientation does not matter
void accumulateRing(AreaMoments& acc, const LinearRing& ring, const GeoPoint& origin, double sign) {
    double area2 = 0.0;
    double momentX = 0.0;
    double momentY = 0.0;
    ringMoments(ring, origin, area2, momentX, momentY);
    if (std::abs(area2) < constants::DEGENERATE_AREA_EPSILON) return;

    double area = std::abs(area2) / 2.0;
    double cx = momentX / (3.0 * area2);
    double cy = momentY / (3.0 * area2);
    acc.area += sign * area;
    acc.sumX += sign * area * cx;
    acc.sumY += sign * area * cy;
}

void accumulatePolygon(AreaMoments& acc, const PolygonGeometry& polygon, const GeoPoint& origin) {
    accumulateRing(acc, polygon.exterior, origin, 1.0);
    for (const auto& hole : polygon.holes) {
        accumulateRing(acc, hole, origin, -1.0);
    }
}

/// Mean of ring vertices without the closing duplicate
void accumulateVertices(const LinearRing& ring, double& sumLat, double& sumLon, size_t& count) {
    size_t n = ring.size();
    if (n > 1 && ring.front() == ring.back()) {
        --n;
    }
    for (size_t i = 0; i < n; ++i) {
        sumLat += ring[i].latitude;
        sumLon += ring[i].longitude;
        ++count;
    }
}

std::optional<GeoPoint> firstVertex(const MultiPolygonGeometry& multiPolygon) {
    for (const auto& polygon : multiPolygon.polygons) {
        if (!polygon.exterior.empty()) {
            return polygon.exterior.front();
        }
    }
    return std::nullopt;
}

}  // namespace

double haversineDistance(const GeoPoint& a, const GeoPoint& b) {
    return haversineDistance(a.latitude, a.longitude, b.latitude, b.longitude);
}

double haversineDistance(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = toRadians(lat1);
    const double phi2 = toRadians(lat2);
    const double dPhi = toRadians(lat2 - lat1);
    const double dLambda = toRadians(lon2 - lon1);

    const double sinPhi = std::sin(dPhi / 2.0);
    const double sinLambda = std::sin(dLambda / 2.0);
    double a = sinPhi * sinPhi + std::cos(phi1) * std::cos(phi2) * sinLambda * sinLambda;
    // Rounding can push a marginally past 1 for antipodal points
    a = std::min(1.0, std::max(0.0, a));

    return 2.0 * constants::EARTH_RADIUS_METERS * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

std::optional<GeoPoint> polygonCentroid(const PolygonGeometry& polygon) {
    MultiPolygonGeometry single;
    single.polygons.push_back(polygon);
    return multiPolygonCentroid(single);
}

std::optional<GeoPoint> multiPolygonCentroid(const MultiPolygonGeometry& multiPolygon) {
    auto origin = firstVertex(multiPolygon);
    if (!origin) {
        return std::nullopt;
    }

    AreaMoments acc;
    for (const auto& polygon : multiPolygon.polygons) {
        accumulatePolygon(acc, polygon, *origin);
    }

    if (std::abs(acc.area) > constants::DEGENERATE_AREA_EPSILON) {
        return GeoPoint{origin->latitude + acc.sumY / acc.area,
                        origin->longitude + acc.sumX / acc.area};
    }

    // Degenerate area: average the exterior vertices
    double sumLat = 0.0;
    double sumLon = 0.0;
    size_t count = 0;
    for (const auto& polygon : multiPolygon.polygons) {
        accumulateVertices(polygon.exterior, sumLat, sumLon, count);
    }
    if (count == 0) {
        return std::nullopt;
    }
    return GeoPoint{sumLat / static_cast<double>(count), sumLon / static_cast<double>(count)};
}

std::optional<GeoPoint> representativePoint(const Geometry& geometry) {
    return std::visit([](const auto& g) -> std::optional<GeoPoint> {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, PointGeometry>) return g.position;
        else if constexpr (std::is_same_v<T, PolygonGeometry>) return polygonCentroid(g);
        else if constexpr (std::is_same_v<T, MultiPolygonGeometry>) return multiPolygonCentroid(g);
        else return std::nullopt;
    }, geometry);
}

}  // namespace geo

}  // namespace loginet
