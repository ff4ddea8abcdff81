#include <gtest/gtest.h>
#include <loginet/core/GeoUtils.h>

#include <algorithm>
#include <cmath>

using namespace loginet;

namespace {

LinearRing square(double south, double west, double north, double east) {
    return {{south, west}, {south, east}, {north, east}, {north, west}, {south, west}};
}

}  // namespace

// ============================================================================
// Haversine distance
// ============================================================================

TEST(HaversineTest, IdenticalPointsAreZero) {
    GeoPoint p{59.9386, 30.3141};
    EXPECT_DOUBLE_EQ(geo::haversineDistance(p, p), 0.0);
}

TEST(HaversineTest, OneDegreeOfLatitudeAtEquator) {
    double d = geo::haversineDistance(GeoPoint{0.0, 0.0}, GeoPoint{1.0, 0.0});
    EXPECT_NEAR(d, 111195.0, 1000.0);
    EXPECT_NEAR(d, constants::METERS_PER_DEGREE, 1e-6);
}

TEST(HaversineTest, IsSymmetric) {
    GeoPoint a{59.9, 30.3};
    GeoPoint b{55.75, 37.62};
    EXPECT_DOUBLE_EQ(geo::haversineDistance(a, b), geo::haversineDistance(b, a));
}

TEST(HaversineTest, AntipodalPointsAreHalfCircumference) {
    double d = geo::haversineDistance(0.0, 0.0, 0.0, 180.0);
    EXPECT_NEAR(d, M_PI * constants::EARTH_RADIUS_METERS, 1e-3);
}

TEST(HaversineTest, KnownCityPair) {
    // Saint Petersburg to Moscow, about 634 km on the haversine sphere
    double d = geo::haversineDistance(GeoPoint{59.9386, 30.3141}, GeoPoint{55.7558, 37.6173});
    EXPECT_NEAR(d, 634000.0, 5000.0);
}

// ============================================================================
// Centroids
// ============================================================================

TEST(CentroidTest, SquarePolygon) {
    PolygonGeometry polygon{square(59.0, 30.0, 59.1, 30.1), {}};

    auto centroid = geo::polygonCentroid(polygon);
    ASSERT_TRUE(centroid.has_value());
    EXPECT_NEAR(centroid->latitude, 59.05, 1e-9);
    EXPECT_NEAR(centroid->longitude, 30.05, 1e-9);
}

TEST(CentroidTest, OrientationDoesNotMatter) {
    LinearRing ring = square(59.0, 30.0, 59.1, 30.1);
    std::reverse(ring.begin(), ring.end());

    auto centroid = geo::polygonCentroid(PolygonGeometry{ring, {}});
    ASSERT_TRUE(centroid.has_value());
    EXPECT_NEAR(centroid->latitude, 59.05, 1e-9);
    EXPECT_NEAR(centroid->longitude, 30.05, 1e-9);
}

TEST(CentroidTest, HoleShiftsCentroidAway) {
    // 4x4 square with a 2x2 hole in its east half
    PolygonGeometry polygon{square(0.0, 0.0, 4.0, 4.0), {square(1.0, 2.0, 3.0, 4.0)}};

    auto centroid = geo::polygonCentroid(polygon);
    ASSERT_TRUE(centroid.has_value());
    // Area 12; moment_x = 16*2 - 4*3 = 20 -> 5/3
    EXPECT_NEAR(centroid->longitude, 5.0 / 3.0, 1e-9);
    EXPECT_NEAR(centroid->latitude, 2.0, 1e-9);
}

TEST(CentroidTest, DegeneratePolygonFallsBackToVertexMean) {
    // Collinear ring has zero area
    PolygonGeometry polygon{{{0.0, 0.0}, {1.0, 1.0}, {2.0, 2.0}, {0.0, 0.0}}, {}};

    auto centroid = geo::polygonCentroid(polygon);
    ASSERT_TRUE(centroid.has_value());
    EXPECT_NEAR(centroid->latitude, 1.0, 1e-12);
    EXPECT_NEAR(centroid->longitude, 1.0, 1e-12);
}

TEST(CentroidTest, EmptyPolygonHasNoCentroid) {
    EXPECT_FALSE(geo::polygonCentroid(PolygonGeometry{}).has_value());
    EXPECT_FALSE(geo::multiPolygonCentroid(MultiPolygonGeometry{}).has_value());
}

TEST(CentroidTest, MultiPolygonWeightsPartsByArea) {
    MultiPolygonGeometry multi;
    multi.polygons.push_back({square(0.0, 0.0, 1.0, 1.0), {}});   // area 1, centroid (0.5, 0.5)
    multi.polygons.push_back({square(0.0, 2.0, 3.0, 5.0), {}});   // area 9, centroid (1.5, 3.5)

    auto centroid = geo::multiPolygonCentroid(multi);
    ASSERT_TRUE(centroid.has_value());
    EXPECT_NEAR(centroid->latitude, (0.5 * 1 + 1.5 * 9) / 10.0, 1e-9);
    EXPECT_NEAR(centroid->longitude, (0.5 * 1 + 3.5 * 9) / 10.0, 1e-9);
}

// ============================================================================
// Representative point
// ============================================================================

TEST(RepresentativePointTest, PointIsItself) {
    Geometry geometry = PointGeometry{{59.9, 30.3}};
    auto point = geo::representativePoint(geometry);
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(*point, GeoPoint(59.9, 30.3));
}

TEST(RepresentativePointTest, UnsupportedHasNone) {
    Geometry geometry = UnsupportedGeometry{"LineString"};
    EXPECT_FALSE(geo::representativePoint(geometry).has_value());
    EXPECT_EQ(geometryTypeName(geometry), "LineString");
}

TEST(RepresentativePointTest, TypeNames) {
    EXPECT_EQ(geometryTypeName(Geometry{PointGeometry{}}), "Point");
    EXPECT_EQ(geometryTypeName(Geometry{PolygonGeometry{}}), "Polygon");
    EXPECT_EQ(geometryTypeName(Geometry{MultiPolygonGeometry{}}), "MultiPolygon");
}
