#include <gtest/gtest.h>
#include <loginet/core/Errors.h>
#include <loginet/facility/GeoJsonFeatureSource.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace loginet;

namespace {

const char* kFacilities = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "id": 101,
     "geometry": {"type": "Point", "coordinates": [30.3, 59.9]},
     "properties": {"building": "warehouse", "name": "North", "levels": 3}},
    {"type": "Feature",
     "geometry": {"type": "Polygon",
                  "coordinates": [[[30.0, 59.0], [30.1, 59.0], [30.1, 59.1], [30.0, 59.1], [30.0, 59.0]]]},
     "properties": {"building": "depot", "capacity": 12.5, "operator": null}},
    {"type": "Feature",
     "geometry": {"type": "Point", "coordinates": [30.4, 59.8]},
     "properties": {"railway": "yard"}},
    {"type": "Feature",
     "geometry": {"type": "Point", "coordinates": [10.0, 50.0]},
     "properties": {"building": "warehouse"}},
    {"type": "Feature",
     "geometry": {"type": "LineString", "coordinates": [[30.3, 59.9], [30.4, 59.9]]},
     "properties": {"building": "industrial"}}
  ]
})";

}  // namespace

class GeoJsonFeatureSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("loginet_features_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".geojson"))
                    .string();
        std::ofstream file(path_);
        file << kFacilities;
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    std::string path_;
    BoundingBox region_{29.0, 58.0, 31.0, 61.0};
};

// --- Parsing ---

TEST_F(GeoJsonFeatureSourceTest, ParseReadsAllFeaturesInOrder) {
    auto records = GeoJsonFeatureSource::parse(kFacilities);
    ASSERT_EQ(records.size(), 5u);

    ASSERT_TRUE(std::holds_alternative<PointGeometry>(records[0].geometry));
    const auto& point = std::get<PointGeometry>(records[0].geometry);
    EXPECT_DOUBLE_EQ(point.position.latitude, 59.9);   // GeoJSON is [lon, lat]
    EXPECT_DOUBLE_EQ(point.position.longitude, 30.3);

    ASSERT_TRUE(std::holds_alternative<PolygonGeometry>(records[1].geometry));
    EXPECT_EQ(std::get<PolygonGeometry>(records[1].geometry).exterior.size(), 5u);

    ASSERT_TRUE(std::holds_alternative<UnsupportedGeometry>(records[4].geometry));
    EXPECT_EQ(std::get<UnsupportedGeometry>(records[4].geometry).typeName, "LineString");
}

TEST_F(GeoJsonFeatureSourceTest, ParsePropertyTypes) {
    auto records = GeoJsonFeatureSource::parse(kFacilities);

    const AttributeMap& first = records[0].attributes;
    EXPECT_EQ(std::get<std::string>(first.at("name")), "North");
    EXPECT_EQ(std::get<int64_t>(first.at("levels")), 3);
    EXPECT_EQ(std::get<int64_t>(first.at("id")), 101);

    const AttributeMap& second = records[1].attributes;
    EXPECT_DOUBLE_EQ(std::get<double>(second.at("capacity")), 12.5);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(second.at("operator")));
}

TEST_F(GeoJsonFeatureSourceTest, ParseDropsGeometryProperty) {
    auto records = GeoJsonFeatureSource::parse(R"json({"type": "Feature",
        "geometry": {"type": "Point", "coordinates": [1, 2]},
        "properties": {"geometry": "POINT (1 2)", "building": "depot"}})json");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].attributes.count("geometry"), 0u);
    EXPECT_EQ(records[0].attributes.count("building"), 1u);
}

TEST_F(GeoJsonFeatureSourceTest, ParseKeepsIntegersBeyondInt64AsText) {
    auto records = GeoJsonFeatureSource::parse(R"({"type": "Feature",
        "geometry": {"type": "Point", "coordinates": [1, 2]},
        "properties": {"osm_id": 18446744073709551000, "levels": 4}})");

    ASSERT_EQ(records.size(), 1u);
    const AttributeMap& attributes = records[0].attributes;
    ASSERT_TRUE(std::holds_alternative<std::string>(attributes.at("osm_id")));
    EXPECT_EQ(std::get<std::string>(attributes.at("osm_id")), "18446744073709551000");
    EXPECT_EQ(std::get<int64_t>(attributes.at("levels")), 4);
}

TEST_F(GeoJsonFeatureSourceTest, NullGeometryIsUnsupported) {
    auto records = GeoJsonFeatureSource::parse(
        R"({"type": "FeatureCollection", "features": [{"type": "Feature", "geometry": null, "properties": {}}]})");

    ASSERT_EQ(records.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<UnsupportedGeometry>(records[0].geometry));
    EXPECT_EQ(std::get<UnsupportedGeometry>(records[0].geometry).typeName, "null");
}

TEST_F(GeoJsonFeatureSourceTest, ParseRejectsMalformedDocuments) {
    EXPECT_THROW(GeoJsonFeatureSource::parse("{not json"), std::runtime_error);
    EXPECT_THROW(GeoJsonFeatureSource::parse(R"({"type": "Topology"})"), std::runtime_error);
    EXPECT_THROW(GeoJsonFeatureSource::parse(
                     R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": [1]}})"),
                 std::runtime_error);
}

// --- Fetching ---

TEST_F(GeoJsonFeatureSourceTest, FetchAppliesModeFilterAndRegion) {
    GeoJsonFeatureSource source(path_);

    auto autoRecords = source.fetch(region_, CategoryMode::Auto);
    // Warehouse and depot inside the region plus the unsupported LineString feature
    // (no representative point, so the region clip cannot exclude it)
    ASSERT_EQ(autoRecords.size(), 3u);
    EXPECT_EQ(std::get<std::string>(autoRecords[0].attributes.at("name")), "North");

    auto railRecords = source.fetch(region_, CategoryMode::Rail);
    ASSERT_EQ(railRecords.size(), 1u);
    EXPECT_EQ(std::get<std::string>(railRecords[0].attributes.at("railway")), "yard");
}

TEST_F(GeoJsonFeatureSourceTest, FetchWithoutFilters) {
    GeoJsonFeatureSource source(path_, GeoJsonFeatureSource::Options{false, false});
    EXPECT_EQ(source.fetch(region_, CategoryMode::Sea).size(), 5u);
}

TEST_F(GeoJsonFeatureSourceTest, MissingFileIsProviderError) {
    GeoJsonFeatureSource source(path_ + ".missing");
    EXPECT_THROW(source.fetch(region_, CategoryMode::Auto), ExternalProviderError);
}

TEST_F(GeoJsonFeatureSourceTest, MalformedFileErrorNamesThePath) {
    {
        std::ofstream file(path_);
        file << "[1, 2, 3]";
    }
    GeoJsonFeatureSource source(path_);
    try {
        source.fetch(region_, CategoryMode::Auto);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path_), std::string::npos);
    }
}
