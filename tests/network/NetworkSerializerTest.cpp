#include <gtest/gtest.h>
#include <loginet/network/NetworkSerializer.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace loginet;
using json = nlohmann::json;

namespace {

NetworkResult sampleResult() {
    std::vector<NetworkPoint> points{
        {59.9, 30.3, {{"name", std::string("North")}, {"operator", std::nullopt}}},
        {59.8, 30.4, {{"name", std::string("Mid")}, {"operator", std::string("RZD")}}},
        {59.7, 30.5, {{"name", std::string("South")}, {"operator", std::nullopt}}},
    };
    std::vector<RefinedEdge> edges{
        RefinedEdge::refined(WeightedEdge(0, 1, 12480.25), 14210.5),
        RefinedEdge::fallback(WeightedEdge(1, 2, 12501.75), FallbackReason::NoPath),
    };
    NetworkMetadata metadata;
    metadata.mode = CategoryMode::Rail;
    metadata.region = BoundingBox{30.0, 59.5, 30.6, 60.0};
    metadata.droppedRecords = 1;
    return NetworkResult(std::move(points), std::move(edges), metadata);
}

}  // namespace

// --- JSON Serialization ---

TEST(NetworkSerializerTest, ToJsonContainsSummaryFields) {
    json j = json::parse(NetworkSerializer::toJson(sampleResult()));

    EXPECT_EQ(j["status"], "ok");
    EXPECT_EQ(j["mode"], "rail");
    EXPECT_EQ(j["bbox"], json({30.0, 59.5, 30.6, 60.0}));
    EXPECT_EQ(j["nodes_count"], 3);
    EXPECT_EQ(j["edges_count"], 2);
    EXPECT_DOUBLE_EQ(j["total_distance"].get<double>(), 14210.5 + 12501.75);
    EXPECT_EQ(j["refined_count"], 1);
    EXPECT_EQ(j["fallback_count"], 1);
    EXPECT_EQ(j["dropped_records"], 1);
    EXPECT_EQ(j["refinement_degraded"], false);
}

TEST(NetworkSerializerTest, ToJsonPointsAndEdges) {
    json j = json::parse(NetworkSerializer::toJson(sampleResult()));

    ASSERT_EQ(j["points"].size(), 3u);
    EXPECT_DOUBLE_EQ(j["points"][0]["lat"].get<double>(), 59.9);
    EXPECT_DOUBLE_EQ(j["points"][0]["lon"].get<double>(), 30.3);
    EXPECT_EQ(j["points"][0]["tags"]["name"], "North");
    EXPECT_TRUE(j["points"][0]["tags"]["operator"].is_null());

    ASSERT_EQ(j["edges"].size(), 2u);
    EXPECT_EQ(j["edges"][0]["from_index"], 0);
    EXPECT_EQ(j["edges"][0]["to_index"], 1);
    EXPECT_EQ(j["edges"][0]["status"], "refined");
    EXPECT_TRUE(j["edges"][0]["fallback_reason"].is_null());
    EXPECT_DOUBLE_EQ(j["edges"][0]["distance"].get<double>(), 14210.5);
    EXPECT_DOUBLE_EQ(j["edges"][0]["geodesic_distance"].get<double>(), 12480.25);
    EXPECT_EQ(j["edges"][1]["status"], "fallback");
    EXPECT_EQ(j["edges"][1]["fallback_reason"], "no_path");
}

TEST(NetworkSerializerTest, EmptyResultIsNoData) {
    json j = json::parse(NetworkSerializer::toJson(NetworkResult{}));

    EXPECT_EQ(j["status"], "no_data");
    EXPECT_EQ(j["nodes_count"], 0);
    EXPECT_EQ(j["edges_count"], 0);
    EXPECT_EQ(j["total_distance"], 0.0);
    EXPECT_TRUE(j["points"].is_array());
    EXPECT_TRUE(j["edges"].empty());
}

TEST(NetworkSerializerTest, FromJsonRestoresEqualResult) {
    NetworkResult original = sampleResult();
    NetworkResult restored = NetworkSerializer::fromJson(NetworkSerializer::toJson(original, -1));

    EXPECT_EQ(restored, original);
    EXPECT_EQ(restored.status(), NetworkStatus::Ok);
    EXPECT_DOUBLE_EQ(restored.totalDistance(), original.totalDistance());
}

TEST(NetworkSerializerTest, FromJsonRejectsInconsistentCounts) {
    json j = json::parse(NetworkSerializer::toJson(sampleResult()));
    j["nodes_count"] = 7;
    EXPECT_THROW(NetworkSerializer::fromJson(j.dump()), std::runtime_error);
}

TEST(NetworkSerializerTest, FromJsonRejectsMalformedInput) {
    EXPECT_THROW(NetworkSerializer::fromJson("{"), std::runtime_error);
    EXPECT_THROW(NetworkSerializer::fromJson(R"({"points": []})"), std::runtime_error);
    EXPECT_THROW(NetworkSerializer::fromJson(R"({"points": [], "edges": [], "mode": "bike"})"),
                 std::runtime_error);
}

// --- File I/O ---

TEST(NetworkSerializerTest, SaveAndLoadFile) {
    std::string path = (std::filesystem::temp_directory_path() / "loginet_network_test.json").string();

    ASSERT_TRUE(NetworkSerializer::saveToFile(sampleResult(), path));

    NetworkResult loaded;
    ASSERT_TRUE(NetworkSerializer::loadFromFile(loaded, path));
    EXPECT_EQ(loaded, sampleResult());

    std::filesystem::remove(path);
    EXPECT_FALSE(NetworkSerializer::loadFromFile(loaded, path));
}

TEST(NetworkSerializerTest, SaveToUnwritablePathFails) {
    EXPECT_FALSE(NetworkSerializer::saveToFile(sampleResult(), "/nonexistent/dir/network.json"));
}
