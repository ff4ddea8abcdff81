#include <gtest/gtest.h>
#include <loginet/network/PipelineOptions.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace loginet;
using std::chrono::milliseconds;

TEST(PipelineOptionsTest, DefaultsMatchBalancedPreset) {
    PipelineOptions defaults;
    PipelineOptions balanced = PipelineOptions::balanced();

    EXPECT_EQ(defaults.geometryPolicy, InvalidGeometryPolicy::Fail);
    EXPECT_TRUE(defaults.refineRoutes);
    EXPECT_EQ(defaults.edgeTimeout, balanced.edgeTimeout);
    EXPECT_EQ(defaults.providerRetries, balanced.providerRetries);
    EXPECT_GE(defaults.workerThreads, 1u);
    EXPECT_EQ(defaults.largeInputWarning, 2000u);
}

TEST(PipelineOptionsTest, PresetsDiffer) {
    PipelineOptions fast = PipelineOptions::fast();
    PipelineOptions thorough = PipelineOptions::thorough();

    EXPECT_EQ(fast.providerRetries, 0);
    EXPECT_LT(fast.edgeTimeout, PipelineOptions::balanced().edgeTimeout);
    EXPECT_EQ(thorough.edgeTimeout, milliseconds(0));
    EXPECT_EQ(thorough.pipelineTimeout, milliseconds(0));
    EXPECT_GT(thorough.providerRetries, PipelineOptions::balanced().providerRetries);
}

TEST(PipelineOptionsTest, FluentSetters) {
    auto options = PipelineOptions::balanced()
                       .withGeometryPolicy(InvalidGeometryPolicy::DropAndReport)
                       .withWorkerThreads(0)
                       .withRefineRoutes(false)
                       .withEdgeTimeout(milliseconds(50))
                       .withPipelineTimeout(milliseconds(500))
                       .withMaxSnapDistance(250.0)
                       .withProviderRetries(3, milliseconds(10));

    EXPECT_EQ(options.geometryPolicy, InvalidGeometryPolicy::DropAndReport);
    EXPECT_EQ(options.workerThreads, 0u);
    EXPECT_FALSE(options.refineRoutes);
    EXPECT_EQ(options.edgeTimeout, milliseconds(50));
    EXPECT_EQ(options.pipelineTimeout, milliseconds(500));
    EXPECT_DOUBLE_EQ(options.maxSnapDistanceMeters, 250.0);
    EXPECT_EQ(options.providerRetries, 3);
    EXPECT_EQ(options.retryBackoff, milliseconds(10));
}

TEST(PipelineOptionsTest, JsonRoundTrip) {
    auto original = PipelineOptions::fast()
                        .withGeometryPolicy(InvalidGeometryPolicy::DropAndReport)
                        .withWorkerThreads(6)
                        .withMaxSnapDistance(125.5);

    PipelineOptions restored = PipelineOptions::fromJson(original.toJson());

    EXPECT_EQ(restored.geometryPolicy, original.geometryPolicy);
    EXPECT_EQ(restored.workerThreads, 6u);
    EXPECT_EQ(restored.edgeTimeout, original.edgeTimeout);
    EXPECT_EQ(restored.pipelineTimeout, original.pipelineTimeout);
    EXPECT_DOUBLE_EQ(restored.maxSnapDistanceMeters, 125.5);
    EXPECT_EQ(restored.providerRetries, original.providerRetries);
    EXPECT_EQ(restored.retryBackoff, original.retryBackoff);
}

TEST(PipelineOptionsTest, FromJsonOverridesOnlyPresentKeys) {
    PipelineOptions options = PipelineOptions::fromJson(R"({"refineRoutes": false, "unknownKey": 1})");

    EXPECT_FALSE(options.refineRoutes);
    EXPECT_EQ(options.edgeTimeout, PipelineOptions::balanced().edgeTimeout);
}

TEST(PipelineOptionsTest, FromJsonRejectsWrongTypes) {
    EXPECT_THROW(PipelineOptions::fromJson("not json"), std::runtime_error);
    EXPECT_THROW(PipelineOptions::fromJson("[1]"), std::runtime_error);
    EXPECT_THROW(PipelineOptions::fromJson(R"({"refineRoutes": "yes"})"), std::runtime_error);
    EXPECT_THROW(PipelineOptions::fromJson(R"({"workerThreads": -2})"), std::runtime_error);
    EXPECT_THROW(PipelineOptions::fromJson(R"({"edgeTimeoutMs": 1.5})"), std::runtime_error);
    EXPECT_THROW(PipelineOptions::fromJson(R"({"geometryPolicy": "ignore"})"), std::runtime_error);
}

TEST(PipelineOptionsTest, LoadFromFile) {
    std::string path = (std::filesystem::temp_directory_path() / "loginet_options_test.json").string();
    {
        std::ofstream file(path);
        file << R"({"geometryPolicy": "drop", "providerRetries": 5})";
    }

    PipelineOptions options = PipelineOptions::loadFromFile(path);
    EXPECT_EQ(options.geometryPolicy, InvalidGeometryPolicy::DropAndReport);
    EXPECT_EQ(options.providerRetries, 5);

    std::filesystem::remove(path);
    EXPECT_THROW(PipelineOptions::loadFromFile(path), std::runtime_error);
}
