#pragma once

#include "DistanceGraphBuilder.h"
#include "GeometryExtractor.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace loginet {

/// Configuration for a NetworkPipeline run
///
/// Presets:
/// - fast(): short timeouts, no provider retries
/// - balanced(): default settings
/// - thorough(): no timeouts, more retries
///
/// Usage:
/// @code
/// auto options = PipelineOptions::balanced()
///                    .withWorkerThreads(8)
///                    .withGeometryPolicy(InvalidGeometryPolicy::DropAndReport);
/// NetworkPipeline pipeline(options);
/// @endcode
struct PipelineOptions {
    /// Reaction to unsupported or invalid geometries
    InvalidGeometryPolicy geometryPolicy = InvalidGeometryPolicy::Fail;

    /// Query the road network for MST edges
    /// When false every edge keeps its geodesic weight
    bool refineRoutes = true;

    /// Routing workers; 0 runs every query on the calling thread
    size_t workerThreads = defaultWorkerThreads();

    /// Upper bound on one routing query, from when a worker starts it (0 = unlimited)
    std::chrono::milliseconds edgeTimeout{10000};

    /// Upper bound on one run() invocation, measured from entry (0 = unlimited)
    /// Provider retries stop and unfinished edges fall back once it expires
    std::chrono::milliseconds pipelineTimeout{120000};

    /// Snaps farther than this from the facility count as failures (0 = unlimited)
    double maxSnapDistanceMeters = 0.0;

    /// Extra attempts at loading the road network before degrading
    int providerRetries = 2;

    /// Delay before the first retry; doubled for each further attempt
    std::chrono::milliseconds retryBackoff{500};

    /// Point count above which graph construction logs a warning
    size_t largeInputWarning = DistanceGraphBuilder::DEFAULT_LARGE_INPUT_WARNING;

    // === Named Presets ===

    static PipelineOptions fast();
    static PipelineOptions balanced();
    static PipelineOptions thorough();

    static size_t defaultWorkerThreads();

    // === Convenience Methods ===

    PipelineOptions& withGeometryPolicy(InvalidGeometryPolicy policy) {
        geometryPolicy = policy;
        return *this;
    }

    PipelineOptions& withRefineRoutes(bool refine) {
        refineRoutes = refine;
        return *this;
    }

    PipelineOptions& withWorkerThreads(size_t threads) {
        workerThreads = threads;
        return *this;
    }

    PipelineOptions& withEdgeTimeout(std::chrono::milliseconds timeout) {
        edgeTimeout = timeout;
        return *this;
    }

    PipelineOptions& withPipelineTimeout(std::chrono::milliseconds timeout) {
        pipelineTimeout = timeout;
        return *this;
    }

    PipelineOptions& withMaxSnapDistance(double meters) {
        maxSnapDistanceMeters = meters;
        return *this;
    }

    PipelineOptions& withProviderRetries(int retries, std::chrono::milliseconds backoff) {
        providerRetries = retries;
        retryBackoff = backoff;
        return *this;
    }

    // === Serialization ===

    /// JSON object with camelCase keys ("edgeTimeoutMs", "geometryPolicy": "fail"|"drop", ...)
    std::string toJson() const;

    /// Start from balanced() and override the keys present; unknown keys are ignored
    /// @throws std::runtime_error on malformed JSON, a wrong value type or a negative count
    static PipelineOptions fromJson(const std::string& json);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static PipelineOptions loadFromFile(const std::string& path);
};

const char* toString(InvalidGeometryPolicy policy);

/// @throws std::invalid_argument for anything but "fail" or "drop"
InvalidGeometryPolicy parseInvalidGeometryPolicy(const std::string& text);

}  // namespace loginet
