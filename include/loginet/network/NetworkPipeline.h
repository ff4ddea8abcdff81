#pragma once

#include "IRoutableNetwork.h"
#include "NetworkResult.h"
#include "PipelineOptions.h"
#include "loginet/core/TaskExecutor.h"
#include "loginet/facility/IFeatureSource.h"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace loginet {

/// Wall-clock time spent in each stage of the last run, in milliseconds
struct PipelineStats {
    double fetchMs = 0.0;
    double extractMs = 0.0;
    double buildMs = 0.0;
    double spanningTreeMs = 0.0;
    double networkLoadMs = 0.0;
    double refineMs = 0.0;
    double assembleMs = 0.0;
    int providerAttempts = 0;   ///< Road network load attempts (0 when refinement is off)

    double totalMs() const {
        return fetchMs + extractMs + buildMs + spanningTreeMs + networkLoadMs + refineMs + assembleMs;
    }
};

/// Runs extraction, graph construction, spanning tree, route refinement and
/// assembly in order and returns the facility network
///
/// Routing workers live as long as the pipeline so a timed-out query can
/// finish in the background without blocking the run that abandoned it.
/// PipelineOptions::pipelineTimeout starts when run() is entered and bounds
/// provider retries and route refinement; stages already in progress when it
/// expires (fetch, extraction, spanning tree) are not interrupted.
class NetworkPipeline {
public:
    explicit NetworkPipeline(PipelineOptions options = PipelineOptions::balanced());

    /// Use a caller-provided executor for routing queries
    NetworkPipeline(PipelineOptions options, std::shared_ptr<ITaskExecutor> executor);

    /// @param provider Road network source; nullptr keeps geodesic weights
    /// @throws std::invalid_argument for an invalid region
    /// @throws InvalidGeometryError under InvalidGeometryPolicy::Fail
    NetworkResult run(const std::vector<FacilityRecord>& records,
                      const BoundingBox& region,
                      CategoryMode mode,
                      std::shared_ptr<IRoutableNetworkProvider> provider = nullptr);

    /// Fetch records from a feature source, then run as above
    NetworkResult run(IFeatureSource& source,
                      const BoundingBox& region,
                      CategoryMode mode,
                      std::shared_ptr<IRoutableNetworkProvider> provider = nullptr);

    const PipelineOptions& options() const { return options_; }
    const PipelineStats& lastStats() const { return stats_; }

private:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    Deadline deadlineFromNow() const;

    NetworkResult runUntil(const std::vector<FacilityRecord>& records,
                           const BoundingBox& region,
                           CategoryMode mode,
                           std::shared_ptr<IRoutableNetworkProvider> provider,
                           const Deadline& deadline);

    /// Load the road network with retries; nullptr once every attempt failed
    /// or the deadline left no time for another one
    std::shared_ptr<const IRoutableNetwork> loadNetwork(IRoutableNetworkProvider& provider,
                                                        const BoundingBox& region,
                                                        const Deadline& deadline);

    static std::shared_ptr<ITaskExecutor> makeExecutor(size_t workerThreads);

    PipelineOptions options_;
    std::shared_ptr<ITaskExecutor> executor_;
    PipelineStats stats_;
};

}  // namespace loginet
