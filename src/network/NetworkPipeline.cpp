#include "loginet/network/NetworkPipeline.h"
#include "loginet/common/Logger.h"
#include "loginet/core/Errors.h"
#include "loginet/network/DistanceGraphBuilder.h"
#include "loginet/network/GeometryExtractor.h"
#include "loginet/network/NetworkAssembler.h"
#include "loginet/network/RouteRefiner.h"
#include "loginet/network/SpanningTreeEngine.h"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace loginet {

NetworkPipeline::NetworkPipeline(PipelineOptions options)
    : NetworkPipeline(options, makeExecutor(options.workerThreads)) {}

NetworkPipeline::NetworkPipeline(PipelineOptions options, std::shared_ptr<ITaskExecutor> executor)
    : options_(options), executor_(std::move(executor)) {
    if (!executor_) {
        throw std::invalid_argument("NetworkPipeline requires an executor");
    }
}

std::shared_ptr<ITaskExecutor> NetworkPipeline::makeExecutor(size_t workerThreads) {
    if (workerThreads == 0) {
        return std::make_shared<InlineExecutor>();
    }
    return std::make_shared<ThreadPoolExecutor>(workerThreads);
}

NetworkPipeline::Deadline NetworkPipeline::deadlineFromNow() const {
    if (options_.pipelineTimeout.count() <= 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + options_.pipelineTimeout;
}

std::shared_ptr<const IRoutableNetwork> NetworkPipeline::loadNetwork(IRoutableNetworkProvider& provider,
                                                                     const BoundingBox& region,
                                                                     const Deadline& deadline) {
    auto backoff = options_.retryBackoff;
    const int attempts = options_.providerRetries + 1;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            LOG_WARN("Pipeline deadline reached before {} attempt {}; continuing with geodesic weights",
                     provider.name(), attempt);
            break;
        }
        stats_.providerAttempts = attempt;
        try {
            auto network = provider.load(region);
            if (!network) {
                throw ExternalProviderError(std::string(provider.name()) + " returned no network");
            }
            return network;
        } catch (const ExternalProviderError& e) {
            if (attempt == attempts) {
                LOG_WARN("{} failed after {} attempt(s): {}; continuing with geodesic weights",
                         provider.name(), attempt, e.what());
                break;
            }
            if (deadline && std::chrono::steady_clock::now() + backoff >= *deadline) {
                LOG_WARN("{} attempt {}/{} failed: {}; no time left before the pipeline deadline",
                         provider.name(), attempt, attempts, e.what());
                break;
            }
            LOG_WARN("{} attempt {}/{} failed: {}; retrying in {} ms",
                     provider.name(), attempt, attempts, e.what(), backoff.count());
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    return nullptr;
}

NetworkResult NetworkPipeline::run(const std::vector<FacilityRecord>& records,
                                   const BoundingBox& region,
                                   CategoryMode mode,
                                   std::shared_ptr<IRoutableNetworkProvider> provider) {
    return runUntil(records, region, mode, std::move(provider), deadlineFromNow());
}

NetworkResult NetworkPipeline::runUntil(const std::vector<FacilityRecord>& records,
                                        const BoundingBox& region,
                                        CategoryMode mode,
                                        std::shared_ptr<IRoutableNetworkProvider> provider,
                                        const Deadline& deadline) {
    if (!region.isValid()) {
        throw std::invalid_argument("Invalid region: " + region.toString());
    }

    stats_ = PipelineStats{};

    LOG_INFO("Building {} network for {} from {} records", toString(mode), region.toString(), records.size());

    // 1. Extract
    ExtractionResult extraction;
    {
        StageTimer timer("extract", stats_.extractMs);
        extraction = GeometryExtractor(options_.geometryPolicy).extract(records);
    }

    // 2. Complete geodesic graph
    WeightedGraph graph;
    {
        StageTimer timer("distance graph", stats_.buildMs);
        graph = DistanceGraphBuilder(options_.largeInputWarning).build(extraction.points);
    }

    // 3. Minimum spanning tree
    std::vector<WeightedEdge> tree;
    {
        StageTimer timer("spanning tree", stats_.spanningTreeMs);
        tree = SpanningTreeEngine().computeMst(graph);
    }

    // 4. Road refinement
    RefinementResult refinement;
    if (!options_.refineRoutes || !provider) {
        refinement = RefinementResult::allFallback(tree, FallbackReason::RefinementDisabled);
    } else if (!tree.empty()) {
        std::shared_ptr<const IRoutableNetwork> network;
        {
            StageTimer timer("road network load", stats_.networkLoadMs);
            network = loadNetwork(*provider, region, deadline);
        }

        if (!network) {
            refinement = RefinementResult::allFallback(tree, FallbackReason::RefinementSkipped);
        } else {
            StageTimer timer("route refinement", stats_.refineMs);
            RefinerOptions refinerOptions;
            refinerOptions.edgeTimeout = options_.edgeTimeout;
            refinerOptions.maxSnapDistanceMeters = options_.maxSnapDistanceMeters;
            refinerOptions.deadline = deadline;
            refinement = RouteRefiner(executor_, refinerOptions).refine(extraction.points, tree, network);
        }
    }

    // 5. Assemble
    NetworkMetadata metadata;
    metadata.mode = mode;
    metadata.region = region;
    metadata.droppedRecords = extraction.droppedTotal();
    NetworkResult result;
    {
        StageTimer timer("assemble", stats_.assembleMs);
        result = NetworkAssembler().assemble(extraction.points, refinement, metadata);
    }

    if (result.refinementDegraded()) {
        LOG_WARN("Route refinement degraded; all edges use geodesic weights");
    }
    LOG_INFO("Network ready: {} nodes, {} edges, {:.1f} m total ({} refined) in {:.1f} ms",
             result.nodesCount(), result.edgesCount(), result.totalDistance(),
             result.refinedCount(), stats_.totalMs());
    return result;
}

NetworkResult NetworkPipeline::run(IFeatureSource& source,
                                   const BoundingBox& region,
                                   CategoryMode mode,
                                   std::shared_ptr<IRoutableNetworkProvider> provider) {
    if (!region.isValid()) {
        throw std::invalid_argument("Invalid region: " + region.toString());
    }

    const Deadline deadline = deadlineFromNow();
    std::vector<FacilityRecord> records;
    double fetchMs = 0.0;
    {
        StageTimer timer("fetch", fetchMs);
        records = source.fetch(region, mode);
    }
    LOG_DEBUG("Fetched {} records from {}", records.size(), source.name());

    NetworkResult result = runUntil(records, region, mode, std::move(provider), deadline);
    stats_.fetchMs = fetchMs;
    return result;
}

}  // namespace loginet
