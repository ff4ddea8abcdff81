#include "loginet/network/RouteRefiner.h"
#include "loginet/common/Logger.h"
#include "loginet/core/Errors.h"
#include "loginet/core/GeoUtils.h"

#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace loginet {

const char* toString(EdgeStatus status) {
    switch (status) {
        case EdgeStatus::Refined:  return "refined";
        case EdgeStatus::Fallback: return "fallback";
    }
    return "fallback";
}

const char* toString(FallbackReason reason) {
    switch (reason) {
        case FallbackReason::None:               return "none";
        case FallbackReason::NoPath:             return "no_path";
        case FallbackReason::SnapFailed:         return "snap_failed";
        case FallbackReason::SameSnapNode:       return "same_snap_node";
        case FallbackReason::ProviderError:      return "provider_error";
        case FallbackReason::Timeout:            return "timeout";
        case FallbackReason::RefinementSkipped:  return "refinement_skipped";
        case FallbackReason::RefinementDisabled: return "refinement_disabled";
    }
    return "none";
}

EdgeStatus parseEdgeStatus(const std::string& text) {
    if (text == "refined") return EdgeStatus::Refined;
    if (text == "fallback") return EdgeStatus::Fallback;
    throw std::invalid_argument("Unknown edge status: " + text);
}

FallbackReason parseFallbackReason(const std::string& text) {
    static const FallbackReason all[] = {
        FallbackReason::None, FallbackReason::NoPath, FallbackReason::SnapFailed,
        FallbackReason::SameSnapNode, FallbackReason::ProviderError, FallbackReason::Timeout,
        FallbackReason::RefinementSkipped, FallbackReason::RefinementDisabled};
    for (FallbackReason reason : all) {
        if (text == toString(reason)) return reason;
    }
    throw std::invalid_argument("Unknown fallback reason: " + text);
}

RefinedEdge RefinedEdge::refined(const WeightedEdge& edge, double roadLength) {
    RefinedEdge result;
    result.from = edge.from;
    result.to = edge.to;
    result.weight = roadLength;
    result.geodesicWeight = edge.weight;
    result.status = EdgeStatus::Refined;
    result.reason = FallbackReason::None;
    return result;
}

RefinedEdge RefinedEdge::fallback(const WeightedEdge& edge, FallbackReason reason) {
    RefinedEdge result;
    result.from = edge.from;
    result.to = edge.to;
    result.weight = edge.weight;
    result.geodesicWeight = edge.weight;
    result.status = EdgeStatus::Fallback;
    result.reason = reason;
    return result;
}

RefinementResult RefinementResult::allFallback(const std::vector<WeightedEdge>& tree, FallbackReason reason) {
    RefinementResult result;
    result.edges.reserve(tree.size());
    for (const auto& edge : tree) {
        result.edges.push_back(RefinedEdge::fallback(edge, reason));
    }
    result.fallbackCount = tree.size();
    result.degraded = reason == FallbackReason::RefinementSkipped;
    return result;
}

// =============================================================================
// RouteRefiner
// =============================================================================

RouteRefiner::RouteRefiner(std::shared_ptr<ITaskExecutor> executor, RefinerOptions options)
    : executor_(std::move(executor)), options_(options) {
    if (!executor_) {
        throw std::invalid_argument("RouteRefiner requires an executor");
    }
}

class RouteRefiner::TaskStarts {
public:
    explicit TaskStarts(size_t count) : starts_(count) {}

    void markStarted(size_t index) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            starts_[index] = std::chrono::steady_clock::now();
        }
        started_.notify_all();
    }

    /// Blocks until task `index` has started; nullopt if the deadline came first
    std::optional<std::chrono::steady_clock::time_point> waitStarted(
        size_t index, const std::optional<std::chrono::steady_clock::time_point>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto hasStarted = [this, index] { return starts_[index].has_value(); };
        if (deadline) {
            started_.wait_until(lock, *deadline, hasStarted);
        } else {
            started_.wait(lock, hasStarted);
        }
        return starts_[index];
    }

private:
    std::mutex mutex_;
    std::condition_variable started_;
    std::vector<std::optional<std::chrono::steady_clock::time_point>> starts_;
};

template <class T>
std::optional<T> RouteRefiner::await(std::future<T>& future, TaskStarts& starts, size_t index) const {
    auto started = starts.waitStarted(index, options_.deadline);
    if (!started) {
        return std::nullopt;
    }

    std::optional<std::chrono::steady_clock::time_point> limit = options_.deadline;
    if (options_.edgeTimeout.count() > 0) {
        auto edgeLimit = *started + options_.edgeTimeout;
        if (!limit || edgeLimit < *limit) {
            limit = edgeLimit;
        }
    }
    if (limit && future.wait_until(*limit) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

RouteRefiner::SnapOutcome RouteRefiner::snapOne(const IRoutableNetwork& network, const GeoPoint& position,
                                                double maxSnapDistanceMeters) {
    SnapOutcome outcome;
    try {
        outcome.node = network.nearestNode(position.latitude, position.longitude);
        if (!outcome.node) {
            outcome.failure = FallbackReason::SnapFailed;
            return outcome;
        }
        if (maxSnapDistanceMeters > 0.0) {
            auto location = network.nodeLocation(*outcome.node);
            if (!location || geo::haversineDistance(position, *location) > maxSnapDistanceMeters) {
                outcome.node.reset();
                outcome.failure = FallbackReason::SnapFailed;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Snapping ({}, {}) failed: {}", position.latitude, position.longitude, e.what());
        outcome.node.reset();
        outcome.failure = FallbackReason::ProviderError;
    } catch (...) {
        LOG_DEBUG("Snapping ({}, {}) failed with a non-standard exception", position.latitude, position.longitude);
        outcome.node.reset();
        outcome.failure = FallbackReason::ProviderError;
    }
    return outcome;
}

RouteRefiner::RouteOutcome RouteRefiner::routeOne(const IRoutableNetwork& network,
                                                  const SnapOutcome& source, const SnapOutcome& target) {
    RouteOutcome outcome;
    if (!source.node) {
        outcome.failure = source.failure;
        return outcome;
    }
    if (!target.node) {
        outcome.failure = target.failure;
        return outcome;
    }
    if (*source.node == *target.node) {
        outcome.failure = FallbackReason::SameSnapNode;
        return outcome;
    }

    try {
        auto path = network.shortestPath(*source.node, *target.node);
        if (path && path->isRoutable()) {
            outcome.length = path->totalLength();
        } else {
            outcome.failure = FallbackReason::NoPath;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Routing {} -> {} failed: {}", *source.node, *target.node, e.what());
        outcome.failure = FallbackReason::ProviderError;
    } catch (...) {
        LOG_DEBUG("Routing {} -> {} failed with a non-standard exception", *source.node, *target.node);
        outcome.failure = FallbackReason::ProviderError;
    }
    return outcome;
}

std::vector<RouteRefiner::SnapOutcome> RouteRefiner::snapPoints(
    const std::vector<LocatedPoint>& points,
    const std::vector<bool>& used,
    const std::shared_ptr<const IRoutableNetwork>& network) const {

    const double maxSnap = options_.maxSnapDistanceMeters;
    auto starts = std::make_shared<TaskStarts>(points.size());
    std::vector<std::optional<std::future<SnapOutcome>>> pending(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        if (!used[i]) continue;
        GeoPoint position = points[i].position();
        pending[i] = submitTask(*executor_, [network, starts, i, position, maxSnap]() {
            starts->markStarted(i);
            return snapOne(*network, position, maxSnap);
        });
    }

    std::vector<SnapOutcome> snaps(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        if (!pending[i]) continue;
        auto outcome = await(*pending[i], *starts, i);
        if (outcome) {
            snaps[i] = *outcome;
        } else {
            snaps[i].failure = FallbackReason::Timeout;
        }
    }
    return snaps;
}

RefinementResult RouteRefiner::refine(const std::vector<LocatedPoint>& points,
                                      const std::vector<WeightedEdge>& tree,
                                      std::shared_ptr<const IRoutableNetwork> network) const {
    if (tree.empty()) {
        return {};
    }
    if (!network) {
        return RefinementResult::allFallback(tree, FallbackReason::RefinementDisabled);
    }

    std::vector<bool> used(points.size(), false);
    for (const auto& edge : tree) {
        if (edge.from >= points.size() || edge.to >= points.size()) {
            throw std::out_of_range("Tree edge references a point outside the extracted set");
        }
        used[edge.from] = true;
        used[edge.to] = true;
    }

    const std::vector<SnapOutcome> snaps = snapPoints(points, used, network);

    auto starts = std::make_shared<TaskStarts>(tree.size());
    std::vector<std::future<RouteOutcome>> pending;
    pending.reserve(tree.size());
    for (size_t k = 0; k < tree.size(); ++k) {
        SnapOutcome source = snaps[tree[k].from];
        SnapOutcome target = snaps[tree[k].to];
        pending.push_back(submitTask(*executor_, [network, starts, k, source, target]() {
            starts->markStarted(k);
            return routeOne(*network, source, target);
        }));
    }

    RefinementResult result;
    result.edges.reserve(tree.size());
    size_t providerErrors = 0;
    for (size_t k = 0; k < tree.size(); ++k) {
        const WeightedEdge& edge = tree[k];
        auto outcome = await(pending[k], *starts, k);

        if (outcome && outcome->length) {
            result.edges.push_back(RefinedEdge::refined(edge, *outcome->length));
            ++result.refinedCount;
            continue;
        }

        FallbackReason reason = outcome ? outcome->failure : FallbackReason::Timeout;
        if (reason == FallbackReason::ProviderError) {
            ++providerErrors;
        }
        LOG_DEBUG("Edge {}-{} keeps geodesic weight {:.1f} m ({})",
                  edge.from, edge.to, edge.weight, toString(reason));
        result.edges.push_back(RefinedEdge::fallback(edge, reason));
        ++result.fallbackCount;
    }

    result.degraded = providerErrors == tree.size();
    if (result.degraded) {
        LOG_WARN("Route refinement degraded: all {} edges failed with provider errors", tree.size());
    }
    LOG_DEBUG("Route refinement: {} refined, {} fallback", result.refinedCount, result.fallbackCount);
    return result;
}

}  // namespace loginet
