#pragma once

#include "GeometryExtractor.h"
#include "IRoutableNetwork.h"
#include "loginet/core/Graph.h"
#include "loginet/core/TaskExecutor.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loginet {

/// Whether an edge weight came from the road network or stayed geodesic
enum class EdgeStatus {
    Refined,
    Fallback
};

/// Why an edge kept its geodesic weight
enum class FallbackReason {
    None,                ///< Edge was refined
    NoPath,              ///< Snapped nodes are not connected
    SnapFailed,          ///< An endpoint has no road node (or none within range)
    SameSnapNode,        ///< Both endpoints snapped to one road node
    ProviderError,       ///< The network raised an error for this query
    Timeout,             ///< Per-edge timeout or pipeline deadline expired
    RefinementSkipped,   ///< The network could not be loaded; stage degraded
    RefinementDisabled   ///< Refinement turned off or no provider configured
};

const char* toString(EdgeStatus status);
const char* toString(FallbackReason reason);

/// @throws std::invalid_argument for an unknown name
EdgeStatus parseEdgeStatus(const std::string& text);
FallbackReason parseFallbackReason(const std::string& text);

/// A spanning tree edge after the refinement stage
struct RefinedEdge {
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    double weight = 0.0;          ///< Final weight in meters
    double geodesicWeight = 0.0;  ///< Haversine weight from the spanning tree
    EdgeStatus status = EdgeStatus::Fallback;
    FallbackReason reason = FallbackReason::None;

    bool isRefined() const { return status == EdgeStatus::Refined; }

    static RefinedEdge refined(const WeightedEdge& edge, double roadLength);
    static RefinedEdge fallback(const WeightedEdge& edge, FallbackReason reason);

    bool operator==(const RefinedEdge& o) const {
        return from == o.from && to == o.to && weight == o.weight &&
               geodesicWeight == o.geodesicWeight && status == o.status && reason == o.reason;
    }
};

struct RefinerOptions {
    /// Upper bound on one query, measured from when a worker starts it (0 = unlimited)
    std::chrono::milliseconds edgeTimeout{0};

    /// Absolute deadline for the whole stage; unfinished edges fall back
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /// Reject snaps farther than this from the facility (0 = unlimited)
    double maxSnapDistanceMeters = 0.0;
};

struct RefinementResult {
    std::vector<RefinedEdge> edges;  ///< Same order and endpoints as the input tree
    size_t refinedCount = 0;
    size_t fallbackCount = 0;

    /// Every edge failed with a provider error, or the network was unavailable
    bool degraded = false;

    /// Every edge falls back with the same reason, weights stay geodesic
    static RefinementResult allFallback(const std::vector<WeightedEdge>& tree, FallbackReason reason);
};

/// Replaces geodesic spanning-tree weights with road-network path lengths
///
/// Each point is snapped once; every edge is then routed as an independent
/// task on the executor and joined back into its input slot. Failures never
/// propagate: the edge keeps its geodesic weight and records the reason.
/// The network is shared read-only with the tasks. A query queued behind a
/// slow one is not charged for the wait: its edge timeout starts when a
/// worker picks it up, and only the deadline bounds time spent queued.
class RouteRefiner {
public:
    explicit RouteRefiner(std::shared_ptr<ITaskExecutor> executor, RefinerOptions options = {});

    RefinementResult refine(const std::vector<LocatedPoint>& points,
                            const std::vector<WeightedEdge>& tree,
                            std::shared_ptr<const IRoutableNetwork> network) const;

    const RefinerOptions& options() const { return options_; }

private:
    struct SnapOutcome {
        std::optional<RoadNodeId> node;
        FallbackReason failure = FallbackReason::SnapFailed;
    };

    struct RouteOutcome {
        std::optional<double> length;
        FallbackReason failure = FallbackReason::NoPath;
    };

    /// Start times of submitted tasks, shared with the tasks themselves
    class TaskStarts;

    /// Result of task `index`, or nullopt once its timeout or the deadline expired
    template <class T>
    std::optional<T> await(std::future<T>& future, TaskStarts& starts, size_t index) const;

    std::vector<SnapOutcome> snapPoints(const std::vector<LocatedPoint>& points,
                                        const std::vector<bool>& used,
                                        const std::shared_ptr<const IRoutableNetwork>& network) const;

    static SnapOutcome snapOne(const IRoutableNetwork& network, const GeoPoint& position,
                               double maxSnapDistanceMeters);
    static RouteOutcome routeOne(const IRoutableNetwork& network,
                                 const SnapOutcome& source, const SnapOutcome& target);

    std::shared_ptr<ITaskExecutor> executor_;
    RefinerOptions options_;
};

}  // namespace loginet
