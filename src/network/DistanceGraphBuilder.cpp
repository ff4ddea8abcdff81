#include "loginet/network/DistanceGraphBuilder.h"
#include "loginet/common/Logger.h"
#include "loginet/core/GeoUtils.h"

namespace loginet {

WeightedGraph DistanceGraphBuilder::build(const std::vector<LocatedPoint>& points) const {
    std::vector<GeoPoint> positions;
    positions.reserve(points.size());
    for (const auto& point : points) {
        positions.push_back(point.position());
    }
    return build(positions);
}

WeightedGraph DistanceGraphBuilder::build(const std::vector<GeoPoint>& positions) const {
    const size_t n = positions.size();
    if (largeInputWarning_ > 0 && n > largeInputWarning_) {
        LOG_WARN("Building complete graph over {} points ({} edges); cost grows quadratically",
                 n, completeEdgeCount(n));
    }

    WeightedGraph graph(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            double distance = geo::haversineDistance(positions[i], positions[j]);
            graph.addEdge(static_cast<NodeId>(i), static_cast<NodeId>(j), distance);
        }
    }

    LOG_DEBUG("Distance graph: {} nodes, {} edges", graph.nodeCount(), graph.edgeCount());
    return graph;
}

}  // namespace loginet
