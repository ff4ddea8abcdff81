#pragma once

#include "GeometryExtractor.h"
#include "loginet/core/Graph.h"

#include <vector>

namespace loginet {

/// Builds the complete geodesic graph over located points
///
/// Edges are emitted for every pair i < j in lexicographic (i, j) order and
/// weighted by haversine distance. The result has n(n-1)/2 edges, so memory
/// and time grow quadratically; inputs above largeInputWarning are logged.
class DistanceGraphBuilder {
public:
    static constexpr size_t DEFAULT_LARGE_INPUT_WARNING = 2000;

    explicit DistanceGraphBuilder(size_t largeInputWarning = DEFAULT_LARGE_INPUT_WARNING)
        : largeInputWarning_(largeInputWarning) {}

    WeightedGraph build(const std::vector<LocatedPoint>& points) const;
    WeightedGraph build(const std::vector<GeoPoint>& positions) const;

    /// Number of edges a complete graph over n points has
    static size_t completeEdgeCount(size_t n) { return n < 2 ? 0 : n * (n - 1) / 2; }

private:
    size_t largeInputWarning_;
};

}  // namespace loginet
