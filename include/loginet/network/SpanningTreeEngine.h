#pragma once

#include "loginet/core/Graph.h"

#include <vector>

namespace loginet {

/// Disjoint-set forest with path compression and union by rank
class UnionFind {
public:
    explicit UnionFind(size_t size);

    NodeId find(NodeId x);

    /// Merge the sets containing a and b
    /// @return false if they were already in the same set
    bool unite(NodeId a, NodeId b);

    size_t componentCount() const { return components_; }

private:
    std::vector<NodeId> parent_;
    std::vector<uint8_t> rank_;
    size_t components_;
};

/// Minimum spanning tree over a connected weighted graph (Kruskal)
///
/// Ties are broken by (from, to) so the selected edge set is a pure function
/// of the input. Output edges are sorted by (weight, from, to).
class SpanningTreeEngine {
public:
    /// @return exactly nodeCount - 1 edges (none for 0 or 1 nodes)
    /// @throws std::logic_error if the graph is disconnected
    std::vector<WeightedEdge> computeMst(const WeightedGraph& graph) const;

    /// Comparator used for edge ordering
    static bool edgeLess(const WeightedEdge& a, const WeightedEdge& b);
};

}  // namespace loginet
