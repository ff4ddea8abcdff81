#pragma once

#include "Types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace loginet {

/// Undirected weighted edge between two point indices
///
/// Stored in canonical form (from < to). Weight is in meters.
struct WeightedEdge {
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    double weight = 0.0;

    WeightedEdge() = default;
    WeightedEdge(NodeId a, NodeId b, double w)
        : from(a < b ? a : b), to(a < b ? b : a), weight(w) {}

    /// The endpoint opposite to `id`
    NodeId other(NodeId id) const { return id == from ? to : from; }

    bool operator==(const WeightedEdge& o) const {
        return from == o.from && to == o.to && weight == o.weight;
    }
    bool operator!=(const WeightedEdge& o) const { return !(*this == o); }
};

/// Undirected weighted graph over dense node ids 0..n-1
///
/// Nodes are the indices of located points, so they are never removed.
/// Parallel edges and self-loops are rejected.
class WeightedGraph {
public:
    WeightedGraph() = default;
    explicit WeightedGraph(size_t nodeCount);
    virtual ~WeightedGraph() = default;

    WeightedGraph(const WeightedGraph&) = default;
    WeightedGraph& operator=(const WeightedGraph&) = default;
    WeightedGraph(WeightedGraph&&) = default;
    WeightedGraph& operator=(WeightedGraph&&) = default;

    // Node operations
    NodeId addNode();
    void addNodes(size_t count);
    bool hasNode(NodeId id) const;

    // Edge operations
    // addEdge() throws std::invalid_argument for unknown nodes, self-loops,
    // duplicate pairs, and negative or non-finite weights.
    EdgeId addEdge(NodeId a, NodeId b, double weight);
    EdgeId addEdge(const WeightedEdge& edge);
    bool hasEdge(EdgeId id) const;

    // Edge access API:
    // - getEdge(): throws std::out_of_range if ID is invalid.
    // - tryGetEdge(): returns std::nullopt if ID is invalid.
    const WeightedEdge& getEdge(EdgeId id) const;
    std::optional<WeightedEdge> tryGetEdge(EdgeId id) const;

    // Queries
    size_t nodeCount() const { return nodeCount_; }
    size_t edgeCount() const { return edges_.size(); }

    std::vector<NodeId> nodes() const;
    const std::vector<WeightedEdge>& edges() const { return edges_; }

    std::vector<NodeId> neighbors(NodeId id) const;
    std::vector<EdgeId> getConnectedEdges(NodeId id) const;
    size_t degree(NodeId id) const;

    /// Find the edge joining two nodes regardless of argument order
    std::optional<EdgeId> findEdge(NodeId a, NodeId b) const;

    /// Sum of all edge weights in meters
    double totalWeight() const;

    virtual void clear();

private:
    static uint64_t pairKey(NodeId a, NodeId b);

    size_t nodeCount_ = 0;
    std::vector<WeightedEdge> edges_;

    // Adjacency lists
    std::unordered_map<NodeId, std::vector<EdgeId>> adjacency_;
    std::unordered_map<uint64_t, EdgeId> pairIndex_;
};

}  // namespace loginet
