#include "loginet/core/Graph.h"

#include <cmath>

namespace loginet {

WeightedGraph::WeightedGraph(size_t nodeCount) {
    addNodes(nodeCount);
}

NodeId WeightedGraph::addNode() {
    NodeId id = static_cast<NodeId>(nodeCount_++);
    adjacency_[id] = {};
    return id;
}

void WeightedGraph::addNodes(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        addNode();
    }
}

bool WeightedGraph::hasNode(NodeId id) const {
    return id < nodeCount_;
}

EdgeId WeightedGraph::addEdge(NodeId a, NodeId b, double weight) {
    return addEdge(WeightedEdge{a, b, weight});
}

EdgeId WeightedGraph::addEdge(const WeightedEdge& edge) {
    if (!hasNode(edge.from) || !hasNode(edge.to)) {
        throw std::invalid_argument("Invalid node ID in edge (" + std::to_string(edge.from) +
                                    ", " + std::to_string(edge.to) + ")");
    }
    if (edge.from == edge.to) {
        throw std::invalid_argument("Self-loop on node " + std::to_string(edge.from));
    }
    if (!std::isfinite(edge.weight) || edge.weight < 0.0) {
        throw std::invalid_argument("Edge weight must be finite and non-negative");
    }

    uint64_t key = pairKey(edge.from, edge.to);
    if (pairIndex_.count(key) != 0) {
        throw std::invalid_argument("Duplicate edge (" + std::to_string(edge.from) +
                                    ", " + std::to_string(edge.to) + ")");
    }

    EdgeId id = static_cast<EdgeId>(edges_.size());
    edges_.push_back(edge);
    adjacency_[edge.from].push_back(id);
    adjacency_[edge.to].push_back(id);
    pairIndex_[key] = id;
    return id;
}

bool WeightedGraph::hasEdge(EdgeId id) const {
    return id < edges_.size();
}

const WeightedEdge& WeightedGraph::getEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return edges_[id];
}

std::optional<WeightedEdge> WeightedGraph::tryGetEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        return std::nullopt;
    }
    return edges_[id];
}

std::vector<NodeId> WeightedGraph::nodes() const {
    std::vector<NodeId> result;
    result.reserve(nodeCount_);
    for (size_t i = 0; i < nodeCount_; ++i) {
        result.push_back(static_cast<NodeId>(i));
    }
    return result;
}

std::vector<NodeId> WeightedGraph::neighbors(NodeId id) const {
    std::vector<NodeId> result;
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return result;

    result.reserve(it->second.size());
    for (EdgeId edgeId : it->second) {
        result.push_back(edges_[edgeId].other(id));
    }
    return result;
}

std::vector<EdgeId> WeightedGraph::getConnectedEdges(NodeId id) const {
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) return {};
    return it->second;
}

size_t WeightedGraph::degree(NodeId id) const {
    auto it = adjacency_.find(id);
    return it == adjacency_.end() ? 0 : it->second.size();
}

std::optional<EdgeId> WeightedGraph::findEdge(NodeId a, NodeId b) const {
    if (!hasNode(a) || !hasNode(b) || a == b) return std::nullopt;

    auto it = pairIndex_.find(pairKey(a, b));
    if (it == pairIndex_.end()) return std::nullopt;
    return it->second;
}

double WeightedGraph::totalWeight() const {
    double total = 0.0;
    for (const auto& edge : edges_) {
        total += edge.weight;
    }
    return total;
}

void WeightedGraph::clear() {
    nodeCount_ = 0;
    edges_.clear();
    adjacency_.clear();
    pairIndex_.clear();
}

uint64_t WeightedGraph::pairKey(NodeId a, NodeId b) {
    NodeId lo = a < b ? a : b;
    NodeId hi = a < b ? b : a;
    return (static_cast<uint64_t>(lo) << 32) | hi;
}

}  // namespace loginet
