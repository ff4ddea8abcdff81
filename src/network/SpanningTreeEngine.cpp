#include "loginet/network/SpanningTreeEngine.h"
#include "loginet/common/Logger.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace loginet {

UnionFind::UnionFind(size_t size)
    : parent_(size), rank_(size, 0), components_(size) {
    std::iota(parent_.begin(), parent_.end(), NodeId{0});
}

NodeId UnionFind::find(NodeId x) {
    NodeId root = x;
    while (parent_[root] != root) {
        root = parent_[root];
    }
    while (parent_[x] != root) {
        NodeId next = parent_[x];
        parent_[x] = root;
        x = next;
    }
    return root;
}

bool UnionFind::unite(NodeId a, NodeId b) {
    NodeId rootA = find(a);
    NodeId rootB = find(b);
    if (rootA == rootB) {
        return false;
    }
    if (rank_[rootA] < rank_[rootB]) {
        std::swap(rootA, rootB);
    }
    parent_[rootB] = rootA;
    if (rank_[rootA] == rank_[rootB]) {
        ++rank_[rootA];
    }
    --components_;
    return true;
}

bool SpanningTreeEngine::edgeLess(const WeightedEdge& a, const WeightedEdge& b) {
    if (a.weight != b.weight) return a.weight < b.weight;
    if (a.from != b.from) return a.from < b.from;
    return a.to < b.to;
}

std::vector<WeightedEdge> SpanningTreeEngine::computeMst(const WeightedGraph& graph) const {
    const size_t n = graph.nodeCount();
    std::vector<WeightedEdge> tree;
    if (n < 2) {
        return tree;
    }

    std::vector<WeightedEdge> sorted = graph.edges();
    std::sort(sorted.begin(), sorted.end(), edgeLess);

    UnionFind forest(n);
    tree.reserve(n - 1);
    for (const auto& edge : sorted) {
        if (forest.unite(edge.from, edge.to)) {
            tree.push_back(edge);
            if (tree.size() == n - 1) {
                break;
            }
        }
    }

    if (tree.size() != n - 1) {
        throw std::logic_error("Graph is disconnected: spanning forest has " +
                               std::to_string(forest.componentCount()) + " components");
    }

    LOG_DEBUG("MST selected {} of {} edges", tree.size(), graph.edgeCount());
    return tree;
}

}  // namespace loginet
