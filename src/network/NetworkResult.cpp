#include "loginet/network/NetworkResult.h"

#include <stdexcept>

namespace loginet {

const char* toString(NetworkStatus status) {
    return status == NetworkStatus::NoData ? "no_data" : "ok";
}

NetworkStatus parseNetworkStatus(const std::string& text) {
    if (text == "ok") return NetworkStatus::Ok;
    if (text == "no_data") return NetworkStatus::NoData;
    throw std::invalid_argument("Unknown network status: " + text);
}

NetworkResult::NetworkResult(std::vector<NetworkPoint> points, std::vector<RefinedEdge> edges,
                             NetworkMetadata metadata)
    : points_(std::move(points)), edges_(std::move(edges)), metadata_(metadata) {
    for (const auto& edge : edges_) {
        if (edge.from >= points_.size() || edge.to >= points_.size()) {
            throw std::invalid_argument("Edge " + std::to_string(edge.from) + "-" +
                                        std::to_string(edge.to) + " references a missing point");
        }
        totalDistance_ += edge.weight;
        if (edge.isRefined()) {
            ++refinedCount_;
        }
    }
}

const NetworkPoint* NetworkResult::getPoint(NodeId id) const {
    return id < points_.size() ? &points_[id] : nullptr;
}

std::vector<size_t> NetworkResult::edgesOf(NodeId id) const {
    std::vector<size_t> result;
    for (size_t i = 0; i < edges_.size(); ++i) {
        if (edges_[i].from == id || edges_[i].to == id) {
            result.push_back(i);
        }
    }
    return result;
}

bool NetworkResult::operator==(const NetworkResult& o) const {
    return points_ == o.points_ && edges_ == o.edges_ &&
           metadata_.mode == o.metadata_.mode && metadata_.region == o.metadata_.region &&
           metadata_.droppedRecords == o.metadata_.droppedRecords &&
           metadata_.refinementDegraded == o.metadata_.refinementDegraded;
}

}  // namespace loginet
