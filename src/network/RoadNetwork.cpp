#include "loginet/network/RoadNetwork.h"
#include "loginet/common/Logger.h"
#include "loginet/core/Errors.h"
#include "loginet/core/GeoUtils.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <functional>
#include <limits>
#include <queue>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace loginet {

namespace {

// Open-set entry ordered by (distance, id) so equal-cost frontiers expand deterministically
struct QueueEntry {
    double distance;
    RoadNodeId id;

    bool operator>(const QueueEntry& other) const {
        if (distance != other.distance) return distance > other.distance;
        return id > other.id;
    }
};

struct Predecessor {
    RoadNodeId node;
    double length;
};

}  // namespace

void RoadNetwork::addNode(RoadNodeId id, const GeoPoint& location) {
    if (!location.isValid()) {
        throw std::invalid_argument("Road node " + std::to_string(id) + " has an invalid coordinate");
    }
    locations_[id] = location;
}

void RoadNetwork::addSegment(RoadNodeId from, RoadNodeId to, double length, bool oneway) {
    auto fromIt = locations_.find(from);
    auto toIt = locations_.find(to);
    if (fromIt == locations_.end() || toIt == locations_.end()) {
        throw std::invalid_argument("Road segment " + std::to_string(from) + "->" +
                                    std::to_string(to) + " references an unknown node");
    }
    if (!std::isfinite(length)) {
        throw std::invalid_argument("Road segment length must be finite");
    }
    if (length < 0.0) {
        length = geo::haversineDistance(fromIt->second, toIt->second);
    }

    adjacency_[from].push_back({from, to, length});
    ++segmentCount_;
    if (!oneway) {
        adjacency_[to].push_back({to, from, length});
        ++segmentCount_;
    }
}

std::optional<RoadNodeId> RoadNetwork::nearestNode(double latitude, double longitude) const {
    std::optional<RoadNodeId> best;
    double bestDistance = std::numeric_limits<double>::infinity();

    for (const auto& [id, location] : locations_) {
        double distance = geo::haversineDistance(latitude, longitude, location.latitude, location.longitude);
        if (distance < bestDistance || (distance == bestDistance && best && id < *best)) {
            bestDistance = distance;
            best = id;
        }
    }
    return best;
}

std::optional<GeoPoint> RoadNetwork::nodeLocation(RoadNodeId id) const {
    auto it = locations_.find(id);
    if (it == locations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RoadSegment> RoadNetwork::outgoing(RoadNodeId id) const {
    auto it = adjacency_.find(id);
    if (it == adjacency_.end()) {
        return {};
    }
    return it->second;
}

std::optional<RoutePath> RoadNetwork::shortestPath(RoadNodeId from, RoadNodeId to) const {
    if (!hasNode(from) || !hasNode(to)) {
        return std::nullopt;
    }
    if (from == to) {
        RoutePath trivial;
        trivial.nodes.push_back(from);
        return trivial;
    }

    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> openSet;
    std::unordered_map<RoadNodeId, double> distance;
    std::unordered_map<RoadNodeId, Predecessor> cameFrom;

    distance[from] = 0.0;
    openSet.push({0.0, from});

    bool found = false;
    while (!openSet.empty()) {
        QueueEntry current = openSet.top();
        openSet.pop();

        auto known = distance.find(current.id);
        if (known != distance.end() && current.distance > known->second) {
            continue;  // Stale entry
        }
        if (current.id == to) {
            found = true;
            break;
        }

        auto adjacent = adjacency_.find(current.id);
        if (adjacent == adjacency_.end()) {
            continue;
        }
        for (const auto& segment : adjacent->second) {
            double candidate = current.distance + segment.length;
            auto it = distance.find(segment.to);
            if (it == distance.end() || candidate < it->second) {
                distance[segment.to] = candidate;
                cameFrom[segment.to] = {current.id, segment.length};
                openSet.push({candidate, segment.to});
            }
        }
    }

    if (!found) {
        return std::nullopt;
    }

    // Reconstruct path
    RoutePath path;
    RoadNodeId node = to;
    while (node != from) {
        const Predecessor& previous = cameFrom.at(node);
        path.nodes.push_back(node);
        path.segmentLengths.push_back(previous.length);
        node = previous.node;
    }
    path.nodes.push_back(from);
    std::reverse(path.nodes.begin(), path.nodes.end());
    std::reverse(path.segmentLengths.begin(), path.segmentLengths.end());
    return path;
}

RoadNetwork RoadNetwork::clipped(const BoundingBox& region) const {
    RoadNetwork result;
    for (const auto& [id, location] : locations_) {
        if (region.contains(location)) {
            result.locations_[id] = location;
        }
    }
    for (const auto& [id, segments] : adjacency_) {
        if (!result.hasNode(id)) continue;
        for (const auto& segment : segments) {
            if (result.hasNode(segment.to)) {
                result.adjacency_[id].push_back(segment);
                ++result.segmentCount_;
            }
        }
    }
    return result;
}

RoadNetwork RoadNetwork::fromJson(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid road network JSON: ") + e.what());
    }

    if (!root.is_object() || !root.contains("nodes") || !root["nodes"].is_array()) {
        throw std::runtime_error("Road network JSON must contain a 'nodes' array");
    }

    RoadNetwork network;
    try {
        for (const auto& node : root["nodes"]) {
            network.addNode(node.at("id").get<RoadNodeId>(),
                            {node.at("lat").get<double>(), node.at("lon").get<double>()});
        }
        if (root.contains("edges")) {
            for (const auto& edge : root["edges"]) {
                network.addSegment(edge.at("from").get<RoadNodeId>(),
                                   edge.at("to").get<RoadNodeId>(),
                                   edge.value("length", -1.0),
                                   edge.value("oneway", false));
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed road network entry: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid road network entry: ") + e.what());
    }
    return network;
}

RoadNetwork RoadNetwork::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open road network file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return fromJson(buffer.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

// =============================================================================
// RoadNetworkFileProvider
// =============================================================================

RoadNetworkFileProvider::RoadNetworkFileProvider(std::string path, double marginDegrees)
    : path_(std::move(path)), marginDegrees_(marginDegrees) {}

std::shared_ptr<const IRoutableNetwork> RoadNetworkFileProvider::load(const BoundingBox& region) {
    if (!full_) {
        try {
            full_ = std::make_shared<const RoadNetwork>(RoadNetwork::loadFromFile(path_));
        } catch (const std::runtime_error& e) {
            throw ExternalProviderError(e.what());
        }
        LOG_INFO("Loaded road network {}: {} nodes, {} segments",
                 path_, full_->nodeCount(), full_->segmentCount());
    }

    auto network = std::make_shared<const RoadNetwork>(full_->clipped(region.expanded(marginDegrees_)));
    LOG_DEBUG("Clipped road network to {} (+{} deg): {} nodes",
              region.toString(), marginDegrees_, network->nodeCount());
    return network;
}

}  // namespace loginet
