#pragma once

#include <loginet/core/Errors.h>
#include <loginet/core/GeoUtils.h>
#include <loginet/network/IRoutableNetwork.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <thread>
#include <utility>
#include <vector>

namespace loginet::test {

/// Deterministic IRoutableNetwork whose nodes and paths are scripted by the test
///
/// nearestNode() snaps to the closest scripted node; shortestPath() returns
/// the scripted segments for a pair (in either direction) or no path.
class ScriptedNetwork : public IRoutableNetwork {
public:
    void addNode(RoadNodeId id, const GeoPoint& location) {
        nodes_.emplace_back(id, location);
    }

    /// Script a path between two nodes as a list of segment lengths
    void setPath(RoadNodeId from, RoadNodeId to, std::vector<double> segments) {
        paths_[{from, to}] = std::move(segments);
    }

    /// Delay only the route between two nodes (either direction)
    void setPathDelay(RoadNodeId from, RoadNodeId to, std::chrono::milliseconds delay) {
        delays_[{from, to}] = delay;
    }

    std::optional<RoadNodeId> nearestNode(double latitude, double longitude) const override {
        if (failAll) {
            throw ExternalProviderError("routing backend unavailable");
        }
        if (failNonStandard) {
            throw 42;
        }
        std::optional<RoadNodeId> best;
        double bestDistance = std::numeric_limits<double>::infinity();
        for (const auto& [id, location] : nodes_) {
            double d = geo::haversineDistance(latitude, longitude, location.latitude, location.longitude);
            if (d < bestDistance) {
                bestDistance = d;
                best = id;
            }
        }
        return best;
    }

    std::optional<GeoPoint> nodeLocation(RoadNodeId id) const override {
        for (const auto& [nodeId, location] : nodes_) {
            if (nodeId == id) return location;
        }
        return std::nullopt;
    }

    std::optional<RoutePath> shortestPath(RoadNodeId from, RoadNodeId to) const override {
        ++routeCalls;
        if (failAll) {
            throw ExternalProviderError("routing backend unavailable");
        }
        if (failRouteNonStandard) {
            throw 42;
        }
        if (routeDelay.count() > 0) {
            std::this_thread::sleep_for(routeDelay);
        }
        auto delay = delays_.find({from, to});
        if (delay == delays_.end()) {
            delay = delays_.find({to, from});
        }
        if (delay != delays_.end()) {
            std::this_thread::sleep_for(delay->second);
        }

        auto it = paths_.find({from, to});
        if (it == paths_.end()) {
            it = paths_.find({to, from});
        }
        if (it == paths_.end()) {
            return std::nullopt;
        }

        RoutePath path;
        path.nodes.push_back(from);
        for (size_t i = 1; i < it->second.size(); ++i) {
            path.nodes.push_back(1000 + static_cast<RoadNodeId>(i));
        }
        path.nodes.push_back(to);
        path.segmentLengths = it->second;
        return path;
    }

    bool failAll = false;
    bool failNonStandard = false;       ///< nearestNode() throws a non-std exception
    bool failRouteNonStandard = false;  ///< shortestPath() throws a non-std exception
    std::chrono::milliseconds routeDelay{0};
    mutable std::atomic<int> routeCalls{0};

private:
    std::vector<std::pair<RoadNodeId, GeoPoint>> nodes_;
    std::map<std::pair<RoadNodeId, RoadNodeId>, std::vector<double>> paths_;
    std::map<std::pair<RoadNodeId, RoadNodeId>, std::chrono::milliseconds> delays_;
};

}  // namespace loginet::test
