#pragma once

#include "IRoutableNetwork.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace loginet {

/// Directed road segment between two road nodes
struct RoadSegment {
    RoadNodeId from = 0;
    RoadNodeId to = 0;
    double length = 0.0;  ///< Meters
};

/// In-memory road graph with nearest-node snapping and Dijkstra routing
///
/// Road file format (JSON):
/// @code
/// { "nodes": [ {"id": 1, "lat": 59.9, "lon": 30.3}, ... ],
///   "edges": [ {"from": 1, "to": 2, "length": 812.5, "oneway": false}, ... ] }
/// @endcode
/// "length" defaults to the haversine distance between the endpoints and
/// "oneway" defaults to false.
class RoadNetwork : public IRoutableNetwork {
public:
    RoadNetwork() = default;

    // === Construction ===

    /// Add or move a node
    /// @throws std::invalid_argument for a non-finite or out-of-range coordinate
    void addNode(RoadNodeId id, const GeoPoint& location);

    /// Add a segment; two-way segments are stored in both directions
    /// @param length Meters; a negative value selects the haversine distance
    /// @throws std::invalid_argument for unknown endpoints or a non-finite length
    void addSegment(RoadNodeId from, RoadNodeId to, double length = -1.0, bool oneway = false);

    // === IRoutableNetwork ===

    std::optional<RoadNodeId> nearestNode(double latitude, double longitude) const override;
    std::optional<GeoPoint> nodeLocation(RoadNodeId id) const override;
    std::optional<RoutePath> shortestPath(RoadNodeId from, RoadNodeId to) const override;

    // === Queries ===

    size_t nodeCount() const { return locations_.size(); }
    size_t segmentCount() const { return segmentCount_; }
    bool hasNode(RoadNodeId id) const { return locations_.count(id) > 0; }
    std::vector<RoadSegment> outgoing(RoadNodeId id) const;

    /// Copy containing only nodes inside the region and segments between them
    RoadNetwork clipped(const BoundingBox& region) const;

    // === Serialization ===

    /// @throws std::runtime_error on malformed input
    static RoadNetwork fromJson(const std::string& json);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static RoadNetwork loadFromFile(const std::string& path);

private:
    std::unordered_map<RoadNodeId, GeoPoint> locations_;
    std::unordered_map<RoadNodeId, std::vector<RoadSegment>> adjacency_;
    size_t segmentCount_ = 0;
};

/// Loads a RoadNetwork from a JSON road file and clips it to each requested region
///
/// The file is parsed once and kept in memory. Nodes within marginDegrees
/// outside the region are kept so routes may leave the box slightly.
class RoadNetworkFileProvider : public IRoutableNetworkProvider {
public:
    static constexpr double DEFAULT_MARGIN_DEGREES = 0.05;

    explicit RoadNetworkFileProvider(std::string path, double marginDegrees = DEFAULT_MARGIN_DEGREES);

    std::shared_ptr<const IRoutableNetwork> load(const BoundingBox& region) override;
    const char* name() const override { return "RoadNetworkFileProvider"; }

private:
    std::string path_;
    double marginDegrees_;
    std::shared_ptr<const RoadNetwork> full_;
};

/// Serves the same network for every region
class StaticNetworkProvider : public IRoutableNetworkProvider {
public:
    explicit StaticNetworkProvider(std::shared_ptr<const IRoutableNetwork> network)
        : network_(std::move(network)) {}

    std::shared_ptr<const IRoutableNetwork> load(const BoundingBox&) override { return network_; }
    const char* name() const override { return "StaticNetworkProvider"; }

private:
    std::shared_ptr<const IRoutableNetwork> network_;
};

}  // namespace loginet
