#pragma once

#include "loginet/core/Types.h"

#include <memory>
#include <optional>
#include <vector>

namespace loginet {

/// Shortest path through a routable network
struct RoutePath {
    std::vector<RoadNodeId> nodes;       ///< Visited road nodes, source first
    std::vector<double> segmentLengths;  ///< Length of each hop in meters (nodes.size() - 1 entries)

    /// Sum of segment lengths in meters
    double totalLength() const {
        double total = 0.0;
        for (double length : segmentLengths) {
            total += length;
        }
        return total;
    }

    /// A path joining two distinct nodes has at least two entries
    bool isRoutable() const { return nodes.size() > 1; }
};

/// Read-only routable road graph used to refine geodesic edge weights
///
/// Implementations must be safe for concurrent const calls; the refiner
/// queries one instance from several worker threads.
class IRoutableNetwork {
public:
    virtual ~IRoutableNetwork() = default;

    /// Nearest road node to a coordinate, or std::nullopt for an empty network
    virtual std::optional<RoadNodeId> nearestNode(double latitude, double longitude) const = 0;

    /// Coordinate of a road node, or std::nullopt if the id is unknown
    virtual std::optional<GeoPoint> nodeLocation(RoadNodeId id) const = 0;

    /// Shortest path by length, or std::nullopt if the nodes are not connected
    /// @throws ExternalProviderError on a systemic backend failure
    virtual std::optional<RoutePath> shortestPath(RoadNodeId from, RoadNodeId to) const = 0;
};

/// Produces a routable network covering a region
class IRoutableNetworkProvider {
public:
    virtual ~IRoutableNetworkProvider() = default;

    /// @throws ExternalProviderError when the network cannot be obtained
    virtual std::shared_ptr<const IRoutableNetwork> load(const BoundingBox& region) = 0;

    /// Provider name for logging
    virtual const char* name() const = 0;
};

}  // namespace loginet
