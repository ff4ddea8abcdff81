#pragma once

#include "RouteRefiner.h"
#include "loginet/core/Types.h"
#include "loginet/facility/CategoryMode.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace loginet {

/// Outcome of a pipeline run; both values are successful completions
enum class NetworkStatus {
    Ok,      ///< At least one facility was located
    NoData   ///< No facility survived extraction
};

const char* toString(NetworkStatus status);

/// @throws std::invalid_argument for an unknown name
NetworkStatus parseNetworkStatus(const std::string& text);

/// Sanitized tags: every value is a string or an explicit null
using SanitizedTags = std::map<std::string, std::optional<std::string>>;

/// Positioned facility in the output network
struct NetworkPoint {
    double latitude = 0.0;
    double longitude = 0.0;
    SanitizedTags tags;

    GeoPoint position() const { return {latitude, longitude}; }

    bool operator==(const NetworkPoint& o) const {
        return latitude == o.latitude && longitude == o.longitude && tags == o.tags;
    }
};

/// Run context carried into the result
struct NetworkMetadata {
    CategoryMode mode = CategoryMode::Auto;
    BoundingBox region;
    size_t droppedRecords = 0;
    bool refinementDegraded = false;
};

/// Final facility network: points, spanning-tree edges and summary totals
///
/// Counts and the total distance are derived once from the points and edges
/// on construction; the object exposes no mutators.
class NetworkResult {
public:
    /// Empty NoData result
    NetworkResult() = default;

    NetworkResult(std::vector<NetworkPoint> points, std::vector<RefinedEdge> edges, NetworkMetadata metadata);

    // Status
    NetworkStatus status() const { return points_.empty() ? NetworkStatus::NoData : NetworkStatus::Ok; }

    /// True for Ok and NoData alike; failures are reported as exceptions
    bool isSuccess() const { return true; }
    bool isEmpty() const { return points_.empty(); }

    // Content
    const std::vector<NetworkPoint>& points() const { return points_; }
    const std::vector<RefinedEdge>& edges() const { return edges_; }
    const NetworkPoint* getPoint(NodeId id) const;

    /// Indices into edges() touching a point
    std::vector<size_t> edgesOf(NodeId id) const;

    // Totals
    size_t nodesCount() const { return points_.size(); }
    size_t edgesCount() const { return edges_.size(); }
    double totalDistance() const { return totalDistance_; }
    size_t refinedCount() const { return refinedCount_; }
    size_t fallbackCount() const { return edges_.size() - refinedCount_; }

    // Metadata
    const NetworkMetadata& metadata() const { return metadata_; }
    CategoryMode mode() const { return metadata_.mode; }
    const BoundingBox& region() const { return metadata_.region; }
    size_t droppedRecords() const { return metadata_.droppedRecords; }
    bool refinementDegraded() const { return metadata_.refinementDegraded; }

    bool operator==(const NetworkResult& o) const;
    bool operator!=(const NetworkResult& o) const { return !(*this == o); }

private:
    std::vector<NetworkPoint> points_;
    std::vector<RefinedEdge> edges_;
    NetworkMetadata metadata_;
    double totalDistance_ = 0.0;
    size_t refinedCount_ = 0;
};

}  // namespace loginet
