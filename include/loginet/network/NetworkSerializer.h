#pragma once

#include "NetworkResult.h"

#include <string>

namespace loginet {

/// JSON serialization and file I/O for NetworkResult
///
/// Document layout:
/// @code
/// { "status": "ok", "mode": "auto", "bbox": [w, s, e, n],
///   "nodes_count": 3, "edges_count": 2, "total_distance": 25041.7,
///   "refined_count": 0, "fallback_count": 2, "dropped_records": 0,
///   "refinement_degraded": false,
///   "points": [ {"lat": 59.9, "lon": 30.3, "tags": {"name": "A", "ref": null}} ],
///   "edges": [ {"from_index": 0, "to_index": 1, "distance": 12520.9,
///               "geodesic_distance": 12520.9, "status": "fallback",
///               "fallback_reason": "refinement_disabled"} ] }
/// @endcode
class NetworkSerializer {
public:
    /// Serialize a network result to a JSON string
    /// @param indent Pretty-print indent; negative for compact output
    static std::string toJson(const NetworkResult& result, int indent = 2);

    /// Deserialize a network result
    /// @throws std::runtime_error if parsing fails or the counts are inconsistent
    static NetworkResult fromJson(const std::string& json);

    /// Save a network result to file
    /// @return true if save succeeded
    static bool saveToFile(const NetworkResult& result, const std::string& path);

    /// Load a network result from file
    /// @return true if load succeeded; `result` is untouched otherwise
    static bool loadFromFile(NetworkResult& result, const std::string& path);
};

}  // namespace loginet
