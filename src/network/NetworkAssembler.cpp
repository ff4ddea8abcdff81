#include "loginet/network/NetworkAssembler.h"
#include "loginet/common/Logger.h"

namespace loginet {

std::set<std::string> NetworkAssembler::attributeSchema(const std::vector<LocatedPoint>& points) {
    std::set<std::string> schema;
    for (const auto& point : points) {
        for (const auto& [key, value] : point.attributes) {
            schema.insert(key);
        }
    }
    schema.erase(GEOMETRY_ATTRIBUTE_KEY);
    return schema;
}

SanitizedTags NetworkAssembler::sanitize(const AttributeMap& attributes, const std::set<std::string>& schema) {
    SanitizedTags tags;
    for (const auto& key : schema) {
        auto it = attributes.find(key);
        if (it == attributes.end() || isNullAttribute(it->second)) {
            tags[key] = std::nullopt;
        } else {
            tags[key] = attributeToString(it->second);
        }
    }
    return tags;
}

NetworkResult NetworkAssembler::assemble(const std::vector<LocatedPoint>& points,
                                         const RefinementResult& refinement,
                                         NetworkMetadata metadata) const {
    const std::set<std::string> schema = attributeSchema(points);

    std::vector<NetworkPoint> output;
    output.reserve(points.size());
    for (const auto& point : points) {
        output.push_back({point.latitude, point.longitude, sanitize(point.attributes, schema)});
    }

    metadata.refinementDegraded = metadata.refinementDegraded || refinement.degraded;
    NetworkResult result(std::move(output), refinement.edges, metadata);

    LOG_DEBUG("Assembled network: {} nodes, {} edges, {:.1f} m ({})",
              result.nodesCount(), result.edgesCount(), result.totalDistance(), toString(result.status()));
    return result;
}

}  // namespace loginet
