#pragma once

#include "GeometryExtractor.h"
#include "NetworkResult.h"
#include "RouteRefiner.h"

#include <set>
#include <string>
#include <vector>

namespace loginet {

/// Combines located points and refined edges into the final NetworkResult
///
/// Tags are sanitized against the union of attribute keys over all points:
/// a key a point lacks, a null value and a non-finite number all become an
/// explicit null, every other value its string form. The geometry key is
/// never emitted.
class NetworkAssembler {
public:
    NetworkResult assemble(const std::vector<LocatedPoint>& points,
                           const RefinementResult& refinement,
                           NetworkMetadata metadata) const;

    /// Sorted union of attribute keys, without the geometry key
    static std::set<std::string> attributeSchema(const std::vector<LocatedPoint>& points);

    static SanitizedTags sanitize(const AttributeMap& attributes, const std::set<std::string>& schema);
};

}  // namespace loginet
