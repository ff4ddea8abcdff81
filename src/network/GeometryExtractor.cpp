#include "loginet/network/GeometryExtractor.h"
#include "loginet/common/Logger.h"
#include "loginet/core/Errors.h"
#include "loginet/core/GeoUtils.h"

namespace loginet {

ExtractionResult GeometryExtractor::extract(const std::vector<FacilityRecord>& records) const {
    ExtractionResult result;
    result.points.reserve(records.size());

    for (size_t i = 0; i < records.size(); ++i) {
        const FacilityRecord& record = records[i];
        auto position = geo::representativePoint(record.geometry);

        if (!position) {
            std::string reason = "unsupported or empty geometry '" +
                                 geometryTypeName(record.geometry) + "'";
            if (policy_ == InvalidGeometryPolicy::Fail) {
                throw InvalidGeometryError(i, reason);
            }
            LOG_DEBUG("Dropping record {}: {}", i, reason);
            ++result.droppedUnsupported;
            continue;
        }

        if (!position->isValid()) {
            std::string reason = "coordinate (" + std::to_string(position->latitude) + ", " +
                                 std::to_string(position->longitude) + ") is not a valid WGS84 position";
            if (policy_ == InvalidGeometryPolicy::Fail) {
                throw InvalidGeometryError(i, reason);
            }
            LOG_DEBUG("Dropping record {}: {}", i, reason);
            ++result.droppedInvalid;
            continue;
        }

        LocatedPoint point;
        point.latitude = position->latitude;
        point.longitude = position->longitude;
        point.attributes = record.attributes;
        point.attributes.erase(GEOMETRY_ATTRIBUTE_KEY);
        point.sourceIndex = i;
        result.points.push_back(std::move(point));
    }

    if (result.droppedTotal() > 0) {
        LOG_WARN("Extracted {} points, dropped {} unsupported and {} invalid records",
                 result.points.size(), result.droppedUnsupported, result.droppedInvalid);
    } else {
        LOG_DEBUG("Extracted {} points", result.points.size());
    }
    return result;
}

}  // namespace loginet
