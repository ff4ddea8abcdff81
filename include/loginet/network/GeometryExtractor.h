#pragma once

#include "loginet/core/Types.h"
#include "loginet/facility/FacilityRecord.h"

#include <vector>

namespace loginet {

/// A facility reduced to one coordinate; its index in the extracted sequence
/// is the node id used by every edge
struct LocatedPoint {
    double latitude = 0.0;
    double longitude = 0.0;
    AttributeMap attributes;     ///< Source attributes without the geometry key
    size_t sourceIndex = 0;      ///< Index of the originating FacilityRecord

    GeoPoint position() const { return {latitude, longitude}; }
};

/// What to do with a record that cannot be reduced to a valid coordinate
enum class InvalidGeometryPolicy {
    Fail,           ///< Throw InvalidGeometryError on the first bad record
    DropAndReport   ///< Skip bad records and count them
};

/// Output of the extraction stage
struct ExtractionResult {
    std::vector<LocatedPoint> points;
    size_t droppedUnsupported = 0;  ///< Unsupported or empty geometries skipped
    size_t droppedInvalid = 0;      ///< Non-finite or out-of-range coordinates skipped

    size_t droppedTotal() const { return droppedUnsupported + droppedInvalid; }
};

/// Normalizes point / polygon / multi-polygon facility records into located points
///
/// Polygons resolve to their area-weighted planar centroid in degree space
/// (see geo::polygonCentroid). Surviving records keep their input order.
class GeometryExtractor {
public:
    explicit GeometryExtractor(InvalidGeometryPolicy policy = InvalidGeometryPolicy::Fail)
        : policy_(policy) {}

    /// @throws InvalidGeometryError when the policy is Fail and a record is bad
    ExtractionResult extract(const std::vector<FacilityRecord>& records) const;

    InvalidGeometryPolicy policy() const { return policy_; }

private:
    InvalidGeometryPolicy policy_;
};

}  // namespace loginet
