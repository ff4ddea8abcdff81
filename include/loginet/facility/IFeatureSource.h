#pragma once

#include "CategoryMode.h"
#include "FacilityRecord.h"
#include "loginet/core/Types.h"

#include <vector>

namespace loginet {

/// Supplier of facility records for a region and category mode
///
/// Implementations may read files, query a remote service, or serve
/// in-memory fixtures. Systemic failures are reported as
/// ExternalProviderError; malformed data as std::runtime_error.
class IFeatureSource {
public:
    virtual ~IFeatureSource() = default;

    /// Fetch all records of the given mode inside the region
    virtual std::vector<FacilityRecord> fetch(const BoundingBox& region, CategoryMode mode) = 0;

    /// Source name for debugging/logging
    virtual const char* name() const = 0;
};

}  // namespace loginet
