#pragma once

#include "IFeatureSource.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace loginet {

/// Cache key for a feature download: region plus category mode
struct FeatureCacheKey {
    BoundingBox region;
    CategoryMode mode = CategoryMode::Auto;

    /// Canonical form "<mode>:<w>,<s>,<e>,<n>"
    std::string toString() const;

    bool operator<(const FeatureCacheKey& o) const { return toString() < o.toString(); }
    bool operator==(const FeatureCacheKey& o) const { return region == o.region && mode == o.mode; }
};

/// Read-through in-memory cache in front of another feature source
///
/// Entries live until invalidated explicitly; there is no expiry and no disk
/// state, so two pipelines sharing a cache see the same records for a key.
class CachedFeatureSource : public IFeatureSource {
public:
    explicit CachedFeatureSource(std::shared_ptr<IFeatureSource> upstream);

    /// Returns the cached records for (region, mode), fetching from upstream on a miss.
    /// Upstream exceptions propagate and nothing is cached.
    std::vector<FacilityRecord> fetch(const BoundingBox& region, CategoryMode mode) override;

    const char* name() const override { return "CachedFeatureSource"; }

    /// Drop one entry; returns true if it was present
    bool invalidate(const FeatureCacheKey& key);

    /// Drop every entry; returns the number removed
    size_t invalidateAll();

    bool contains(const FeatureCacheKey& key) const;
    size_t size() const;
    size_t hits() const;
    size_t misses() const;

private:
    std::shared_ptr<IFeatureSource> upstream_;
    std::map<std::string, std::vector<FacilityRecord>> entries_;
    mutable std::mutex mutex_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

}  // namespace loginet
