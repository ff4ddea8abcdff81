#include "loginet/facility/CachedFeatureSource.h"
#include "loginet/common/Logger.h"

#include <stdexcept>

namespace loginet {

std::string FeatureCacheKey::toString() const {
    return loginet::toString(mode) + ":" + region.toString();
}

CachedFeatureSource::CachedFeatureSource(std::shared_ptr<IFeatureSource> upstream)
    : upstream_(std::move(upstream)) {
    if (!upstream_) {
        throw std::invalid_argument("CachedFeatureSource requires an upstream source");
    }
}

std::vector<FacilityRecord> CachedFeatureSource::fetch(const BoundingBox& region, CategoryMode mode) {
    const std::string key = FeatureCacheKey{region, mode}.toString();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            ++hits_;
            LOG_DEBUG("Cache hit for {} ({} records)", key, it->second.size());
            return it->second;
        }
        ++misses_;
    }

    // Fetch outside the lock; a concurrent miss for the same key simply fetches twice
    std::vector<FacilityRecord> records = upstream_->fetch(region, mode);
    LOG_DEBUG("Cache miss for {}: fetched {} records from {}", key, records.size(), upstream_->name());

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = records;
    return records;
}

bool CachedFeatureSource::invalidate(const FeatureCacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key.toString()) > 0;
}

size_t CachedFeatureSource::invalidateAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = entries_.size();
    entries_.clear();
    return removed;
}

bool CachedFeatureSource::contains(const FeatureCacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key.toString()) > 0;
}

size_t CachedFeatureSource::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t CachedFeatureSource::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t CachedFeatureSource::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

}  // namespace loginet
