#pragma once

#include "IFeatureSource.h"

#include <string>

namespace loginet {

/// Reads facility records from a GeoJSON FeatureCollection file
///
/// Supports Point, Polygon and MultiPolygon geometries; every other geometry
/// type is kept as UnsupportedGeometry so that the extractor's policy decides
/// its fate. Feature properties become attributes: JSON null maps to an
/// explicit null, arrays and objects are stored as their compact JSON text.
class GeoJsonFeatureSource : public IFeatureSource {
public:
    struct Options {
        bool applyModeFilter = true;  ///< Keep only records matching defaultTagFilter(mode)
        bool clipToRegion = true;     ///< Drop records whose representative point is outside the region
    };

    explicit GeoJsonFeatureSource(std::string path);
    GeoJsonFeatureSource(std::string path, Options options);

    /// @throws ExternalProviderError if the file cannot be opened
    /// @throws std::runtime_error if the file is not a valid FeatureCollection
    std::vector<FacilityRecord> fetch(const BoundingBox& region, CategoryMode mode) override;

    const char* name() const override { return "GeoJsonFeatureSource"; }

    const std::string& path() const { return path_; }

    /// Parse GeoJSON text (FeatureCollection or single Feature) without filtering
    /// @throws std::runtime_error on malformed input
    static std::vector<FacilityRecord> parse(const std::string& geojson);

private:
    std::string path_;
    Options options_;
};

}  // namespace loginet
