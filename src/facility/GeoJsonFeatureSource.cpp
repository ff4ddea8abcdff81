#include "loginet/facility/GeoJsonFeatureSource.h"
#include "loginet/common/Logger.h"
#include "loginet/core/Errors.h"
#include "loginet/core/GeoUtils.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace loginet {

namespace {

GeoPoint parsePosition(const json& position) {
    if (!position.is_array() || position.size() < 2 ||
        !position[0].is_number() || !position[1].is_number()) {
        throw std::runtime_error("GeoJSON position must be [lon, lat, ...]");
    }
    // GeoJSON order is longitude first
    return {position[1].get<double>(), position[0].get<double>()};
}

LinearRing parseRing(const json& ring) {
    if (!ring.is_array()) {
        throw std::runtime_error("GeoJSON ring must be an array of positions");
    }
    LinearRing result;
    result.reserve(ring.size());
    for (const auto& position : ring) {
        result.push_back(parsePosition(position));
    }
    return result;
}

PolygonGeometry parsePolygon(const json& rings) {
    if (!rings.is_array()) {
        throw std::runtime_error("GeoJSON polygon must be an array of rings");
    }
    PolygonGeometry polygon;
    for (size_t i = 0; i < rings.size(); ++i) {
        if (i == 0) {
            polygon.exterior = parseRing(rings[i]);
        } else {
            polygon.holes.push_back(parseRing(rings[i]));
        }
    }
    return polygon;
}

Geometry parseGeometry(const json& geometry) {
    if (geometry.is_null()) {
        return UnsupportedGeometry{"null"};
    }
    if (!geometry.is_object() || !geometry.contains("type") || !geometry["type"].is_string()) {
        throw std::runtime_error("GeoJSON geometry must be an object with a string 'type'");
    }

    const std::string type = geometry["type"].get<std::string>();
    if (type != "Point" && type != "Polygon" && type != "MultiPolygon") {
        return UnsupportedGeometry{type};
    }

    if (!geometry.contains("coordinates")) {
        throw std::runtime_error("GeoJSON " + type + " has no 'coordinates'");
    }
    const json& coordinates = geometry["coordinates"];

    if (type == "Point") {
        return PointGeometry{parsePosition(coordinates)};
    }
    if (type == "Polygon") {
        return parsePolygon(coordinates);
    }

    if (!coordinates.is_array()) {
        throw std::runtime_error("GeoJSON MultiPolygon coordinates must be an array");
    }
    MultiPolygonGeometry multiPolygon;
    for (const auto& polygon : coordinates) {
        multiPolygon.polygons.push_back(parsePolygon(polygon));
    }
    return multiPolygon;
}

AttributeValue parseProperty(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return std::monostate{};
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
            return value.get<int64_t>();
        case json::value_t::number_unsigned: {
            uint64_t number = value.get<uint64_t>();
            if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::to_string(number);
            }
            return static_cast<int64_t>(number);
        }
        case json::value_t::number_float:
            return value.get<double>();
        case json::value_t::string:
            return value.get<std::string>();
        default:
            // Nested arrays and objects are not scalar; keep their JSON text
            return value.dump();
    }
}

FacilityRecord parseFeature(const json& feature) {
    if (!feature.is_object() || feature.value("type", "") != "Feature") {
        throw std::runtime_error("GeoJSON feature must be an object of type 'Feature'");
    }

    FacilityRecord record;
    record.geometry = parseGeometry(feature.contains("geometry") ? feature["geometry"] : json());

    if (feature.contains("properties") && feature["properties"].is_object()) {
        for (const auto& [key, value] : feature["properties"].items()) {
            if (key == GEOMETRY_ATTRIBUTE_KEY) continue;
            record.attributes[key] = parseProperty(value);
        }
    }
    if (feature.contains("id") && record.attributes.count("id") == 0) {
        record.attributes["id"] = parseProperty(feature["id"]);
    }
    return record;
}

}  // namespace

GeoJsonFeatureSource::GeoJsonFeatureSource(std::string path)
    : GeoJsonFeatureSource(std::move(path), Options{}) {}

GeoJsonFeatureSource::GeoJsonFeatureSource(std::string path, Options options)
    : path_(std::move(path)), options_(options) {}

std::vector<FacilityRecord> GeoJsonFeatureSource::fetch(const BoundingBox& region, CategoryMode mode) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw ExternalProviderError("Cannot open GeoJSON file: " + path_);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::vector<FacilityRecord> parsed;
    try {
        parsed = parse(buffer.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path_ + ": " + e.what());
    }

    const TagFilter filter = defaultTagFilter(mode);
    std::vector<FacilityRecord> result;
    result.reserve(parsed.size());
    for (auto& record : parsed) {
        if (options_.applyModeFilter && !filter.matches(record.attributes)) {
            continue;
        }
        if (options_.clipToRegion) {
            auto point = geo::representativePoint(record.geometry);
            if (point && point->isFinite() && !region.contains(*point)) {
                continue;
            }
        }
        result.push_back(std::move(record));
    }

    LOG_DEBUG("Loaded {} of {} features from {} (mode={}, bbox={})",
              result.size(), parsed.size(), path_, toString(mode), region.toString());
    return result;
}

std::vector<FacilityRecord> GeoJsonFeatureSource::parse(const std::string& geojson) {
    json root;
    try {
        root = json::parse(geojson);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid GeoJSON: ") + e.what());
    }

    std::vector<FacilityRecord> records;
    const std::string type = root.is_object() ? root.value("type", "") : "";
    if (type == "Feature") {
        records.push_back(parseFeature(root));
        return records;
    }
    if (type != "FeatureCollection" || !root.contains("features") || !root["features"].is_array()) {
        throw std::runtime_error("GeoJSON root must be a FeatureCollection with a 'features' array");
    }

    records.reserve(root["features"].size());
    for (const auto& feature : root["features"]) {
        records.push_back(parseFeature(feature));
    }
    return records;
}

}  // namespace loginet
