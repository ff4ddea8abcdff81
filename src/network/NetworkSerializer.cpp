#include "loginet/network/NetworkSerializer.h"
#include "loginet/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace loginet {

std::string NetworkSerializer::toJson(const NetworkResult& result, int indent) {
    json j;
    j["status"] = toString(result.status());
    j["mode"] = toString(result.mode());
    const BoundingBox& bbox = result.region();
    j["bbox"] = {bbox.west, bbox.south, bbox.east, bbox.north};
    j["nodes_count"] = result.nodesCount();
    j["edges_count"] = result.edgesCount();
    j["total_distance"] = result.totalDistance();
    j["refined_count"] = result.refinedCount();
    j["fallback_count"] = result.fallbackCount();
    j["dropped_records"] = result.droppedRecords();
    j["refinement_degraded"] = result.refinementDegraded();

    json points = json::array();
    for (const auto& point : result.points()) {
        json tags = json::object();
        for (const auto& [key, value] : point.tags) {
            tags[key] = value ? json(*value) : json(nullptr);
        }
        points.push_back({{"lat", point.latitude}, {"lon", point.longitude}, {"tags", tags}});
    }
    j["points"] = points;

    json edges = json::array();
    for (const auto& edge : result.edges()) {
        json edgeJson;
        edgeJson["from_index"] = edge.from;
        edgeJson["to_index"] = edge.to;
        edgeJson["distance"] = edge.weight;
        edgeJson["geodesic_distance"] = edge.geodesicWeight;
        edgeJson["status"] = toString(edge.status);
        if (edge.isRefined()) {
            edgeJson["fallback_reason"] = nullptr;
        } else {
            edgeJson["fallback_reason"] = toString(edge.reason);
        }
        edges.push_back(edgeJson);
    }
    j["edges"] = edges;

    return j.dump(indent);
}

NetworkResult NetworkSerializer::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        NetworkMetadata metadata;
        metadata.mode = parseCategoryMode(j.value("mode", "auto"));
        if (j.contains("bbox")) {
            const json& bbox = j["bbox"];
            if (!bbox.is_array() || bbox.size() != 4) {
                throw std::runtime_error("'bbox' must be [west, south, east, north]");
            }
            metadata.region = {bbox[0].get<double>(), bbox[1].get<double>(),
                               bbox[2].get<double>(), bbox[3].get<double>()};
        }
        metadata.droppedRecords = j.value("dropped_records", size_t{0});
        metadata.refinementDegraded = j.value("refinement_degraded", false);

        std::vector<NetworkPoint> points;
        for (const auto& pj : j.at("points")) {
            NetworkPoint point;
            point.latitude = pj.at("lat").get<double>();
            point.longitude = pj.at("lon").get<double>();
            if (pj.contains("tags")) {
                for (const auto& [key, value] : pj["tags"].items()) {
                    if (value.is_null()) {
                        point.tags[key] = std::nullopt;
                    } else {
                        point.tags[key] = value.get<std::string>();
                    }
                }
            }
            points.push_back(std::move(point));
        }

        std::vector<RefinedEdge> edges;
        for (const auto& ej : j.at("edges")) {
            RefinedEdge edge;
            edge.from = ej.at("from_index").get<NodeId>();
            edge.to = ej.at("to_index").get<NodeId>();
            edge.weight = ej.at("distance").get<double>();
            edge.geodesicWeight = ej.value("geodesic_distance", edge.weight);
            edge.status = parseEdgeStatus(ej.value("status", "fallback"));
            if (ej.contains("fallback_reason") && ej["fallback_reason"].is_string()) {
                edge.reason = parseFallbackReason(ej["fallback_reason"].get<std::string>());
            }
            edges.push_back(edge);
        }

        if (j.contains("nodes_count") && j["nodes_count"].get<size_t>() != points.size()) {
            throw std::runtime_error("'nodes_count' does not match the points array");
        }
        if (j.contains("edges_count") && j["edges_count"].get<size_t>() != edges.size()) {
            throw std::runtime_error("'edges_count' does not match the edges array");
        }

        return NetworkResult(std::move(points), std::move(edges), metadata);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse network JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid network JSON: ") + e.what());
    }
}

bool NetworkSerializer::saveToFile(const NetworkResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(result);
    return static_cast<bool>(file);
}

bool NetworkSerializer::loadFromFile(NetworkResult& result, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        result = fromJson(buffer.str());
        return true;
    } catch (const std::runtime_error& e) {
        LOG_WARN("Cannot load network from {}: {}", path, e.what());
        return false;
    }
}

}  // namespace loginet
