#pragma once

/// @file loginet.h
/// @brief Main header for the LogiNet facility network library
///
/// LogiNet connects logistics facilities (warehouses, terminals, ports,
/// rail yards) inside a region with a minimum spanning tree, optionally
/// re-weighting tree edges with road-network path lengths.
///
/// Example usage:
/// @code
/// #include <loginet/loginet.h>
///
/// loginet::GeoJsonFeatureSource source("facilities.geojson");
/// auto roads = std::make_shared<loginet::RoadNetworkFileProvider>("roads.json");
///
/// loginet::NetworkPipeline pipeline(loginet::PipelineOptions::balanced());
/// auto result = pipeline.run(source, loginet::BoundingBox::parse("30.0,59.7,30.6,60.1"),
///                            loginet::CategoryMode::Auto, roads);
///
/// loginet::NetworkSerializer::saveToFile(result, "network.json");
/// @endcode

// Core module - Geometry, graph and execution primitives
#include "core/Types.h"
#include "core/Errors.h"
#include "core/Geometry.h"
#include "core/GeoUtils.h"
#include "core/Graph.h"
#include "core/TaskExecutor.h"

// Facility module - Input records and feature sources
#include "facility/FacilityRecord.h"
#include "facility/CategoryMode.h"
#include "facility/IFeatureSource.h"
#include "facility/GeoJsonFeatureSource.h"
#include "facility/CachedFeatureSource.h"

// Network module - Pipeline stages and results
#include "network/GeometryExtractor.h"
#include "network/DistanceGraphBuilder.h"
#include "network/SpanningTreeEngine.h"
#include "network/IRoutableNetwork.h"
#include "network/RoadNetwork.h"
#include "network/RouteRefiner.h"
#include "network/NetworkResult.h"
#include "network/NetworkAssembler.h"
#include "network/PipelineOptions.h"
#include "network/NetworkPipeline.h"
#include "network/NetworkSerializer.h"

// Logging
#include "common/Logger.h"

#include <string>

namespace loginet {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace loginet
