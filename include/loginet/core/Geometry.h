#pragma once

#include "Types.h"

#include <string>
#include <variant>
#include <vector>

namespace loginet {

struct PointGeometry {
    GeoPoint position;
};

/// Closed or open ring of vertices; the closing duplicate vertex is optional
using LinearRing = std::vector<GeoPoint>;

struct PolygonGeometry {
    LinearRing exterior;
    std::vector<LinearRing> holes;
};

struct MultiPolygonGeometry {
    std::vector<PolygonGeometry> polygons;
};

/// Geometry kind the extractor cannot reduce to a point (LineString, GeometryCollection, ...)
struct UnsupportedGeometry {
    std::string typeName;
};

/// Tagged geometry of a facility record
using Geometry = std::variant<PointGeometry, PolygonGeometry, MultiPolygonGeometry, UnsupportedGeometry>;

/// GeoJSON-style type name ("Point", "Polygon", "MultiPolygon", or the unsupported name)
std::string geometryTypeName(const Geometry& geometry);

}  // namespace loginet
