#pragma once

#include "loginet/core/Geometry.h"

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace loginet {

/// Scalar attribute value; std::monostate is an explicit null
using AttributeValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

/// Attribute bag keyed by tag name, ordered for deterministic output
using AttributeMap = std::map<std::string, AttributeValue>;

/// Reserved attribute key that never survives extraction
inline constexpr const char* GEOMETRY_ATTRIBUTE_KEY = "geometry";

/// One input feature: geometry plus its tags
struct FacilityRecord {
    Geometry geometry;
    AttributeMap attributes;
};

/// True for std::monostate and for non-finite doubles
bool isNullAttribute(const AttributeValue& value);

/// String form of an attribute value: bools as "true"/"false", integers in
/// decimal, doubles in shortest round-trip form. Null yields an empty string.
std::string attributeToString(const AttributeValue& value);

}  // namespace loginet
