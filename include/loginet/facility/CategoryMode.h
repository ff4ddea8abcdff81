#pragma once

#include "FacilityRecord.h"

#include <array>
#include <string>
#include <vector>

namespace loginet {

/// Transport category selecting which facilities participate in a network
enum class CategoryMode {
    Auto,   ///< Road freight: warehouses, depots, industrial buildings
    Aero,   ///< Air cargo: terminals, hangars
    Sea,    ///< Ports: harbours, piers, docks
    Rail    ///< Rail freight: stations, yards, cargo terminals
};

/// All modes in declaration order
constexpr std::array<CategoryMode, 4> ALL_CATEGORY_MODES = {
    CategoryMode::Auto, CategoryMode::Aero, CategoryMode::Sea, CategoryMode::Rail};

/// Lower-case mode name ("auto", "aero", "sea", "rail")
std::string toString(CategoryMode mode);

/// Case-insensitive inverse of toString()
/// @throws std::invalid_argument for an unknown mode name
CategoryMode parseCategoryMode(const std::string& name);

/// One OSM-style tag condition: key present with one of the listed values,
/// or with any value when `values` is empty
struct TagRule {
    std::string key;
    std::vector<std::string> values;

    bool matchesAnyValue() const { return values.empty(); }
    bool matches(const AttributeMap& attributes) const;

    bool operator==(const TagRule& o) const { return key == o.key && values == o.values; }
};

/// Disjunction of tag rules: a record matches when any rule matches
struct TagFilter {
    std::vector<TagRule> rules;

    bool matches(const AttributeMap& attributes) const;

    bool operator==(const TagFilter& o) const { return rules == o.rules; }
};

/// Facility tag filter for a mode
TagFilter defaultTagFilter(CategoryMode mode);

}  // namespace loginet
