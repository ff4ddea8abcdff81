#include "loginet/facility/CategoryMode.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace loginet {

std::string toString(CategoryMode mode) {
    switch (mode) {
        case CategoryMode::Auto: return "auto";
        case CategoryMode::Aero: return "aero";
        case CategoryMode::Sea: return "sea";
        case CategoryMode::Rail: return "rail";
    }
    return "auto";
}

CategoryMode parseCategoryMode(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (CategoryMode mode : ALL_CATEGORY_MODES) {
        if (toString(mode) == lower) {
            return mode;
        }
    }
    throw std::invalid_argument("Unknown category mode: '" + name + "'");
}

bool TagRule::matches(const AttributeMap& attributes) const {
    auto it = attributes.find(key);
    if (it == attributes.end() || isNullAttribute(it->second)) {
        return false;
    }
    if (matchesAnyValue()) {
        return true;
    }
    const std::string actual = attributeToString(it->second);
    return std::find(values.begin(), values.end(), actual) != values.end();
}

bool TagFilter::matches(const AttributeMap& attributes) const {
    return std::any_of(rules.begin(), rules.end(),
                       [&](const TagRule& rule) { return rule.matches(attributes); });
}

TagFilter defaultTagFilter(CategoryMode mode) {
    switch (mode) {
        case CategoryMode::Auto:
            return {{{"building", {"warehouse", "depot", "industrial"}}}};
        case CategoryMode::Aero:
            return {{{"aeroway", {"terminal", "hangar", "cargo"}}}};
        case CategoryMode::Sea:
            return {{{"harbour", {}}, {"man_made", {"pier", "dock"}}}};
        case CategoryMode::Rail:
            return {{{"railway", {"station", "yard", "cargo_terminal"}}}};
    }
    return {};
}

}  // namespace loginet
