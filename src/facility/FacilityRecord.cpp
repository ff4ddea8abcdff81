#include "loginet/facility/FacilityRecord.h"

#include <cmath>
#include <fmt/format.h>
#include <type_traits>

namespace loginet {

bool isNullAttribute(const AttributeValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const double* d = std::get_if<double>(&value)) {
        return !std::isfinite(*d);
    }
    return false;
}

std::string attributeToString(const AttributeValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) return {};
        else if constexpr (std::is_same_v<T, bool>) return v ? "true" : "false";
        else if constexpr (std::is_same_v<T, std::string>) return v;
        else return fmt::format("{}", v);
    }, value);
}

}  // namespace loginet
