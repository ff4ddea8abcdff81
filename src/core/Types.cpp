#include "loginet/core/Types.h"

#include <fmt/format.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace loginet {

std::string BoundingBox::toString() const {
    return fmt::format("{},{},{},{}", west, south, east, north);
}

BoundingBox BoundingBox::parse(const std::string& text) {
    std::vector<double> values;
    std::stringstream stream(text);
    std::string token;
    while (std::getline(stream, token, ',')) {
        try {
            size_t consumed = 0;
            double value = std::stod(token, &consumed);
            if (token.find_first_not_of(" \t", consumed) != std::string::npos) {
                throw std::invalid_argument("trailing characters");
            }
            values.push_back(value);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid bounding box component '" + token + "' in '" + text + "'");
        }
    }

    if (values.size() != 4) {
        throw std::invalid_argument("Bounding box must have 4 components (w,s,e,n): '" + text + "'");
    }

    BoundingBox box{values[0], values[1], values[2], values[3]};
    if (!box.isValid()) {
        throw std::invalid_argument("Bounding box out of range or unordered: '" + text + "'");
    }
    return box;
}

}  // namespace loginet
