#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace loginet {

/// A facility record whose geometry cannot be reduced to a valid coordinate
class InvalidGeometryError : public std::runtime_error {
public:
    InvalidGeometryError(size_t recordIndex, const std::string& reason)
        : std::runtime_error("Record " + std::to_string(recordIndex) + ": " + reason)
        , recordIndex_(recordIndex) {}

    /// Index of the offending record in the input sequence
    size_t recordIndex() const noexcept { return recordIndex_; }

private:
    size_t recordIndex_;
};

/// Systemic failure of an external collaborator (routable network or feature source)
///
/// Per-query failures are reported through empty optionals instead; this is
/// reserved for outages that make every query fail.
class ExternalProviderError : public std::runtime_error {
public:
    explicit ExternalProviderError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace loginet
