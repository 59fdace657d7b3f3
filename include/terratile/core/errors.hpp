/**
 * @file errors.hpp
 * @brief Exception types raised by map generation and map I/O
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace terratile {

/// Requested map dimension is non-positive or above the configured maximum.
/// Raised before any grid is allocated.
class InvalidDimension : public std::invalid_argument {
public:
    InvalidDimension(const std::string& message, int64_t dimension)
        : std::invalid_argument(message), dimension_(dimension) {}

    [[nodiscard]] int64_t dimension() const { return dimension_; }

private:
    int64_t dimension_;
};

/// A layer builder could not meet its placement rule. Terrain catches this,
/// logs a warning and substitutes an empty layer.
class LayerConstraintUnsatisfied : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Two generation runs with the same inputs produced different grids.
class NonDeterminismDetected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Map file or payload is corrupt, truncated, or of an unknown version.
class MapFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace terratile
