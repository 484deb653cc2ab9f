#pragma once

#include <cmath>

#include <kohonen/core/base.hpp>
#include <kohonen/core/errors.hpp>

namespace kohonen {

/**
 * @brief Euclidean distance between two neurons on the map.
 */
inline double grid_distance(const GridCoord& a, const GridCoord& b) {
    const double dx = static_cast<double>(a.x - b.x);
    const double dy = static_cast<double>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

/**
 * @brief Throw DimensionMismatch unless both vectors have the same width.
 */
inline void require_same_width(const Vector& expected, const Vector& actual) {
    if (expected.size() != actual.size()) {
        throw DimensionMismatch(expected.size(), actual.size());
    }
}

}  // namespace kohonen
