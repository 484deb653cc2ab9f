/**
 * @file influence.hpp
 * @brief Neighborhood functions
 *
 * An influence tells how much a neuron moves toward the current input,
 * given its grid distance d to the BMU. The neighborhood shrinks as the
 * iteration t approaches T.
 */

#pragma once

#include <cmath>
#include <functional>

#include <kohonen/core/base.hpp>
#include <kohonen/core/utils.hpp>

namespace kohonen {

using InfluenceFunc = std::function<Scalar(
    const GridCoord& bmu, int current_it, int iterations, const GridCoord& candidate)>;

/**
 * @brief Only the BMU itself is updated.
 */
struct BmuOnlyInfluence {
    Scalar operator()(const GridCoord& bmu, int, int, const GridCoord& candidate) const {
        return bmu == candidate ? 1.0 : 0.0;
    }
};

/**
 * @brief Constant influence inside a shrinking radius.
 *
 * q(t) = radius / (1 + t/T), so radius >= q(t) > radius/2.
 */
struct RadiusReducingInfluence {
    Scalar radius = 1.0;

    Scalar operator()(const GridCoord& bmu, int current_it, int iterations,
                      const GridCoord& candidate) const {
        const Scalar t = static_cast<Scalar>(current_it);
        const Scalar T = static_cast<Scalar>(iterations);
        const Scalar qt = radius / (1.0 + t / T);
        return grid_distance(bmu, candidate) > qt ? 0.0 : 1.0;
    }
};

/**
 * @brief exp(-d^2 / (2 q^2)) for a given neighborhood width q.
 *
 * A non-positive width only keeps the BMU.
 */
inline Scalar gaussian_neighborhood(const GridCoord& bmu, const GridCoord& candidate, Scalar q) {
    if (!(q > 0.0)) {
        return bmu == candidate ? 1.0 : 0.0;
    }
    const Scalar d = grid_distance(bmu, candidate);
    return std::exp(-(d * d) / (2.0 * q * q));
}

/**
 * @brief Gaussian neighborhood with width q(t) = initial_width * exp(-t/T).
 */
struct GaussianInfluence {
    Scalar initial_width = 1.0;

    Scalar operator()(const GridCoord& bmu, int current_it, int iterations,
                      const GridCoord& candidate) const {
        const Scalar t = static_cast<Scalar>(current_it);
        const Scalar T = static_cast<Scalar>(iterations);
        return gaussian_neighborhood(bmu, candidate, initial_width * std::exp(-t / T));
    }
};

/**
 * @brief Gaussian neighborhood with a caller supplied width q(t, T).
 */
struct GaussianWidthInfluence {
    using WidthFunc = std::function<Scalar(int current_it, int iterations)>;

    WidthFunc width;

    Scalar operator()(const GridCoord& bmu, int current_it, int iterations,
                      const GridCoord& candidate) const {
        return gaussian_neighborhood(bmu, candidate, width(current_it, iterations));
    }
};

}  // namespace kohonen
