/**
 * @file distance.hpp
 * @brief Dissimilarity measures between input vectors and neuron weights
 */

#pragma once

#include <functional>

#include <kohonen/core/base.hpp>
#include <kohonen/core/utils.hpp>

namespace kohonen {

/**
 * @brief Distance between two vectors of equal width.
 *
 * Implementations are non-negative, symmetric and zero only for equal
 * vectors. Operands of different widths throw DimensionMismatch.
 */
using DistanceFunc = std::function<Scalar(const Vector&, const Vector&)>;

struct EuclideanDistance {
    Scalar operator()(const Vector& x, const Vector& y) const {
        require_same_width(x, y);
        return (x - y).norm();
    }
};

struct ManhattanDistance {
    Scalar operator()(const Vector& x, const Vector& y) const {
        require_same_width(x, y);
        return (x - y).lpNorm<1>();
    }
};

struct ChebyshevDistance {
    Scalar operator()(const Vector& x, const Vector& y) const {
        require_same_width(x, y);
        if (x.size() == 0) return 0.0;
        return (x - y).lpNorm<Eigen::Infinity>();
    }
};

}  // namespace kohonen
