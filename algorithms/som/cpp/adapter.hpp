/**
 * @file adapter.hpp
 * @brief Input pre-processing applied before vectors reach the map
 */

#pragma once

#include <functional>
#include <limits>

#include <kohonen/core/base.hpp>
#include <kohonen/core/dataset.hpp>
#include <kohonen/core/utils.hpp>

namespace kohonen {

/**
 * @brief Adapts a vector in place.
 *
 * The map always hands a copy of the input to its adapter.
 */
using InputAdapter = std::function<void(Vector&)>;

struct IdentityAdapter {
    void operator()(Vector&) const {}
};

/**
 * @brief Per-coordinate min-max scaling, v_i = (v_i - min_i) / (max_i - min_i).
 *
 * A coordinate with max_i == min_i is mapped to 0.
 */
class MinMaxAdapter {
public:
    /**
     * @throws DimensionMismatch if min and max differ in width
     */
    MinMaxAdapter(const Vector& min, const Vector& max) : min_(min), max_(max) {
        require_same_width(min, max);
    }

    /**
     * @brief Build the adapter from the per-coordinate bounds of a data set.
     *
     * @throws EmptyDataset if the data set holds no vectors
     */
    static MinMaxAdapter fit(const Dataset& set) {
        Vector min = Vector::Constant(set.width(), std::numeric_limits<Scalar>::max());
        Vector max = Vector::Constant(set.width(), std::numeric_limits<Scalar>::lowest());
        for (const auto& v : set) {
            min = min.cwiseMin(v);
            max = max.cwiseMax(v);
        }
        return MinMaxAdapter(min, max);
    }

    /**
     * @throws DimensionMismatch if the vector width differs from min/max
     */
    void operator()(Vector& v) const {
        require_same_width(min_, v);
        for (Eigen::Index i = 0; i < v.size(); ++i) {
            const Scalar range = max_(i) - min_(i);
            v(i) = range != 0.0 ? (v(i) - min_(i)) / range : 0.0;
        }
    }

    const Vector& min() const { return min_; }
    const Vector& max() const { return max_; }

private:
    Vector min_;
    Vector max_;
};

}  // namespace kohonen
