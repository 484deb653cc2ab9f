/**
 * @file restraint.hpp
 * @brief Learning-rate schedules
 *
 * A restraint maps (t, T), t in [0, T), to the coefficient applied to
 * every weight update of iteration t.
 */

#pragma once

#include <cmath>
#include <functional>

#include <kohonen/core/base.hpp>

namespace kohonen {

using RestraintFunc = std::function<Scalar(int current_it, int iterations)>;

/**
 * @brief Always 1, weight updates are not restrained.
 */
struct NoRestraint {
    Scalar operator()(int, int) const { return 1.0; }
};

/**
 * @brief a / (b + t)
 */
struct SimpleRestraint {
    Scalar a = 1.0;
    Scalar b = 1.0;

    Scalar operator()(int current_it, int) const {
        return a / (b + static_cast<Scalar>(current_it));
    }
};

/**
 * @brief initial_rate * exp(-t / T)
 *
 * A positive time_constant replaces T in the exponent.
 */
struct ExpRestraint {
    Scalar initial_rate = 1.0;
    Scalar time_constant = 0.0;

    Scalar operator()(int current_it, int iterations) const {
        const Scalar t = static_cast<Scalar>(current_it);
        const Scalar n = time_constant > 0.0 ? time_constant : static_cast<Scalar>(iterations);
        return initial_rate * std::exp(-t / n);
    }
};

}  // namespace kohonen
