#pragma once

#include <random>

namespace kohonen {

/**
 * @brief Process-wide random source.
 *
 * Used for BMU tie-breaks and by the random selector and initializers
 * unless another engine is injected. Seeded from std::random_device on
 * first use.
 */
inline std::mt19937& global_rng() {
    static std::mt19937 rng(std::random_device{}());
    return rng;
}

/**
 * @brief Reseed the process-wide random source for reproducible runs.
 */
inline void seed_global_rng(unsigned int seed) {
    global_rng().seed(seed);
}

}  // namespace kohonen
