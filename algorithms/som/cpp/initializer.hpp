/**
 * @file initializer.hpp
 * @brief Initial neuron weights
 *
 * An initializer runs first in every learn() call and sizes the weight
 * vectors of all neurons to the data set width.
 */

#pragma once

#include <cstddef>
#include <random>

#include <kohonen/core/base.hpp>
#include <kohonen/core/dataset.hpp>
#include <kohonen/core/random.hpp>

#include "selector.hpp"

namespace kohonen {

class Initializer {
public:
    virtual ~Initializer() = default;

    /**
     * @throws EmptyDataset if the data set holds no vectors
     */
    virtual void init(const Dataset& set, Grid& grid) = 0;
};

/**
 * @brief Weights sized to the data set width and filled with zeros.
 */
class ZeroInitializer : public Initializer {
public:
    void init(const Dataset& set, Grid& grid) override {
        const int width = set.width();
        for (auto& column : grid) {
            for (auto& neuron : column) {
                neuron.weights = Vector::Zero(width);
            }
        }
    }
};

/**
 * @brief Small random weights, uniform in [0, 1).
 */
class RandomInitializer : public Initializer {
public:
    explicit RandomInitializer(std::mt19937& rng = global_rng()) : rng_(&rng) {}

    void init(const Dataset& set, Grid& grid) override {
        ZeroInitializer().init(set, grid);

        std::uniform_real_distribution<Scalar> dist(0.0, 1.0);
        for (auto& column : grid) {
            for (auto& neuron : column) {
                for (Eigen::Index k = 0; k < neuron.weights.size(); ++k) {
                    neuron.weights(k) = dist(*rng_);
                }
            }
        }
    }

private:
    std::mt19937* rng_;
};

/**
 * @brief Weights copied from data set vectors.
 *
 * When the map has fewer cells than the data set has vectors, a sorted
 * copy is downsampled to the cell count first so that each neuron starts
 * from a representative of one band of the sorted data. Vectors are then
 * handed out in random order without repeats, cells visited row by row.
 */
class DatasetSampleInitializer : public Initializer {
public:
    explicit DatasetSampleInitializer(std::mt19937& rng = global_rng()) : rng_(&rng) {}

    void init(const Dataset& set, Grid& grid) override {
        ZeroInitializer().init(set, grid);

        std::size_t cells = 0;
        for (const auto& column : grid) {
            cells += column.size();
        }

        Dataset samples = set.copy();
        if (cells < samples.size()) {
            samples.sort_lexicographic();
            samples.downsample(cells);
        }

        RandomSelector selector(*rng_);
        selector.init(samples);
        for (auto& column : grid) {
            for (auto& neuron : column) {
                neuron.weights = selector.next();
            }
        }
    }

private:
    std::mt19937* rng_;
};

}  // namespace kohonen
