/**
 * @file som.hpp
 * @brief Self-Organizing Map (SOM) implementation
 *
 * Based on:
 *   - Kohonen, T. (1982). "Self-organized formation of topologically correct feature maps"
 *   - Kohonen, T. (2001). "Self-Organizing Maps" (3rd ed.)
 *
 * Neurons are arranged on a fixed X by Y lattice. The neighborhood is
 * measured on the lattice, not in data space. Every step of the learning
 * loop is delegated to a replaceable policy: initializer, selector,
 * input adapter, distance, restraint and influence.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include <kohonen/core/base.hpp>
#include <kohonen/core/dataset.hpp>
#include <kohonen/core/errors.hpp>
#include <kohonen/core/logger.hpp>
#include <kohonen/core/random.hpp>

#include "adapter.hpp"
#include "distance.hpp"
#include "influence.hpp"
#include "initializer.hpp"
#include "restraint.hpp"
#include "selector.hpp"

namespace kohonen {

/**
 * @brief SOM hyperparameters.
 */
struct SOMParams {
    int size_x = 10;  // Number of neurons along x
    int size_y = 10;  // Number of neurons along y
};

/**
 * @brief Self-Organizing Map (Kohonen Map).
 *
 * Policies are public members and may be replaced between learn() calls.
 * Defaults: zero initializer, sequential selector, no restraint, BMU-only
 * influence, Euclidean distance, identity adapter.
 *
 * Not thread-safe. learn() and test() write the neurons; the const
 * queries only read them.
 */
class SelfOrganizingMap {
public:
    using Callback = std::function<void(const SelfOrganizingMap&, int)>;

    std::shared_ptr<Initializer> initializer = std::make_shared<ZeroInitializer>();
    std::shared_ptr<Selector> selector = std::make_shared<SequentialSelector>();
    RestraintFunc restraint = NoRestraint();
    InfluenceFunc influence = BmuOnlyInfluence();
    DistanceFunc distance = EuclideanDistance();
    InputAdapter adapter = IdentityAdapter();

    int n_learning = 0;  // Completed update steps over all learn() calls

    /**
     * @brief Construct an untrained map.
     *
     * @param params Map size
     * @param rng Random source for BMU tie-breaks
     * @throws std::invalid_argument if a dimension is not positive
     */
    explicit SelfOrganizingMap(const SOMParams& params = SOMParams(),
                               std::mt19937& rng = global_rng())
        : params_(params), rng_(&rng) {
        if (params.size_x < 1 || params.size_y < 1) {
            throw std::invalid_argument("map dimensions must be positive");
        }
        grid_.reserve(params.size_x);
        for (int x = 0; x < params.size_x; ++x) {
            std::vector<Neuron> column;
            column.reserve(params.size_y);
            for (int y = 0; y < params.size_y; ++y) {
                column.emplace_back(x, y);
            }
            grid_.push_back(std::move(column));
        }
    }

    SelfOrganizingMap(int size_x, int size_y, std::mt19937& rng = global_rng())
        : SelfOrganizingMap(SOMParams{size_x, size_y}, rng) {}

    /**
     * @brief Train the map.
     *
     * Runs the initializer, binds the selector to the data set, then
     * performs up to `iterations` update steps. The loop ends early when
     * the selector runs out of data.
     *
     * @param set Training data, must outlive the call
     * @param iterations Number of update steps (T)
     * @param callback Optional callback(self, iteration) after each step
     * @return Number of completed steps
     */
    int learn(const Dataset& set, int iterations, const Callback& callback = nullptr) {
        initializer->init(set, grid_);
        selector->init(set);

        KOHONEN_LOG(MOD_SOM, SEV_DEBUG) << "learn: " << params_.size_x << "x" << params_.size_y
                                        << " map, " << set.size() << " vectors, "
                                        << iterations << " iterations";

        int it = 0;
        for (; it < iterations; ++it) {
            Vector input;
            try {
                input = selector->next();
            } catch (const NoDataLeft&) {
                KOHONEN_LOG(MOD_SOM, SEV_DEBUG) << "learn: selector exhausted after "
                                                << it << " iterations";
                break;
            }

            adapter(input);
            compute_distances(input);
            const GridCoord bmu = find_bmu().coord();
            fix_weights(it, iterations, bmu, input);
            n_learning++;

            if (callback) {
                callback(*this, it);
            }
        }

        KOHONEN_LOG(MOD_SOM, SEV_DEBUG) << "learn: done, " << it << " steps";
        return it;
    }

    /**
     * @brief Find the Best Matching Unit of a vector, without learning.
     *
     * Overwrites the working distance of every neuron.
     */
    const Neuron& test(const Vector& vector) {
        Vector input = vector;
        adapter(input);
        compute_distances(input);
        return find_bmu();
    }

    /**
     * @brief Distance from a vector to every neuron.
     *
     * Same values test() would store in the neurons, but the neurons are
     * left untouched.
     *
     * @return size_x by size_y matrix
     */
    Matrix compute_distance_matrix(const Vector& vector) const {
        Vector input = vector;
        adapter(input);

        Matrix distances(params_.size_x, params_.size_y);
        for (int x = 0; x < params_.size_x; ++x) {
            for (int y = 0; y < params_.size_y; ++y) {
                distances(x, y) = distance_to(grid_[x][y], input);
            }
        }
        return distances;
    }

    /**
     * @brief Split the weights per input dimension.
     *
     * Entry k is a size_x by size_y matrix holding the k-th weight of
     * every neuron.
     */
    std::vector<Matrix> separate_weights() const {
        const Eigen::Index width = grid_[0][0].weights.size();
        std::vector<Matrix> separations(static_cast<std::size_t>(width),
                                       Matrix(params_.size_x, params_.size_y));
        for (int x = 0; x < params_.size_x; ++x) {
            for (int y = 0; y < params_.size_y; ++y) {
                const Vector& weights = grid_[x][y].weights;
                for (Eigen::Index k = 0; k < width; ++k) {
                    separations[k](x, y) = weights(k);
                }
            }
        }
        return separations;
    }

    /**
     * @brief Mean distance between the data set vectors and their BMU.
     */
    Scalar quantization_error(const Dataset& set) const {
        if (set.empty()) return 0.0;

        Scalar total_error = 0.0;
        for (const auto& v : set) {
            total_error += compute_distance_matrix(v).minCoeff();
        }
        return total_error / static_cast<Scalar>(set.size());
    }

    const Grid& grid() const { return grid_; }

    const Neuron& neuron(int x, int y) const { return grid_.at(x).at(y); }
    Neuron& neuron(int x, int y) { return grid_.at(x).at(y); }

    int size_x() const { return params_.size_x; }
    int size_y() const { return params_.size_y; }
    int num_nodes() const { return params_.size_x * params_.size_y; }

private:
    SOMParams params_;
    Grid grid_;
    std::mt19937* rng_;

    /**
     * @brief Distance between an input and a neuron.
     *
     * Uninitialized neurons (empty weights) are at distance 0.
     */
    Scalar distance_to(const Neuron& neuron, const Vector& input) const {
        if (neuron.weights.size() == 0) return 0.0;
        if (neuron.weights.size() != input.size()) {
            throw DimensionMismatch(neuron.weights.size(), input.size());
        }
        return distance(input, neuron.weights);
    }

    void compute_distances(const Vector& input) {
        for (auto& column : grid_) {
            for (auto& neuron : column) {
                neuron.distance = distance_to(neuron, input);
            }
        }
    }

    /**
     * @brief Neuron with the smallest working distance.
     *
     * Ties are broken uniformly at random.
     */
    const Neuron& find_bmu() const {
        const Neuron* bmu = &grid_[0][0];
        Scalar min_distance = bmu->distance;
        int candidates_count = 0;
        for (const auto& column : grid_) {
            for (const auto& candidate : column) {
                if (candidate.distance < min_distance) {
                    bmu = &candidate;
                    min_distance = candidate.distance;
                    candidates_count = 1;
                } else if (candidate.distance == min_distance) {
                    candidates_count++;
                }
            }
        }

        if (candidates_count <= 1) {
            return *bmu;
        }

        std::vector<const Neuron*> candidates;
        candidates.reserve(candidates_count);
        for (const auto& column : grid_) {
            for (const auto& candidate : column) {
                if (candidate.distance == min_distance) {
                    candidates.push_back(&candidate);
                }
            }
        }

        std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
        return *candidates[dist(*rng_)];
    }

    void fix_weights(int current_it, int iterations, const GridCoord& bmu, const Vector& input) {
        const Scalar rate = restraint(current_it, iterations);
        for (auto& column : grid_) {
            for (auto& neuron : column) {
                const Scalar cof = rate * influence(bmu, current_it, iterations, neuron.coord());
                if (cof == 0.0) continue;
                neuron.weights += cof * (input - neuron.weights);
            }
        }
    }
};

}  // namespace kohonen
