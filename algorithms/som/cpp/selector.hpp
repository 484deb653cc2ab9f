/**
 * @file selector.hpp
 * @brief Strategies choosing the training vector of each iteration
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <random>
#include <vector>

#include <kohonen/core/dataset.hpp>
#include <kohonen/core/errors.hpp>
#include <kohonen/core/random.hpp>

namespace kohonen {

/**
 * @brief Source of training vectors.
 *
 * init() binds the selector to a data set, which must outlive every
 * subsequent next() call.
 */
class Selector {
public:
    virtual ~Selector() = default;

    virtual void init(const Dataset& set) = 0;

    /**
     * @brief Next vector to learn from.
     *
     * @throws NoDataLeft when the selector is exhausted
     */
    virtual const Vector& next() = 0;
};

/**
 * @brief One pass over the data set in stored order.
 */
class SequentialSelector : public Selector {
public:
    void init(const Dataset& set) override {
        set_ = &set;
        idx_ = 0;
    }

    const Vector& next() override {
        if (set_ == nullptr || idx_ >= set_->size()) {
            throw NoDataLeft();
        }
        return (*set_)[idx_++];
    }

private:
    const Dataset* set_ = nullptr;
    std::size_t idx_ = 0;
};

/**
 * @brief Endless random selection without repeats inside a cycle.
 *
 * For a data set of size N, every cycle of N calls returns each vector
 * exactly once; a new permutation is drawn at the start of each cycle.
 */
class RandomSelector : public Selector {
public:
    explicit RandomSelector(std::mt19937& rng = global_rng()) : rng_(&rng) {}

    void init(const Dataset& set) override {
        set_ = &set;
        reshuffle();
    }

    const Vector& next() override {
        if (set_ == nullptr || set_->empty()) {
            throw NoDataLeft();
        }
        if (idx_ == perm_.size()) {
            reshuffle();
        }
        return (*set_)[perm_[idx_++]];
    }

private:
    const Dataset* set_ = nullptr;
    std::mt19937* rng_;
    std::vector<std::size_t> perm_;
    std::size_t idx_ = 0;

    void reshuffle() {
        perm_.resize(set_->size());
        std::iota(perm_.begin(), perm_.end(), 0);
        std::shuffle(perm_.begin(), perm_.end(), *rng_);
        idx_ = 0;
    }
};

}  // namespace kohonen
