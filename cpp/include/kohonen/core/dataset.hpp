#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <random>
#include <utility>
#include <vector>

#include <kohonen/core/base.hpp>
#include <kohonen/core/errors.hpp>
#include <kohonen/core/random.hpp>

namespace kohonen {

/**
 * @brief In-memory collection of equally sized input vectors.
 *
 * All vectors of a non-empty data set share one width; adding a vector
 * of another width throws DimensionMismatch.
 */
class Dataset {
public:
    using const_iterator = std::vector<Vector>::const_iterator;

    Dataset() = default;

    explicit Dataset(const std::vector<Vector>& vectors) {
        vectors_.reserve(vectors.size());
        for (const auto& v : vectors) {
            add(v);
        }
    }

    /**
     * @brief Append a vector.
     *
     * @throws DimensionMismatch if the width differs from the stored vectors
     */
    void add(const Vector& vector) {
        if (!vectors_.empty() && vectors_.front().size() != vector.size()) {
            throw DimensionMismatch(vectors_.front().size(), vector.size());
        }
        vectors_.push_back(vector);
    }

    void add_raw(std::initializer_list<Scalar> values) {
        Vector v(static_cast<Eigen::Index>(values.size()));
        Eigen::Index k = 0;
        for (Scalar value : values) {
            v(k++) = value;
        }
        add(v);
    }

    std::size_t size() const { return vectors_.size(); }
    bool empty() const { return vectors_.empty(); }

    /**
     * @brief Width shared by every vector.
     *
     * @throws EmptyDataset if the data set holds no vectors
     */
    int width() const {
        if (vectors_.empty()) {
            throw EmptyDataset();
        }
        return static_cast<int>(vectors_.front().size());
    }

    const Vector& operator[](std::size_t i) const { return vectors_[i]; }
    const std::vector<Vector>& vectors() const { return vectors_; }

    const_iterator begin() const { return vectors_.begin(); }
    const_iterator end() const { return vectors_.end(); }

    /**
     * @brief Uniformly random in-place permutation.
     */
    void shuffle(std::mt19937& rng = global_rng()) {
        std::shuffle(vectors_.begin(), vectors_.end(), rng);
    }

    Dataset copy() const { return *this; }

    /**
     * @brief Stable ascending sort, comparing coordinates left to right.
     */
    void sort_lexicographic() {
        std::stable_sort(vectors_.begin(), vectors_.end(),
                         [](const Vector& a, const Vector& b) {
                             return std::lexicographical_compare(
                                 a.data(), a.data() + a.size(),
                                 b.data(), b.data() + b.size());
                         });
    }

    /**
     * @brief Keep n representatives of the sequence.
     *
     * The sequence is split into n contiguous segments and the middle
     * element of each one is kept:
     *
     *   0 1 2 3 4 5 6 7 8  (size 9, n 3)
     *   * ^   * ^   * ^   *
     *   kept indices: (0+3)>>1 = 1, (3+6)>>1 = 4, (6+9)>>1 = 7
     *
     * No-op when size() <= n.
     */
    void downsample(std::size_t n) {
        if (vectors_.size() <= n) return;

        std::vector<Vector> kept;
        kept.reserve(n);

        const double step = static_cast<double>(vectors_.size()) / static_cast<double>(n);
        for (std::size_t i = 0; i < n; ++i) {
            auto left = static_cast<std::size_t>(std::floor(i * step));
            auto right = static_cast<std::size_t>(std::floor((i + 1) * step));
            kept.push_back(std::move(vectors_[(left + right) >> 1]));
        }

        vectors_ = std::move(kept);
    }

private:
    std::vector<Vector> vectors_;
};

}  // namespace kohonen
