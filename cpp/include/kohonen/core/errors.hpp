#pragma once

#include <stdexcept>
#include <string>

namespace kohonen {

/**
 * @brief A vector width is inconsistent with the data set, the grid or
 * another operand.
 */
class DimensionMismatch : public std::invalid_argument {
public:
    DimensionMismatch(long expected, long actual)
        : std::invalid_argument("dimension mismatch: expected width " +
                                std::to_string(expected) + ", got " +
                                std::to_string(actual)),
          expected_(expected),
          actual_(actual) {}

    long expected() const { return expected_; }
    long actual() const { return actual_; }

private:
    long expected_;
    long actual_;
};

/**
 * @brief Width queried on a data set holding no vectors.
 */
class EmptyDataset : public std::logic_error {
public:
    EmptyDataset() : std::logic_error("data set contains no elements") {}
};

/**
 * @brief Raised by a selector when there is nothing left to select.
 *
 * Not fatal: the training loop stops when it sees it.
 */
class NoDataLeft : public std::out_of_range {
public:
    NoDataLeft() : std::out_of_range("no data left") {}
};

}  // namespace kohonen
