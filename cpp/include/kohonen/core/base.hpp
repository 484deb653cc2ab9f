#pragma once

#include <Eigen/Dense>
#include <vector>

namespace kohonen {

/**
 * @brief Common numeric types shared by every SOM component.
 *
 * Input vectors and neuron weights have a width only known at runtime
 * (the data set width), hence dynamic-size Eigen types.
 */
using Scalar = double;
using Vector = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;
using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

/**
 * @brief Integer position of a neuron on the map.
 */
struct GridCoord {
    int x = 0;
    int y = 0;

    bool operator==(const GridCoord& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const GridCoord& other) const { return !(*this == other); }
};

/**
 * @brief One unit of the map.
 *
 * Coordinates are fixed at creation. The weight vector is sized by the
 * initializer and then updated in place while learning. `distance` is
 * scratch state of the last BMU search.
 */
class Neuron {
public:
    Neuron(int x, int y) : x_(x), y_(y) {}

    int x() const { return x_; }
    int y() const { return y_; }
    GridCoord coord() const { return {x_, y_}; }

    Vector weights;
    Scalar distance = 0.0;

private:
    int x_;
    int y_;
};

// Grid of neurons, indexed [x][y]
using Grid = std::vector<std::vector<Neuron>>;

}  // namespace kohonen
