/**
 * @file grid_csv.hpp
 * @brief CSV export/import of a trained map
 *
 * Layout: header "x,y,w0,...,w{k-1}", then one row per neuron in
 * [x][y] order. Weights are written with 17 significant digits so that
 * loading a saved file restores them exactly.
 */

#pragma once

#include <cstddef>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <kohonen/core/base.hpp>
#include <kohonen/core/logger.hpp>

namespace kohonen {
namespace io {

/**
 * @brief Write every neuron's coordinates and weights.
 *
 * @throws std::runtime_error if the file cannot be written
 */
template <typename Map>
void save_grid_csv(const Map& map, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }

    const Eigen::Index width = map.neuron(0, 0).weights.size();
    file << "x,y";
    for (Eigen::Index k = 0; k < width; ++k) {
        file << ",w" << k;
    }
    file << "\n";

    file << std::setprecision(std::numeric_limits<Scalar>::max_digits10);
    for (const auto& column : map.grid()) {
        for (const auto& neuron : column) {
            file << neuron.x() << "," << neuron.y();
            for (Eigen::Index k = 0; k < neuron.weights.size(); ++k) {
                file << "," << neuron.weights(k);
            }
            file << "\n";
        }
    }

    if (!file) {
        throw std::runtime_error("failed writing " + path);
    }
    KOHONEN_LOG(MOD_IO, SEV_INFO) << "saved " << map.size_x() << "x" << map.size_y()
                                  << " map to " << path;
}

namespace detail {

inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::istringstream iss(line);
    std::string cell;
    while (std::getline(iss, cell, ',')) {
        cells.push_back(cell);
    }
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

inline std::runtime_error parse_error(const std::string& path, int line_no,
                                      const std::string& what) {
    return std::runtime_error(path + ":" + std::to_string(line_no) + ": " + what);
}

/**
 * @brief Parse a whole cell as an integer grid coordinate.
 */
inline int parse_coordinate(const std::string& cell, const std::string& path, int line_no) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(cell, &consumed);
    } catch (const std::logic_error&) {
        throw parse_error(path, line_no, "invalid coordinate '" + cell + "'");
    }
    if (consumed != cell.size()) {
        throw parse_error(path, line_no, "invalid coordinate '" + cell + "'");
    }
    return value;
}

/**
 * @brief Parse a whole cell as a weight.
 */
inline Scalar parse_weight(const std::string& cell, const std::string& path, int line_no) {
    std::size_t consumed = 0;
    Scalar value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::logic_error&) {
        throw parse_error(path, line_no, "invalid number '" + cell + "'");
    }
    if (consumed != cell.size()) {
        throw parse_error(path, line_no, "invalid number '" + cell + "'");
    }
    return value;
}

}  // namespace detail

/**
 * @brief Restore the weights of a map of the same shape from a CSV file.
 *
 * The weight width is taken from the header and every row must match it.
 * The whole file is validated before any neuron is written, so the map is
 * left unchanged when loading fails.
 *
 * @throws std::runtime_error on unreadable files, malformed rows, or rows
 *         that do not match the map shape
 */
template <typename Map>
void load_grid_csv(Map& map, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open " + path + " for reading");
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error(path + ": missing header");
    }
    const std::vector<std::string> header = detail::split_csv_line(line);
    if (header.size() < 2 || header[0] != "x" || header[1] != "y") {
        throw std::runtime_error(path + ": header must start with x,y");
    }
    const std::size_t n_fields = header.size();
    const Eigen::Index width = static_cast<Eigen::Index>(n_fields - 2);

    std::vector<std::vector<Vector>> weights(map.size_x(), std::vector<Vector>(map.size_y()));
    std::vector<std::vector<bool>> seen(map.size_x(), std::vector<bool>(map.size_y(), false));
    int rows = 0;
    int line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;

        const std::vector<std::string> cells = detail::split_csv_line(line);
        if (cells.size() != n_fields) {
            throw detail::parse_error(path, line_no,
                                      "expected " + std::to_string(n_fields) + " fields, found " +
                                          std::to_string(cells.size()));
        }

        const int x = detail::parse_coordinate(cells[0], path, line_no);
        const int y = detail::parse_coordinate(cells[1], path, line_no);
        if (x < 0 || x >= map.size_x() || y < 0 || y >= map.size_y() || seen[x][y]) {
            throw detail::parse_error(path, line_no,
                                      "unexpected neuron (" + std::to_string(x) + ", " +
                                          std::to_string(y) + ")");
        }
        seen[x][y] = true;

        Vector& row = weights[x][y];
        row.resize(width);
        for (Eigen::Index k = 0; k < width; ++k) {
            row(k) = detail::parse_weight(cells[static_cast<std::size_t>(k) + 2], path, line_no);
        }
        ++rows;
    }

    if (rows != map.num_nodes()) {
        throw std::runtime_error(path + ": expected " + std::to_string(map.num_nodes()) +
                                 " neurons, found " + std::to_string(rows));
    }

    for (int x = 0; x < map.size_x(); ++x) {
        for (int y = 0; y < map.size_y(); ++y) {
            map.neuron(x, y).weights = std::move(weights[x][y]);
        }
    }
    KOHONEN_LOG(MOD_IO, SEV_INFO) << "loaded " << rows << " neurons from " << path;
}

}  // namespace io
}  // namespace kohonen
