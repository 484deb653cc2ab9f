/**
 * @file csv_writer.hpp
 * @brief CSV output utilities for SOM experiment results
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <kohonen/core/base.hpp>
#include <kohonen/core/dataset.hpp>

namespace csv_writer {

namespace fs = std::filesystem;

/**
 * @brief Create output directory if it doesn't exist
 */
inline void ensure_directory(const std::string& path) {
    fs::create_directories(path);
}

/**
 * @brief Format iteration number with zero padding
 */
inline std::string format_iteration(int iteration, int width = 5) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(width) << iteration;
    return oss.str();
}

inline std::ofstream open_for_writing(const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    return file;
}

/**
 * @brief Save data set vectors to CSV, one column per coordinate
 */
inline void save_dataset(const kohonen::Dataset& set, const std::string& path) {
    std::ofstream file = open_for_writing(path);
    const int width = set.width();
    for (int k = 0; k < width; ++k) {
        file << (k == 0 ? "" : ",") << "v" << k;
    }
    file << "\n";
    file << std::fixed << std::setprecision(6);
    for (const auto& v : set) {
        for (int k = 0; k < width; ++k) {
            file << (k == 0 ? "" : ",") << v(k);
        }
        file << "\n";
    }
}

/**
 * @brief Save one matrix (e.g. a distance matrix or one weight plane) to CSV
 */
inline void save_matrix(const kohonen::Matrix& m, const std::string& path) {
    std::ofstream file = open_for_writing(path);
    file << std::fixed << std::setprecision(6);
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            file << (j == 0 ? "" : ",") << m(i, j);
        }
        file << "\n";
    }
}

/**
 * @brief Save frame iteration numbers to CSV
 */
inline void save_frames(
    const std::vector<int>& frames,
    const std::string& path
) {
    std::ofstream file = open_for_writing(path);
    file << "iteration\n";
    for (int f : frames) {
        file << f << "\n";
    }
}

/**
 * @brief Metadata writer for test results
 */
class MetadataWriter {
public:
    explicit MetadataWriter(const std::string& path) : path_(path) {}

    void add(const std::string& key, const std::string& value) {
        entries_.emplace_back(key, value);
    }

    void add(const std::string& key, int value) {
        add(key, std::to_string(value));
    }

    void add(const std::string& key, double value) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6) << value;
        add(key, oss.str());
    }

    void save() const {
        std::ofstream file = open_for_writing(path_);
        file << "key,value\n";
        for (const auto& [key, value] : entries_) {
            file << key << "," << value << "\n";
        }
    }

private:
    std::string path_;
    std::vector<std::pair<std::string, std::string>> entries_;
};

/**
 * @brief Timer utility for measuring execution time
 */
class Timer {
public:
    void start() {
        start_ = std::chrono::high_resolution_clock::now();
    }

    void stop() {
        end_ = std::chrono::high_resolution_clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(end_ - start_).count();
    }

private:
    std::chrono::high_resolution_clock::time_point start_;
    std::chrono::high_resolution_clock::time_point end_;
};

}  // namespace csv_writer
