/**
 * @file grid.hpp
 * @brief Two-dimensional array of collected values.
 */

#ifndef PPF_GRID_HPP
#define PPF_GRID_HPP

#include "config.hpp"

#include <vector>

namespace ppf {

/**
 * @brief Dense row-major grid of doubles.
 *
 * Rows index mesh positions (zones or nodes), columns index dumps, so
 * column j holds one array of dump j.
 */
class Grid {
public:
    Grid() = default;

    Grid(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols), data_(rows * cols, 0.0) {}

    [[nodiscard]] std::size_t rows() const noexcept {
        return rows_;
    }

    [[nodiscard]] std::size_t cols() const noexcept {
        return cols_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return data_.empty();
    }

    double& operator()(std::size_t row, std::size_t col) noexcept {
        return data_[(row * cols_) + col];
    }

    double operator()(std::size_t row, std::size_t col) const noexcept {
        return data_[(row * cols_) + col];
    }

    /**
     * @brief Copy out one column (all rows of one dump).
     */
    [[nodiscard]] std::vector<double> column(std::size_t col) const {
        std::vector<double> values(rows_);
        for (std::size_t r = 0; r < rows_; ++r) {
            values[r] = (*this)(r, col);
        }
        return values;
    }

    /**
     * @brief Copy out one row (one mesh position over time).
     */
    [[nodiscard]] std::vector<double> row(std::size_t row) const {
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(row * cols_);
        return std::vector<double>(first, first + static_cast<std::ptrdiff_t>(cols_));
    }

    /**
     * @brief Row-major storage.
     */
    [[nodiscard]] const std::vector<double>& data() const noexcept {
        return data_;
    }

    bool operator==(const Grid&) const = default;

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::vector<double> data_;
};

} // namespace ppf

#endif // PPF_GRID_HPP
