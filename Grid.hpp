#pragma once
#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class ShapeMismatch : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// True when n * n doubles can be addressed without wrapping size_t.
inline bool side_fits(std::size_t n) {
    return n == 0 || n <= std::numeric_limits<std::size_t>::max() / sizeof(double) / n;
}

// Square n x n field, row-major.
struct Grid {
    std::size_t n = 0;
    std::vector<double> data;

    Grid() = default;
    explicit Grid(std::size_t n_, double value = 0.0) : n(n_) {
        if (!side_fits(n_))
            throw std::invalid_argument("grid side " + std::to_string(n_) + " is too large");
        data.assign(n_ * n_, value);
    }

    static Grid from_rows(const std::vector<std::vector<double>>& rows) {
        Grid g(rows.size());
        for (std::size_t i = 0; i < rows.size(); i++) {
            if (rows[i].size() != g.n)
                throw ShapeMismatch("row " + std::to_string(i) + " has " +
                                    std::to_string(rows[i].size()) + " cells, expected " +
                                    std::to_string(g.n));
            std::copy(rows[i].begin(), rows[i].end(), g.data.begin() + i * g.n);
        }
        return g;
    }

    inline double& operator()(std::size_t i, std::size_t j) { return data[i * n + j]; }
    inline double operator()(std::size_t i, std::size_t j) const { return data[i * n + j]; }

    inline std::size_t cells() const { return data.size(); }

    void fill(double v) { std::fill(data.begin(), data.end(), v); }
};

inline bool has_shape(const Grid& g, std::size_t n) {
    return side_fits(n) && g.n == n && g.data.size() == n * n;
}

inline std::pair<double, double> value_range(const Grid& g) {
    if (g.data.empty()) return {0.0, 0.0};
    auto [lo, hi] = std::minmax_element(g.data.begin(), g.data.end());
    return {*lo, *hi};
}
