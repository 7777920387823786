#pragma once
#include <array>
#include <cstddef>
#include <string>
#include "Grid.hpp"

// Isotropic 9-point Laplacian. Weights sum to zero.
inline constexpr std::array<double, 9> kLaplaceKernel = {
    0.25, 0.5,  0.25,
    0.5,  -3.0, 0.5,
    0.25, 0.5,  0.25,
};

// Zero padding: taps that fall outside the grid are skipped.
static inline double laplacian_at(const double* __restrict u,
                                  std::size_t i, std::size_t j, std::size_t n)
{
    double s = 0.0;
    for (std::size_t di = 0; di < 3; ++di) {
        if (i + di < 1 || i + di > n) continue;
        const std::size_t r = (i + di - 1) * n;
        for (std::size_t dj = 0; dj < 3; ++dj) {
            if (j + dj < 1 || j + dj > n) continue;
            s += kLaplaceKernel[di * 3 + dj] * u[r + j + dj - 1];
        }
    }
    return s;
}

// Fills rows [i0, i1) of out. Reads rows i0-1 .. i1 of u only, so disjoint
// row ranges can be computed concurrently against the same input.
static inline void laplacian_rows(const double* __restrict u, double* __restrict out,
                                  std::size_t n, std::size_t i0, std::size_t i1)
{
    for (std::size_t i = i0; i < i1; ++i) {
        const std::size_t base = i * n;
        for (std::size_t j = 0; j < n; ++j)
            out[base + j] = laplacian_at(u, i, j, n);
    }
}

inline Grid laplacian(const Grid& g) {
    if (!has_shape(g, g.n))
        throw ShapeMismatch("grid declares " + std::to_string(g.n) + "x" +
                            std::to_string(g.n) + " but holds " +
                            std::to_string(g.data.size()) + " cells");
    Grid out(g.n);
    const double* in = g.data.data();
    double* o = out.data.data();
    const std::size_t n = g.n;

    #pragma omp parallel for schedule(static)
    for (std::size_t i = 0; i < n; ++i)
        laplacian_rows(in, o, n, i, i + 1);

    return out;
}
