#pragma once
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "Grid.hpp"
#include "Laplacian.hpp"

struct StepParams {
    double eps = 0.03;      // time step
    double damping = 0.04;
    double c = 3.0;         // wave speed
};

struct Energy {
    double kinetic = 0.0;
    double potential = 0.0;
    inline double total() const { return kinetic + potential; }
};

// Damped wave equation u_tt = c^2 L(u) - damping u_t on an n x n pond,
// advanced with explicit Euler.
class WaveField {
public:
    WaveField(std::size_t n, Grid u0, Grid v0)
        : n_(n), u_(std::move(u0)), v_(std::move(v0))
    {
        if (n_ == 0) throw std::invalid_argument("grid size must be positive");
        if (!side_fits(n_))
            throw std::invalid_argument("grid size " + std::to_string(n_) + " is too large");
        if (!has_shape(u_, n_))
            throw ShapeMismatch("displacement grid is not " + std::to_string(n_) + "x" +
                                std::to_string(n_));
        if (!has_shape(v_, n_))
            throw ShapeMismatch("velocity grid is not " + std::to_string(n_) + "x" +
                                std::to_string(n_));

        lap_.resize(n_ * n_);
        u_next_.resize(n_ * n_);
        v_next_.resize(n_ * n_);
    }

    inline std::size_t size() const { return n_; }
    inline const Grid& displacement() const { return u_; }
    inline const Grid& velocity() const { return v_; }
    inline std::uint64_t steps() const { return steps_; }
    inline double time() const { return t_; }
    inline bool stepped() const { return steps_ > 0; }

    void step(const StepParams& p) {
        const std::size_t n = n_;

        #pragma omp parallel for schedule(static)
        for (std::size_t i = 0; i < n; ++i)
            advance_rows(p, i, i + 1);

        commit(p);
    }

    void run(std::uint64_t count, const StepParams& p) {
        for (std::uint64_t s = 0; s < count; ++s)
            step(p);
    }

    // Computes rows [i0, i1) of the next state into scratch buffers. Reads the
    // current grids only; the visible state changes in commit().
    void advance_rows(const StepParams& p, std::size_t i0, std::size_t i1) {
        if (i0 > i1 || i1 > n_)
            throw std::out_of_range("row range [" + std::to_string(i0) + ", " +
                                    std::to_string(i1) + ") outside the pond");
        const double* ud = u_.data.data();
        const double* vd = v_.data.data();
        double* lap = lap_.data();
        double* un = u_next_.data();
        double* vn = v_next_.data();
        const double c2 = p.c * p.c;

        laplacian_rows(ud, lap, n_, i0, i1);

        for (std::size_t k = i0 * n_; k < i1 * n_; ++k) {
            un[k] = ud[k] + p.eps * vd[k];
            vn[k] = vd[k] + p.eps * (c2 * lap[k] - p.damping * vd[k]);
        }
        advanced_.fetch_add(i1 - i0, std::memory_order_relaxed);
    }

    // Publishes the advanced rows. Throws, leaving the visible state untouched,
    // unless the rows advanced since the last commit add up to the pond size.
    void commit(const StepParams& p) {
        std::size_t rows = advanced_.exchange(0, std::memory_order_acq_rel);
        if (rows != n_)
            throw std::logic_error("commit after " + std::to_string(rows) + " of " +
                                   std::to_string(n_) + " rows advanced");
        u_.data.swap(u_next_);
        v_.data.swap(v_next_);
        t_ += p.eps;
        ++steps_;
    }

    Energy energy(double c) const {
        Energy e;
        const double* ud = u_.data.data();
        const double* vd = v_.data.data();

        for (std::size_t k = 0; k < u_.cells(); k++)
            e.kinetic += 0.5 * vd[k] * vd[k];

        for (std::size_t i = 0; i < n_; i++) {
            std::size_t io = i * n_;
            for (std::size_t j = 0; j < n_; j++)
                e.potential -= 0.5 * c * c * ud[io + j] * laplacian_at(ud, i, j, n_);
        }
        return e;
    }

    // First NaN/Inf cell in u, then v.
    std::optional<std::pair<std::size_t, std::size_t>> first_nonfinite() const {
        for (const Grid* g : {&u_, &v_}) {
            for (std::size_t k = 0; k < g->cells(); k++) {
                if (!std::isfinite(g->data[k]))
                    return std::make_pair(k / n_, k % n_);
            }
        }
        return std::nullopt;
    }

private:
    std::size_t n_;
    Grid u_, v_;
    std::vector<double> lap_, u_next_, v_next_;
    double t_ = 0.0;
    std::uint64_t steps_ = 0;
    std::atomic<std::size_t> advanced_{0};
};
