#include <gtest/gtest.h>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <random>
#include "Laplacian.hpp"

namespace {

Grid impulse(std::size_t n, std::size_t i, std::size_t j, double v) {
    Grid g(n);
    g(i, j) = v;
    return g;
}

}  // namespace

TEST(Laplacian, KernelWeightsSumToZero) {
    double s = 0.0;
    for (double w : kLaplaceKernel) s += w;
    EXPECT_DOUBLE_EQ(s, 0.0);
    EXPECT_DOUBLE_EQ(kLaplaceKernel[4], -3.0);
}

TEST(Laplacian, InteriorImpulse) {
    const double v = 2.5;
    Grid out = laplacian(impulse(7, 3, 3, v));
    ASSERT_EQ(out.n, 7u);

    for (std::size_t i = 0; i < 7; i++) {
        for (std::size_t j = 0; j < 7; j++) {
            long di = static_cast<long>(i) - 3;
            long dj = static_cast<long>(j) - 3;
            double expected = 0.0;
            if (di == 0 && dj == 0) expected = -3.0 * v;
            else if (std::labs(di) + std::labs(dj) == 1) expected = 0.5 * v;
            else if (std::labs(di) == 1 && std::labs(dj) == 1) expected = 0.25 * v;
            EXPECT_DOUBLE_EQ(out(i, j), expected) << "at (" << i << ", " << j << ")";
        }
    }
}

TEST(Laplacian, CornerUsesZeroPadding) {
    const double v = 1.75;
    Grid out = laplacian(impulse(5, 0, 0, v));

    EXPECT_DOUBLE_EQ(out(0, 0), -3.0 * v);
    EXPECT_DOUBLE_EQ(out(0, 1), 0.5 * v);
    EXPECT_DOUBLE_EQ(out(1, 0), 0.5 * v);
    EXPECT_DOUBLE_EQ(out(1, 1), 0.25 * v);
    // No wraparound onto the opposite edges.
    EXPECT_DOUBLE_EQ(out(4, 4), 0.0);
    EXPECT_DOUBLE_EQ(out(0, 4), 0.0);
    EXPECT_DOUBLE_EQ(out(4, 0), 0.0);
}

TEST(Laplacian, ConstantFieldOnlyLeaksAtEdges) {
    Grid g(4, 1.0);
    Grid out = laplacian(g);
    EXPECT_DOUBLE_EQ(out(1, 1), 0.0);
    EXPECT_DOUBLE_EQ(out(2, 2), 0.0);
    EXPECT_DOUBLE_EQ(out(0, 1), -1.0);   // missing row: 0.25 + 0.5 + 0.25
    EXPECT_DOUBLE_EQ(out(0, 0), -1.75);  // missing row and column
}

TEST(Laplacian, IsLinear) {
    const std::size_t n = 16;
    std::mt19937_64 gen(7);
    std::uniform_real_distribution<double> d(-1.0, 1.0);
    Grid x(n), y(n), mix(n);
    const double a = 0.7, b = -1.3;
    for (std::size_t k = 0; k < x.cells(); k++) {
        x.data[k] = d(gen);
        y.data[k] = d(gen);
        mix.data[k] = a * x.data[k] + b * y.data[k];
    }

    Grid lx = laplacian(x), ly = laplacian(y), lmix = laplacian(mix);
    for (std::size_t k = 0; k < mix.cells(); k++)
        EXPECT_NEAR(lmix.data[k], a * lx.data[k] + b * ly.data[k], 1e-12);
}

TEST(Laplacian, RowRangesMatchWholeGrid) {
    const std::size_t n = 9;
    std::mt19937_64 gen(11);
    std::uniform_real_distribution<double> d(0.0, 1.0);
    Grid g(n);
    for (double& x : g.data) x = d(gen);

    Grid whole = laplacian(g);
    std::vector<double> pieces(n * n, -1.0);
    laplacian_rows(g.data.data(), pieces.data(), n, 0, 4);
    laplacian_rows(g.data.data(), pieces.data(), n, 4, 5);
    laplacian_rows(g.data.data(), pieces.data(), n, 5, n);

    EXPECT_EQ(pieces, whole.data);
}

TEST(Laplacian, DoesNotModifyInput) {
    Grid g = impulse(3, 1, 1, 1.0);
    Grid copy = g;
    (void)laplacian(g);
    EXPECT_EQ(g.data, copy.data);
}

TEST(Laplacian, NanPropagates) {
    Grid g = impulse(3, 1, 1, std::numeric_limits<double>::quiet_NaN());
    Grid out = laplacian(g);
    for (double x : out.data) EXPECT_TRUE(std::isnan(x));
}

TEST(Laplacian, RejectsMalformedGrid) {
    Grid g(3);
    g.data.pop_back();
    EXPECT_THROW(laplacian(g), ShapeMismatch);
}
