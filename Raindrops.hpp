#pragma once
#include <cstddef>
#include <random>
#include <stdexcept>
#include "Grid.hpp"

inline Grid still_water(std::size_t n) {
    if (n == 0) throw std::invalid_argument("grid size must be positive");
    return Grid(n);
}

// Scatters `drops` point impulses over a flat pond. Each drop picks a row, a
// column and a height in [0, 1); a later drop on the same cell wins.
template <typename URNG>
Grid make_raindrops(std::size_t n, std::size_t drops, URNG& gen)
{
    Grid u = still_water(n);
    std::uniform_int_distribution<std::size_t> pos(0, n - 1);
    std::uniform_real_distribution<double> height(0.0, 1.0);

    for (std::size_t d = 0; d < drops; d++) {
        std::size_t i = pos(gen);
        std::size_t j = pos(gen);
        u(i, j) = height(gen);
    }
    return u;
}
