#pragma once
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "Grid.hpp"

struct FrameRange {
    double low = -0.1;
    double high = 0.1;
};

// Linear map of [low, high] onto 0..255, clipped. NaN renders black.
inline std::vector<std::uint8_t> render_gray(const Grid& g, const FrameRange& r) {
    if (!(r.high > r.low))
        throw std::invalid_argument("frame range must satisfy low < high");

    std::vector<std::uint8_t> px(g.cells());
    const double span = r.high - r.low;
    for (std::size_t k = 0; k < g.cells(); k++) {
        double a = (g.data[k] - r.low) / span * 255.0;
        if (std::isnan(a) || a < 0.0) a = 0.0;
        if (a > 255.0) a = 255.0;
        px[k] = static_cast<std::uint8_t>(a);
    }
    return px;
}

// Binary PGM (P5), one byte per pixel.
inline void write_pgm(const std::string& filename, const std::vector<std::uint8_t>& px,
                      std::size_t n)
{
    if (px.size() != n * n)
        throw std::invalid_argument("pixel buffer does not match frame size");

    std::ofstream os(filename, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("bad output file: " + filename);

    os << "P5\n" << n << ' ' << n << "\n255\n";
    os.write(reinterpret_cast<const char*>(px.data()), static_cast<std::streamsize>(px.size()));
    if (!os) throw std::runtime_error("write failed: " + filename);
}

inline void atomic_write_pgm(const std::string& filename, const std::vector<std::uint8_t>& px,
                             std::size_t n)
{
    std::string tmp = filename + ".tmp";
    write_pgm(tmp, px, n);
    std::error_code ec;
    std::filesystem::rename(tmp, filename, ec);
    if (ec) {
        std::filesystem::remove(filename, ec);
        std::filesystem::rename(tmp, filename, ec);
        if (ec) throw std::runtime_error("frame rename failed: " + ec.message());
    }
}

inline std::string make_frame_name(std::uint64_t step) {
    std::ostringstream ss;
    ss << "frame-" << std::setw(7) << std::setfill('0') << step << ".pgm";
    return ss.str();
}
