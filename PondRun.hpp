#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include "FrameWriter.hpp"
#include "Raindrops.hpp"
#include "RunConfig.hpp"
#include "WaveField.hpp"

// Shared setup and output for the pondsim drivers.

inline WaveField make_pond(const RunConfig& cfg, std::uint64_t& seed_used) {
    seed_used = cfg.seed ? *cfg.seed : std::random_device{}();
    std::mt19937_64 gen(seed_used);
    Grid u0 = make_raindrops(cfg.size, cfg.drops, gen);
    return WaveField(cfg.size, std::move(u0), still_water(cfg.size));
}

inline void prepare_frame_dir(const RunConfig& cfg) {
    if (cfg.frame_dir.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(cfg.frame_dir, ec);
    if (ec) throw std::runtime_error("cannot create " + cfg.frame_dir + ": " + ec.message());
}

inline void emit_frame(const RunConfig& cfg, const WaveField& w) {
    if (cfg.frame_dir.empty() || w.steps() % cfg.every != 0) return;
    std::filesystem::path p = std::filesystem::path(cfg.frame_dir) / make_frame_name(w.steps());
    atomic_write_pgm(p.string(), render_gray(w.displacement(), cfg.range), w.size());
}

inline void report_energy(const char* label, const WaveField& w, double c) {
    Energy e = w.energy(c);
    auto [lo, hi] = value_range(w.displacement());
    std::cout << label << " (step " << w.steps() << ", t = " << w.time() << "): "
              << "kinetic = " << e.kinetic
              << ", potential = " << e.potential
              << ", u in [" << lo << ", " << hi << "]\n";
}

class DegeneracyWatch {
public:
    void check(const WaveField& w) {
        if (warned) return;
        if (auto cell = w.first_nonfinite()) {
            std::cerr << "Warning: non-finite value at (" << cell->first << ", "
                      << cell->second << ") after step " << w.steps()
                      << "; eps may be too large for this grid\n";
            warned = true;
        }
    }

private:
    bool warned = false;
};

class ProgressClock {
public:
    explicit ProgressClock(double interval) : interval(interval) {}

    bool due() {
        if (interval <= 0.0) return false;
        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration<double>(now - last).count() < interval) return false;
        last = now;
        return true;
    }

    double elapsed() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

private:
    double interval;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point last = start;
};
