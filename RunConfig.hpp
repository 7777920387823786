#pragma once
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include "FrameWriter.hpp"
#include "WaveField.hpp"

struct RunConfig {
    std::size_t size = 500;
    std::size_t drops = 40;
    std::uint64_t steps = 1000;
    std::optional<std::uint64_t> seed;
    StepParams params;
    FrameRange range;
    std::string frame_dir;      // empty: no frames
    std::uint64_t every = 1;
    int threads = 0;            // 0: take from the environment
};

inline const char* usage_text() {
    return " [--size N] [--drops K] [--steps S] [--seed X]"
           " [--eps E] [--damping D] [--speed C] [--range LOW HIGH]"
           " [--frames DIR] [--every K] [--threads T]\n";
}

inline double to_double(const char* flag, const char* s) {
    char* endp = nullptr;
    double v = std::strtod(s, &endp);
    if (endp == s || *endp != '\0' || !std::isfinite(v))
        throw std::invalid_argument(std::string(flag) + ": not a number: " + s);
    return v;
}

inline std::uint64_t to_count(const char* flag, const char* s) {
    char* endp = nullptr;
    if (*s == '-')
        throw std::invalid_argument(std::string(flag) + ": must not be negative: " + s);
    errno = 0;
    unsigned long long v = std::strtoull(s, &endp, 10);
    if (endp == s || *endp != '\0')
        throw std::invalid_argument(std::string(flag) + ": not an integer: " + s);
    if (errno == ERANGE)
        throw std::invalid_argument(std::string(flag) + ": out of range: " + s);
    return static_cast<std::uint64_t>(v);
}

inline RunConfig parse_run_config(int argc, char** argv) {
    RunConfig cfg;
    for (int i = 1; i < argc; ++i) {
        const char* flag = argv[i];
        auto value = [&]() -> const char* {
            if (i + 1 >= argc)
                throw std::invalid_argument(std::string(flag) + ": missing value");
            return argv[++i];
        };

        if (std::strcmp(flag, "--size") == 0) {
            cfg.size = to_count(flag, value());
        } else if (std::strcmp(flag, "--drops") == 0) {
            cfg.drops = to_count(flag, value());
        } else if (std::strcmp(flag, "--steps") == 0) {
            cfg.steps = to_count(flag, value());
        } else if (std::strcmp(flag, "--seed") == 0) {
            cfg.seed = to_count(flag, value());
        } else if (std::strcmp(flag, "--eps") == 0) {
            cfg.params.eps = to_double(flag, value());
        } else if (std::strcmp(flag, "--damping") == 0) {
            cfg.params.damping = to_double(flag, value());
        } else if (std::strcmp(flag, "--speed") == 0) {
            cfg.params.c = to_double(flag, value());
        } else if (std::strcmp(flag, "--range") == 0) {
            cfg.range.low = to_double(flag, value());
            cfg.range.high = to_double(flag, value());
        } else if (std::strcmp(flag, "--frames") == 0) {
            cfg.frame_dir = value();
        } else if (std::strcmp(flag, "--every") == 0) {
            cfg.every = to_count(flag, value());
        } else if (std::strcmp(flag, "--threads") == 0) {
            std::uint64_t t = to_count(flag, value());
            if (t > static_cast<std::uint64_t>(INT_MAX))
                throw std::invalid_argument(std::string(flag) + ": too many threads");
            cfg.threads = static_cast<int>(t);
        } else {
            throw std::invalid_argument(std::string("unknown option: ") + flag);
        }
    }

    if (cfg.size == 0) throw std::invalid_argument("--size: must be positive");
    if (!side_fits(cfg.size)) throw std::invalid_argument("--size: too large");
    if (cfg.every == 0) throw std::invalid_argument("--every: must be positive");
    if (!(cfg.range.high > cfg.range.low))
        throw std::invalid_argument("--range: LOW must be below HIGH");
    return cfg;
}

// Seconds between progress reports; -1 disables them.
inline double parse_interval_env() {
    const char* s = std::getenv("INTVL");
    if (!s || !*s) return -1.0;
    char* endp = nullptr;
    double val = std::strtod(s, &endp);
    if (endp == s || !std::isfinite(val) || val <= 0.0) return -1.0;
    return val;
}

inline int threads_from_env(const char* var, int fallback) {
    if (const char* s = std::getenv(var)) {
        int n = std::atoi(s);
        if (n > 0) return n;
    }
    return fallback;
}
