#include <iostream>
#include <atomic>
#include <barrier>
#include <cstdint>
#include <exception>
#include <thread>
#include <utility>
#include <vector>
#include "PondRun.hpp"

namespace {
    inline std::pair<std::size_t, std::size_t>
    split_range(std::size_t n, int rank, int size) {
        std::size_t base = n / size;
        std::size_t extra = n % size;
        std::size_t local = base + (static_cast<std::size_t>(rank) < extra ? 1 : 0);
        std::size_t first = base * rank + (static_cast<std::size_t>(rank) < extra ? rank : extra);
        return {first, first + local};
    }
}

int main(int argc, char** argv) {
    RunConfig cfg;
    try {
        cfg = parse_run_config(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Usage: " << (argc > 0 ? argv[0] : "pondsim_thread") << usage_text();
        return 1;
    }

    int T = cfg.threads > 0 ? cfg.threads : threads_from_env("SOLVER_NUM_THREADS", 1);

    try {
        std::uint64_t seed = 0;
        WaveField w = make_pond(cfg, seed);

        // No worker without rows.
        if (static_cast<std::size_t>(T) > w.size()) T = static_cast<int>(w.size());

        std::cout << "pond " << cfg.size << "x" << cfg.size << ", " << cfg.drops
                  << " drops (seed " << seed << "), " << cfg.steps << " steps, "
                  << T << " threads\n"
                  << "eps = " << cfg.params.eps << ", damping = " << cfg.params.damping
                  << ", c = " << cfg.params.c << "\n";

        prepare_frame_dir(cfg);
        report_energy("Initial energies", w, cfg.params.c);
        emit_frame(cfg, w);

        DegeneracyWatch watch;
        ProgressClock clock(parse_interval_env());
        const StepParams p = cfg.params;

        std::barrier sync(T);
        std::atomic<bool> failed(false);
        std::exception_ptr error;

        auto worker = [&](int tid) {
            auto [i0, i1] = split_range(w.size(), tid, T);

            for (std::uint64_t s = 0; s < cfg.steps; ++s) {
                w.advance_rows(p, i0, i1);

                sync.arrive_and_wait();

                if (tid == 0) {
                    w.commit(p);
                    watch.check(w);
                    try {
                        emit_frame(cfg, w);
                        if (clock.due())
                            report_energy("Progress", w, p.c);
                    } catch (...) {
                        error = std::current_exception();
                        failed.store(true, std::memory_order_relaxed);
                    }
                }

                sync.arrive_and_wait();

                if (failed.load(std::memory_order_relaxed))
                    return;
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(T);
        for (int i = 0; i < T; i++)
            threads.emplace_back(worker, i);
        for (auto& th : threads)
            th.join();

        if (error)
            std::rethrow_exception(error);

        report_energy("Final energies", w, p.c);
        std::cout << "elapsed " << clock.elapsed() << " s\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
