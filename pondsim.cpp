#include <iostream>
#include <exception>
#include <omp.h>
#include "PondRun.hpp"

int main(int argc, char** argv) {
    RunConfig cfg;
    try {
        cfg = parse_run_config(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Usage: " << (argc > 0 ? argv[0] : "pondsim") << usage_text();
        return 1;
    }

    const int threads = cfg.threads > 0 ? cfg.threads : threads_from_env("OMP_NUM_THREADS", 8);
    omp_set_dynamic(0);
    omp_set_num_threads(threads);
    omp_set_schedule(omp_sched_static, 0);

    try {
        std::uint64_t seed = 0;
        WaveField w = make_pond(cfg, seed);
        std::cout << "pond " << cfg.size << "x" << cfg.size << ", " << cfg.drops
                  << " drops (seed " << seed << "), " << cfg.steps << " steps, "
                  << threads << " threads\n"
                  << "eps = " << cfg.params.eps << ", damping = " << cfg.params.damping
                  << ", c = " << cfg.params.c << "\n";

        prepare_frame_dir(cfg);
        report_energy("Initial energies", w, cfg.params.c);
        emit_frame(cfg, w);

        DegeneracyWatch watch;
        ProgressClock clock(parse_interval_env());

        for (std::uint64_t s = 0; s < cfg.steps; ++s) {
            w.step(cfg.params);
            watch.check(w);
            emit_frame(cfg, w);
            if (clock.due())
                report_energy("Progress", w, cfg.params.c);
        }

        report_energy("Final energies", w, cfg.params.c);
        std::cout << "elapsed " << clock.elapsed() << " s\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
