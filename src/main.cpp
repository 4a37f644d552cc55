// Main entry: estimate where each rank lands after a (biased) shuffle and print the table
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include "cli/cli.hpp"
#include "cli/table.hpp"
#include "core/rng.hpp"
#include "shuffle/uniform.hpp"
#include "sim/simulate.hpp"
#include "stats/hoeffding.hpp"
#include "util/timing.hpp"

int main(int argc, char** argv) {
    try {
        // Parse CLI
        bool want_help = false; std::string help_text;
        cli::Options opt = cli::parse_args(argc, argv, want_help, help_text);
        if (want_help) { std::cout << help_text; return 0; }

        // Deterministic master RNG unless --random-seed
        const std::uint64_t seed = opt.random_seed ? core::make_random_seed() : core::resolve_seed(opt.seed);
        core::SplitMix64 rng(seed);

        if (opt.verbose > 1) {
            if (!opt.config_path.empty()) std::cerr << "Config: " << opt.config_path << "\n";
            std::cerr << "Seed: " << seed << "\n";
            std::cerr << "Trials for +/-0.01 on every cell at confidence " << (1.0 - opt.alpha) << ": "
                      << hoeffding::required_runs(0.01, opt.alpha, hoeffding::landing_cells(opt.items)) << "\n";
        }
        if (opt.verbose > 0) {
            std::cerr << "Simulating " << opt.simulations << " " << cli::to_string(opt.shuffle)
                      << " shuffles of " << opt.items << " items";
            if (opt.shuffle == cli::ShuffleKind::Elitist) std::cerr << " (inequality " << opt.inequality << ")";
            std::cerr << "\n";
        }

        // ---- Run ----
        util::Stopwatch sw;
        sim::LandingDistribution dist;
        if (opt.shuffle == cli::ShuffleKind::Elitist) {
            dist = sim::simulate_elitist(opt.items, opt.simulations, opt.inequality, rng);
        } else {
            dist = sim::simulate(shuffle::UniformShuffle<core::SplitMix64>(rng), opt.items, opt.simulations);
        }

        if (opt.verbose > 0) {
            const double eps = hoeffding::half_width(opt.simulations, opt.alpha, hoeffding::landing_cells(opt.items));
            std::cerr << "Done in " << sw.milliseconds() << " ms; every cell within +/-" << eps
                      << " at confidence " << (1.0 - opt.alpha) << "\n";
        }

        cli::write_table(std::cout, dist, opt.precision);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
