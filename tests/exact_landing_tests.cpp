// Brute-force check of the elitist shuffle against its exact landing probabilities.
// For small n we enumerate all n! draw orders; a draw order's probability is the
// product over steps of (weight of the pick) / (weight still in the pool).
// Prints ALL TESTS PASSED and exits 0 on success.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <vector>

#include "core/rng.hpp"
#include "shuffle/weights.hpp"
#include "sim/simulate.hpp"
#include "stats/hoeffding.hpp"

using std::size_t;
using Table = std::vector<std::vector<double>>; // [initial][final]

static Table exact_landing(size_t n, double inequality) {
    const auto w = shuffle::rank_weights(n, inequality);
    Table t(n, std::vector<double>(n, 0.0));
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    do {
        double p = 1.0;
        for (size_t step = 0; step < n; ++step) {
            double remaining = 0.0;
            for (size_t r = step; r < n; ++r) remaining += w[order[r]];
            p *= w[order[step]] / remaining;
        }
        for (size_t step = 0; step < n; ++step) t[order[step]][step] += p;
    } while (std::next_permutation(order.begin(), order.end()));
    return t;
}

static bool check_doubly_stochastic(const Table& t, size_t n, double inequality) {
    bool ok = true;
    for (size_t i = 0; i < n; ++i) {
        double row = 0.0, col = 0.0;
        for (size_t j = 0; j < n; ++j) { row += t[i][j]; col += t[j][i]; }
        if (std::abs(row - 1.0) > 1e-12 || std::abs(col - 1.0) > 1e-12) {
            std::cerr << "n=" << n << " inequality=" << inequality << " index " << i
                      << " row=" << row << " col=" << col << " (expected 1)\n";
            ok = false;
        }
    }
    return ok;
}

static bool check_uniform(const Table& t, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (std::abs(t[i][j] - 1.0 / static_cast<double>(n)) > 1e-12) {
                std::cerr << "n=" << n << " inequality=0 cell (" << i << "," << j << ")=" << t[i][j] << "\n";
                return false;
            }
        }
    }
    return true;
}

// Higher rank never has less mass in the first k positions.
static bool check_monotone(const Table& t, size_t n, double inequality) {
    for (size_t k = 1; k <= n; ++k) {
        for (size_t i = 0; i + 1 < n; ++i) {
            double a = 0.0, b = 0.0;
            for (size_t j = 0; j < k; ++j) { a += t[i][j]; b += t[i+1][j]; }
            if (a + 1e-12 < b) {
                std::cerr << "n=" << n << " inequality=" << inequality << " k=" << k
                          << " mass(" << i << ")=" << a << " < mass(" << i+1 << ")=" << b << "\n";
                return false;
            }
        }
    }
    return true;
}

static bool check_simulation(const Table& t, size_t n, double inequality, std::uint64_t seed) {
    const size_t trials = 100000;
    const double alpha = 1e-6;
    const double eps = hoeffding::half_width(trials, alpha, hoeffding::landing_cells(n));

    core::SplitMix64 rng(seed);
    const auto d = sim::simulate_elitist(n, trials, inequality, rng);
    bool ok = true;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            const double got = d.probability(i, j);
            if (std::abs(got - t[i][j]) > eps) {
                std::cerr << "n=" << n << " inequality=" << inequality << " cell (" << i << "," << j
                          << ") simulated=" << got << " exact=" << t[i][j] << " eps=" << eps << "\n";
                ok = false;
            }
        }
    }
    return ok;
}

int main() {
    bool ok = true;
    const double inequalities[] = {0.0, 0.5, 1.0, 2.0, 4.0};
    const std::uint64_t seed = 0x5EED;

    for (size_t n = 1; n <= 6; ++n) {
        for (double inequality : inequalities) {
            const Table t = exact_landing(n, inequality);
            ok &= check_doubly_stochastic(t, n, inequality);
            if (inequality == 0.0) ok &= check_uniform(t, n);
            else ok &= check_monotone(t, n, inequality);
            if (n <= 4) ok &= check_simulation(t, n, inequality, core::derive_seed(seed, n * 10 + static_cast<size_t>(inequality * 2)));
        }
    }

    std::cout << (ok ? "ALL TESTS PASSED\n" : "TESTS FAILED\n");
    return ok ? 0 : 1;
}
