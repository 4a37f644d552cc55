// hoeffding.hpp — sample-size and accuracy bounds for landing probabilities
#pragma once
#include <cmath>
#include <cstdint>
#include <limits>

namespace hoeffding {

/**
 * Required number of trials so that each of M empirical frequencies (means of
 * [0,1] variables) is within ±eps of its true value with probability ≥ 1-alpha,
 * via Hoeffding and a union bound over the M cells:
 *
 *   n_req >= (1/(2*eps^2)) * ln(2*M/alpha).
 */
inline std::uint64_t required_runs(double eps, double alpha, std::uint64_t M_components) {
    if (eps <= 0.0) return std::numeric_limits<std::uint64_t>::max();
    if (alpha <= 0.0) alpha = 1e-300; // avoid log(0)
    if (M_components == 0) M_components = 1;
    const double num = std::log((2.0 * double(M_components)) / alpha);
    const double den = 2.0 * eps * eps;
    double req = num / den;
    if (req < 1.0) req = 1.0;
    return static_cast<std::uint64_t>(std::ceil(req));
}

/**
 * Inverse of required_runs: the ±eps that n trials guarantee simultaneously
 * for M cells at level 1-alpha.
 *
 *   eps = sqrt( ln(2*M/alpha) / (2*n) )
 */
inline double half_width(std::uint64_t n, double alpha, std::uint64_t M_components) {
    if (n == 0) return std::numeric_limits<double>::infinity();
    if (alpha <= 0.0) alpha = 1e-300;
    if (M_components == 0) M_components = 1;
    return std::sqrt(std::log((2.0 * double(M_components)) / alpha) / (2.0 * double(n)));
}

// Number of cells of an n_items landing table.
inline std::uint64_t landing_cells(std::uint64_t n_items) { return n_items * n_items; }

} // namespace hoeffding
