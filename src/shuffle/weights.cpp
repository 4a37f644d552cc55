// weights.cpp — rank weight vectors for the elitist shuffle

#include "shuffle/weights.hpp"

#include <cmath>
#include <string>

#include "core/errors.hpp"

namespace shuffle {

void validate_inequality(double inequality) {
    if (std::isnan(inequality) || std::isinf(inequality)) {
        throw core::InvalidParameter("inequality must be finite, got " + std::to_string(inequality));
    }
    if (inequality < 0.0) {
        throw core::InvalidParameter("inequality must be >= 0, got " + std::to_string(inequality));
    }
}

std::vector<double> base_scores(std::size_t n) {
    std::vector<double> b(n);
    const double nd = static_cast<double>(n);
    for (std::size_t i = 0; i < n; ++i) b[i] = 1.0 - static_cast<double>(i) / nd;
    return b;
}

void l1_normalize(std::vector<double>& weights) {
    if (weights.empty()) return;
    double total = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        const double w = weights[i];
        if (!std::isfinite(w) || w < 0.0) {
            throw core::InvalidParameter("weight " + std::to_string(i) + " is not a finite non-negative value");
        }
        total += w;
    }
    if (!(total > 0.0) || !std::isfinite(total)) {
        throw core::InvalidParameter("weights do not have a positive finite sum");
    }
    for (double& w : weights) w /= total;
}

std::vector<double> rank_weights(std::size_t n, double inequality) {
    validate_inequality(inequality);
    auto w = base_scores(n);
    // b_i > 0 for every i, so pow never sees 0^0 or a negative base
    for (double& x : w) x = std::pow(x, inequality);
    l1_normalize(w);
    return w;
}

} // namespace shuffle
