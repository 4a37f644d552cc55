// weights.hpp — rank weight vectors for the elitist shuffle
#pragma once

#include <cstddef>
#include <vector>

namespace shuffle {

/**
 * @brief Throw core::InvalidParameter unless inequality is finite and >= 0.
 */
void validate_inequality(double inequality);

/**
 * @brief Base scores b_i = 1 - i/n for i in [0, n).
 * @return Strictly decreasing scores in (0, 1]; empty for n == 0.
 */
std::vector<double> base_scores(std::size_t n);

/**
 * @brief Scale a non-negative vector so its entries sum to 1.
 * @throws core::InvalidParameter on a negative or non-finite entry, or when
 *         the sum is not positive and finite. An empty vector is left as is.
 */
void l1_normalize(std::vector<double>& weights);

/**
 * @brief Normalized weights w_i = b_i^inequality / sum_j b_j^inequality.
 * @param n Number of ranks.
 * @param inequality Exponent, finite and >= 0. Zero gives uniform weights.
 */
std::vector<double> rank_weights(std::size_t n, double inequality);

} // namespace shuffle
