// permutation.hpp — identity sequences and bijection checks over {0..n-1}
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "core/config.hpp"

namespace sim {

using Sequence = std::vector<core::position_t>;

// [0, 1, ..., n-1]
Sequence identity_sequence(std::size_t n);

/**
 * @brief Verify that seq holds every value of {0..n-1} exactly once.
 * @throws core::ShapeMismatch naming the first defect found (wrong length,
 *         out-of-range value, repeated value).
 */
void check_bijection(std::span<const core::position_t> seq, std::size_t n);

/**
 * @brief Inverse permutation: result[item] is the position of item in seq.
 * @throws core::ShapeMismatch if seq is not a bijection over {0..n-1}.
 */
Sequence landing_positions(std::span<const core::position_t> seq, std::size_t n);

} // namespace sim
