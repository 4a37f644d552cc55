// simulate.hpp — Monte Carlo landing statistics for a shuffle procedure
#pragma once

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

#include "core/errors.hpp"
#include "shuffle/elitist.hpp"
#include "sim/landing.hpp"
#include "sim/permutation.hpp"
#include "sim/shuffle_concepts.hpp"

namespace sim {

/**
 * @brief Run one shuffle over items and return the resulting arrangement,
 *        whichever of the accepted conventions the procedure follows.
 */
template <class F>
    requires ShuffleProcedure<F>
inline Sequence apply_shuffle(F& shuffle, Sequence items) {
    if constexpr (InPlaceShuffle<F>) {
        std::invoke(shuffle, items);
        return items;
    } else if constexpr (OptionalShuffle<F>) {
        auto result = std::invoke(shuffle, items);
        if (result) return std::move(*result);
        return items;
    } else {
        return Sequence(std::invoke(shuffle, items));
    }
}

/**
 * @brief Shuffle the identity sequence n_simulations times and estimate, for
 *        every initial position, the distribution of its final position.
 *
 * Each trial adds one observation per item, i.e. 1/n_simulations of
 * probability mass to its (initial, final) cell.
 *
 * @param shuffle Shuffle procedure (see shuffle_concepts.hpp).
 * @param n_items Sequence length; 0 yields an empty distribution.
 * @param n_simulations Number of trials, > 0.
 * @throws core::InvalidParameter if n_simulations == 0.
 * @throws core::ShapeMismatch as soon as a trial's output is not a permutation.
 */
template <class F>
    requires ShuffleProcedure<std::remove_reference_t<F>>
inline LandingDistribution simulate(F&& shuffle, std::size_t n_items, std::size_t n_simulations) {
    if (n_simulations == 0) throw core::InvalidParameter("n_simulations must be > 0");

    LandingCounts counts(n_items);
    for (std::size_t t = 0; t < n_simulations; ++t) {
        const Sequence arranged = apply_shuffle(shuffle, identity_sequence(n_items));
        counts.record(landing_positions(arranged, n_items));
    }
    return counts.finalize();
}

// Landing statistics of the elitist shuffle at the given inequality.
template <class URBG>
inline LandingDistribution simulate_elitist(std::size_t n_items, std::size_t n_simulations,
                                            double inequality, URBG& rng) {
    shuffle::ElitistShuffle<URBG> elitist(inequality, rng);
    return simulate(elitist, n_items, n_simulations);
}

} // namespace sim
