// landing.hpp — landing counts (per-run accumulator) and landing distribution (result)
#pragma once

#include <cstddef>
#include <map>
#include <span>
#include <vector>

#include "core/config.hpp"

namespace sim {

/**
 * @brief Per initial position, the estimated probability of each final position.
 *
 * Rows and cells iterate in ascending key order. Only observed cells are
 * stored: probability() of an absent cell is 0. Read-only once built.
 */
class LandingDistribution {
public:
    using Row  = std::map<core::position_t, double>;
    using Rows = std::map<core::position_t, Row>;

    LandingDistribution() = default;
    LandingDistribution(Rows rows, std::size_t n_items, core::count_t n_simulations);

    const Rows& rows() const noexcept { return rows_; }
    Rows::const_iterator begin() const noexcept { return rows_.begin(); }
    Rows::const_iterator end() const noexcept { return rows_.end(); }

    bool empty() const noexcept { return rows_.empty(); }
    std::size_t size() const noexcept { return rows_.size(); }
    bool contains(core::position_t initial) const { return rows_.count(initial) != 0; }

    std::size_t n_items() const noexcept { return n_items_; }
    core::count_t n_simulations() const noexcept { return n_simulations_; }

    // Throws std::out_of_range if no row exists for initial.
    const Row& row(core::position_t initial) const;

    double probability(core::position_t initial, core::position_t final_pos) const;

    // Sum of the row; 1 up to rounding for every stored row.
    double row_total(core::position_t initial) const;

    // P(final position < k | initial position).
    double mass_before(core::position_t initial, core::position_t k) const;

    // Mean final position of initial. Throws std::out_of_range for a missing row.
    double expected_position(core::position_t initial) const;

    bool operator==(const LandingDistribution&) const = default;

private:
    Rows          rows_;
    std::size_t   n_items_{0};
    core::count_t n_simulations_{0};
};

/**
 * @brief Dense n x n observation counts, mutated once per trial.
 *
 * Cell (item, pos) counts the trials in which item ended at pos. finalize()
 * turns the counts into probabilities count / trials.
 */
class LandingCounts {
public:
    explicit LandingCounts(std::size_t n_items);

    // positions[item] = final position of item in one trial (a bijection).
    void record(std::span<const core::position_t> positions);

    core::count_t count(core::position_t initial, core::position_t final_pos) const;
    std::size_t n_items() const noexcept { return n_; }
    core::count_t trials() const noexcept { return trials_; }

    // Throws core::InvalidParameter if no trial was recorded.
    LandingDistribution finalize() const;

private:
    std::size_t                n_;
    std::vector<core::count_t> counts_; // row-major n × n
    core::count_t              trials_{0};
};

} // namespace sim
