// landing.cpp — landing counts and landing distribution

#include "sim/landing.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/errors.hpp"

namespace sim {

// ---------- LandingDistribution ----------

LandingDistribution::LandingDistribution(Rows rows, std::size_t n_items, core::count_t n_simulations)
    : rows_(std::move(rows)), n_items_(n_items), n_simulations_(n_simulations) {}

const LandingDistribution::Row& LandingDistribution::row(core::position_t initial) const {
    auto it = rows_.find(initial);
    if (it == rows_.end()) {
        throw std::out_of_range("no landing row for initial position " + std::to_string(initial));
    }
    return it->second;
}

double LandingDistribution::probability(core::position_t initial, core::position_t final_pos) const {
    auto it = rows_.find(initial);
    if (it == rows_.end()) return 0.0;
    auto cell = it->second.find(final_pos);
    return cell == it->second.end() ? 0.0 : cell->second;
}

double LandingDistribution::row_total(core::position_t initial) const {
    auto it = rows_.find(initial);
    if (it == rows_.end()) return 0.0;
    double total = 0.0;
    for (const auto& [pos, p] : it->second) total += p;
    return total;
}

double LandingDistribution::mass_before(core::position_t initial, core::position_t k) const {
    auto it = rows_.find(initial);
    if (it == rows_.end()) return 0.0;
    double total = 0.0;
    for (auto cell = it->second.begin(); cell != it->second.end() && cell->first < k; ++cell) {
        total += cell->second;
    }
    return total;
}

double LandingDistribution::expected_position(core::position_t initial) const {
    double mean = 0.0;
    for (const auto& [pos, p] : row(initial)) mean += static_cast<double>(pos) * p;
    return mean;
}

// ---------- LandingCounts ----------

LandingCounts::LandingCounts(std::size_t n_items)
    : n_(n_items), counts_(n_items * n_items, core::count_t{0}) {}

void LandingCounts::record(std::span<const core::position_t> positions) {
    CORE_ASSERT_H(positions.size() == n_, "landing positions do not match item count");
    for (std::size_t item = 0; item < n_; ++item) {
        ++counts_[item * n_ + positions[item]];
    }
    ++trials_;
}

core::count_t LandingCounts::count(core::position_t initial, core::position_t final_pos) const {
    if (initial >= n_ || final_pos >= n_) {
        throw std::out_of_range("landing cell (" + std::to_string(initial) + ", " +
                                std::to_string(final_pos) + ") outside " + std::to_string(n_) + " items");
    }
    return counts_[initial * n_ + final_pos];
}

LandingDistribution LandingCounts::finalize() const {
    if (trials_ == 0) throw core::InvalidParameter("no trials recorded");

    const double trials = static_cast<double>(trials_);
    LandingDistribution::Rows rows;
    for (std::size_t item = 0; item < n_; ++item) {
        LandingDistribution::Row row;
        for (std::size_t pos = 0; pos < n_; ++pos) {
            const core::count_t c = counts_[item * n_ + pos];
            if (c != 0) row.emplace(pos, static_cast<double>(c) / trials);
        }
        rows.emplace(item, std::move(row));
    }
    LandingDistribution out(std::move(rows), n_, trials_);
#if CORE_HARDENED
    for (const auto& entry : out) {
        CORE_ASSERT_H(std::abs(out.row_total(entry.first) - 1.0) <= core::normalization_tolerance * static_cast<double>(n_),
                      "landing row does not sum to 1");
    }
#endif
    return out;
}

} // namespace sim
