#pragma once
/*
weighted_pool.hpp — weighted sampling WITHOUT replacement

The pool holds the not-yet-drawn (index, weight) pairs in their original
order. Each draw picks entry j with probability weight_j / sum(remaining),
removes it, and renormalizes the survivors so they sum to 1 again.

Degenerate tail: once every remaining weight is zero (all of them underflowed
for a very large inequality, or the caller passed explicit zeros) the pool
hands out what is left in original order. This is the limit of an
ever-sharper bias toward the front.
*/

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "core/rng.hpp"
#include "shuffle/weights.hpp"

namespace shuffle {

class WeightedPool {
public:
    struct Entry {
        std::size_t index;
        double      weight;
    };

    WeightedPool() = default;

    /**
     * @brief Build the pool over indices [0, weights.size()).
     * @throws core::InvalidParameter if the weights are negative, non-finite,
     *         or (for a non-empty vector) sum to zero.
     */
    explicit WeightedPool(std::vector<double> weights) {
        l1_normalize(weights);
        pool_.reserve(weights.size());
        for (std::size_t i = 0; i < weights.size(); ++i) pool_.push_back(Entry{i, weights[i]});
        mass_ = weights.empty() ? 0.0 : 1.0;
    }

    std::size_t size() const noexcept { return pool_.size(); }
    bool empty() const noexcept { return pool_.empty(); }

    // Sum of the remaining (renormalized) weights: ~1, or 0 in the degenerate tail.
    double remaining_mass() const noexcept { return mass_; }

    const std::vector<Entry>& entries() const noexcept { return pool_; }

    /**
     * @brief Draw one index proportional to the remaining weights and remove it.
     * @throws std::out_of_range if the pool is empty.
     */
    template <class URBG>
    std::size_t draw(URBG& rng) {
        if (pool_.empty()) throw std::out_of_range("draw from an empty WeightedPool");

        std::size_t k = 0;
        if (mass_ > 0.0) {
            const double u = core::uniform_unit(rng) * mass_;
            double acc = 0.0;
            std::size_t last_positive = 0;
            bool hit = false;
            for (std::size_t j = 0; j < pool_.size(); ++j) {
                if (pool_[j].weight <= 0.0) continue;
                acc += pool_[j].weight;
                last_positive = j;
                if (u < acc) { k = j; hit = true; break; }
            }
            // u can land a rounding error past the final cumulative sum
            if (!hit) k = last_positive;
        }

        const std::size_t picked = pool_[k].index;
        pool_.erase(pool_.begin() + static_cast<std::ptrdiff_t>(k));
        renormalize();
        return picked;
    }

private:
    void renormalize() noexcept {
        double total = 0.0;
        for (const auto& e : pool_) total += e.weight;
        if (!(total > 0.0)) { mass_ = 0.0; return; }
        mass_ = 0.0;
        for (auto& e : pool_) { e.weight /= total; mass_ += e.weight; }
    }

    std::vector<Entry> pool_;
    double mass_{0.0};
};

} // namespace shuffle
