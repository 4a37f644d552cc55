// elitist.hpp — rank-biased random permutation ("elitist shuffle")
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "shuffle/weighted_pool.hpp"
#include "shuffle/weights.hpp"

namespace shuffle {

/**
 * @brief Random permutation of items that tends to keep high ranks in front.
 *
 * Position i gets weight (1 - i/n)^inequality; the output is built by drawing
 * positions without replacement proportional to those weights. inequality = 0
 * is a uniform shuffle, larger values preserve the input order more strongly.
 *
 * @param items Items in rank order (index 0 = highest rank).
 * @param inequality Bias exponent, finite and >= 0.
 * @param rng Random source; the only state touched.
 * @return A permutation of items. Empty input gives empty output.
 * @throws core::InvalidParameter for a negative or non-finite inequality.
 */
template <class T, class URBG>
std::vector<T> elitist_shuffle(std::span<const T> items, double inequality, URBG& rng) {
    WeightedPool pool(rank_weights(items.size(), inequality));
    std::vector<T> out;
    out.reserve(items.size());
    while (!pool.empty()) out.push_back(items[pool.draw(rng)]);
    return out;
}

template <class T, class URBG>
std::vector<T> elitist_shuffle(const std::vector<T>& items, double inequality, URBG& rng) {
    return elitist_shuffle(std::span<const T>(items.data(), items.size()), inequality, rng);
}

/**
 * @brief Elitist shuffle bound to an inequality and a random source.
 * Callable as shuffle(items) -> permutation, which is the shape
 * sim::simulate expects. The engine is borrowed and must outlive the object.
 */
template <class URBG>
class ElitistShuffle {
public:
    ElitistShuffle(double inequality, URBG& rng) : inequality_(inequality), rng_(&rng) {
        validate_inequality(inequality);
    }

    template <class T>
    std::vector<T> operator()(const std::vector<T>& items) const {
        return elitist_shuffle(items, inequality_, *rng_);
    }

    double inequality() const noexcept { return inequality_; }

private:
    double inequality_;
    URBG*  rng_;
};

} // namespace shuffle
