// uniform.hpp — unbiased in-place shuffle used as the inequality = 0 baseline
#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "core/rng.hpp"

namespace shuffle {

// Fisher–Yates. Mutates items and produces no new value.
template <class T, class URBG>
void uniform_shuffle(std::vector<T>& items, URBG& rng) {
    for (std::size_t i = items.size(); i > 1; --i) {
        const auto j = static_cast<std::size_t>(core::uniform_bounded(rng, i));
        using std::swap;
        swap(items[i - 1], items[j]);
    }
}

// uniform_shuffle bound to a random source, callable as shuffle(items&).
template <class URBG>
class UniformShuffle {
public:
    explicit UniformShuffle(URBG& rng) : rng_(&rng) {}

    template <class T>
    void operator()(std::vector<T>& items) const { uniform_shuffle(items, *rng_); }

private:
    URBG* rng_;
};

} // namespace shuffle
