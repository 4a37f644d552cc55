// permutation.cpp — identity sequences and bijection checks over {0..n-1}

#include "sim/permutation.hpp"

#include <limits>
#include <numeric>
#include <string>

#include "core/errors.hpp"

namespace sim {

namespace {
constexpr core::position_t unseen = std::numeric_limits<core::position_t>::max();
}

Sequence identity_sequence(std::size_t n) {
    Sequence s(n);
    std::iota(s.begin(), s.end(), core::position_t{0});
    return s;
}

void check_bijection(std::span<const core::position_t> seq, std::size_t n) {
    (void)landing_positions(seq, n);
}

Sequence landing_positions(std::span<const core::position_t> seq, std::size_t n) {
    if (seq.size() != n) {
        throw core::ShapeMismatch("shuffle returned " + std::to_string(seq.size()) +
                                  " items, expected " + std::to_string(n));
    }
    Sequence pos(n, unseen);
    for (std::size_t p = 0; p < seq.size(); ++p) {
        const core::position_t item = seq[p];
        if (item >= n) {
            throw core::ShapeMismatch("shuffle returned item " + std::to_string(item) +
                                      " at position " + std::to_string(p) +
                                      ", outside [0, " + std::to_string(n) + ")");
        }
        if (pos[item] != unseen) {
            throw core::ShapeMismatch("shuffle returned item " + std::to_string(item) +
                                      " twice (positions " + std::to_string(pos[item]) +
                                      " and " + std::to_string(p) + ")");
        }
        pos[item] = p;
    }
    // n values, none repeated, all in range: every item was seen
    return pos;
}

} // namespace sim
