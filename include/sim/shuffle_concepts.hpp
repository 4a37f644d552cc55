// shuffle_concepts.hpp — accepted shapes of a shuffle procedure
#pragma once

#include <concepts>
#include <optional>
#include <type_traits>

#include "sim/permutation.hpp"

namespace sim {

// A shuffle procedure is called with an lvalue Sequence and either
//  - returns the shuffled sequence,
//  - returns std::optional<Sequence>, nullopt meaning "shuffled in place", or
//  - returns void after shuffling in place.

template <class F>
concept ReturningShuffle = std::invocable<F&, Sequence&> &&
    std::convertible_to<std::invoke_result_t<F&, Sequence&>, Sequence>;

template <class F>
concept OptionalShuffle = std::invocable<F&, Sequence&> &&
    std::same_as<std::remove_cvref_t<std::invoke_result_t<F&, Sequence&>>, std::optional<Sequence>>;

template <class F>
concept InPlaceShuffle = std::invocable<F&, Sequence&> &&
    std::is_void_v<std::invoke_result_t<F&, Sequence&>>;

template <class F>
concept ShuffleProcedure = ReturningShuffle<F> || OptionalShuffle<F> || InPlaceShuffle<F>;

} // namespace sim
