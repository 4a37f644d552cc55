// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

// Compile-time configuration for core facilities.

// Global hardening switch for optional runtime assertions in debug/testing code.
// Set via compile flag: -DCORE_HARDENED=1
#ifndef CORE_HARDENED
#define CORE_HARDENED 0
#endif

#if CORE_HARDENED
#include <stdexcept>
#define CORE_ASSERT_H(cond, msg) do { if(!(cond)) throw std::logic_error(msg); } while(0)
#else
#define CORE_ASSERT_H(cond, msg) do { } while(0)
#endif

// Observation counter type for landing counts.
#ifndef CORE_COUNT_T
#define CORE_COUNT_T std::uint64_t
#endif

namespace core {
using count_t    = CORE_COUNT_T;
using position_t = std::size_t;

// Tolerance used when checking that a probability vector sums to one.
inline constexpr double normalization_tolerance = 1e-9;
} // namespace core
