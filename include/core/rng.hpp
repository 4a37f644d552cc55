#pragma once
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <limits>
#include <random>
#include <thread>
#include <type_traits>

namespace core {

// SplitMix64: fast 64-bit engine, also used as a seed expander and hash.
// Models UniformRandomBitGenerator so it plugs into <random> and into every
// sampler below.
struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state(seed) {}

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    void seed(std::uint64_t s) noexcept { state = s; }

    inline std::uint64_t next_u64() noexcept {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
    inline result_type operator()() noexcept { return next_u64(); }
};

inline std::uint64_t splitmix_hash(std::uint64_t x) noexcept {
    SplitMix64 sm(x);
    return sm.next_u64();
}

template <class URBG>
inline constexpr bool is_full_u64_urbg =
    std::is_same_v<typename URBG::result_type, std::uint64_t> &&
    URBG::min() == 0 && URBG::max() == std::numeric_limits<std::uint64_t>::max();

// ---------------- Random utilities ----------------

// Unbiased mapping of a URBG output to [0, n). 64-bit engines go through
// Lemire's multiply-high method with a tiny rejection loop; anything else
// falls back to std::uniform_int_distribution.
// Preconditions: n > 0.
template <class URBG>
inline std::uint64_t uniform_bounded(URBG& rng, std::uint64_t n) {
    if constexpr (is_full_u64_urbg<URBG>) {
        __extension__ typedef unsigned __int128 u128;
        std::uint64_t x = rng();
        u128 m = (u128)x * (u128)n;
        std::uint64_t l = (std::uint64_t)m;
        if (l < n) {
            const std::uint64_t t = (-n) % n;
            while (l < t) { x = rng(); m = (u128)x * (u128)n; l = (std::uint64_t)m; }
        }
        return (std::uint64_t)(m >> 64);
    } else {
        std::uniform_int_distribution<std::uint64_t> dist(0, n - 1);
        return dist(rng);
    }
}

// Uniform double in [0, 1) with 53 bits of mantissa.
template <class URBG>
inline double uniform_unit(URBG& rng) {
    if constexpr (is_full_u64_urbg<URBG>) {
        return static_cast<double>(rng() >> 11) * (1.0 / static_cast<double>(1ull << 53));
    } else {
        return std::generate_canonical<double, 53>(rng);
    }
}

// ---------------- Seeding ----------------

// Seed for run `index` derived from a master seed; distinct indices give
// decorrelated engines.
inline std::uint64_t derive_seed(std::uint64_t master, std::uint64_t index) noexcept {
    return splitmix_hash(master + 0x9E3779B97F4A7C15ULL * (index + 1));
}

// Fresh, non-reproducible seed from random_device, the clock and the thread id.
inline std::uint64_t make_random_seed() {
    std::uint64_t s = 0;
    try {
        std::random_device rd;
        const std::uint64_t a = (std::uint64_t(rd()) << 32) ^ std::uint64_t(rd());
        s ^= splitmix_hash(a);
    } catch (const std::exception&) {
        // random_device unavailable; the clock and thread id below still mix in entropy
    }
    const auto t = static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    s ^= splitmix_hash(t);
    const auto tid = static_cast<std::uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    s ^= splitmix_hash(tid);
    if (s == 0) s = 0x9E3779B97F4A7C15ULL;
    return s;
}

// Deterministic master seed: explicit value if non-zero, else SEED env, else a constant.
inline std::uint64_t resolve_seed(std::uint64_t explicit_seed) {
    if (explicit_seed != 0) return explicit_seed;
    std::uint64_t seed = 123456789ULL;
    if (const char* es = std::getenv("SEED")) {
        unsigned long long v = std::strtoull(es, nullptr, 10);
        if (v != 0ULL) seed = static_cast<std::uint64_t>(v);
    }
    return seed;
}

} // namespace core
