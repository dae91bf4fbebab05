/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <limits>

namespace isets {

// Describes the ordered domain of a value type.
//
// A discrete domain exposes min(), max(), succ(), pred() and distance(), and
// lets boundaries on both sides of a missing-nothing gap collapse into one cut.
// A bounded dense domain exposes min() and max() only. Types without a
// specialization are dense and unbounded: they can be stored in sets, but
// have no universe and therefore no complement.
//
// Specialize for user types, e.g. to make an enum discrete.
template <typename V>
struct domain_traits {
};

template <std::integral V>
struct domain_traits<V> {
    static constexpr V min() noexcept { return std::numeric_limits<V>::min(); }
    static constexpr V max() noexcept { return std::numeric_limits<V>::max(); }
    // Not defined for max(), callers check first.
    static constexpr V succ(V v) noexcept { return static_cast<V>(v + 1); }
    // Not defined for min(), callers check first.
    static constexpr V pred(V v) noexcept { return static_cast<V>(v - 1); }
    // b - a, for a <= b. Wraps for the full range of 64-bit types.
    static constexpr uint64_t distance(V a, V b) noexcept {
        return static_cast<uint64_t>(b) - static_cast<uint64_t>(a);
    }
};

template <std::floating_point V>
struct domain_traits<V> {
    static constexpr V min() noexcept {
        return std::numeric_limits<V>::has_infinity ? -std::numeric_limits<V>::infinity() : std::numeric_limits<V>::lowest();
    }
    static constexpr V max() noexcept {
        return std::numeric_limits<V>::has_infinity ? std::numeric_limits<V>::infinity() : std::numeric_limits<V>::max();
    }
};

template <typename V>
concept Domain = std::totally_ordered<V> && std::copyable<V> && std::default_initializable<V>;

template <typename V>
concept Bounded = Domain<V> && requires {
    { domain_traits<V>::min() } -> std::convertible_to<V>;
    { domain_traits<V>::max() } -> std::convertible_to<V>;
};

template <typename V>
concept Discrete = Bounded<V> && requires (const V& v) {
    { domain_traits<V>::succ(v) } -> std::convertible_to<V>;
    { domain_traits<V>::pred(v) } -> std::convertible_to<V>;
    { domain_traits<V>::distance(v, v) } -> std::convertible_to<uint64_t>;
};

// True if b is the value immediately following a. Always false on a dense domain.
template <Domain V>
constexpr bool adjacent(const V& a, const V& b) {
    if constexpr (Discrete<V>) {
        return a < b && domain_traits<V>::succ(a) == b;
    } else {
        return false;
    }
}

}
