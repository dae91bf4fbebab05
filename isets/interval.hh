/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "isets/boundary.hh"

namespace isets {

// Builders and predicates shared by both interval representations.
// Derived provides lower(), upper(), is_empty() and make(lower, upper).
template <typename Derived, typename V>
class interval_base {
    const Derived& self() const {
        return static_cast<const Derived&>(*this);
    }
public:
    using bound = boundary<V>;

    static Derived empty() {
        return Derived();
    }
    // [a, b]
    static Derived closed(V a, V b) {
        return Derived::make(bound::below(std::move(a)), bound::above(std::move(b)));
    }
    // (a, b)
    static Derived open(V a, V b) {
        return Derived::make(bound::above(std::move(a)), bound::below(std::move(b)));
    }
    // [a, b)
    static Derived closed_open(V a, V b) {
        return Derived::make(bound::below(std::move(a)), bound::below(std::move(b)));
    }
    // (a, b]
    static Derived open_closed(V a, V b) {
        return Derived::make(bound::above(std::move(a)), bound::above(std::move(b)));
    }
    static Derived singular(V v) {
        auto copy = v;
        return closed(std::move(copy), std::move(v));
    }

    bool is_open_below() const { return self().lower().is_above(); }
    bool is_open_above() const { return self().upper().is_below(); }
    bool is_open() const { return is_open_below() && is_open_above(); }
    bool is_closed_below() const { return !is_open_below(); }
    bool is_closed_above() const { return !is_open_above(); }
    bool is_closed() const { return is_closed_below() && is_closed_above(); }

    // Holds exactly one value.
    bool is_singular() const {
        return !self().is_empty() && is_closed() && self().lower().value() == self().upper().value();
    }

    bool contains(const V& v) const {
        return self().lower() < v && v < self().upper();
    }

    // True iff all values of other are also values of this. Empty intervals
    // neither contain nor are contained.
    bool contains(const Derived& other) const {
        return !self().is_empty() && !other.is_empty()
               && self().lower() <= other.lower() && other.upper() <= self().upper();
    }
};

// A range of values of a dense domain, delimited by two boundaries.
// Empty iff upper() <= lower().
template <Domain V>
class interval : public interval_base<interval<V>, V> {
public:
    using bound = boundary<V>;
private:
    bound _lower;
    bound _upper;
public:
    interval()
        : _lower(bound::above(V()))
        , _upper(bound::below(V()))
    { }
    interval(bound lower, bound upper)
        : _lower(std::move(lower))
        , _upper(std::move(upper))
    { }
    static interval make(bound lower, bound upper) {
        return interval(std::move(lower), std::move(upper));
    }

    const bound& lower() const { return _lower; }
    const bound& upper() const { return _upper; }
    bool is_empty() const { return _upper <= _lower; }
};

// A range of values of a discrete domain, stored as the inclusive pair
// [first, last]. The boundaries are derived: lower() is below(first) and
// upper() is above(last). Empty iff last < first.
template <Discrete V>
class interval<V> : public interval_base<interval<V>, V> {
    using traits = domain_traits<V>;
public:
    using bound = boundary<V>;
private:
    V _first;
    V _last;
public:
    interval()
        : _first(traits::max())
        , _last(traits::min())
    { }
    interval(V first, V last)
        : _first(std::move(first))
        , _last(std::move(last))
    { }
    // A cut at the edge of the domain leaves nothing on its inner side, which
    // makes the interval empty rather than an error.
    static interval make(const bound& lower, const bound& upper) {
        if ((lower.is_above() && lower.value() == traits::max())
                || (upper.is_below() && upper.value() == traits::min())) {
            return interval();
        }
        return interval(lower.value_above(), upper.value_below());
    }

    bound lower() const { return bound::below(_first); }
    bound upper() const { return bound::above(_last); }
    const V& first() const { return _first; }
    const V& last() const { return _last; }
    bool is_empty() const { return _last < _first; }

    // Number of values in the interval.
    // Throws domain_error for the whole domain of a 64-bit type, whose size
    // does not fit in 64 bits.
    uint64_t size() const {
        if (is_empty()) {
            return 0;
        }
        auto d = traits::distance(_first, _last);
        if (d == std::numeric_limits<uint64_t>::max()) {
            log_debug_and_throw<domain_error>(isets_logger, "size of {}..{} does not fit in 64 bits", _first, _last);
        }
        return d + 1;
    }
};

// Ordered by (lower, upper); empty intervals sort first and are all equal.
template <Domain V>
std::strong_ordering operator<=>(const interval<V>& a, const interval<V>& b) {
    if (a.is_empty()) {
        return b.is_empty() ? std::strong_ordering::equal : std::strong_ordering::less;
    }
    if (b.is_empty()) {
        return std::strong_ordering::greater;
    }
    auto r = a.lower() <=> b.lower();
    if (r != 0) {
        return r;
    }
    return a.upper() <=> b.upper();
}

template <Domain V>
bool operator==(const interval<V>& a, const interval<V>& b) {
    return (a <=> b) == 0;
}

// True if a and b share a value or can be fused into one interval without
// covering anything else: adjacent ranges of a discrete domain ([1,2] and
// [3,4]) and dense ranges meeting at one cut ([0,1) and [1,2]) overlap.
template <Domain V>
bool overlaps(const interval<V>& a, const interval<V>& b) {
    return !a.is_empty() && !b.is_empty()
           && !(a.upper() < b.lower()) && !(b.upper() < a.lower());
}

// True if a and b share at least one value.
template <Domain V>
bool intersects(const interval<V>& a, const interval<V>& b) {
    return !a.is_empty() && !b.is_empty()
           && b.lower() < a.upper() && a.lower() < b.upper();
}

template <Domain V>
interval<V> intersection(const interval<V>& a, const interval<V>& b) {
    return interval<V>::make(std::max(a.lower(), b.lower()), std::min(a.upper(), b.upper()));
}

// Smallest interval enclosing both a and b.
template <Domain V>
interval<V> extent(const interval<V>& a, const interval<V>& b) {
    if (a.is_empty()) {
        return b;
    }
    if (b.is_empty()) {
        return a;
    }
    return interval<V>::make(std::min(a.lower(), b.lower()), std::max(a.upper(), b.upper()));
}

// Computes a - b as the part of a below b and the part of a above b.
// Either part may be empty; both are empty iff b contains a.
template <Domain V>
std::array<interval<V>, 2> difference(const interval<V>& a, const interval<V>& b) {
    if (a.is_empty() || b.is_empty()) {
        return {a, interval<V>()};
    }
    return {
        interval<V>::make(a.lower(), std::min(a.upper(), b.lower())),
        interval<V>::make(std::max(a.lower(), b.upper()), a.upper()),
    };
}

}

template <typename V>
struct fmt::formatter<isets::interval<V>> : fmt::formatter<string_view> {
    auto format(const isets::interval<V>& i, fmt::format_context& ctx) const {
        auto out = ctx.out();
        if (i.is_empty()) {
            return fmt::format_to(out, "empty");
        }
        if (i.is_singular()) {
            return fmt::format_to(out, "{}", i.lower().value());
        }
        return fmt::format_to(out, "{}{}..{}{}",
                i.lower().value(), i.is_open_below() ? "<" : "",
                i.is_open_above() ? "<" : "", i.upper().value());
    }
};

namespace isets {

template <typename V>
std::ostream& operator<<(std::ostream& out, const interval<V>& i) {
    fmt::print(out, "{}", i);
    return out;
}

}

// The hash function 31 * lower + upper, over the canonical boundaries.
namespace std {

template <typename V>
struct hash<isets::interval<V>> {
    size_t operator()(const isets::interval<V>& i) const {
        if (i.is_empty()) {
            return 0;
        }
        auto h = std::hash<isets::boundary<V>>();
        return 31 * h(i.lower()) + h(i.upper());
    }
};

}
