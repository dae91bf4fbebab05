/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "isets/domain.hh"
#include "isets/exceptions.hh"
#include "isets/log.hh"

namespace isets {

enum class bound_side : uint8_t {
    below,
    above,
};

// A cut dividing the domain of V into the values below it and the values above it.
// No value sits on a boundary: below(v) is the cut immediately preceding v,
// above(v) the cut immediately following it.
//
// On a discrete domain above(v) and below(succ(v)) are the same cut and compare
// equal. On a dense domain boundaries are equal only if value and side match.
template <Domain V>
class boundary {
    using traits = domain_traits<V>;

    V _value;
    bound_side _side;

    boundary(V value, bound_side side)
        : _value(std::move(value))
        , _side(side)
    { }

    static std::strong_ordering compare_values(const V& a, const V& b) {
        if (a < b) {
            return std::strong_ordering::less;
        } else if (b < a) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }
public:
    static boundary below(V v) {
        return boundary(std::move(v), bound_side::below);
    }
    static boundary above(V v) {
        return boundary(std::move(v), bound_side::above);
    }

    const V& value() const { return _value; }
    bound_side side() const { return _side; }
    bool is_below() const { return _side == bound_side::below; }
    bool is_above() const { return _side == bound_side::above; }

    static std::strong_ordering tri_compare(const boundary& a, const boundary& b) {
        if (a._side == b._side) {
            return compare_values(a._value, b._value);
        }
        if (a.is_below()) {
            // below(x) vs above(y)
            if (b._value < a._value) {
                return adjacent(b._value, a._value) ? std::strong_ordering::equal : std::strong_ordering::greater;
            }
            return std::strong_ordering::less;
        }
        // above(x) vs below(y)
        if (a._value < b._value) {
            return adjacent(a._value, b._value) ? std::strong_ordering::equal : std::strong_ordering::less;
        }
        return std::strong_ordering::greater;
    }

    friend std::strong_ordering operator<=>(const boundary& a, const boundary& b) {
        return tri_compare(a, b);
    }
    friend bool operator==(const boundary& a, const boundary& b) {
        return tri_compare(a, b) == 0;
    }

    // The cut lies below v.
    friend bool operator<(const boundary& b, const V& v) {
        return b.is_below() ? !(v < b._value) : b._value < v;
    }
    // The cut lies above v.
    friend bool operator<(const V& v, const boundary& b) {
        return b.is_below() ? v < b._value : !(b._value < v);
    }

    // The lowest value above the cut.
    // Throws domain_error for above(max()) and on dense domains.
    V value_above() const {
        if (is_below()) {
            return _value;
        }
        if constexpr (Discrete<V>) {
            if (_value == traits::max()) {
                log_debug_and_throw<domain_error>(isets_logger, "no value above a boundary at the domain maximum");
            }
            return traits::succ(_value);
        } else {
            log_debug_and_throw<domain_error>(isets_logger, "value above a boundary is undefined on a dense domain");
        }
    }

    // The highest value below the cut.
    // Throws domain_error for below(min()) and on dense domains.
    V value_below() const {
        if (is_above()) {
            return _value;
        }
        if constexpr (Discrete<V>) {
            if (_value == traits::min()) {
                log_debug_and_throw<domain_error>(isets_logger, "no value below a boundary at the domain minimum");
            }
            return traits::pred(_value);
        } else {
            log_debug_and_throw<domain_error>(isets_logger, "value below a boundary is undefined on a dense domain");
        }
    }

    // Representative of the equivalence class of this cut, used for hashing.
    // On discrete domains above(v) is folded into below(succ(v)).
    boundary canonical() const {
        if constexpr (Discrete<V>) {
            if (is_above() && _value != traits::max()) {
                return below(traits::succ(_value));
            }
        }
        return *this;
    }
};

}

template <typename V>
struct fmt::formatter<isets::boundary<V>> : fmt::formatter<string_view> {
    auto format(const isets::boundary<V>& b, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}({})", b.is_below() ? "below" : "above", b.value());
    }
};

namespace isets {

template <typename V>
std::ostream& operator<<(std::ostream& out, const boundary<V>& b) {
    fmt::print(out, "{}", b);
    return out;
}

}

namespace std {

template <typename V>
struct hash<isets::boundary<V>> {
    size_t operator()(const isets::boundary<V>& b) const {
        auto c = b.canonical();
        return 31 * std::hash<V>()(c.value()) + static_cast<size_t>(c.side());
    }
};

}
