/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "isets/interval_set.hh"

// Set operations returning a new set. Operands are never modified.

namespace isets {

// The set of all values of V.
template <Bounded V>
interval_set<V> universe() {
    return interval_set<V>{interval<V>::closed(domain_traits<V>::min(), domain_traits<V>::max())};
}

template <Bounded V>
interval_set<V> complement(const interval_set<V>& s) {
    auto result = universe<V>();
    result.remove(s);
    return result;
}

template <Domain V>
interval_set<V> set_union(const interval_set<V>& a, const interval_set<V>& b) {
    auto result = a;
    result.add(b);
    return result;
}

template <Domain V>
interval_set<V> difference(const interval_set<V>& a, const interval_set<V>& b) {
    auto result = a;
    result.remove(b);
    return result;
}

// Removes from a everything outside of b. Unbounded domains have no
// complement, for them a - (a - b) is used instead.
template <Domain V>
interval_set<V> intersection(const interval_set<V>& a, const interval_set<V>& b) {
    auto result = a;
    if constexpr (Bounded<V>) {
        result.remove(complement(b));
    } else {
        result.remove(difference(a, b));
    }
    return result;
}

// Values in exactly one of a and b.
template <Domain V>
interval_set<V> symmetric_difference(const interval_set<V>& a, const interval_set<V>& b) {
    auto result = difference(a, b);
    result.add(difference(b, a));
    return result;
}

}
