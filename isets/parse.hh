/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "isets/exceptions.hh"
#include "isets/interval_set.hh"
#include "isets/log.hh"

// Reads back the textual form produced by the fmt formatters:
//
//   interval:  v | a..b | a<..b | a..<b | a<..<b | empty
//   set:       { interval, interval, ... }
//
// A '<' next to ".." marks the bound on that side as open.

namespace isets {

namespace internal {

template <Domain V>
V parse_value(std::string_view text) {
    auto trimmed = boost::algorithm::trim_copy(std::string(text));
    try {
        return boost::lexical_cast<V>(trimmed);
    } catch (const boost::bad_lexical_cast&) {
        log_debug_and_throw<parse_error>(isets_logger, "cannot parse value '{}'", trimmed);
    }
}

}

// Reversed bounds give an empty interval.
template <Domain V>
interval<V> parse_interval(std::string_view text) {
    auto trimmed = boost::algorithm::trim_copy(std::string(text));
    if (trimmed.empty()) {
        log_debug_and_throw<parse_error>(isets_logger, "empty interval text");
    }
    if (trimmed == "empty") {
        return interval<V>();
    }
    auto dots = trimmed.find("..");
    if (dots == std::string::npos) {
        return interval<V>::singular(internal::parse_value<V>(trimmed));
    }
    std::string_view lower(trimmed.data(), dots);
    std::string_view upper(trimmed.data() + dots + 2, trimmed.size() - dots - 2);
    bool open_below = !lower.empty() && lower.back() == '<';
    if (open_below) {
        lower.remove_suffix(1);
    }
    bool open_above = !upper.empty() && upper.front() == '<';
    if (open_above) {
        upper.remove_prefix(1);
    }
    auto a = internal::parse_value<V>(lower);
    auto b = internal::parse_value<V>(upper);
    return interval<V>::make(
            open_below ? boundary<V>::above(std::move(a)) : boundary<V>::below(std::move(a)),
            open_above ? boundary<V>::below(std::move(b)) : boundary<V>::above(std::move(b)));
}

template <Domain V>
interval_set<V> parse_interval_set(std::string_view text) {
    auto trimmed = boost::algorithm::trim_copy(std::string(text));
    if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') {
        log_debug_and_throw<parse_error>(isets_logger, "interval set '{}' must be enclosed in braces", trimmed);
    }
    auto body = boost::algorithm::trim_copy(trimmed.substr(1, trimmed.size() - 2));
    if (body.empty()) {
        return interval_set<V>();
    }
    std::vector<std::string> items;
    boost::algorithm::split(items, body, boost::algorithm::is_any_of(","));
    std::vector<interval<V>> intervals;
    intervals.reserve(items.size());
    for (auto&& item : items) {
        intervals.push_back(parse_interval<V>(item));
    }
    return interval_set<V>::from_intervals(intervals);
}

}
