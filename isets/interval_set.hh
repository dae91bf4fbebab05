/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <algorithm>
#include <bitset>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <ostream>
#include <ranges>
#include <type_traits>
#include <vector>

#include <boost/container/static_vector.hpp>
#include <boost/range/iterator_range.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <seastar/core/bitset-iter.hh>
#include <seastar/core/on_internal_error.hh>

#include "isets/interval.hh"
#include "isets/log.hh"

namespace isets {

// Selects which stored intervals a query interval reaches.
enum class overlap_mode {
    // Intervals sharing a value with the query, and intervals merely touching
    // it, which would have to be fused with it.
    fuse,
    // Intervals sharing a value with the query.
    strict,
};

// Represents a subset of the domain of V as an ordered sequence of disjoint
// intervals. After every public operation the sequence is canonical:
//
//  - no interval is empty,
//  - no two intervals share a value,
//  - no two consecutive intervals could be fused (on a discrete domain they
//    are separated by at least one missing value, on a dense domain they do
//    not meet at a single cut),
//  - intervals are in ascending order.
//
// Lookups are binary searches. Mutations only touch the run of intervals
// reached by the argument.
template <Domain V>
class interval_set {
public:
    using value_type = V;
    using interval_type = interval<V>;
    using bound = boundary<V>;
    using container_type = std::vector<interval_type>;
    using const_iterator = typename container_type::const_iterator;

    // Indexes [first, last) into the stored intervals.
    struct index_range {
        size_t first;
        size_t last;

        bool empty() const { return first >= last; }
        size_t size() const { return empty() ? 0 : last - first; }
    };

    // Walks every value of a discrete set in ascending order.
    class value_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = V;
        using difference_type = std::ptrdiff_t;
        using pointer = const V*;
        using reference = const V&;
    private:
        const_iterator _i;
        const_iterator _end;
        V _value;
    public:
        value_iterator() = default;
        value_iterator(const_iterator i, const_iterator end)
            : _i(i)
            , _end(end)
            , _value(i != end ? i->first() : V())
        { }
        reference operator*() const { return _value; }
        pointer operator->() const { return &_value; }
        value_iterator& operator++() {
            if (_value == _i->last()) {
                if (++_i != _end) {
                    _value = _i->first();
                }
            } else {
                _value = domain_traits<V>::succ(_value);
            }
            return *this;
        }
        value_iterator operator++(int) {
            auto tmp = *this;
            ++*this;
            return tmp;
        }
        bool operator==(const value_iterator& other) const {
            return _i == other._i && (_i == _end || _value == other._value);
        }
    };
private:
    using fragments = boost::container::static_vector<interval_type, 2>;

    container_type _intervals;

    // Replaces the intervals in r with the given fragments. Capacity is reserved
    // before anything is moved, so an allocation failure leaves the set intact.
    void splice(index_range r, fragments replacement) {
        if (r.first > r.last || r.last > _intervals.size()) {
            seastar::on_internal_error(isets_logger, fmt::format("splice of [{}, {}) out of bounds of {} intervals",
                    r.first, r.last, _intervals.size()));
        }
        auto removed = r.last - r.first;
        if (replacement.size() > removed) {
            _intervals.reserve(_intervals.size() + replacement.size() - removed);
        }
        auto kept = std::min(removed, replacement.size());
        auto pos = _intervals.begin() + r.first;
        std::move(replacement.begin(), replacement.begin() + kept, pos);
        if (removed > kept) {
            _intervals.erase(pos + kept, _intervals.begin() + r.last);
        } else {
            _intervals.insert(pos + kept,
                    std::make_move_iterator(replacement.begin() + kept),
                    std::make_move_iterator(replacement.end()));
        }
    }

    // Sorts and fuses an arbitrary sequence of intervals in place.
    static void normalize(container_type& intervals) {
        std::erase_if(intervals, [] (const interval_type& i) { return i.is_empty(); });
        if (intervals.size() <= 1) {
            return;
        }
        std::sort(intervals.begin(), intervals.end());

        auto out = intervals.begin();
        for (auto it = std::next(intervals.begin()); it != intervals.end(); ++it) {
            if (overlaps(*out, *it)) {
                *out = extent(*out, *it);
            } else if (++out != it) {
                *out = std::move(*it);
            }
        }
        intervals.erase(std::next(out), intervals.end());
    }
public:
    interval_set() = default;
    interval_set(std::initializer_list<interval_type> intervals)
        : _intervals(intervals)
    {
        normalize(_intervals);
    }

    // Builds a set from intervals in any order. Empty intervals are dropped,
    // overlapping and adjacent ones are fused.
    template <std::ranges::input_range Range>
    requires std::convertible_to<std::ranges::range_reference_t<Range>, interval_type>
    static interval_set from_intervals(Range&& intervals) {
        interval_set s;
        for (auto&& i : intervals) {
            s._intervals.emplace_back(i);
        }
        normalize(s._intervals);
        return s;
    }

    template <std::ranges::input_range Range>
    requires std::convertible_to<std::ranges::range_reference_t<Range>, V>
    static interval_set from_values(Range&& values) {
        interval_set s;
        for (auto&& v : values) {
            s._intervals.push_back(interval_type::singular(v));
        }
        normalize(s._intervals);
        return s;
    }

    // Bit i of bits stands for the value i. Set bits are visited in ascending
    // order, so runs are appended directly without searching. Limited to
    // bitsets fitting a machine word.
    template <size_t N>
    requires std::integral<V> && (!std::same_as<V, bool>) && (N <= std::numeric_limits<unsigned long>::digits)
    static interval_set from_bitset(const std::bitset<N>& bits) {
        static_assert(N == 0 || N - 1 <= static_cast<std::make_unsigned_t<V>>(std::numeric_limits<V>::max()),
                "bitset is wider than the value domain");
        interval_set s;
        for (auto bit : seastar::bitsets::for_each_set(bits)) {
            auto v = static_cast<V>(bit);
            if (!s._intervals.empty() && adjacent(s._intervals.back().last(), v)) {
                s._intervals.back() = interval_type(s._intervals.back().first(), v);
            } else {
                s._intervals.emplace_back(v, v);
            }
        }
        return s;
    }

    bool empty() const { return _intervals.empty(); }
    size_t interval_count() const { return _intervals.size(); }
    // Throws std::out_of_range for n >= interval_count().
    const interval_type& interval_at(size_t n) const { return _intervals.at(n); }
    const container_type& intervals() const { return _intervals; }
    // The set must not be empty.
    const interval_type& front() const { return _intervals.front(); }
    const interval_type& back() const { return _intervals.back(); }
    const_iterator begin() const { return _intervals.begin(); }
    const_iterator end() const { return _intervals.end(); }

    // Number of values in the set.
    // Throws domain_error for the whole domain of a 64-bit type, see
    // interval::size(). Disjoint intervals sum to less than that otherwise.
    uint64_t size() const requires Discrete<V> {
        uint64_t n = 0;
        for (auto&& i : _intervals) {
            n += i.size();
        }
        return n;
    }

    boost::iterator_range<value_iterator> values() const requires Discrete<V> {
        return boost::make_iterator_range(value_iterator(_intervals.begin(), _intervals.end()),
                                          value_iterator(_intervals.end(), _intervals.end()));
    }

    // Finds the stored intervals reached by q. The first search skips the
    // intervals ending before q, the second stops at the first interval starting
    // after q. If nothing is reached, the range is empty and first is where q
    // would be inserted.
    index_range overlap_range(const interval_type& q, overlap_mode mode) const {
        if (q.is_empty()) {
            return {0, 0};
        }
        const bound q_lower = q.lower();
        const bound q_upper = q.upper();
        auto ends_before = [&] (const interval_type& e) {
            return mode == overlap_mode::fuse ? e.upper() < q_lower : e.upper() <= q_lower;
        };
        auto starts_within = [&] (const interval_type& e) {
            return mode == overlap_mode::fuse ? !(q_upper < e.lower()) : !(q_upper <= e.lower());
        };
        auto first = std::partition_point(_intervals.begin(), _intervals.end(), ends_before);
        auto last = std::partition_point(_intervals.begin(), _intervals.end(), starts_within);
        size_t f = first - _intervals.begin();
        size_t l = last - _intervals.begin();
        return {f, std::max(f, l)};
    }

    bool contains(const V& v) const {
        auto i = std::partition_point(_intervals.begin(), _intervals.end(), [&v] (const interval_type& e) {
            return e.upper() < v;
        });
        return i != _intervals.end() && i->lower() < v;
    }

    // True if a single stored interval encloses i. False for empty i.
    bool contains(const interval_type& i) const {
        if (i.is_empty()) {
            return false;
        }
        if (i.is_singular()) {
            return contains(i.lower().value());
        }
        auto r = overlap_range(i, overlap_mode::strict);
        return r.size() == 1 && _intervals[r.first].contains(i);
    }

    // True if every interval of other is contained in this set.
    // An empty set contains nothing, not even the empty set.
    bool contains(const interval_set& other) const {
        if (empty()) {
            return false;
        }
        return std::all_of(other._intervals.begin(), other._intervals.end(), [this] (const interval_type& i) {
            return contains(i);
        });
    }

    void add(const V& v) {
        add(interval_type::singular(v));
    }

    // Adds all values of i. Stored intervals overlapping or touching i are
    // fused with it into a single interval.
    void add(const interval_type& i) {
        if (i.is_empty()) {
            return;
        }
        auto r = overlap_range(i, overlap_mode::fuse);
        if (r.empty()) {
            isets_logger.trace("add: new interval at {} of {}", r.first, _intervals.size());
            _intervals.insert(_intervals.begin() + r.first, i);
            return;
        }
        if (r.size() == 1 && _intervals[r.first].contains(i)) {
            return;
        }
        isets_logger.trace("add: fusing intervals [{}, {}) of {}", r.first, r.last, _intervals.size());
        auto fused = extent(extent(_intervals[r.first], i), _intervals[r.last - 1]);
        splice(r, fragments{std::move(fused)});
    }

    void add(const interval_set& other) {
        for (auto&& i : other._intervals) {
            add(i);
        }
    }

    void remove(const V& v) {
        remove(interval_type::singular(v));
    }

    // Removes all values of i. Intervals fully covered by i disappear, the
    // first and last intervals reached keep their parts outside of i. When a
    // single interval is reached and i lies strictly inside it, it is split.
    void remove(const interval_type& i) {
        if (i.is_empty() || _intervals.empty()) {
            return;
        }
        auto r = overlap_range(i, overlap_mode::strict);
        if (r.empty()) {
            return;
        }
        fragments remaining;
        auto below = difference(_intervals[r.first], i)[0];
        auto above = difference(_intervals[r.last - 1], i)[1];
        if (!below.is_empty()) {
            remaining.push_back(std::move(below));
        }
        if (!above.is_empty()) {
            remaining.push_back(std::move(above));
        }
        isets_logger.trace("remove: replacing intervals [{}, {}) of {} with {} fragments",
                r.first, r.last, _intervals.size(), remaining.size());
        splice(r, std::move(remaining));
    }

    void remove(const interval_set& other) {
        for (auto&& i : other._intervals) {
            remove(i);
        }
    }

    bool operator==(const interval_set& other) const {
        return _intervals == other._intervals;
    }
};

}

// Printed as "{a..b, c}" by the formatter below, not by fmt's range formatter.
template <typename V, typename Char>
struct fmt::is_range<isets::interval_set<V>, Char> : std::false_type {};

template <typename V>
struct fmt::formatter<isets::interval_set<V>> : fmt::formatter<string_view> {
    auto format(const isets::interval_set<V>& s, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{{}}}", fmt::join(s.begin(), s.end(), ", "));
    }
};

namespace isets {

template <typename V>
std::ostream& operator<<(std::ostream& out, const interval_set<V>& s) {
    fmt::print(out, "{}", s);
    return out;
}

}

namespace std {

template <typename V>
struct hash<isets::interval_set<V>> {
    size_t operator()(const isets::interval_set<V>& s) const {
        auto h = std::hash<isets::interval<V>>();
        size_t result = 0;
        for (auto&& i : s) {
            result = 31 * result + h(i);
        }
        return result;
    }
};

}
