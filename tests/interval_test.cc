/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE interval

#include <climits>
#include <cstdint>
#include <functional>
#include <limits>

#include <boost/test/unit_test.hpp>
#include <fmt/format.h>

#include "isets/exceptions.hh"
#include "isets/interval.hh"
#include "weekday.hh"

using int_interval = isets::interval<int>;
using real_interval = isets::interval<double>;
using int_bound = isets::boundary<int>;
using real_bound = isets::boundary<double>;

BOOST_AUTO_TEST_CASE(test_endpoint_kinds) {
    auto i1 = real_interval::open(1.0, 2.0);
    BOOST_REQUIRE(i1.is_open());
    BOOST_REQUIRE_EQUAL(i1, real_interval(real_bound::above(1.0), real_bound::below(2.0)));

    auto i2 = real_interval::closed_open(1.0, 2.0);
    BOOST_REQUIRE(i2.is_closed_below());
    BOOST_REQUIRE(i2.is_open_above());
    BOOST_REQUIRE(!i2.is_open());

    auto i3 = real_interval::open_closed(1.0, 2.0);
    BOOST_REQUIRE(i3.is_open_below());
    BOOST_REQUIRE(i3.is_closed_above());

    // discrete intervals are always closed
    BOOST_REQUIRE(int_interval(1, 2).is_closed());
    BOOST_REQUIRE(int_interval::open(1, 4).is_closed());
}

BOOST_AUTO_TEST_CASE(test_discrete_construction_from_boundaries) {
    BOOST_REQUIRE_EQUAL(int_interval::open(1, 4), int_interval(2, 3));
    BOOST_REQUIRE_EQUAL(int_interval::closed_open(4, 5), int_interval(4, 4));
    BOOST_REQUIRE_EQUAL(int_interval::open_closed(4, 6), int_interval(5, 6));
    BOOST_REQUIRE_EQUAL(int_interval::closed(4, 5), int_interval(4, 5));
    BOOST_REQUIRE(int_interval::open(4, 5).is_empty());

    // cuts at the edges of the domain leave nothing inside
    BOOST_REQUIRE(int_interval::make(int_bound::above(INT_MAX), int_bound::above(INT_MAX)).is_empty());
    BOOST_REQUIRE(int_interval::make(int_bound::below(INT_MIN), int_bound::below(INT_MIN)).is_empty());
    BOOST_REQUIRE_EQUAL(int_interval::closed(INT_MIN, INT_MAX).first(), INT_MIN);
    BOOST_REQUIRE_EQUAL(int_interval::closed(INT_MIN, INT_MAX).last(), INT_MAX);
}

BOOST_AUTO_TEST_CASE(test_emptiness) {
    BOOST_REQUIRE(real_interval::closed(2.0, 1.0).is_empty());
    BOOST_REQUIRE(real_interval::closed_open(1.0, 1.0).is_empty());
    BOOST_REQUIRE(real_interval::open(1.0, 1.0).is_empty());
    BOOST_REQUIRE(!real_interval::closed(1.0, 1.0).is_empty());
    BOOST_REQUIRE(real_interval().is_empty());
    BOOST_REQUIRE(real_interval::empty().is_empty());

    BOOST_REQUIRE(int_interval(2, 1).is_empty());
    BOOST_REQUIRE(int_interval().is_empty());
    BOOST_REQUIRE(!int_interval(1, 1).is_empty());
}

BOOST_AUTO_TEST_CASE(test_singular) {
    BOOST_REQUIRE(int_interval(1, 1).is_singular());
    BOOST_REQUIRE(int_interval::singular(7).is_singular());
    BOOST_REQUIRE(!int_interval(1, 2).is_singular());
    BOOST_REQUIRE(real_interval::singular(0.5).is_singular());
    BOOST_REQUIRE(!real_interval::closed_open(0.5, 0.5).is_singular());
    BOOST_REQUIRE(!real_interval::closed(0.5, 0.75).is_singular());
}

BOOST_AUTO_TEST_CASE(test_ordering) {
    BOOST_REQUIRE(int_interval(1, 2) < int_interval(2, 3));
    BOOST_REQUIRE(int_interval::closed_open(4, 5) < int_interval::closed(4, 5));
    BOOST_REQUIRE(real_interval::closed(0.0, 1.0) < real_interval::open_closed(0.0, 1.0));
    BOOST_REQUIRE(real_interval::closed_open(0.0, 1.0) < real_interval::closed(0.0, 1.0));

    // all empty intervals are equal and sort first
    BOOST_REQUIRE_EQUAL(int_interval(5, 1), int_interval());
    BOOST_REQUIRE(int_interval() < int_interval(INT_MIN, INT_MIN));
    BOOST_REQUIRE_EQUAL(real_interval::closed(3.0, 2.0), real_interval::open(1.0, 1.0));
}

BOOST_AUTO_TEST_CASE(test_contains_value) {
    BOOST_REQUIRE(real_interval::closed(0.0, 1.0).contains(1.0));
    BOOST_REQUIRE(real_interval::closed(0.0, 1.0).contains(0.0));
    BOOST_REQUIRE(!real_interval::closed_open(0.0, 1.0).contains(1.0));
    BOOST_REQUIRE(!real_interval::open(0.0, 1.0).contains(0.0));
    BOOST_REQUIRE(real_interval::open(0.0, 1.0).contains(0.5));
    BOOST_REQUIRE(!real_interval().contains(0.0));

    BOOST_REQUIRE(int_interval(1, 10).contains(1));
    BOOST_REQUIRE(int_interval(1, 10).contains(10));
    BOOST_REQUIRE(!int_interval(1, 10).contains(11));
    BOOST_REQUIRE(!int_interval().contains(0));
}

BOOST_AUTO_TEST_CASE(test_contains_interval) {
    BOOST_REQUIRE(int_interval(1, 10).contains(int_interval(2, 3)));
    BOOST_REQUIRE(int_interval(1, 10).contains(int_interval(1, 10)));
    BOOST_REQUIRE(!int_interval(1, 10).contains(int_interval(0, 3)));
    BOOST_REQUIRE(!int_interval(1, 10).contains(int_interval()));
    BOOST_REQUIRE(!int_interval().contains(int_interval()));

    BOOST_REQUIRE(real_interval::closed(0.0, 1.0).contains(real_interval::open(0.0, 1.0)));
    BOOST_REQUIRE(!real_interval::open(0.0, 1.0).contains(real_interval::closed(0.0, 1.0)));
    BOOST_REQUIRE(real_interval::closed_open(0.0, 1.0).contains(real_interval::open(0.5, 1.0)));
}

BOOST_AUTO_TEST_CASE(test_overlap) {
    BOOST_REQUIRE(isets::overlaps(int_interval(1, 2), int_interval(2, 3)));
    // adjacent discrete ranges must be fused, so they overlap
    BOOST_REQUIRE(isets::overlaps(int_interval(1, 2), int_interval(3, 4)));
    BOOST_REQUIRE(isets::overlaps(int_interval(3, 4), int_interval(1, 2)));
    BOOST_REQUIRE(!isets::overlaps(int_interval(1, 2), int_interval(4, 5)));
    BOOST_REQUIRE(!isets::overlaps(int_interval(1, 2), int_interval()));

    BOOST_REQUIRE(isets::overlaps(real_interval::closed_open(0.0, 1.0), real_interval::closed(1.0, 2.0)));
    BOOST_REQUIRE(!isets::overlaps(real_interval::closed_open(0.0, 1.0), real_interval::open_closed(1.0, 2.0)));
    BOOST_REQUIRE(!isets::overlaps(real_interval::closed(0.0, 1.0), real_interval::closed(1.5, 2.0)));
}

BOOST_AUTO_TEST_CASE(test_intersects) {
    BOOST_REQUIRE(isets::intersects(int_interval(1, 2), int_interval(2, 3)));
    BOOST_REQUIRE(!isets::intersects(int_interval(1, 2), int_interval(3, 4)));
    BOOST_REQUIRE(isets::intersects(real_interval::closed(0.0, 1.0), real_interval::closed(1.0, 2.0)));
    BOOST_REQUIRE(!isets::intersects(real_interval::closed_open(0.0, 1.0), real_interval::closed(1.0, 2.0)));
}

BOOST_AUTO_TEST_CASE(test_intersection_and_extent) {
    BOOST_REQUIRE_EQUAL(isets::intersection(int_interval(1, 2), int_interval(2, 3)), int_interval(2, 2));
    BOOST_REQUIRE_EQUAL(isets::extent(int_interval(1, 2), int_interval(2, 3)), int_interval(1, 3));
    BOOST_REQUIRE(isets::intersection(int_interval(1, 2), int_interval(4, 5)).is_empty());
    BOOST_REQUIRE(isets::intersection(int_interval(1, 2), int_interval()).is_empty());
    BOOST_REQUIRE_EQUAL(isets::extent(int_interval(), int_interval(4, 5)), int_interval(4, 5));
    BOOST_REQUIRE_EQUAL(isets::extent(int_interval(4, 5), int_interval()), int_interval(4, 5));

    BOOST_REQUIRE_EQUAL(isets::intersection(real_interval::closed(0.0, 1.0), real_interval::open(0.5, 2.0)),
                        real_interval::open_closed(0.5, 1.0));
    BOOST_REQUIRE_EQUAL(isets::extent(real_interval::closed_open(0.0, 1.0), real_interval::open(0.5, 2.0)),
                        real_interval::closed_open(0.0, 2.0));
}

BOOST_AUTO_TEST_CASE(test_difference) {
    auto d = isets::difference(int_interval(0, 4), int_interval(1, 2));
    BOOST_REQUIRE_EQUAL(d[0], int_interval(0, 0));
    BOOST_REQUIRE_EQUAL(d[1], int_interval(3, 4));

    d = isets::difference(int_interval(0, 4), int_interval(0, 4));
    BOOST_REQUIRE(d[0].is_empty());
    BOOST_REQUIRE(d[1].is_empty());

    d = isets::difference(int_interval(0, 4), int_interval(3, 10));
    BOOST_REQUIRE_EQUAL(d[0], int_interval(0, 2));
    BOOST_REQUIRE(d[1].is_empty());

    d = isets::difference(int_interval(0, 4), int_interval(8, 10));
    BOOST_REQUIRE_EQUAL(d[0], int_interval(0, 4));
    BOOST_REQUIRE(d[1].is_empty());

    // no wrapping around the edges of the domain
    d = isets::difference(int_interval(INT_MIN, 5), int_interval(INT_MIN, 2));
    BOOST_REQUIRE(d[0].is_empty());
    BOOST_REQUIRE_EQUAL(d[1], int_interval(3, 5));
    d = isets::difference(int_interval(0, INT_MAX), int_interval(3, INT_MAX));
    BOOST_REQUIRE_EQUAL(d[0], int_interval(0, 2));
    BOOST_REQUIRE(d[1].is_empty());

    auto r = isets::difference(real_interval::closed(0.0, 1.0), real_interval::singular(0.5));
    BOOST_REQUIRE_EQUAL(r[0], real_interval::closed_open(0.0, 0.5));
    BOOST_REQUIRE_EQUAL(r[1], real_interval::open_closed(0.5, 1.0));
}

BOOST_AUTO_TEST_CASE(test_size) {
    BOOST_REQUIRE_EQUAL(int_interval(1, 10).size(), 10u);
    BOOST_REQUIRE_EQUAL(int_interval(-5, 5).size(), 11u);
    BOOST_REQUIRE_EQUAL(int_interval().size(), 0u);
    BOOST_REQUIRE_EQUAL(isets::interval<uint8_t>(0, 255).size(), 256u);
    BOOST_REQUIRE_EQUAL(isets::interval<weekday>(weekday::mon, weekday::sun).size(), 7u);

    const auto min64 = std::numeric_limits<int64_t>::min();
    const auto max64 = std::numeric_limits<int64_t>::max();
    BOOST_REQUIRE_EQUAL(isets::interval<int64_t>(min64 + 1, max64).size(), std::numeric_limits<uint64_t>::max());
    auto is_domain_edge = [] (const isets::domain_error& e) {
        return e.code() == isets::error_code::DOMAIN_EDGE;
    };
    BOOST_REQUIRE_EXCEPTION(isets::interval<int64_t>(min64, max64).size(), isets::domain_error, is_domain_edge);
    BOOST_REQUIRE_EXCEPTION(isets::interval<uint64_t>(0, std::numeric_limits<uint64_t>::max()).size(),
                            isets::domain_error, is_domain_edge);
}

BOOST_AUTO_TEST_CASE(test_hash) {
    auto h = std::hash<int_interval>();
    BOOST_REQUIRE_EQUAL(h(int_interval::open(1, 4)), h(int_interval(2, 3)));
    BOOST_REQUIRE_EQUAL(h(int_interval(5, 1)), h(int_interval()));
    BOOST_REQUIRE_NE(h(int_interval(1, 2)), h(int_interval(1, 3)));
}

BOOST_AUTO_TEST_CASE(test_format) {
    BOOST_REQUIRE_EQUAL(fmt::format("{}", int_interval(2, 6)), "2..6");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", int_interval(5, 5)), "5");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", int_interval()), "empty");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", real_interval::closed_open(0.0, 0.5)), "0..<0.5");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", real_interval::open_closed(0.5, 1.0)), "0.5<..1");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", real_interval::open(1.0, 2.0)), "1<..<2");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", real_interval::singular(0.5)), "0.5");
}
