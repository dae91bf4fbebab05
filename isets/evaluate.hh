/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "isets/exceptions.hh"
#include "isets/log.hh"
#include "isets/parse.hh"
#include "isets/set_algebra.hh"

namespace isets {

// One operation over sets given in their textual form, as read from the
// command line.
struct operation_request {
    std::string operation;
    std::string lhs = "{}";
    std::string rhs = "{}";
    // Interval looked up by "contains" instead of the rhs set.
    std::optional<std::string> value;
};

// Evaluates the request and renders its result: a set, or "true"/"false" for
// "contains". Throws parse_error for malformed operands and
// unknown_operation_error for an operation it does not know.
template <Bounded V>
std::string evaluate(const operation_request& req) {
    const auto lhs = parse_interval_set<V>(req.lhs);

    if (req.operation == "normalize") {
        return fmt::format("{}", lhs);
    }
    if (req.operation == "complement") {
        return fmt::format("{}", complement(lhs));
    }
    if (req.operation == "contains") {
        bool found = req.value ? lhs.contains(parse_interval<V>(*req.value))
                               : lhs.contains(parse_interval_set<V>(req.rhs));
        return found ? "true" : "false";
    }

    const auto rhs = parse_interval_set<V>(req.rhs);
    if (req.operation == "union") {
        return fmt::format("{}", set_union(lhs, rhs));
    } else if (req.operation == "difference") {
        return fmt::format("{}", difference(lhs, rhs));
    } else if (req.operation == "intersection") {
        return fmt::format("{}", intersection(lhs, rhs));
    } else if (req.operation == "symmetric-difference") {
        return fmt::format("{}", symmetric_difference(lhs, rhs));
    }
    log_debug_and_throw<unknown_operation_error>(isets_logger, "unknown operation '{}'", req.operation);
}

}
