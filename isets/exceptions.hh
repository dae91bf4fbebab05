/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <exception>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>
#include <seastar/core/sstring.hh>

namespace isets {

enum class error_code : int32_t {
    // a value was requested past the edge of its domain, or on a dense domain
    DOMAIN_EDGE = 0x0100,
    // textual input could not be read as an interval or a set
    PARSE       = 0x0200,
    // an operation name not known to the evaluator
    OPERATION   = 0x0300,
};

inline auto format_as(error_code ec) {
    return fmt::underlying(ec);
}

const std::unordered_map<error_code, seastar::sstring>& error_map();

class interval_set_exception : public std::exception {
private:
    error_code _code;
    seastar::sstring _msg;
public:
    interval_set_exception(error_code code, std::string_view msg)
        : _code(code)
        , _msg(msg.data(), msg.size())
    { }
    virtual const char* what() const noexcept override { return _msg.c_str(); }
    error_code code() const { return _code; }
};

/**
 * Thrown when asking for the value adjacent to a boundary which has none:
 * the boundary sits on the minimum or maximum of a discrete domain, or the
 * domain is dense.
 */
class domain_error : public interval_set_exception {
public:
    domain_error(std::string_view msg)
        : interval_set_exception(error_code::DOMAIN_EDGE, msg)
    { }
};

class parse_error : public interval_set_exception {
public:
    parse_error(std::string_view msg)
        : interval_set_exception(error_code::PARSE, msg)
    { }
};

class unknown_operation_error : public interval_set_exception {
public:
    unknown_operation_error(std::string_view msg)
        : interval_set_exception(error_code::OPERATION, msg)
    { }
};

}
