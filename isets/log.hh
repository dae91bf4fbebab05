/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <utility>

#include <seastar/util/log.hh>

#include <fmt/format.h>

namespace logging {

using log_level = seastar::log_level;
using logger = seastar::logger;

}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_and_throw(logging::logger& logger, logging::log_level log_level, fmt::format_string<Args...> fmt, Args&&... args) {
    auto msg = fmt::format(fmt, std::forward<Args>(args)...);
    logger.log(log_level, "{}", msg);
    throw ExceptionType(msg);
}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_debug_and_throw(logging::logger& logger, fmt::format_string<Args...> fmt, Args&&... args) {
    log_and_throw<ExceptionType>(logger, logging::log_level::debug, fmt, std::forward<Args>(args)...);
}

namespace isets {

// Shared by the containers, the parser and the tool.
extern logging::logger isets_logger;

}
