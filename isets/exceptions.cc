/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "isets/exceptions.hh"

namespace isets {

const std::unordered_map<error_code, seastar::sstring>& error_map() {
    static const std::unordered_map<error_code, seastar::sstring> map {
        {error_code::DOMAIN_EDGE, "domain_edge"},
        {error_code::PARSE, "parse_error"},
        {error_code::OPERATION, "unknown_operation"},
    };
    return map;
}

}
