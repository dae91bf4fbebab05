/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "isets/log.hh"

namespace isets {

logging::logger isets_logger("isets");

}
