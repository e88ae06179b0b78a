// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <string_view>

#include "gflags/gflags.h"

#include "datetime/date_time.hpp"
#include "datetime/timezone.hpp"

DECLARE_string(datetime_timezone);

namespace datetime::flags {

/// Empty means the system local zone; otherwise an identifier known to the zone table.
bool ValidTimezone(std::string_view value);

/// Zone selected by --datetime_timezone, resolved once and cached. Falls back to UTC when the
/// configured zone cannot be resolved.
Timezone DefaultZone();

/// Re-reads --datetime_timezone, for use after the flag was changed at run time.
void ReloadDefaultZone();

DateTime NowInDefaultZone();

}  // namespace datetime::flags
