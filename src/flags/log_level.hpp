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

#include <optional>
#include <string_view>

#include <spdlog/common.h>
#include "gflags/gflags.h"

DECLARE_string(datetime_log_level);
DECLARE_bool(datetime_log_to_stderr);

namespace datetime::flags {

bool ValidLogLevel(std::string_view value);
std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value);

/// Applies --datetime_log_level and --datetime_log_to_stderr to the default spdlog logger.
void InitializeLogger();

}  // namespace datetime::flags
