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

#include "flags/log_level.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <string>
#include <utility>

#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(datetime_log_to_stderr, false, "Send the library's log messages to stderr instead of stdout.");

namespace {

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

std::string AllowedLogLevels() {
  std::string allowed;
  for (const auto &[name, _] : log_level_mappings) {
    if (!allowed.empty()) {
      allowed += ", ";
    }
    allowed += name;
  }
  return allowed;
}

const std::string log_level_help_string = fmt::format("Minimum log level. Allowed values: {}", AllowedLogLevels());

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables, misc-unused-parameters)
DEFINE_VALIDATED_string(datetime_log_level, "WARNING", log_level_help_string.c_str(),
                        { return datetime::flags::ValidLogLevel(value); });

bool datetime::flags::ValidLogLevel(std::string_view value) {
  if (value.empty()) {
    std::cout << "Log level cannot be empty." << std::endl;
    return false;
  }
  if (!LogLevelToEnum(value)) {
    std::cout << "Invalid value for log level. Allowed values: " << AllowedLogLevels() << std::endl;
    return false;
  }
  return true;
}

std::optional<spdlog::level::level_enum> datetime::flags::LogLevelToEnum(std::string_view value) {
  const auto it = std::find_if(log_level_mappings.begin(), log_level_mappings.end(),
                               [value](const auto &mapping) { return mapping.first == value; });
  if (it == log_level_mappings.end()) {
    return std::nullopt;
  }
  return it->second;
}

void datetime::flags::InitializeLogger() {
  if (FLAGS_datetime_log_to_stderr) {
    logging::RedirectToStderr();
  }
  const auto log_level = LogLevelToEnum(FLAGS_datetime_log_level);
  DT_ASSERT(log_level, "Invalid log level {}", FLAGS_datetime_log_level);
  spdlog::set_level(*log_level);
}
