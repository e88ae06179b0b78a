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

#include "flags/timezone.hpp"

#include <mutex>
#include <optional>

#include "tz/zone_table.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables, misc-unused-parameters)
DEFINE_VALIDATED_string(datetime_timezone, "UTC",
                        "Time zone used to display instants when none is given (IANA format). Empty string selects "
                        "the system local zone.",
                        { return datetime::flags::ValidTimezone(value); });

namespace datetime::flags {
namespace {

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
std::mutex default_zone_lock;
std::optional<Timezone> default_zone;
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

Timezone ResolveZone(const std::string &name) {
  auto rules = name.empty() ? tz::LocalZone() : tz::LocateZone(name);
  if (!rules) {
    spdlog::warn("Time zone '{}' cannot be resolved, using UTC", name);
    return Timezone::Utc();
  }
  spdlog::debug("Default time zone set to {}", rules->Name());
  return Timezone{std::move(rules)};
}

}  // namespace

bool ValidTimezone(const std::string_view value) { return value.empty() || tz::LocateZone(value) != nullptr; }

Timezone DefaultZone() {
  std::lock_guard guard{default_zone_lock};
  if (!default_zone) {
    default_zone.emplace(ResolveZone(FLAGS_datetime_timezone));
  }
  return *default_zone;
}

void ReloadDefaultZone() {
  auto zone = ResolveZone(FLAGS_datetime_timezone);
  std::lock_guard guard{default_zone_lock};
  default_zone.emplace(std::move(zone));
}

DateTime NowInDefaultZone() { return DateTime::Now().InZone(DefaultZone()); }

}  // namespace datetime::flags
