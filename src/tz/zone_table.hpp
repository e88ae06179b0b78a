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

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "datetime/timezone.hpp"

namespace datetime::tz {

/// Offset rules of one IANA zone, read from the system time zone database.
class NamedZone final : public ZoneRules {
 public:
  explicit NamedZone(const std::chrono::time_zone *zone) : zone_{zone} {}

  std::chrono::seconds OffsetAt(std::chrono::sys_seconds instant) const override;
  std::string_view Name() const override { return zone_->name(); }
  std::string Abbreviation(std::chrono::sys_seconds instant) const override;

 private:
  const std::chrono::time_zone *zone_;
};

/**
 * @brief Identifier -> rules lookup over the tz database.
 *
 * Links resolve to the rules of their target, so "US/Pacific" and
 * "America/Los_Angeles" share one NamedZone named after the target. A table
 * never changes after construction.
 */
class ZoneTable {
 public:
  ZoneTable() = default;
  explicit ZoneTable(const std::chrono::tzdb &db);

  /// nullptr for unknown identifiers.
  std::shared_ptr<const ZoneRules> Find(std::string_view name) const;

  /// Canonical and link identifiers, sorted.
  std::vector<std::string_view> Identifiers() const;

  size_t size() const { return zones_.size(); }
  bool empty() const { return zones_.empty(); }

 private:
  std::map<std::string, std::shared_ptr<const NamedZone>, std::less<>> zones_;
};

/// Process-wide table, built on first use.
std::shared_ptr<const ZoneTable> GetZoneTable();

/// Rules for an IANA identifier, nullptr (and a warning) when the identifier is unknown.
std::shared_ptr<const ZoneRules> LocateZone(std::string_view name);

/// Rules of the zone the system is configured with, nullptr when it cannot be determined.
std::shared_ptr<const ZoneRules> LocalZone();

}  // namespace datetime::tz
