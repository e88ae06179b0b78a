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

#include "tz/zone_table.hpp"

#include <stdexcept>

#include "utils/logging.hpp"

namespace datetime::tz {

std::chrono::seconds NamedZone::OffsetAt(const std::chrono::sys_seconds instant) const {
  return zone_->get_info(instant).offset;
}

std::string NamedZone::Abbreviation(const std::chrono::sys_seconds instant) const {
  return zone_->get_info(instant).abbrev;
}

ZoneTable::ZoneTable(const std::chrono::tzdb &db) {
  for (const auto &zone : db.zones) {
    zones_.emplace(std::string{zone.name()}, std::make_shared<const NamedZone>(&zone));
  }
  for (const auto &link : db.links) {
    const auto target = zones_.find(link.target());
    if (target == zones_.end()) {
      spdlog::debug("Time zone link {} points to unknown zone {}", link.name(), link.target());
      continue;
    }
    zones_.emplace(std::string{link.name()}, target->second);
  }
}

std::shared_ptr<const ZoneRules> ZoneTable::Find(const std::string_view name) const {
  const auto it = zones_.find(name);
  if (it == zones_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string_view> ZoneTable::Identifiers() const {
  std::vector<std::string_view> identifiers;
  identifiers.reserve(zones_.size());
  for (const auto &[name, _] : zones_) {
    identifiers.emplace_back(name);
  }
  return identifiers;
}

std::shared_ptr<const ZoneTable> GetZoneTable() {
  static const std::shared_ptr<const ZoneTable> table = []() -> std::shared_ptr<const ZoneTable> {
    try {
      const auto &db = std::chrono::get_tzdb();
      auto loaded = std::make_shared<const ZoneTable>(db);
      spdlog::debug("Loaded time zone database {} with {} identifiers", db.version, loaded->size());
      return loaded;
    } catch (const std::runtime_error &e) {
      spdlog::error("Time zone database unavailable, only fixed offsets can be used: {}", e.what());
      return std::make_shared<const ZoneTable>();
    }
  }();
  return table;
}

std::shared_ptr<const ZoneRules> LocateZone(const std::string_view name) {
  auto rules = GetZoneTable()->Find(name);
  if (!rules) {
    spdlog::warn("Unsupported timezone: {}", name);
  }
  return rules;
}

std::shared_ptr<const ZoneRules> LocalZone() {
  try {
    return LocateZone(std::chrono::current_zone()->name());
  } catch (const std::runtime_error &e) {
    spdlog::warn("Cannot determine the local time zone: {}", e.what());
    return nullptr;
  }
}

}  // namespace datetime::tz
