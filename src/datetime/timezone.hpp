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
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace datetime {

/**
 * @brief Offset rules of a named zone.
 *
 * Implementations must be immutable; a single instance is shared by every
 * Timezone (and therefore every DateTime) referring to the zone.
 */
class ZoneRules {
 public:
  virtual ~ZoneRules() = default;

  /// UTC offset (including daylight saving) in effect at the given instant.
  virtual std::chrono::seconds OffsetAt(std::chrono::sys_seconds instant) const = 0;

  /// Canonical identifier, e.g. "America/New_York".
  virtual std::string_view Name() const = 0;

  /// Abbreviation in effect at the given instant, e.g. "EDT".
  virtual std::string Abbreviation(std::chrono::sys_seconds instant) const = 0;
};

enum class Disambiguation : uint8_t {
  // Earlier instant for repeated local times, later wall clock for skipped ones.
  COMPATIBLE,
  EARLIER,
  LATER,
  REJECT,
};

/// How a local (wall clock) time maps onto the UTC timeline in some zone.
struct LocalInfo {
  enum class Kind : uint8_t { UNIQUE, AMBIGUOUS, NONEXISTENT };

  Kind kind;
  // UNIQUE: both hold the only instant.
  // AMBIGUOUS: the earlier and the later of the two instants.
  // NONEXISTENT: local time read with the offset after, respectively before, the transition.
  std::chrono::sys_seconds first;
  std::chrono::sys_seconds second;
};

class Timezone {
 private:
  std::variant<std::chrono::seconds, std::shared_ptr<const ZoneRules>> offset_;

 public:
  /// Fixed offset from UTC; throws temporal::InvalidArgumentException unless it is within (-24h, 24h).
  explicit Timezone(std::chrono::seconds offset);
  /// Named zone; throws temporal::InvalidArgumentException on nullptr.
  explicit Timezone(std::shared_ptr<const ZoneRules> rules);

  static Timezone Utc() { return Timezone{std::chrono::seconds{0}}; }

  bool operator==(const Timezone &other) const;

  bool IsFixed() const { return std::holds_alternative<std::chrono::seconds>(offset_); }

  std::chrono::seconds OffsetAt(std::chrono::sys_seconds instant) const;

  std::string Abbreviation(std::chrono::sys_seconds instant) const;

  /// Empty for fixed offsets.
  std::string_view TimezoneName() const;

  /// Shared rules of a named zone, nullptr for fixed offsets.
  std::shared_ptr<const ZoneRules> Rules() const;

  LocalInfo GetLocalInfo(std::chrono::local_seconds local) const;

  /// nullopt when the policy is REJECT and the local time is ambiguous or nonexistent.
  std::optional<std::chrono::sys_seconds> ToSys(std::chrono::local_seconds local, Disambiguation policy) const;

  std::chrono::local_seconds ToLocal(std::chrono::sys_seconds instant) const {
    return std::chrono::local_seconds{(instant + OffsetAt(instant)).time_since_epoch()};
  }
};

/// "+HH:MM" rendering of an offset; `separator` false gives "+HHMM".
std::string FormatOffset(std::chrono::seconds offset, bool separator = true);

}  // namespace datetime
