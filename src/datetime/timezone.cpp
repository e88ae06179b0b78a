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

#include "datetime/timezone.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "datetime/errors.hpp"

namespace datetime {

Timezone::Timezone(const std::chrono::seconds offset) : offset_{offset} {
  if (offset <= -std::chrono::hours{24} || offset >= std::chrono::hours{24}) {
    throw temporal::InvalidArgumentException(
        "Creating a Timezone with invalid offset of {} seconds. The offset should be strictly between -24 and 24 "
        "hours.",
        offset.count());
  }
}

Timezone::Timezone(std::shared_ptr<const ZoneRules> rules) : offset_{std::move(rules)} {
  if (!std::get<std::shared_ptr<const ZoneRules>>(offset_)) {
    throw temporal::InvalidArgumentException("Creating a Timezone without zone rules.");
  }
}

bool Timezone::operator==(const Timezone &other) const {
  if (IsFixed() != other.IsFixed()) {
    return false;
  }
  if (IsFixed()) {
    return std::get<std::chrono::seconds>(offset_) == std::get<std::chrono::seconds>(other.offset_);
  }
  return TimezoneName() == other.TimezoneName();
}

std::chrono::seconds Timezone::OffsetAt(const std::chrono::sys_seconds instant) const {
  if (IsFixed()) {
    return std::get<std::chrono::seconds>(offset_);
  }
  return std::get<std::shared_ptr<const ZoneRules>>(offset_)->OffsetAt(instant);
}

std::string Timezone::Abbreviation(const std::chrono::sys_seconds instant) const {
  if (IsFixed()) {
    const auto offset = std::get<std::chrono::seconds>(offset_);
    return offset == std::chrono::seconds::zero() ? std::string{"UTC"} : FormatOffset(offset);
  }
  return std::get<std::shared_ptr<const ZoneRules>>(offset_)->Abbreviation(instant);
}

std::string_view Timezone::TimezoneName() const {
  if (IsFixed()) {
    return "";
  }
  return std::get<std::shared_ptr<const ZoneRules>>(offset_)->Name();
}

std::shared_ptr<const ZoneRules> Timezone::Rules() const {
  if (IsFixed()) {
    return nullptr;
  }
  return std::get<std::shared_ptr<const ZoneRules>>(offset_);
}

LocalInfo Timezone::GetLocalInfo(const std::chrono::local_seconds local) const {
  namespace chrono = std::chrono;
  const auto as_sys = chrono::sys_seconds{local.time_since_epoch()};

  if (IsFixed()) {
    const auto instant = as_sys - std::get<chrono::seconds>(offset_);
    return {LocalInfo::Kind::UNIQUE, instant, instant};
  }

  // Offsets a day away on either side bracket at most one transition. A candidate instant is real
  // only if the zone actually uses the offset it was derived from at that instant.
  const auto &rules = std::get<std::shared_ptr<const ZoneRules>>(offset_);
  const auto offset_before = rules->OffsetAt(as_sys - chrono::days{1});
  const auto offset_after = rules->OffsetAt(as_sys + chrono::days{1});

  const auto candidate_before = as_sys - offset_before;
  const auto candidate_after = as_sys - offset_after;
  const bool before_valid = rules->OffsetAt(candidate_before) == offset_before;
  const bool after_valid = rules->OffsetAt(candidate_after) == offset_after;

  if (before_valid && after_valid && candidate_before != candidate_after) {
    const auto [earlier, later] = std::minmax(candidate_before, candidate_after);
    return {LocalInfo::Kind::AMBIGUOUS, earlier, later};
  }
  if (before_valid) {
    return {LocalInfo::Kind::UNIQUE, candidate_before, candidate_before};
  }
  if (after_valid) {
    return {LocalInfo::Kind::UNIQUE, candidate_after, candidate_after};
  }
  return {LocalInfo::Kind::NONEXISTENT, candidate_after, candidate_before};
}

std::optional<std::chrono::sys_seconds> Timezone::ToSys(const std::chrono::local_seconds local,
                                                        const Disambiguation policy) const {
  const auto info = GetLocalInfo(local);
  switch (info.kind) {
    case LocalInfo::Kind::UNIQUE:
      return info.first;
    case LocalInfo::Kind::AMBIGUOUS:
      switch (policy) {
        case Disambiguation::COMPATIBLE:
        case Disambiguation::EARLIER:
          return info.first;
        case Disambiguation::LATER:
          return info.second;
        case Disambiguation::REJECT:
          return std::nullopt;
      }
      break;
    case LocalInfo::Kind::NONEXISTENT:
      switch (policy) {
        case Disambiguation::EARLIER:
          return info.first;
        case Disambiguation::COMPATIBLE:
        case Disambiguation::LATER:
          return info.second;
        case Disambiguation::REJECT:
          return std::nullopt;
      }
      break;
  }
  return std::nullopt;
}

std::string FormatOffset(const std::chrono::seconds offset, const bool separator) {
  const auto total = offset.count();
  const auto abs = total < 0 ? -total : total;
  const char sign = total < 0 ? '-' : '+';
  const auto hours = abs / 3'600;
  const auto minutes = (abs % 3'600) / 60;
  const auto seconds = abs % 60;
  // Seconds appear only when present, e.g. local mean time offsets before standard time was adopted.
  if (separator) {
    return seconds == 0 ? fmt::format("{}{:0>2}:{:0>2}", sign, hours, minutes)
                        : fmt::format("{}{:0>2}:{:0>2}:{:0>2}", sign, hours, minutes, seconds);
  }
  return seconds == 0 ? fmt::format("{}{:0>2}{:0>2}", sign, hours, minutes)
                      : fmt::format("{}{:0>2}{:0>2}{:0>2}", sign, hours, minutes, seconds);
}

}  // namespace datetime
