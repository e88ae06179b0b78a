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
#include <string_view>

namespace datetime {

inline constexpr int64_t kMinYear = -32767;
inline constexpr int64_t kMaxYear = 32767;
inline constexpr int64_t kSecondsPerDay = 86'400;
inline constexpr int64_t kNanosPerSecond = 1'000'000'000;

struct DateParameters {
  int64_t year{1970};
  int64_t month{1};
  int64_t day{1};

  bool operator==(const DateParameters &) const = default;
};

struct TimeParameters {
  int64_t hour{0};
  int64_t minute{0};
  int64_t second{0};
  int64_t nanosecond{0};

  bool operator==(const TimeParameters &) const = default;
};

// Sunday is 0, matching strftime's %w.
enum class Weekday : uint8_t { SUNDAY = 0, MONDAY, TUESDAY, WEDNESDAY, THURSDAY, FRIDAY, SATURDAY };

/// Civil (wall clock) fields of an instant as seen in some zone.
struct CivilDateTime {
  int32_t year;
  uint8_t month;
  uint8_t day;
  uint8_t hour;
  uint8_t minute;
  uint8_t second;
  uint32_t nanosecond;

  DateParameters Date() const { return {year, month, day}; }
  TimeParameters Time() const { return {hour, minute, second, nanosecond}; }

  bool operator==(const CivilDateTime &) const = default;
};

constexpr bool IsInBounds(const auto low, const auto high, const auto value) { return low <= value && value <= high; }

constexpr std::chrono::year_month_day ToChronoYMD(int64_t year, int64_t month, int64_t day) {
  namespace chrono = std::chrono;
  return chrono::year_month_day(chrono::year(static_cast<int>(year)), chrono::month(static_cast<unsigned>(month)),
                                chrono::day(static_cast<unsigned>(day)));
}

// Proleptic Gregorian: every fourth year, except centuries not divisible by 400.
constexpr bool IsLeapYear(int64_t year) { return std::chrono::year(static_cast<int>(year)).is_leap(); }

constexpr uint8_t DaysInMonth(int64_t year, int64_t month) {
  namespace chrono = std::chrono;
  const auto last = chrono::year_month_day_last(chrono::year(static_cast<int>(year)),
                                                chrono::month_day_last(chrono::month(static_cast<unsigned>(month))));
  return static_cast<uint8_t>(static_cast<unsigned>(last.day()));
}

constexpr bool IsValidDate(const DateParameters &date) {
  if (!IsInBounds(kMinYear, kMaxYear, date.year) || !IsInBounds(1, 12, date.month)) {
    return false;
  }
  return IsInBounds(1, 31, date.day) && ToChronoYMD(date.year, date.month, date.day).ok();
}

constexpr bool IsValidTime(const TimeParameters &time) {
  // Leap seconds are not representable; second 60 is rejected.
  return IsInBounds(0, 23, time.hour) && IsInBounds(0, 59, time.minute) && IsInBounds(0, 59, time.second) &&
         IsInBounds(0, kNanosPerSecond - 1, time.nanosecond);
}

// Floor division; the civil day of a negative timestamp starts at or before it.
constexpr int64_t FloorDiv(const int64_t value, const int64_t divisor) {
  const auto quotient = value / divisor;
  return (value % divisor != 0 && value < 0) ? quotient - 1 : quotient;
}

// Day numbers are computed on 400 year eras starting at March 1st, the same way std::chrono does it, but in
// int64 so local dates one day past the supported years of an instant near the bounds do not wrap around.

/// Days between 1970-01-01 and the given (valid) civil date; negative before the epoch.
constexpr int64_t DaysFromCivil(const DateParameters &date) {
  const auto year = date.month <= 2 ? date.year - 1 : date.year;
  const auto era = FloorDiv(year, 400);
  const auto year_of_era = year - era * 400;
  const auto month_from_march = date.month > 2 ? date.month - 3 : date.month + 9;
  const auto day_of_year = (153 * month_from_march + 2) / 5 + date.day - 1;
  const auto day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
  return era * 146'097 + day_of_era - 719'468;
}

/// Inverse of DaysFromCivil.
constexpr DateParameters CivilFromDays(const int64_t days) {
  const auto shifted = days + 719'468;
  const auto era = FloorDiv(shifted, 146'097);
  const auto day_of_era = shifted - era * 146'097;
  const auto year_of_era = (day_of_era - day_of_era / 1'460 + day_of_era / 36'524 - day_of_era / 146'096) / 365;
  const auto day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
  const auto month_from_march = (5 * day_of_year + 2) / 153;
  const auto day = day_of_year - (153 * month_from_march + 2) / 5 + 1;
  const auto month = month_from_march < 10 ? month_from_march + 3 : month_from_march - 9;
  return {year_of_era + era * 400 + (month <= 2 ? 1 : 0), month, day};
}

constexpr int64_t SecondsOfDay(const TimeParameters &time) {
  return time.hour * 3'600 + time.minute * 60 + time.second;
}

/// Seconds since the epoch of the given civil fields, read as if they were UTC.
constexpr int64_t SecondsFromCivil(const DateParameters &date, const TimeParameters &time) {
  return DaysFromCivil(date) * kSecondsPerDay + SecondsOfDay(time);
}

/// Earliest and latest instants, in seconds since the epoch, whose UTC date lies in [kMinYear, kMaxYear].
inline constexpr int64_t kMinTimestamp = DaysFromCivil({kMinYear, 1, 1}) * kSecondsPerDay;
inline constexpr int64_t kMaxTimestamp = (DaysFromCivil({kMaxYear, 12, 31}) + 1) * kSecondsPerDay - 1;

constexpr bool IsValidTimestamp(const int64_t seconds) { return IsInBounds(kMinTimestamp, kMaxTimestamp, seconds); }

/// Local fields of `seconds` read as UTC. Valid for any timestamp within a day of the supported range.
CivilDateTime CivilFromSeconds(int64_t seconds, uint32_t nanosecond);

Weekday WeekdayFromDays(int64_t days);

uint16_t DayOfYear(const DateParameters &date);

/// Moves a date by whole months, clamping the day to the length of the target month.
DateParameters AddMonthsClamped(const DateParameters &date, int64_t months);

std::string_view MonthName(uint8_t month);
std::string_view MonthAbbreviation(uint8_t month);
std::string_view WeekdayName(Weekday weekday);

}  // namespace datetime
