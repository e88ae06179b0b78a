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

#include "datetime/civil.hpp"

#include <algorithm>
#include <array>

#include "utils/logging.hpp"

namespace datetime {
namespace {

using namespace std::string_view_literals;

inline constexpr std::array kMonthNames{"January"sv, "February"sv, "March"sv,     "April"sv,
                                        "May"sv,     "June"sv,     "July"sv,      "August"sv,
                                        "September"sv, "October"sv, "November"sv, "December"sv};

inline constexpr std::array kWeekdayNames{"Sunday"sv,   "Monday"sv, "Tuesday"sv, "Wednesday"sv,
                                          "Thursday"sv, "Friday"sv, "Saturday"sv};

}  // namespace

CivilDateTime CivilFromSeconds(const int64_t seconds, const uint32_t nanosecond) {
  DT_DASSERT(IsInBounds(kMinTimestamp - kSecondsPerDay, kMaxTimestamp + kSecondsPerDay, seconds),
             "Local seconds {} are out of the supported range", seconds);
  const auto days = FloorDiv(seconds, kSecondsPerDay);
  auto seconds_of_day = seconds - days * kSecondsPerDay;
  const auto date = CivilFromDays(days);

  CivilDateTime civil{};
  civil.year = static_cast<int32_t>(date.year);
  civil.month = static_cast<uint8_t>(date.month);
  civil.day = static_cast<uint8_t>(date.day);
  civil.hour = static_cast<uint8_t>(seconds_of_day / 3'600);
  seconds_of_day %= 3'600;
  civil.minute = static_cast<uint8_t>(seconds_of_day / 60);
  civil.second = static_cast<uint8_t>(seconds_of_day % 60);
  civil.nanosecond = nanosecond;
  return civil;
}

Weekday WeekdayFromDays(const int64_t days) {
  namespace chrono = std::chrono;
  return static_cast<Weekday>(chrono::weekday(chrono::sys_days(chrono::days(days))).c_encoding());
}

uint16_t DayOfYear(const DateParameters &date) {
  const auto first_of_year = DaysFromCivil({date.year, 1, 1});
  return static_cast<uint16_t>(DaysFromCivil(date) - first_of_year + 1);
}

DateParameters AddMonthsClamped(const DateParameters &date, const int64_t months) {
  const auto month_index = date.year * 12 + (date.month - 1) + months;
  DateParameters result;
  result.year = FloorDiv(month_index, 12);
  result.month = month_index - result.year * 12 + 1;
  if (IsInBounds(kMinYear, kMaxYear, result.year)) {
    result.day = std::min<int64_t>(date.day, DaysInMonth(result.year, result.month));
  } else {
    // Out of the representable range; leave the day as is and let validation reject the year.
    result.day = date.day;
  }
  return result;
}

std::string_view MonthName(const uint8_t month) {
  DT_ASSERT(IsInBounds(1, 12, month), "Invalid month {}", month);
  return kMonthNames[month - 1];
}

std::string_view MonthAbbreviation(const uint8_t month) { return MonthName(month).substr(0, 3); }

std::string_view WeekdayName(const Weekday weekday) { return kWeekdayNames[static_cast<uint8_t>(weekday)]; }

}  // namespace datetime
