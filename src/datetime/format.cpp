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

#include <iterator>
#include <string>

#include <fmt/format.h>

#include "datetime/date_time.hpp"

namespace datetime {
namespace {

enum class Padding : uint8_t { ZERO, SPACE, NONE };

void AppendNumber(std::string &out, const int64_t value, const int width, const Padding padding) {
  switch (padding) {
    case Padding::ZERO:
      fmt::format_to(std::back_inserter(out), "{:0{}}", value, width);
      return;
    case Padding::SPACE:
      fmt::format_to(std::back_inserter(out), "{:>{}}", value, width);
      return;
    case Padding::NONE:
      fmt::format_to(std::back_inserter(out), "{}", value);
      return;
  }
}

std::string FormatYear(const int32_t year) {
  // ISO 8601 expanded years carry an explicit sign.
  if (year < 0) {
    return fmt::format("{:05}", year);
  }
  return year > 9999 ? fmt::format("+{}", year) : fmt::format("{:04}", year);
}

uint8_t TwelveHourClock(const uint8_t hour) {
  if (hour == 0) {
    return 12;
  }
  return hour > 12 ? hour - 12 : hour;
}

// Digits of the sub-second part; 0 selects the precision of the value.
void AppendFraction(std::string &out, const uint32_t nanos, const int digits) {
  switch (digits) {
    case 3:
      fmt::format_to(std::back_inserter(out), "{:03}", nanos / 1'000'000);
      return;
    case 6:
      fmt::format_to(std::back_inserter(out), "{:06}", nanos / 1'000);
      return;
    default:
      fmt::format_to(std::back_inserter(out), "{:09}", nanos);
      return;
  }
}

}  // namespace

std::string DateTime::Format(const std::string_view pattern) const {
  const auto civil = Civil();
  const auto weekday = DayOfWeek();
  std::string out;
  out.reserve(pattern.size() * 2);

  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] != '%') {
      out.push_back(pattern[i]);
      continue;
    }

    auto padding = Padding::ZERO;
    bool explicit_padding = false;
    bool dot = false;
    int digits = 0;
    ++i;
    for (; i < pattern.size(); ++i) {
      const auto modifier = pattern[i];
      if (modifier == '0') {
        padding = Padding::ZERO;
      } else if (modifier == '-') {
        padding = Padding::NONE;
      } else if (modifier == '_') {
        padding = Padding::SPACE;
      } else if (modifier == '.') {
        dot = true;
        continue;
      } else if (modifier == '3' || modifier == '6' || modifier == '9') {
        digits = modifier - '0';
        continue;
      } else {
        break;
      }
      explicit_padding = true;
    }
    if (i == pattern.size()) {
      throw temporal::InvalidArgumentException("Format string '{}' ends with an incomplete specifier.", pattern);
    }

    const auto spec = pattern[i];
    if ((dot || digits != 0) && spec != 'f') {
      throw temporal::InvalidArgumentException("Precision modifiers are only allowed with %f, got '%{}' in '{}'.",
                                               spec, pattern);
    }

    switch (spec) {
      case 'Y':
        if (explicit_padding && padding == Padding::ZERO && civil.year < 0) {
          // The sign does not count towards the four digits.
          out.push_back('-');
          AppendNumber(out, -static_cast<int64_t>(civil.year), 4, padding);
        } else if (explicit_padding) {
          AppendNumber(out, civil.year, 4, padding);
        } else {
          out += FormatYear(civil.year);
        }
        break;
      case 'C':
        AppendNumber(out, civil.year / 100, 2, padding);
        break;
      case 'y':
        AppendNumber(out, ((civil.year % 100) + 100) % 100, 2, padding);
        break;
      case 'm':
        AppendNumber(out, civil.month, 2, padding);
        break;
      case 'b':
      case 'h':
        out += MonthAbbreviation(civil.month);
        break;
      case 'B':
        out += MonthName(civil.month);
        break;
      case 'd':
        AppendNumber(out, civil.day, 2, padding);
        break;
      case 'e':
        AppendNumber(out, civil.day, 2, explicit_padding ? padding : Padding::SPACE);
        break;
      case 'a':
        out += WeekdayName(weekday).substr(0, 3);
        break;
      case 'A':
        out += WeekdayName(weekday);
        break;
      case 'w':
        AppendNumber(out, static_cast<int64_t>(weekday), 1, Padding::NONE);
        break;
      case 'u':
        AppendNumber(out, weekday == Weekday::SUNDAY ? 7 : static_cast<int64_t>(weekday), 1, Padding::NONE);
        break;
      case 'j':
        AppendNumber(out, datetime::DayOfYear(civil.Date()), 3, padding);
        break;
      case 'H':
        AppendNumber(out, civil.hour, 2, padding);
        break;
      case 'I':
        AppendNumber(out, TwelveHourClock(civil.hour), 2, padding);
        break;
      case 'M':
        AppendNumber(out, civil.minute, 2, padding);
        break;
      case 'S':
        AppendNumber(out, civil.second, 2, padding);
        break;
      case 'P':
        out += civil.hour >= 12 ? "PM" : "AM";
        break;
      case 'p':
        out += civil.hour >= 12 ? "pm" : "am";
        break;
      case 'f':
        if (dot) {
          out.push_back('.');
        }
        AppendFraction(out, nanos_, digits);
        break;
      case 's':
        AppendNumber(out, seconds_, 1, Padding::NONE);
        break;
      case 'z':
        out += FormatOffset(Offset(), false);
        break;
      case 'Z':
        out += ZoneAbbreviation();
        break;
      case 'D':
        fmt::format_to(std::back_inserter(out), "{:02}/{:02}/{:02}", civil.month, civil.day,
                       ((civil.year % 100) + 100) % 100);
        break;
      case 'F':
        fmt::format_to(std::back_inserter(out), "{}-{:02}-{:02}", FormatYear(civil.year), civil.month, civil.day);
        break;
      case 'v':
        fmt::format_to(std::back_inserter(out), "{:>2}-{}-{}", civil.day, MonthAbbreviation(civil.month),
                       FormatYear(civil.year));
        break;
      case 'R':
        fmt::format_to(std::back_inserter(out), "{:02}:{:02}", civil.hour, civil.minute);
        break;
      case 'T':
        fmt::format_to(std::back_inserter(out), "{:02}:{:02}:{:02}", civil.hour, civil.minute, civil.second);
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case '%':
        out.push_back('%');
        break;
      default:
        throw temporal::InvalidArgumentException("Invalid format specifier '%{}' in '{}'.", spec, pattern);
    }
  }
  return out;
}

std::string DateTime::ToString() const {
  const auto civil = Civil();
  auto result = fmt::format("{}-{:02}-{:02}T{:02}:{:02}:{:02}", FormatYear(civil.year), civil.month, civil.day,
                            civil.hour, civil.minute, civil.second);
  switch (GetPrecision()) {
    case Precision::SECOND:
      break;
    case Precision::MILLISECOND:
    case Precision::MICROSECOND:
      fmt::format_to(std::back_inserter(result), ".{:06}", nanos_ / 1'000);
      break;
    case Precision::NANOSECOND:
      fmt::format_to(std::back_inserter(result), ".{:09}", nanos_);
      break;
  }
  if (zone_) {
    result += FormatOffset(Offset());
    if (!zone_->IsFixed()) {
      fmt::format_to(std::back_inserter(result), "[{}]", zone_->TimezoneName());
    }
  }
  return result;
}

}  // namespace datetime
