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

#include "datetime/parse.hpp"

#include <array>
#include <charconv>

#include "datetime/date_time.hpp"
#include "datetime/errors.hpp"

#ifdef DATETIME_WITH_TZ
#include "tz/zone_table.hpp"
#endif

namespace datetime {
namespace {

constexpr bool IsDigit(const char c) { return c >= '0' && c <= '9'; }

// Reads between `min_digits` and `max_digits` decimal digits, as many as are available.
std::optional<int64_t> ConsumeNumber(std::string_view &input, const size_t min_digits, const size_t max_digits) {
  size_t count = 0;
  while (count < max_digits && count < input.size() && IsDigit(input[count])) {
    ++count;
  }
  if (count < min_digits) {
    return std::nullopt;
  }

  int64_t value{};
  if (const auto [p, ec] = std::from_chars(input.data(), input.data() + count, value);
      ec != std::errc() || p != input.data() + count) {
    return std::nullopt;
  }
  input.remove_prefix(count);
  return value;
}

std::optional<int64_t> ConsumeYear(std::string_view &input) {
  if (!input.empty() && (input.front() == '-' || input.front() == '+')) {
    const auto negative = input.front() == '-';
    input.remove_prefix(1);
    const auto year = ConsumeNumber(input, 4, 5);
    if (!year) {
      return std::nullopt;
    }
    return negative ? -*year : *year;
  }
  return ConsumeNumber(input, 4, 4);
}

// Scales the digits read to nanoseconds: "5" is 500'000'000.
std::optional<int64_t> ConsumeFraction(std::string_view &input, const size_t min_digits, const size_t max_digits) {
  const auto before = input.size();
  auto value = ConsumeNumber(input, min_digits, max_digits);
  if (!value) {
    return std::nullopt;
  }
  for (auto digits = before - input.size(); digits < 9; ++digits) {
    *value *= 10;
  }
  return value;
}

std::optional<std::chrono::seconds> ConsumeOffset(std::string_view &input) {
  if (input.empty()) {
    return std::nullopt;
  }
  if (input.front() == 'Z') {
    input.remove_prefix(1);
    return std::chrono::seconds::zero();
  }
  if (input.front() != '+' && input.front() != '-') {
    return std::nullopt;
  }
  const auto sign = input.front() == '-' ? -1 : 1;
  input.remove_prefix(1);

  const auto hours = ConsumeNumber(input, 2, 2);
  if (!hours || *hours > 23) {
    return std::nullopt;
  }
  // Minutes and then seconds follow, all with a ':' separator or none at all.
  const auto separated = !input.empty() && input.front() == ':';
  int64_t minutes = 0;
  int64_t seconds = 0;
  for (auto *field : {&minutes, &seconds}) {
    if (separated) {
      if (input.empty() || input.front() != ':') {
        break;
      }
      input.remove_prefix(1);
    } else if (input.size() < 2 || !IsDigit(input[0]) || !IsDigit(input[1])) {
      break;
    }
    const auto parsed = ConsumeNumber(input, 2, 2);
    if (!parsed || *parsed > 59) {
      return std::nullopt;
    }
    *field = *parsed;
  }
  return std::chrono::seconds{sign * (*hours * 3'600 + minutes * 60 + seconds)};
}

bool ConsumeFormat(std::string_view &input, std::string_view format, ParsedDateTime &parsed) {
  for (size_t i = 0; i < format.size(); ++i) {
    if (format[i] != '%') {
      if (input.empty() || input.front() != format[i]) {
        return false;
      }
      input.remove_prefix(1);
      continue;
    }

    ++i;
    bool dot = false;
    size_t digits = 0;
    if (i < format.size() && format[i] == '.') {
      dot = true;
      ++i;
    }
    if (i < format.size() && (format[i] == '3' || format[i] == '6' || format[i] == '9')) {
      digits = static_cast<size_t>(format[i] - '0');
      ++i;
    }
    if (i == format.size()) {
      throw temporal::InvalidArgumentException("Format string '{}' ends with an incomplete specifier.", format);
    }
    const auto spec = format[i];
    if ((dot || digits != 0) && spec != 'f') {
      throw temporal::InvalidArgumentException("Precision modifiers are only allowed with %f, got '%{}' in '{}'.",
                                               spec, format);
    }

    std::optional<int64_t> value;
    switch (spec) {
      case 'Y':
        if (!(value = ConsumeYear(input))) return false;
        parsed.date.year = *value;
        break;
      case 'm':
        if (!(value = ConsumeNumber(input, 2, 2))) return false;
        parsed.date.month = *value;
        break;
      case 'd':
        if (!(value = ConsumeNumber(input, 2, 2))) return false;
        parsed.date.day = *value;
        break;
      case 'H':
        if (!(value = ConsumeNumber(input, 2, 2))) return false;
        parsed.time.hour = *value;
        break;
      case 'M':
        if (!(value = ConsumeNumber(input, 2, 2))) return false;
        parsed.time.minute = *value;
        break;
      case 'S':
        if (!(value = ConsumeNumber(input, 2, 2))) return false;
        parsed.time.second = *value;
        break;
      case 'f': {
        if (dot) {
          // The whole fraction, dot included, may be absent.
          if (input.empty() || input.front() != '.') {
            parsed.time.nanosecond = 0;
            break;
          }
          input.remove_prefix(1);
        }
        const auto min_digits = digits == 0 ? 1 : digits;
        const auto max_digits = digits == 0 ? 9 : digits;
        if (!(value = ConsumeFraction(input, min_digits, max_digits))) return false;
        parsed.time.nanosecond = *value;
        break;
      }
      case 'z': {
        const auto offset = ConsumeOffset(input);
        if (!offset) return false;
        parsed.offset = offset;
        break;
      }
      case 'F':
        if (!ConsumeFormat(input, "%Y-%m-%d", parsed)) return false;
        break;
      case 'T':
        if (!ConsumeFormat(input, "%H:%M:%S", parsed)) return false;
        break;
      case '%':
        if (input.empty() || input.front() != '%') return false;
        input.remove_prefix(1);
        break;
      default:
        throw temporal::InvalidArgumentException("Invalid parse specifier '%{}' in '{}'.", spec, format);
    }
  }
  return true;
}

// Tried in order by DateTime::FromString.
constexpr std::array kStringFormats{
    std::string_view{"%Y-%m-%dT%H:%M:%S%.f%z"}, std::string_view{"%Y-%m-%dT%H:%M:%S%.f"},
    std::string_view{"%Y-%m-%d %H:%M:%S%.f%z"}, std::string_view{"%Y-%m-%d %H:%M:%S%.f"},
    std::string_view{"%Y-%m-%d %H:%M:%S%.f %z"}, std::string_view{"%Y-%m-%dT%H:%M%z"},
    std::string_view{"%Y-%m-%dT%H:%M"},          std::string_view{"%Y-%m-%d"},
};

inline constexpr auto *kSupportedDateTimeFormatsHelpMessage = R"help(
String representing the date time should be in one of the following formats:

- YYYY-MM-DDThh:mm:ss[.f][zone]
- YYYY-MM-DD hh:mm:ss[.f][zone]
- YYYY-MM-DDThh:mm[zone]
- YYYY-MM-DD

zone is one of:

- Z
- +hh, +hhmm, +hhmmss, +hh:mm or +hh:mm:ss
- any of the above followed by [Area/City] naming a time zone

f holds between one and nine fractional digits.)help";

DateTime FromParsed(const ParsedDateTime &parsed) {
  auto builder = DateTime::FromYmd(parsed.date.year, parsed.date.month, parsed.date.day)
                     .WithTime(parsed.time.hour, parsed.time.minute, parsed.time.second, parsed.time.nanosecond);
  if (parsed.offset) {
    builder = std::move(builder).WithZone(Timezone{*parsed.offset});
  }
  if (!parsed.zone_name) {
    return std::move(builder).BuildOrThrow();
  }

#ifdef DATETIME_WITH_TZ
  if (!parsed.offset) {
    return std::move(builder).WithZone(*parsed.zone_name).BuildOrThrow();
  }
  // The offset fixes the instant, the name only tags it.
  auto rules = tz::LocateZone(*parsed.zone_name);
  if (!rules) {
    throw temporal::BuildException(
        DateTimeError{DateTimeErrorKind::UNKNOWN_ZONE, fmt::format("Time zone not found: {}", *parsed.zone_name)});
  }
  return std::move(builder).BuildOrThrow().InZone(Timezone{std::move(rules)});
#else
  throw temporal::BuildException(DateTimeError{
      DateTimeErrorKind::UNKNOWN_ZONE,
      fmt::format("Time zone {} requested, but named time zones are not supported by this build", *parsed.zone_name)});
#endif
}

}  // namespace

std::optional<ParsedDateTime> TryParseDateTime(std::string_view input, const std::string_view format) {
  ParsedDateTime parsed;
  if (!ConsumeFormat(input, format, parsed) || !input.empty()) {
    return std::nullopt;
  }
  return parsed;
}

ParsedDateTime ParseDateTime(const std::string_view input, const std::string_view format) {
  auto parsed = TryParseDateTime(input, format);
  if (!parsed) {
    throw temporal::InvalidArgumentException("String '{}' does not match the format '{}'.", input, format);
  }
  return std::move(*parsed);
}

DateTime DateTime::Parse(const std::string_view input, const std::string_view format) {
  return FromParsed(ParseDateTime(input, format));
}

DateTime DateTime::FromString(std::string_view input) {
  std::optional<std::string> zone_name;
  if (input.ends_with(']')) {
    const auto open = input.rfind('[');
    if (open == std::string_view::npos || open + 2 == input.size()) {
      throw temporal::InvalidArgumentException("Invalid time zone suffix in '{}'. {}", input,
                                               kSupportedDateTimeFormatsHelpMessage);
    }
    zone_name.emplace(input.substr(open + 1, input.size() - open - 2));
    input = input.substr(0, open);
  }

  for (const auto format : kStringFormats) {
    if (auto parsed = TryParseDateTime(input, format)) {
      parsed->zone_name = std::move(zone_name);
      return FromParsed(*parsed);
    }
  }
  throw temporal::InvalidArgumentException("Invalid string for DateTime. {}", kSupportedDateTimeFormatsHelpMessage);
}

}  // namespace datetime
