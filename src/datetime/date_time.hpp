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

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "datetime/civil.hpp"
#include "datetime/errors.hpp"
#include "datetime/interval.hpp"
#include "datetime/timezone.hpp"
#include "utils/result.hpp"

namespace datetime {

class DateTime;

using DateTimeResult = utils::BasicResult<DateTimeError, DateTime>;

/// Finest unit needed to represent the sub-second part without loss.
enum class Precision : uint8_t { SECOND, MILLISECOND, MICROSECOND, NANOSECOND };

/// absent | fixed offset | named zone identifier
using ZoneDescriptor = std::variant<std::monostate, std::chrono::seconds, std::string>;

/// Canonical form handed to and accepted from serialization and database adapters.
struct Interchange {
  int64_t seconds{0};
  uint32_t nanos{0};
  ZoneDescriptor zone;

  bool operator==(const Interchange &) const = default;
};

/**
 * @brief Staged construction of a DateTime from civil fields.
 *
 * Obtained from DateTime::FromYmd. Every stage consumes the builder and returns
 * it, so a chain reads `DateTime::FromYmd(2012, 4, 21).WithTime(11, 0, 0).Build()`.
 * A builder kept in a variable must be moved into the next stage. Invalid
 * fields do not throw; the first failure is remembered and returned by Build().
 */
class [[nodiscard]] DateTimeBuilder {
 public:
  DateTimeBuilder WithTime(int64_t hour, int64_t minute, int64_t second, int64_t nanosecond = 0) &&;
  DateTimeBuilder WithNanos(int64_t nanosecond) &&;

  /// The civil fields are read as wall clock time in `zone`.
  DateTimeBuilder WithZone(Timezone zone) &&;
#ifdef DATETIME_WITH_TZ
  /// IANA identifier, looked up in the zone table when the builder is built.
  DateTimeBuilder WithZone(std::string zone_name) &&;
#endif

  DateTimeBuilder WithDisambiguation(Disambiguation policy) &&;

  DateTimeResult Build() &&;

  /// Like Build(), throws temporal::BuildException on failure.
  DateTime BuildOrThrow() &&;

 private:
  friend class DateTime;

  explicit DateTimeBuilder(const DateParameters &date);

  void RecordError(DateTimeErrorKind kind, std::string message);

  DateParameters date_;
  TimeParameters time_;
  std::variant<std::monostate, Timezone, std::string> zone_;
  Disambiguation disambiguation_{Disambiguation::COMPATIBLE};
  std::optional<DateTimeError> error_;
};

/**
 * @brief An instant on the UTC timeline, optionally tagged with a zone.
 *
 * The instant is seconds since the Unix epoch plus nanoseconds. The zone tag
 * only changes how civil fields are derived and rendered: values holding the
 * same instant compare equal and hash identically whatever their zones.
 */
class DateTime {
 public:
  static DateTimeBuilder FromYmd(int64_t year, int64_t month, int64_t day);

  /// Nanoseconds of one second or more are carried into the seconds. Throws
  /// temporal::InvalidArgumentException outside [kMinTimestamp, kMaxTimestamp].
  static DateTime FromTimestamp(int64_t seconds, uint32_t nanos = 0);

  static DateTime Now();

  static DateTimeResult FromInterchange(const Interchange &interchange);

  /// Parses `input` according to a strptime-like `format`; throws on malformed input or invalid fields.
  static DateTime Parse(std::string_view input, std::string_view format);

  /// Accepts the common ISO-8601 layouts and the output of ToString().
  static DateTime FromString(std::string_view input);

  int64_t Timestamp() const { return seconds_; }
  uint32_t Nanosecond() const { return nanos_; }

  int32_t Year() const;
  uint8_t Month() const;
  uint8_t Day() const;
  uint8_t Hour() const;
  uint8_t Minute() const;
  uint8_t Second() const;
  datetime::Weekday DayOfWeek() const;
  uint16_t DayOfYear() const;

  /// All local civil fields at once.
  CivilDateTime Civil() const;

  /// Offset of the zone tag at this instant, zero without a zone.
  std::chrono::seconds Offset() const;

  const std::optional<Timezone> &Zone() const { return zone_; }
  std::string_view TimezoneName() const;
  std::string ZoneAbbreviation() const;

  DateTime InZone(Timezone zone) const { return DateTime{seconds_, nanos_, std::move(zone)}; }
  DateTime ToUtc() const { return DateTime{seconds_, nanos_, std::nullopt}; }

  datetime::Precision GetPrecision() const;
  int64_t AsSeconds() const { return seconds_; }
  int64_t AsMilliseconds() const;
  int64_t AsMicroseconds() const;
  int64_t AsNanoseconds() const;

  // Calendar arithmetic keeps the local time of day and the zone; see AddMonthsClamped for the day.
  DateTimeResult AddDays(int64_t days) const;
  DateTimeResult AddMonths(int64_t months) const;
  DateTimeResult AddYears(int64_t years) const;

  std::string Format(std::string_view pattern) const;
  std::string ToString() const;

  Interchange ToInterchange() const;

  bool operator==(const DateTime &other) const { return seconds_ == other.seconds_ && nanos_ == other.nanos_; }

  std::strong_ordering operator<=>(const DateTime &other) const {
    if (const auto cmp = seconds_ <=> other.seconds_; cmp != 0) {
      return cmp;
    }
    return nanos_ <=> other.nanos_;
  }

  friend std::ostream &operator<<(std::ostream &os, const DateTime &dt) { return os << dt.ToString(); }

  friend DateTime operator+(const DateTime &dt, const TimeInterval &interval);
  friend DateTime operator+(const TimeInterval &interval, const DateTime &dt) { return dt + interval; }
  friend DateTime operator-(const DateTime &dt, const TimeInterval &interval) { return dt + (-interval); }
  friend TimeInterval operator-(const DateTime &lhs, const DateTime &rhs);

  DateTime &operator+=(const TimeInterval &interval) { return *this = *this + interval; }
  DateTime &operator-=(const TimeInterval &interval) { return *this = *this - interval; }

 private:
  friend class DateTimeBuilder;

  DateTime(int64_t seconds, uint32_t nanos, std::optional<Timezone> zone)
      : seconds_{seconds}, nanos_{nanos}, zone_{std::move(zone)} {
    DT_DASSERT(IsValidTimestamp(seconds), "Timestamp {} is out of the supported range", seconds);
  }

  // Offsets are below a day, so this stays within a day of [kMinTimestamp, kMaxTimestamp].
  int64_t LocalSeconds() const { return seconds_ + Offset().count(); }

  DateTimeResult RebuildLocal(const DateParameters &date) const;

  int64_t seconds_;
  uint32_t nanos_;
  std::optional<Timezone> zone_;
};

struct DateTimeHash {
  size_t operator()(const DateTime &dt) const;
};

}  // namespace datetime

namespace std {
template <>
struct hash<datetime::DateTime> {
  size_t operator()(const datetime::DateTime &dt) const { return datetime::DateTimeHash{}(dt); }
};
}  // namespace std

#if FMT_VERSION > 90000
template <>
class fmt::formatter<datetime::DateTime> : public fmt::ostream_formatter {};
template <>
class fmt::formatter<datetime::TimeInterval> : public fmt::ostream_formatter {};
#endif
