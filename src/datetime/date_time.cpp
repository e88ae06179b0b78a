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

#include "datetime/date_time.hpp"

#include <chrono>
#include <cstdlib>

#include "utils/fnv.hpp"
#include "utils/logging.hpp"

#ifdef DATETIME_WITH_TZ
#include "tz/zone_table.hpp"
#endif

namespace datetime {
namespace {

std::chrono::sys_seconds ToSysSeconds(const int64_t seconds) {
  return std::chrono::sys_seconds{std::chrono::seconds{seconds}};
}

DateTimeError OutOfRangeError(const int64_t seconds) {
  return DateTimeError{DateTimeErrorKind::INVALID_DATE,
                       fmt::format("Timestamp {} is outside the supported range. The value should be an integer "
                                   "between {} and {}.",
                                   seconds, kMinTimestamp, kMaxTimestamp)};
}

std::string_view ToString(const LocalInfo::Kind kind) {
  switch (kind) {
    case LocalInfo::Kind::UNIQUE:
      return "unique";
    case LocalInfo::Kind::AMBIGUOUS:
      return "ambiguous";
    case LocalInfo::Kind::NONEXISTENT:
      return "nonexistent";
  }
  DT_LOG_FATAL("ToString of a LocalInfo::Kind -> check missing switch case");
}

}  // namespace

std::string_view ToString(const DateTimeErrorKind kind) {
  switch (kind) {
    case DateTimeErrorKind::INVALID_DATE:
      return "InvalidDate";
    case DateTimeErrorKind::INVALID_TIME:
      return "InvalidTime";
    case DateTimeErrorKind::UNKNOWN_ZONE:
      return "UnknownZone";
    case DateTimeErrorKind::AMBIGUOUS_OR_INVALID_LOCAL_TIME:
      return "AmbiguousOrInvalidLocalTime";
  }
  DT_LOG_FATAL("ToString of a DateTimeErrorKind -> check missing switch case");
}

DateTimeBuilder::DateTimeBuilder(const DateParameters &date) : date_{date} {
  if (!IsInBounds(kMinYear, kMaxYear, date.year)) {
    RecordError(DateTimeErrorKind::INVALID_DATE,
                fmt::format("Creating a DateTime with invalid year parameter {}. The value should be an integer "
                            "between {} and {}.",
                            date.year, kMinYear, kMaxYear));
  } else if (!IsInBounds(1, 12, date.month)) {
    RecordError(DateTimeErrorKind::INVALID_DATE,
                fmt::format("Creating a DateTime with invalid month parameter {}. The value should be an integer "
                            "between 1 and 12.",
                            date.month));
  } else if (!IsValidDate(date)) {
    RecordError(DateTimeErrorKind::INVALID_DATE,
                fmt::format("Creating a DateTime with invalid day parameter {}. The value should be an integer "
                            "between 1 and {} for {:0>4}-{:0>2}.",
                            date.day, DaysInMonth(date.year, date.month), date.year, date.month));
  }
}

void DateTimeBuilder::RecordError(const DateTimeErrorKind kind, std::string message) {
  if (!error_) {
    error_.emplace(DateTimeError{kind, std::move(message)});
  }
}

DateTimeBuilder DateTimeBuilder::WithTime(const int64_t hour, const int64_t minute, const int64_t second,
                                          const int64_t nanosecond) && {
  const TimeParameters time{hour, minute, second, nanosecond};
  if (!IsInBounds(0, 23, hour)) {
    RecordError(DateTimeErrorKind::INVALID_TIME,
                fmt::format("Creating a DateTime with invalid hour parameter {}. The value should be an integer "
                            "between 0 and 23.",
                            hour));
  } else if (!IsInBounds(0, 59, minute)) {
    RecordError(DateTimeErrorKind::INVALID_TIME,
                fmt::format("Creating a DateTime with invalid minute parameter {}. The value should be an integer "
                            "between 0 and 59.",
                            minute));
  } else if (!IsInBounds(0, 59, second)) {
    // Leap seconds are not supported.
    RecordError(DateTimeErrorKind::INVALID_TIME,
                fmt::format("Creating a DateTime with invalid second parameter {}. The value should be an integer "
                            "between 0 and 59.",
                            second));
  } else if (!IsValidTime(time)) {
    RecordError(DateTimeErrorKind::INVALID_TIME,
                fmt::format("Creating a DateTime with invalid nanosecond parameter {}. The value should be an "
                            "integer between 0 and 999999999.",
                            nanosecond));
  } else {
    time_ = time;
  }
  return std::move(*this);
}

DateTimeBuilder DateTimeBuilder::WithNanos(const int64_t nanosecond) && {
  if (!IsInBounds(0, kNanosPerSecond - 1, nanosecond)) {
    RecordError(DateTimeErrorKind::INVALID_TIME,
                fmt::format("Creating a DateTime with invalid nanosecond parameter {}. The value should be an "
                            "integer between 0 and 999999999.",
                            nanosecond));
  } else {
    time_.nanosecond = nanosecond;
  }
  return std::move(*this);
}

DateTimeBuilder DateTimeBuilder::WithZone(Timezone zone) && {
  zone_ = std::move(zone);
  return std::move(*this);
}

#ifdef DATETIME_WITH_TZ
DateTimeBuilder DateTimeBuilder::WithZone(std::string zone_name) && {
  zone_ = std::move(zone_name);
  return std::move(*this);
}
#endif

DateTimeBuilder DateTimeBuilder::WithDisambiguation(const Disambiguation policy) && {
  disambiguation_ = policy;
  return std::move(*this);
}

DateTimeResult DateTimeBuilder::Build() && {
  if (error_) {
    spdlog::trace("DateTime construction failed: {}", error_->message);
    return std::move(*error_);
  }

  const auto local = std::chrono::local_seconds{std::chrono::seconds{SecondsFromCivil(date_, time_)}};
  const auto nanos = static_cast<uint32_t>(time_.nanosecond);

  std::optional<Timezone> zone;
  if (auto *requested = std::get_if<Timezone>(&zone_)) {
    zone.emplace(std::move(*requested));
  }
#ifdef DATETIME_WITH_TZ
  else if (auto *zone_name = std::get_if<std::string>(&zone_)) {
    auto rules = tz::LocateZone(*zone_name);
    if (!rules) {
      return DateTimeError{DateTimeErrorKind::UNKNOWN_ZONE, fmt::format("Time zone not found: {}", *zone_name)};
    }
    zone.emplace(std::move(rules));
  }
#endif

  if (!zone) {
    if (!IsValidTimestamp(local.time_since_epoch().count())) {
      return OutOfRangeError(local.time_since_epoch().count());
    }
    return DateTime{local.time_since_epoch().count(), nanos, std::nullopt};
  }

  const auto instant = zone->ToSys(local, disambiguation_);
  if (!instant) {
    const auto kind = zone->GetLocalInfo(local).kind;
    return DateTimeError{DateTimeErrorKind::AMBIGUOUS_OR_INVALID_LOCAL_TIME,
                         fmt::format("Local time {:0>4}-{:0>2}-{:0>2}T{:0>2}:{:0>2}:{:0>2} is {} in {}", date_.year,
                                     date_.month, date_.day, time_.hour, time_.minute, time_.second, ToString(kind),
                                     zone->TimezoneName())};
  }
  if (!IsValidTimestamp(instant->time_since_epoch().count())) {
    return OutOfRangeError(instant->time_since_epoch().count());
  }
  return DateTime{instant->time_since_epoch().count(), nanos, std::move(zone)};
}

DateTime DateTimeBuilder::BuildOrThrow() && {
  auto result = std::move(*this).Build();
  if (result.HasError()) {
    throw temporal::BuildException(result.GetError());
  }
  return std::move(result).GetValue();
}

DateTimeBuilder DateTime::FromYmd(const int64_t year, const int64_t month, const int64_t day) {
  return DateTimeBuilder{DateParameters{year, month, day}};
}

DateTime DateTime::FromTimestamp(const int64_t seconds, const uint32_t nanos) {
  const auto normalized = CheckedAdd(seconds, nanos / kNanosPerSecond);
  if (!IsValidTimestamp(normalized)) {
    throw temporal::InvalidArgumentException(OutOfRangeError(normalized).message);
  }
  return DateTime{normalized, static_cast<uint32_t>(nanos % kNanosPerSecond), std::nullopt};
}

DateTime DateTime::Now() {
  namespace chrono = std::chrono;
  const auto since_epoch = chrono::duration_cast<chrono::nanoseconds>(chrono::system_clock::now().time_since_epoch());
  const auto seconds = chrono::floor<chrono::seconds>(since_epoch);
  return FromTimestamp(seconds.count(), static_cast<uint32_t>((since_epoch - seconds).count()));
}

DateTimeResult DateTime::FromInterchange(const Interchange &interchange) {
  if (interchange.nanos >= kNanosPerSecond) {
    return DateTimeError{DateTimeErrorKind::INVALID_TIME,
                         fmt::format("Sub-second part {} is out of range. The value should be an integer between 0 "
                                     "and 999999999.",
                                     interchange.nanos)};
  }
  if (!IsValidTimestamp(interchange.seconds)) {
    return OutOfRangeError(interchange.seconds);
  }

  if (const auto *offset = std::get_if<std::chrono::seconds>(&interchange.zone)) {
    if (*offset <= -std::chrono::hours{24} || *offset >= std::chrono::hours{24}) {
      return DateTimeError{DateTimeErrorKind::UNKNOWN_ZONE,
                           fmt::format("Fixed offset of {} seconds is out of range.", offset->count())};
    }
    return DateTime{interchange.seconds, interchange.nanos, Timezone{*offset}};
  }

  if (const auto *zone_name = std::get_if<std::string>(&interchange.zone)) {
#ifdef DATETIME_WITH_TZ
    auto rules = tz::LocateZone(*zone_name);
    if (!rules) {
      return DateTimeError{DateTimeErrorKind::UNKNOWN_ZONE, fmt::format("Time zone not found: {}", *zone_name)};
    }
    return DateTime{interchange.seconds, interchange.nanos, Timezone{std::move(rules)}};
#else
    return DateTimeError{DateTimeErrorKind::UNKNOWN_ZONE,
                         fmt::format("Time zone {} requested, but named time zones are not supported by this build",
                                     *zone_name)};
#endif
  }

  return DateTime{interchange.seconds, interchange.nanos, std::nullopt};
}

CivilDateTime DateTime::Civil() const { return CivilFromSeconds(LocalSeconds(), nanos_); }

int32_t DateTime::Year() const { return Civil().year; }

uint8_t DateTime::Month() const { return Civil().month; }

uint8_t DateTime::Day() const { return Civil().day; }

uint8_t DateTime::Hour() const { return Civil().hour; }

uint8_t DateTime::Minute() const { return Civil().minute; }

uint8_t DateTime::Second() const { return Civil().second; }

Weekday DateTime::DayOfWeek() const { return WeekdayFromDays(DaysFromCivil(Civil().Date())); }

uint16_t DateTime::DayOfYear() const { return datetime::DayOfYear(Civil().Date()); }

std::chrono::seconds DateTime::Offset() const {
  if (!zone_) {
    return std::chrono::seconds::zero();
  }
  return zone_->OffsetAt(ToSysSeconds(seconds_));
}

std::string_view DateTime::TimezoneName() const { return zone_ ? zone_->TimezoneName() : std::string_view{}; }

std::string DateTime::ZoneAbbreviation() const {
  return zone_ ? zone_->Abbreviation(ToSysSeconds(seconds_)) : std::string{"UTC"};
}

Precision DateTime::GetPrecision() const {
  if (nanos_ == 0) {
    return Precision::SECOND;
  }
  if (nanos_ % 1'000'000 == 0) {
    return Precision::MILLISECOND;
  }
  if (nanos_ % 1'000 == 0) {
    return Precision::MICROSECOND;
  }
  return Precision::NANOSECOND;
}

int64_t DateTime::AsMilliseconds() const { return TimeInterval(seconds_, nanos_).AsMilliseconds(); }

int64_t DateTime::AsMicroseconds() const { return TimeInterval(seconds_, nanos_).AsMicroseconds(); }

int64_t DateTime::AsNanoseconds() const { return TimeInterval(seconds_, nanos_).AsNanoseconds(); }

DateTimeResult DateTime::RebuildLocal(const DateParameters &date) const {
  const auto civil = Civil();
  auto builder = FromYmd(date.year, date.month, date.day).WithTime(civil.hour, civil.minute, civil.second, nanos_);
  if (zone_) {
    builder = std::move(builder).WithZone(*zone_);
  }
  return std::move(builder).Build();
}

DateTimeResult DateTime::AddDays(const int64_t days) const {
  static constexpr auto kMinDays = DaysFromCivil({kMinYear, 1, 1});
  static constexpr auto kMaxDays = DaysFromCivil({kMaxYear, 12, 31});
  const auto current = DaysFromCivil(Civil().Date());
  if (days < kMinDays - current || days > kMaxDays - current) {
    return DateTimeError{DateTimeErrorKind::INVALID_DATE,
                         fmt::format("Adding {} days leaves the supported range of years.", days)};
  }
  return RebuildLocal(CivilFromDays(current + days));
}

DateTimeResult DateTime::AddMonths(const int64_t months) const {
  static constexpr auto kMonthsInRange = (kMaxYear - kMinYear + 1) * 12;
  if (std::llabs(months) > kMonthsInRange) {
    return DateTimeError{DateTimeErrorKind::INVALID_DATE,
                         fmt::format("Adding {} months leaves the supported range of years.", months)};
  }
  // Builder validation rejects a target year outside the supported range.
  return RebuildLocal(AddMonthsClamped(Civil().Date(), months));
}

DateTimeResult DateTime::AddYears(const int64_t years) const {
  if (std::llabs(years) > kMaxYear - kMinYear + 1) {
    return DateTimeError{DateTimeErrorKind::INVALID_DATE,
                         fmt::format("Adding {} years leaves the supported range of years.", years)};
  }
  return AddMonths(years * 12);
}

Interchange DateTime::ToInterchange() const {
  Interchange interchange{seconds_, nanos_, std::monostate{}};
  if (zone_) {
    if (zone_->IsFixed()) {
      interchange.zone = Offset();
    } else {
      interchange.zone = std::string{zone_->TimezoneName()};
    }
  }
  return interchange;
}

DateTime operator+(const DateTime &dt, const TimeInterval &interval) {
  const auto result = TimeInterval(dt.seconds_, dt.nanos_) + interval;
  if (!IsValidTimestamp(result.Seconds())) {
    throw temporal::InvalidArgumentException(OutOfRangeError(result.Seconds()).message);
  }
  return DateTime{result.Seconds(), result.Nanoseconds(), dt.zone_};
}

TimeInterval operator-(const DateTime &lhs, const DateTime &rhs) {
  return TimeInterval(lhs.seconds_, lhs.nanos_) - TimeInterval(rhs.seconds_, rhs.nanos_);
}

size_t DateTimeHash::operator()(const DateTime &dt) const {
  return utils::HashCombine<int64_t, uint32_t>{}(dt.Timestamp(), dt.Nanosecond());
}

}  // namespace datetime
