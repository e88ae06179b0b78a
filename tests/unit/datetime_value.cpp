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

#include <algorithm>
#include <chrono>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "datetime/date_time.hpp"
#include "fake_zone_rules.hpp"

using namespace datetime;

TEST(DateTimeTest, EqualityIgnoresZone) {
  const auto utc = DateTime::FromYmd(2024, 7, 4).WithTime(15, 30, 45).BuildOrThrow();
  const auto same_instant_elsewhere = DateTime::FromYmd(2024, 7, 4)
                                          .WithTime(11, 30, 45)
                                          .WithZone(Timezone{std::chrono::hours{-4}})
                                          .BuildOrThrow();
  const auto in_fake_zagreb = utc.InZone(FakeZagreb());

  EXPECT_EQ(utc, same_instant_elsewhere);
  EXPECT_EQ(utc, in_fake_zagreb);
  EXPECT_EQ(utc.Timestamp(), same_instant_elsewhere.Timestamp());
  EXPECT_EQ(DateTimeHash{}(utc), DateTimeHash{}(same_instant_elsewhere));
  EXPECT_EQ(std::hash<DateTime>{}(utc), std::hash<DateTime>{}(in_fake_zagreb));

  EXPECT_EQ(in_fake_zagreb.Hour(), 17);
  EXPECT_EQ(same_instant_elsewhere.Hour(), 11);
  EXPECT_EQ(in_fake_zagreb.ToUtc().Hour(), 15);
  EXPECT_FALSE(in_fake_zagreb.ToUtc().Zone());

  const std::unordered_set<DateTime> instants{utc, same_instant_elsewhere, in_fake_zagreb};
  EXPECT_EQ(instants.size(), 1);
}

TEST(DateTimeTest, TotalOrder) {
  std::vector<DateTime> values{
      DateTime::FromTimestamp(10, 5),
      DateTime::FromTimestamp(-1, 999'999'999),
      DateTime::FromTimestamp(10, 4).InZone(FakeZagreb()),
      DateTime::FromTimestamp(0),
      DateTime::FromTimestamp(-1).InZone(Timezone{std::chrono::hours{5}}),
  };
  std::sort(values.begin(), values.end());
  for (size_t i = 1; i < values.size(); ++i) {
    const auto &lhs = values[i - 1];
    const auto &rhs = values[i];
    EXPECT_LT(lhs, rhs);
    EXPECT_TRUE(lhs.Timestamp() < rhs.Timestamp() ||
                (lhs.Timestamp() == rhs.Timestamp() && lhs.Nanosecond() < rhs.Nanosecond()));
  }
  EXPECT_EQ(values.front().Timestamp(), -1);
  EXPECT_EQ(values.front().Nanosecond(), 0);
  EXPECT_EQ(DateTime::FromTimestamp(5) <=> DateTime::FromTimestamp(5).InZone(FakeZagreb()),
            std::strong_ordering::equal);
}

TEST(DateTimeTest, Accessors) {
  const auto dt = DateTime::FromYmd(2012, 4, 21).WithTime(11, 5, 7, 8).BuildOrThrow();
  EXPECT_EQ(dt.Year(), 2012);
  EXPECT_EQ(dt.Month(), 4);
  EXPECT_EQ(dt.Day(), 21);
  EXPECT_EQ(dt.Hour(), 11);
  EXPECT_EQ(dt.Minute(), 5);
  EXPECT_EQ(dt.Second(), 7);
  EXPECT_EQ(dt.Nanosecond(), 8);
  EXPECT_EQ(dt.DayOfWeek(), Weekday::SATURDAY);
  EXPECT_EQ(dt.DayOfYear(), 112);
  EXPECT_EQ(dt.ZoneAbbreviation(), "UTC");
  EXPECT_TRUE(dt.TimezoneName().empty());

  const auto before_epoch = DateTime::FromTimestamp(-1);
  EXPECT_EQ(before_epoch.Year(), 1969);
  EXPECT_EQ(before_epoch.Month(), 12);
  EXPECT_EQ(before_epoch.Day(), 31);
  EXPECT_EQ(before_epoch.Second(), 59);
  EXPECT_EQ(before_epoch.DayOfWeek(), Weekday::WEDNESDAY);
}

TEST(DateTimeTest, FromTimestampCarriesNanoseconds) {
  const auto dt = DateTime::FromTimestamp(5, 2'500'000'000);
  EXPECT_EQ(dt.Timestamp(), 7);
  EXPECT_EQ(dt.Nanosecond(), 500'000'000);
}

TEST(DateTimeTest, Precision) {
  EXPECT_EQ(DateTime::FromTimestamp(1).GetPrecision(), Precision::SECOND);
  EXPECT_EQ(DateTime::FromTimestamp(1, 500'000'000).GetPrecision(), Precision::MILLISECOND);
  EXPECT_EQ(DateTime::FromTimestamp(1, 123'456'000).GetPrecision(), Precision::MICROSECOND);
  EXPECT_EQ(DateTime::FromTimestamp(1, 123'456'789).GetPrecision(), Precision::NANOSECOND);

  const auto dt = DateTime::FromTimestamp(-3, 600'000'000);
  EXPECT_EQ(dt.AsSeconds(), -3);
  EXPECT_EQ(dt.AsMilliseconds(), -2'400);
  EXPECT_EQ(dt.AsMicroseconds(), -2'400'000);
  EXPECT_EQ(dt.AsNanoseconds(), -2'400'000'000);
}

TEST(DateTimeTest, IntervalArithmetic) {
  const auto start = DateTime::FromYmd(2024, 12, 31).WithTime(23, 59, 59, 500'000'000).BuildOrThrow();
  const auto next = start + TimeInterval::FromMilliseconds(700);
  EXPECT_EQ(next.Year(), 2025);
  EXPECT_EQ(next.Month(), 1);
  EXPECT_EQ(next.Day(), 1);
  EXPECT_EQ(next.Second(), 0);
  EXPECT_EQ(next.Nanosecond(), 200'000'000);

  EXPECT_EQ(next - start, TimeInterval::FromMilliseconds(700));
  EXPECT_EQ(start - next, TimeInterval::FromMilliseconds(-700));
  EXPECT_EQ(next - TimeInterval::FromMilliseconds(700), start);
  EXPECT_EQ(TimeInterval::FromMilliseconds(700) + start, next);

  auto moving = start.InZone(FakeZagreb());
  moving += TimeInterval(3'600, 0);
  EXPECT_EQ(moving.Zone(), FakeZagreb());
  moving -= TimeInterval(3'600, 0);
  EXPECT_EQ(moving, start);

  EXPECT_THROW(DateTime::FromTimestamp(kMaxTimestamp) + TimeInterval(1, 0), temporal::InvalidArgumentException);
  EXPECT_THROW(DateTime::FromTimestamp(kMinTimestamp) - TimeInterval(0, 1), temporal::InvalidArgumentException);
}

TEST(DateTimeTest, TimestampRange) {
  EXPECT_THROW(DateTime::FromTimestamp(std::numeric_limits<int64_t>::max()), temporal::InvalidArgumentException);
  EXPECT_THROW(DateTime::FromTimestamp(std::numeric_limits<int64_t>::max() / 2), temporal::InvalidArgumentException);
  EXPECT_THROW(DateTime::FromTimestamp(std::numeric_limits<int64_t>::min()), temporal::InvalidArgumentException);
  EXPECT_THROW(DateTime::FromTimestamp(kMaxTimestamp, 1'000'000'000), temporal::InvalidArgumentException);

  const auto last = DateTime::FromTimestamp(kMaxTimestamp, 999'999'999);
  EXPECT_EQ(last.Civil(), (CivilDateTime{32767, 12, 31, 23, 59, 59, 999'999'999}));
  EXPECT_EQ(last.ToString(), "+32767-12-31T23:59:59.999999999");
  const auto first = DateTime::FromTimestamp(kMinTimestamp);
  EXPECT_EQ(first.Civil(), (CivilDateTime{-32767, 1, 1, 0, 0, 0, 0}));
  EXPECT_EQ(first.Timestamp(), -1'096'193'779'200);
  EXPECT_EQ(first.DayOfWeek(), Weekday::SATURDAY);
  EXPECT_EQ(last.Timestamp(), 971'890'963'199);

  // Local fields one day past the supported years stay exact.
  const auto ahead = last.InZone(Timezone{std::chrono::hours{23}});
  EXPECT_EQ(ahead.Year(), 32768);
  EXPECT_EQ(ahead.Month(), 1);
  EXPECT_EQ(ahead.Day(), 1);
  EXPECT_EQ(ahead.Hour(), 22);
  const auto behind = first.InZone(Timezone{std::chrono::hours{-1}});
  EXPECT_EQ(behind.Year(), -32768);
  EXPECT_EQ(behind.Month(), 12);
  EXPECT_EQ(behind.Day(), 31);
  EXPECT_EQ(behind.Hour(), 23);

  const auto too_late = DateTime::FromInterchange({kMaxTimestamp + 1, 0, std::chrono::seconds{3'600}});
  ASSERT_TRUE(too_late.HasError());
  EXPECT_EQ(too_late.GetError().kind, DateTimeErrorKind::INVALID_DATE);
  EXPECT_TRUE(DateTime::FromInterchange({std::numeric_limits<int64_t>::min(), 0, std::monostate{}}).HasError());

  // The wall time is valid, but the instant it names in a zone ahead of UTC falls before the first supported year.
  const auto before_first = DateTime::FromYmd(-32767, 1, 1).WithZone(Timezone{std::chrono::hours{1}}).Build();
  ASSERT_TRUE(before_first.HasError());
  EXPECT_EQ(before_first.GetError().kind, DateTimeErrorKind::INVALID_DATE);
}

TEST(DateTimeTest, CalendarArithmetic) {
  const auto jan31 = DateTime::FromYmd(2024, 1, 31).WithTime(8, 15, 0).BuildOrThrow();
  const auto feb = jan31.AddMonths(1);
  ASSERT_TRUE(feb.HasValue());
  EXPECT_EQ(feb->Timestamp(), 1'709'194'500);
  EXPECT_EQ(feb->Day(), 29);
  EXPECT_EQ(feb->Hour(), 8);
  EXPECT_EQ(feb->Minute(), 15);

  const auto non_leap = DateTime::FromYmd(2023, 1, 31).BuildOrThrow().AddMonths(1);
  ASSERT_TRUE(non_leap.HasValue());
  EXPECT_EQ(non_leap->Month(), 2);
  EXPECT_EQ(non_leap->Day(), 28);

  const auto leap_day = DateTime::FromYmd(2024, 2, 29).BuildOrThrow();
  EXPECT_EQ(leap_day.AddYears(1)->Day(), 28);
  EXPECT_EQ(leap_day.AddYears(4)->Day(), 29);
  EXPECT_EQ(leap_day.AddDays(1)->Month(), 3);
  EXPECT_EQ(leap_day.AddDays(-60)->Year(), 2023);
  EXPECT_EQ(leap_day.AddMonths(-14)->Month(), 12);

  const auto out_of_range = DateTime::FromYmd(32767, 12, 1).BuildOrThrow().AddMonths(1);
  ASSERT_TRUE(out_of_range.HasError());
  EXPECT_EQ(out_of_range.GetError().kind, DateTimeErrorKind::INVALID_DATE);
  EXPECT_TRUE(leap_day.AddDays(std::numeric_limits<int64_t>::max()).HasError());
  EXPECT_TRUE(leap_day.AddYears(-70'000).HasError());
}

TEST(DateTimeTest, CalendarArithmeticKeepsLocalTimeAcrossTransitions) {
  // One day after 12:00 CET on the eve of the switch to summer time is 12:00 CEST, 23 hours later.
  const auto before = DateTime::FromYmd(2024, 3, 30).WithTime(12, 0, 0).WithZone(FakeZagreb()).BuildOrThrow();
  const auto after = before.AddDays(1);
  ASSERT_TRUE(after.HasValue());
  EXPECT_EQ(after->Hour(), 12);
  EXPECT_EQ(after->Day(), 31);
  EXPECT_EQ(*after - before, TimeInterval(23 * 3'600, 0));
  EXPECT_EQ(after->Zone(), FakeZagreb());
}

TEST(DateTimeTest, Interchange) {
  const auto named = DateTime::FromTimestamp(1'335'006'000, 7).InZone(FakeZagreb());
  const auto interchange = named.ToInterchange();
  EXPECT_EQ(interchange.seconds, 1'335'006'000);
  EXPECT_EQ(interchange.nanos, 7);
  EXPECT_EQ(interchange.zone, ZoneDescriptor{std::string{"Fake/Zagreb"}});

  const auto fixed = DateTime::FromTimestamp(1, 2).InZone(Timezone{std::chrono::hours{-5}});
  EXPECT_EQ(fixed.ToInterchange(), (Interchange{1, 2, std::chrono::seconds{-18'000}}));
  const auto restored = DateTime::FromInterchange(fixed.ToInterchange());
  ASSERT_TRUE(restored.HasValue());
  EXPECT_EQ(*restored, fixed);
  EXPECT_EQ(restored->Zone(), fixed.Zone());

  const auto bare = DateTime::FromInterchange({-5, 0, std::monostate{}});
  ASSERT_TRUE(bare.HasValue());
  EXPECT_FALSE(bare->Zone());
  EXPECT_EQ(bare->ToInterchange(), (Interchange{-5, 0, std::monostate{}}));

  const auto bad_nanos = DateTime::FromInterchange({0, 1'000'000'000, std::monostate{}});
  ASSERT_TRUE(bad_nanos.HasError());
  EXPECT_EQ(bad_nanos.GetError().kind, DateTimeErrorKind::INVALID_TIME);

  const auto bad_offset = DateTime::FromInterchange({0, 0, std::chrono::seconds{90'000}});
  ASSERT_TRUE(bad_offset.HasError());
  EXPECT_EQ(bad_offset.GetError().kind, DateTimeErrorKind::UNKNOWN_ZONE);
}

TEST(DateTimeTest, Now) {
  const auto before = std::chrono::system_clock::now();
  const auto now = DateTime::Now();
  const auto after = std::chrono::system_clock::now();
  EXPECT_GE(now.Timestamp(), std::chrono::floor<std::chrono::seconds>(before.time_since_epoch()).count());
  EXPECT_LE(now.Timestamp(), std::chrono::floor<std::chrono::seconds>(after.time_since_epoch()).count());
  EXPECT_LT(now.Nanosecond(), 1'000'000'000);
  EXPECT_FALSE(now.Zone());
}

TEST(DateTimeTest, LoggingAdapters) {
  const auto dt = DateTime::FromTimestamp(1'335'006'000).InZone(Timezone{std::chrono::hours{2}});
  std::ostringstream stream;
  stream << dt;
  EXPECT_EQ(stream.str(), "2012-04-21T13:00:00+02:00");
  EXPECT_EQ(fmt::format("{}", dt), "2012-04-21T13:00:00+02:00");
  EXPECT_EQ(fmt::format("{}", TimeInterval::FromMilliseconds(-2'400)), "-2.400000000s");

  std::ostringstream error_stream;
  error_stream << DateTimeError{DateTimeErrorKind::UNKNOWN_ZONE, "Time zone not found: Mars/Olympus"};
  EXPECT_EQ(error_stream.str(), "UnknownZone: Time zone not found: Mars/Olympus");
}
