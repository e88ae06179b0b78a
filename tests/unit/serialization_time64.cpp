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

#include <array>
#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "datetime/date_time.hpp"
#include "serialization/time64.hpp"

using namespace datetime;
using namespace datetime::serialization;

TEST(Time64SerializationTest, UnitFollowsPrecision) {
  const auto at = [](const int64_t nanos) {
    return DateTime::FromYmd(2012, 4, 21).WithTime(15, 0, 0, nanos).BuildOrThrow();
  };
  EXPECT_EQ(ToTime64(at(0)), (Time64{TimeUnit::SECOND, 1'335'020'400}));
  EXPECT_EQ(ToTime64(at(250'000'000)), (Time64{TimeUnit::MILLISECOND, 1'335'020'400'250}));
  EXPECT_EQ(ToTime64(at(250'001'000)), (Time64{TimeUnit::MICROSECOND, 1'335'020'400'250'001}));
  EXPECT_EQ(ToTime64(at(250'000'001)), (Time64{TimeUnit::NANOSECOND, 1'335'020'400'250'000'001}));
}

TEST(Time64SerializationTest, EveryUnitReadsBack) {
  const auto expected = DateTime::FromYmd(2012, 4, 21).WithTime(15, 0, 0).BuildOrThrow();
  const std::array cases{
      Time64{TimeUnit::SECOND, 1'335'020'400},
      Time64{TimeUnit::MILLISECOND, 1'335'020'400'000},
      Time64{TimeUnit::MICROSECOND, 1'335'020'400'000'000},
      Time64{TimeUnit::NANOSECOND, 1'335'020'400'000'000'000},
  };
  for (const auto &time : cases) {
    const auto dt = FromTime64(time);
    EXPECT_EQ(dt, expected) << time.value;
    EXPECT_FALSE(dt.Zone());
  }
}

TEST(Time64SerializationTest, BeforeTheEpoch) {
  const auto dt = FromTime64({TimeUnit::MILLISECOND, -1});
  EXPECT_EQ(dt.Timestamp(), -1);
  EXPECT_EQ(dt.Nanosecond(), 999'000'000);
  EXPECT_EQ(ToTime64(dt), (Time64{TimeUnit::MILLISECOND, -1}));

  const auto zoned = DateTime::FromTimestamp(-5, 7).InZone(Timezone{std::chrono::hours{3}});
  EXPECT_EQ(FromTime64(ToTime64(zoned)), zoned);
}

TEST(Time64SerializationTest, OutOfRange) {
  // 1500 needs more than 64 bits of nanoseconds.
  const auto too_early = DateTime::FromYmd(1500, 1, 1).WithNanos(1).BuildOrThrow();
  EXPECT_THROW((void)ToTime64(too_early), utils::BasicException);
  EXPECT_THROW((void)FromTime64({TimeUnit::SECOND, std::numeric_limits<int64_t>::max()}),
               temporal::InvalidArgumentException);
}
