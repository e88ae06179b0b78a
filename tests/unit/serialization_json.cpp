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
#include <string>

#include <gtest/gtest.h>

#include "datetime/date_time.hpp"
#include "serialization/json.hpp"

using namespace datetime;

TEST(JsonSerializationTest, DateTimeAsString) {
  const auto dt = DateTime::FromYmd(2024, 7, 4).WithTime(15, 30, 45, 123'456'000).BuildOrThrow();
  const nlohmann::json json = dt;
  EXPECT_EQ(json, "2024-07-04T15:30:45.123456");
  EXPECT_EQ(json.get<DateTime>(), dt);

  const nlohmann::json document{{"created", DateTime::FromYmd(2012, 4, 21).WithTime(11, 0, 0).BuildOrThrow()}};
  EXPECT_EQ(document.dump(), R"({"created":"2012-04-21T11:00:00"})");

  const auto parsed = nlohmann::json::parse(R"({"at": "2024-07-04T17:30:45.123456789+02:00"})");
  const auto at = parsed.at("at").get<DateTime>();
  EXPECT_EQ(at.Timestamp(), 1'720'107'045);
  EXPECT_EQ(at.Nanosecond(), 123'456'789);
  EXPECT_EQ(at.Offset(), std::chrono::hours{2});
}

TEST(JsonSerializationTest, DateTimeWithOffsetSeconds) {
  const auto dt = DateTime::FromTimestamp(1'335'006'000, 250).InZone(Timezone{std::chrono::seconds{-17'762}});
  const nlohmann::json json = dt;
  EXPECT_EQ(json.get<std::string>(), "2012-04-21T06:03:58.000000250-04:56:02");
  const auto restored = json.get<DateTime>();
  EXPECT_EQ(restored, dt);
  EXPECT_EQ(restored.Offset(), dt.Offset());
}

TEST(JsonSerializationTest, InvalidDateTime) {
  EXPECT_THROW((void)nlohmann::json(42).get<DateTime>(), temporal::InvalidArgumentException);
  EXPECT_THROW((void)nlohmann::json("tomorrow").get<DateTime>(), temporal::InvalidArgumentException);
  EXPECT_THROW((void)nlohmann::json("2023-02-29").get<DateTime>(), temporal::BuildException);
}

TEST(JsonSerializationTest, Interchange) {
  using serialization::InterchangeFromJson;
  using serialization::InterchangeToJson;

  const Interchange bare{1'335'006'000, 5, std::monostate{}};
  EXPECT_EQ(InterchangeToJson(bare).dump(), R"({"nanos":5,"seconds":1335006000,"zone":null})");
  EXPECT_EQ(InterchangeFromJson(InterchangeToJson(bare)), bare);

  const Interchange fixed{-1, 0, std::chrono::seconds{-14'400}};
  EXPECT_EQ(InterchangeToJson(fixed)["zone"], -14'400);
  EXPECT_EQ(InterchangeFromJson(InterchangeToJson(fixed)), fixed);

  const Interchange named{0, 999'999'999, std::string{"Asia/Kolkata"}};
  EXPECT_EQ(InterchangeToJson(named)["zone"], "Asia/Kolkata");
  EXPECT_EQ(InterchangeFromJson(InterchangeToJson(named)), named);

  const auto without_zone = InterchangeFromJson(nlohmann::json::parse(R"({"seconds": 10, "nanos": 0})"));
  EXPECT_EQ(without_zone, (Interchange{10, 0, std::monostate{}}));

  const auto dt = DateTime::FromInterchange(InterchangeFromJson(InterchangeToJson(fixed)));
  ASSERT_TRUE(dt.HasValue());
  EXPECT_EQ(dt->Offset(), std::chrono::hours{-4});
}

TEST(JsonSerializationTest, InvalidInterchange) {
  using serialization::InterchangeFromJson;
  const std::array cases{
      R"([1, 2])",
      R"({"nanos": 0})",
      R"({"seconds": "10", "nanos": 0})",
      R"({"seconds": 10})",
      R"({"seconds": 10, "nanos": -1})",
      R"({"seconds": 10, "nanos": 1.5})",
      R"({"seconds": 10, "nanos": 0, "zone": true})",
  };
  for (const auto *text : cases) {
    EXPECT_THROW((void)InterchangeFromJson(nlohmann::json::parse(text)), temporal::InvalidArgumentException) << text;
  }
}
