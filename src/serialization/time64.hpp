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

#include <cstdint>

#include "datetime/date_time.hpp"

namespace datetime::serialization {

enum class TimeUnit : uint8_t { SECOND, MILLISECOND, MICROSECOND, NANOSECOND };

/// Count of `unit` since the Unix epoch, the shape of columnar TIMESTAMP_S/_MS/_US/_NS values.
struct Time64 {
  TimeUnit unit;
  int64_t value;

  bool operator==(const Time64 &) const = default;
};

/**
 * Picks the coarsest unit that keeps every digit of `dt` (see DateTime::GetPrecision).
 * Nanosecond values only fit in int64 between 1677 and 2262; outside that
 * window the conversion throws utils::BasicException.
 */
Time64 ToTime64(const DateTime &dt);

/// Counts before the epoch round toward the past. The result carries no zone.
DateTime FromTime64(const Time64 &time);

}  // namespace datetime::serialization
