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

#include "serialization/time64.hpp"

#include "utils/logging.hpp"

namespace datetime::serialization {

Time64 ToTime64(const DateTime &dt) {
  switch (dt.GetPrecision()) {
    case Precision::SECOND:
      return {TimeUnit::SECOND, dt.AsSeconds()};
    case Precision::MILLISECOND:
      return {TimeUnit::MILLISECOND, dt.AsMilliseconds()};
    case Precision::MICROSECOND:
      return {TimeUnit::MICROSECOND, dt.AsMicroseconds()};
    case Precision::NANOSECOND:
      return {TimeUnit::NANOSECOND, dt.AsNanoseconds()};
  }
  DT_LOG_FATAL("ToTime64 -> check missing switch case");
}

DateTime FromTime64(const Time64 &time) {
  switch (time.unit) {
    case TimeUnit::SECOND:
      return DateTime::FromTimestamp(time.value);
    case TimeUnit::MILLISECOND:
      return DateTime::FromTimestamp(0) + TimeInterval::FromMilliseconds(time.value);
    case TimeUnit::MICROSECOND:
      return DateTime::FromTimestamp(0) + TimeInterval::FromMicroseconds(time.value);
    case TimeUnit::NANOSECOND:
      return DateTime::FromTimestamp(0) + TimeInterval::FromNanoseconds(time.value);
  }
  DT_LOG_FATAL("FromTime64 -> check missing switch case");
}

}  // namespace datetime::serialization
