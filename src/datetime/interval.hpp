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
#include <limits>
#include <ostream>
#include <string>

namespace datetime {

template <typename TType>
bool Overflows(const TType &lhs, const TType &rhs) {
  if (lhs > 0 && rhs > 0 && lhs > (std::numeric_limits<TType>::max() - rhs)) [[unlikely]] {
    return true;
  }
  return false;
}

template <typename TType>
bool Underflows(const TType &lhs, const TType &rhs) {
  if (lhs < 0 && rhs < 0 && lhs < (std::numeric_limits<TType>::min() - rhs)) [[unlikely]] {
    return true;
  }
  return false;
}

/// Adds two int64 values, throwing utils::BasicException when the sum does not fit.
int64_t CheckedAdd(int64_t lhs, int64_t rhs);

/**
 * @brief An interval of time between two instants.
 *
 * Stored as whole seconds plus a nanosecond part that is always in [0, 1e9),
 * even for negative intervals: -2.5 seconds is -3 seconds and 500'000'000
 * nanoseconds.
 */
class TimeInterval {
 public:
  TimeInterval() = default;
  /// Nanoseconds above one second are carried into the seconds.
  TimeInterval(int64_t seconds, uint32_t nanos);

  static TimeInterval FromMilliseconds(int64_t milliseconds);
  static TimeInterval FromMicroseconds(int64_t microseconds);
  static TimeInterval FromNanoseconds(int64_t nanoseconds);

  int64_t Seconds() const { return seconds_; }
  uint32_t Nanoseconds() const { return nanos_; }

  int64_t AsMilliseconds() const;
  int64_t AsMicroseconds() const;
  // Throws utils::BasicException for intervals longer than about 292 years.
  int64_t AsNanoseconds() const;

  std::string ToString() const;

  auto operator<=>(const TimeInterval &) const = default;

  friend std::ostream &operator<<(std::ostream &os, const TimeInterval &interval) {
    return os << interval.ToString();
  }

  TimeInterval operator-() const;

  friend TimeInterval operator+(const TimeInterval &lhs, const TimeInterval &rhs);
  friend TimeInterval operator-(const TimeInterval &lhs, const TimeInterval &rhs) { return lhs + (-rhs); }

  friend TimeInterval operator*(const TimeInterval &lhs, int64_t rhs);
  friend TimeInterval operator*(int64_t lhs, const TimeInterval &rhs) { return rhs * lhs; }
  friend TimeInterval operator/(const TimeInterval &lhs, int64_t rhs);
  friend double operator/(const TimeInterval &lhs, const TimeInterval &rhs);

  TimeInterval &operator+=(const TimeInterval &rhs) { return *this = *this + rhs; }
  TimeInterval &operator-=(const TimeInterval &rhs) { return *this = *this - rhs; }

 private:
  int64_t seconds_{0};
  uint32_t nanos_{0};
};

struct TimeIntervalHash {
  size_t operator()(const TimeInterval &interval) const;
};

}  // namespace datetime
