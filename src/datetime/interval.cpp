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

#include "datetime/interval.hpp"

#include <fmt/format.h>

#include "datetime/civil.hpp"
#include "utils/exceptions.hpp"
#include "utils/fnv.hpp"

namespace datetime {
namespace {

constexpr int64_t kNanosPerMillisecond = 1'000'000;
constexpr int64_t kNanosPerMicrosecond = 1'000;

int64_t CheckedMul(const int64_t lhs, const int64_t rhs) {
  constexpr auto max = std::numeric_limits<int64_t>::max();
  constexpr auto min = std::numeric_limits<int64_t>::min();
  bool overflows = false;
  if (lhs > 0) {
    overflows = rhs > 0 ? lhs > max / rhs : rhs < min / lhs;
  } else if (lhs < 0) {
    overflows = rhs > 0 ? lhs < min / rhs : (rhs != 0 && rhs < max / lhs);
  }
  if (overflows) [[unlikely]] {
    throw utils::BasicException("Time interval arithmetic overflows");
  }
  return lhs * rhs;
}

constexpr int64_t EuclidDiv(const int64_t value, const int64_t divisor) {
  const auto quotient = value / divisor;
  return (value % divisor < 0) ? quotient - 1 : quotient;
}

constexpr int64_t EuclidMod(const int64_t value, const int64_t divisor) {
  const auto remainder = value % divisor;
  return remainder < 0 ? remainder + divisor : remainder;
}

}  // namespace

int64_t CheckedAdd(const int64_t lhs, const int64_t rhs) {
  if (Overflows(lhs, rhs)) {
    throw utils::BasicException("Time interval arithmetic overflows");
  }
  if (Underflows(lhs, rhs)) {
    throw utils::BasicException("Time interval arithmetic underflows");
  }
  return lhs + rhs;
}

TimeInterval::TimeInterval(const int64_t seconds, const uint32_t nanos)
    : seconds_{CheckedAdd(seconds, nanos / kNanosPerSecond)}, nanos_{static_cast<uint32_t>(nanos % kNanosPerSecond)} {}

TimeInterval TimeInterval::FromMilliseconds(const int64_t milliseconds) {
  return {EuclidDiv(milliseconds, 1'000), static_cast<uint32_t>(EuclidMod(milliseconds, 1'000) * kNanosPerMillisecond)};
}

TimeInterval TimeInterval::FromMicroseconds(const int64_t microseconds) {
  return {EuclidDiv(microseconds, 1'000'000),
          static_cast<uint32_t>(EuclidMod(microseconds, 1'000'000) * kNanosPerMicrosecond)};
}

TimeInterval TimeInterval::FromNanoseconds(const int64_t nanoseconds) {
  return {EuclidDiv(nanoseconds, kNanosPerSecond), static_cast<uint32_t>(EuclidMod(nanoseconds, kNanosPerSecond))};
}

int64_t TimeInterval::AsMilliseconds() const {
  return CheckedAdd(CheckedMul(seconds_, 1'000), nanos_ / kNanosPerMillisecond);
}

int64_t TimeInterval::AsMicroseconds() const {
  return CheckedAdd(CheckedMul(seconds_, 1'000'000), nanos_ / kNanosPerMicrosecond);
}

int64_t TimeInterval::AsNanoseconds() const { return CheckedAdd(CheckedMul(seconds_, kNanosPerSecond), nanos_); }

std::string TimeInterval::ToString() const {
  if (seconds_ < 0 && nanos_ != 0) {
    // -3 s + 600'000'000 ns reads as -2.4 s
    const auto whole = static_cast<uint64_t>(-(seconds_ + 1));
    return fmt::format("-{}.{:0>9}s", whole, kNanosPerSecond - nanos_);
  }
  return fmt::format("{}.{:0>9}s", seconds_, nanos_);
}

TimeInterval TimeInterval::operator-() const {
  if (nanos_ == 0) {
    if (seconds_ == std::numeric_limits<int64_t>::min()) [[unlikely]] {
      throw utils::BasicException("Time interval arithmetic overflows");
    }
    return {-seconds_, 0};
  }
  const auto seconds = seconds_ == std::numeric_limits<int64_t>::max() ? std::numeric_limits<int64_t>::min()
                                                                        : -(seconds_ + 1);
  return {seconds, static_cast<uint32_t>(kNanosPerSecond - nanos_)};
}

TimeInterval operator+(const TimeInterval &lhs, const TimeInterval &rhs) {
  const uint32_t nanos = lhs.nanos_ + rhs.nanos_;
  const int64_t carry = nanos >= kNanosPerSecond ? 1 : 0;
  TimeInterval result;
  result.seconds_ = CheckedAdd(CheckedAdd(lhs.seconds_, rhs.seconds_), carry);
  result.nanos_ = static_cast<uint32_t>(nanos - carry * kNanosPerSecond);
  return result;
}

TimeInterval operator*(const TimeInterval &lhs, const int64_t rhs) {
  const auto seconds = CheckedMul(lhs.seconds_, rhs);
  const auto nanos = CheckedMul(lhs.nanos_, rhs);
  return TimeInterval(seconds, 0) + TimeInterval::FromNanoseconds(nanos);
}

TimeInterval operator/(const TimeInterval &lhs, const int64_t rhs) {
  if (rhs == 0) {
    throw utils::BasicException("Time interval division by zero");
  }
  return TimeInterval::FromNanoseconds(lhs.AsNanoseconds() / rhs);
}

double operator/(const TimeInterval &lhs, const TimeInterval &rhs) {
  const auto as_double = [](const TimeInterval &interval) {
    return static_cast<double>(interval.Seconds()) * static_cast<double>(kNanosPerSecond) +
           static_cast<double>(interval.Nanoseconds());
  };
  return as_double(lhs) / as_double(rhs);
}

size_t TimeIntervalHash::operator()(const TimeInterval &interval) const {
  return utils::HashCombine<int64_t, uint32_t>{}(interval.Seconds(), interval.Nanoseconds());
}

}  // namespace datetime
