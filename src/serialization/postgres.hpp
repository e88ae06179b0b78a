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

// 2000-01-01T00:00:00Z, the zero point of PostgreSQL timestamps.
inline constexpr int64_t kPostgresEpochSeconds = 946'684'800;

/// Microseconds since the PostgreSQL epoch, the wire value of `timestamp` and `timestamptz`.
/// Digits below a microsecond are dropped, rounding toward the past.
int64_t ToPgTimestamp(const DateTime &dt);

/// The result carries no zone; PostgreSQL does not store one.
DateTime FromPgTimestamp(int64_t microseconds);

}  // namespace datetime::serialization
