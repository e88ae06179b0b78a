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

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "datetime/civil.hpp"

namespace datetime {

/// Fields read from text, not yet validated against the calendar.
struct ParsedDateTime {
  DateParameters date;
  TimeParameters time;
  std::optional<std::chrono::seconds> offset;
  std::optional<std::string> zone_name;

  bool operator==(const ParsedDateTime &) const = default;
};

/**
 * strptime-like parsing. Supported specifiers:
 *
 *   %Y  four digit year, or a sign followed by four or five digits
 *   %m %d %H %M %S  two digits each
 *   %f  one to nine fraction digits; %3f %6f %9f require exactly that many,
 *       %.f reads an optional '.' followed by the digits
 *   %z  Z, +HH, +HHMM, +HHMMSS, +HH:MM or +HH:MM:SS
 *   %F  %Y-%m-%d
 *   %T  %H:%M:%S
 *   %%  a literal percent sign
 *
 * Every other character of `format` must match the input literally. Returns
 * nullopt when the input does not match the format as a whole; throws
 * temporal::InvalidArgumentException if the format itself is malformed.
 */
std::optional<ParsedDateTime> TryParseDateTime(std::string_view input, std::string_view format);

/// Like TryParseDateTime, throws temporal::InvalidArgumentException when the input does not match.
ParsedDateTime ParseDateTime(std::string_view input, std::string_view format);

}  // namespace datetime
