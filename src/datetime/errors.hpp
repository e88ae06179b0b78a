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
#include <ostream>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace datetime {

enum class DateTimeErrorKind : uint8_t {
  INVALID_DATE,
  INVALID_TIME,
  UNKNOWN_ZONE,
  AMBIGUOUS_OR_INVALID_LOCAL_TIME,
};

std::string_view ToString(DateTimeErrorKind kind);

/// Reason why a DateTime could not be constructed from civil fields.
struct DateTimeError {
  DateTimeErrorKind kind;
  std::string message;

  bool operator==(const DateTimeError &) const = default;

  friend std::ostream &operator<<(std::ostream &os, const DateTimeError &error) {
    return os << ToString(error.kind) << ": " << error.message;
  }
};

namespace temporal {
struct InvalidArgumentException : public utils::BasicException {
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidArgumentException)
};

/// Carries a construction failure out of the throwing entry points (BuildOrThrow, Parse, FromString).
class BuildException : public utils::BasicException {
 public:
  explicit BuildException(DateTimeError error)
      : utils::BasicException("{}: {}", ToString(error.kind), error.message), error_(std::move(error)) {}

  const DateTimeError &error() const { return error_; }

  SPECIALIZE_GET_EXCEPTION_NAME(BuildException)

 private:
  DateTimeError error_;
};
}  // namespace temporal

}  // namespace datetime
