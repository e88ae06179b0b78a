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

/// @file
#pragma once

#include <optional>
#include <utility>

#include "utils/logging.hpp"

namespace datetime::utils {

/// Holds either a value or the error that prevented producing it.
template <class TError, class TValue>
class [[nodiscard]] BasicResult final {
 public:
  using ErrorType = TError;
  using ValueType = TValue;
  BasicResult(const TValue &value) : value_(value) {}
  BasicResult(TValue &&value) noexcept : value_(std::move(value)) {}
  BasicResult(const TError &error) : error_(error) {}
  BasicResult(TError &&error) noexcept : error_(std::move(error)) {}

  bool HasValue() const { return value_.has_value(); }
  bool HasError() const { return error_.has_value(); }

  TValue &GetValue() & {
    DT_ASSERT(value_, "The result is an error!");
    return *value_;
  }

  TValue &&GetValue() && {
    DT_ASSERT(value_, "The result is an error!");
    return std::move(*value_);
  }

  const TValue &GetValue() const & {
    DT_ASSERT(value_, "The result is an error!");
    return *value_;
  }

  const TValue &operator*() const & {
    DT_ASSERT(value_, "The result is an error!");
    return *value_;
  }

  TValue &&operator*() && {
    DT_ASSERT(value_, "The result is an error!");
    return std::move(*value_);
  }

  const TValue *operator->() const {
    DT_ASSERT(value_, "The result is an error!");
    return &*value_;
  }

  const TError &GetError() const & {
    DT_ASSERT(error_, "The result is a value!");
    return *error_;
  }

  TError &&GetError() && {
    DT_ASSERT(error_, "The result is a value!");
    return std::move(*error_);
  }

 private:
  std::optional<TValue> value_;
  std::optional<TError> error_;
};

}  // namespace datetime::utils
