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

#include <source_location>
#include <string>

#include <fmt/format.h>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <boost/preprocessor/comparison/equal.hpp>
#include <boost/preprocessor/control/if.hpp>
#include <boost/preprocessor/variadic/size.hpp>

namespace datetime::logging {

[[noreturn]] void AssertFailed(std::source_location loc, const char *expr, const std::string &message);

#define DT_GET_MESSAGE(...) \
  BOOST_PP_IF(BOOST_PP_EQUAL(BOOST_PP_VARIADIC_SIZE(__VA_ARGS__), 0), "", fmt::format(__VA_ARGS__))

#define DT_ASSERT(expr, ...)                                                                                    \
  do {                                                                                                          \
    if (!(expr)) [[unlikely]] {                                                                                 \
      [&]() __attribute__((noinline, cold, noreturn)) {                                                         \
        ::datetime::logging::AssertFailed(std::source_location::current(), #expr, DT_GET_MESSAGE(__VA_ARGS__)); \
      }                                                                                                         \
      ();                                                                                                       \
    }                                                                                                           \
  } while (false)

#ifndef NDEBUG
#define DT_DASSERT(expr, ...) DT_ASSERT(expr, __VA_ARGS__)
#else
#define DT_DASSERT(...) \
  do {                  \
  } while (false)
#endif

#define DT_LOG_FATAL(...)          \
  do {                             \
    spdlog::critical(__VA_ARGS__); \
    std::terminate();              \
  } while (0)

/// Replaces the default logger with one that writes to stderr, so library diagnostics
/// do not interleave with the caller's stdout.
void RedirectToStderr();

}  // namespace datetime::logging
