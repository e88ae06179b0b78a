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

#include <nlohmann/json.hpp>

#include "datetime/date_time.hpp"

namespace datetime::serialization {

/// {"seconds": int, "nanos": int, "zone": null | offset seconds | identifier}
nlohmann::json InterchangeToJson(const Interchange &interchange);

/// Throws temporal::InvalidArgumentException when `json` does not have the shape written by InterchangeToJson.
Interchange InterchangeFromJson(const nlohmann::json &json);

}  // namespace datetime::serialization

namespace nlohmann {

// DateTime has no default constructor, so it gets a serializer instead of ADL to_json/from_json.
// The JSON value is the ToString() form.
template <>
struct adl_serializer<datetime::DateTime> {
  static datetime::DateTime from_json(const json &j);
  static void to_json(json &j, const datetime::DateTime &dt);
};

}  // namespace nlohmann
