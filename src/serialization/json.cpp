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

#include "serialization/json.hpp"

#include <limits>

#include "datetime/errors.hpp"

namespace datetime::serialization {

nlohmann::json InterchangeToJson(const Interchange &interchange) {
  nlohmann::json zone;
  if (const auto *offset = std::get_if<std::chrono::seconds>(&interchange.zone)) {
    zone = offset->count();
  } else if (const auto *name = std::get_if<std::string>(&interchange.zone)) {
    zone = *name;
  }
  return {{"seconds", interchange.seconds}, {"nanos", interchange.nanos}, {"zone", std::move(zone)}};
}

Interchange InterchangeFromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    throw temporal::InvalidArgumentException("Expected a JSON object for a DateTime, got {}.", json.type_name());
  }
  const auto seconds = json.find("seconds");
  const auto nanos = json.find("nanos");
  if (seconds == json.end() || !seconds->is_number_integer()) {
    throw temporal::InvalidArgumentException("DateTime JSON object needs an integer 'seconds' field.");
  }
  if (nanos == json.end() || !nanos->is_number_integer() || nanos->get<int64_t>() < 0 ||
      nanos->get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
    throw temporal::InvalidArgumentException(
        "DateTime JSON object needs an integer 'nanos' field between 0 and {}.", std::numeric_limits<uint32_t>::max());
  }

  Interchange interchange{seconds->get<int64_t>(), nanos->get<uint32_t>(), std::monostate{}};
  if (const auto zone = json.find("zone"); zone != json.end() && !zone->is_null()) {
    if (zone->is_number_integer()) {
      interchange.zone = std::chrono::seconds{zone->get<int64_t>()};
    } else if (zone->is_string()) {
      interchange.zone = zone->get<std::string>();
    } else {
      throw temporal::InvalidArgumentException("DateTime JSON 'zone' must be null, an offset or an identifier.");
    }
  }
  return interchange;
}

}  // namespace datetime::serialization

namespace nlohmann {

datetime::DateTime adl_serializer<datetime::DateTime>::from_json(const json &j) {
  if (!j.is_string()) {
    throw datetime::temporal::InvalidArgumentException("Expected a JSON string for a DateTime, got {}.",
                                                       j.type_name());
  }
  return datetime::DateTime::FromString(j.get_ref<const std::string &>());
}

void adl_serializer<datetime::DateTime>::to_json(json &j, const datetime::DateTime &dt) { j = dt.ToString(); }

}  // namespace nlohmann
