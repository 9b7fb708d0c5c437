/*
 *
 * Copyright 2026 Veritas authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#include "veritas/examples/weather/weather_report.h"

#include <cmath>
#include <limits>
#include <utility>

#include <google/protobuf/util/json_util.h>
#include "absl/strings/str_cat.h"
#include "veritas/encoding/bcs.h"
#include "veritas/identity/freshness.h"
#include "veritas/identity/intent_scope.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

constexpr char kUnknownLocation[] = "Unknown";

// Returns the member |name| of |object| if it is present and of |kind|.
const google::protobuf::Value *FindField(
    const google::protobuf::Struct &object, const std::string &name,
    google::protobuf::Value::KindCase kind) {
  auto it = object.fields().find(name);
  if (it == object.fields().end() || it->second.kind_case() != kind) {
    return nullptr;
  }
  return &it->second;
}

// Converts a JSON number to an unsigned integer, truncating toward zero and
// saturating at the bounds of uint64_t.
uint64_t SaturatingToUint64(double value) {
  if (!(value > 0)) {
    return 0;
  }
  if (value >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(std::trunc(value));
}

}  // namespace

absl::Status WeatherReport::SerializeBcs(BcsWriter *writer) const {
  VERITAS_RETURN_IF_ERROR(BcsSerialize(location, writer));
  return BcsSerialize(temperature, writer);
}

absl::StatusOr<WeatherReport> WeatherReport::DeserializeBcs(
    BcsReader *reader) {
  WeatherReport report;
  VERITAS_RETURN_IF_ERROR(BcsDeserialize(reader, &report.location));
  VERITAS_RETURN_IF_ERROR(BcsDeserialize(reader, &report.temperature));
  return report;
}

absl::StatusOr<google::protobuf::Value> WeatherReport::ToJsonValue() const {
  google::protobuf::Value json_temperature;
  VERITAS_ASSIGN_OR_RETURN(json_temperature, JsonIntegerValue(temperature));
  google::protobuf::Value value;
  auto *fields = value.mutable_struct_value()->mutable_fields();
  (*fields)["location"].set_string_value(location);
  (*fields)["temperature"] = std::move(json_temperature);
  return value;
}

bool operator==(const WeatherReport &lhs, const WeatherReport &rhs) {
  return lhs.location == rhs.location && lhs.temperature == rhs.temperature;
}

bool operator!=(const WeatherReport &lhs, const WeatherReport &rhs) {
  return !(lhs == rhs);
}

absl::StatusOr<WeatherObservation> ParseWeatherObservation(
    absl::string_view json) {
  google::protobuf::Struct document;
  auto status =
      google::protobuf::util::JsonStringToMessage(std::string(json), &document);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Malformed weather document: ", status.ToString()));
  }

  WeatherObservation observation;
  observation.report.location = kUnknownLocation;

  const google::protobuf::Value *location = FindField(
      document, "location", google::protobuf::Value::kStructValue);
  if (location) {
    const google::protobuf::Value *name =
        FindField(location->struct_value(), "name",
                  google::protobuf::Value::kStringValue);
    if (name) {
      observation.report.location = name->string_value();
    }
  }

  const google::protobuf::Value *current = FindField(
      document, "current", google::protobuf::Value::kStructValue);
  if (current) {
    const google::protobuf::Value *temp_c =
        FindField(current->struct_value(), "temp_c",
                  google::protobuf::Value::kNumberValue);
    if (temp_c) {
      observation.report.temperature =
          SaturatingToUint64(temp_c->number_value());
    }
    const google::protobuf::Value *last_updated =
        FindField(current->struct_value(), "last_updated_epoch",
                  google::protobuf::Value::kNumberValue);
    if (last_updated) {
      uint64_t seconds = SaturatingToUint64(last_updated->number_value());
      observation.last_updated_ms =
          seconds > std::numeric_limits<uint64_t>::max() / 1000
              ? std::numeric_limits<uint64_t>::max()
              : seconds * 1000;
    }
  }
  return observation;
}

absl::StatusOr<SignedResponse<WeatherReport>> SignWeatherObservation(
    const EnclaveService &service, WeatherObservation observation,
    uint64_t now_ms) {
  VERITAS_RETURN_IF_ERROR(
      CheckFreshness(observation.last_updated_ms, now_ms, kWeatherMaxAgeMs));
  return service.Sign(std::move(observation.report),
                      observation.last_updated_ms, IntentScope::kWeather);
}

}  // namespace veritas
