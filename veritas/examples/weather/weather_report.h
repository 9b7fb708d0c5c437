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

#ifndef VERITAS_EXAMPLES_WEATHER_WEATHER_REPORT_H_
#define VERITAS_EXAMPLES_WEATHER_WEATHER_REPORT_H_

#include <cstdint>
#include <string>

#include <google/protobuf/struct.pb.h>
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "veritas/encoding/bcs_reader.h"
#include "veritas/encoding/bcs_writer.h"
#include "veritas/identity/signed_response.h"
#include "veritas/service/enclave_service.h"

namespace veritas {

// Weather observations older than this are refused.
inline constexpr uint64_t kWeatherMaxAgeMs = 60 * 60 * 1000;

// A signed weather observation. Its canonical form is the BCS encoding of
// |location| followed by |temperature|.
struct WeatherReport {
  std::string location;

  // Degrees Celsius, truncated toward zero. Negative readings are stored as
  // zero.
  uint64_t temperature = 0;

  absl::Status SerializeBcs(BcsWriter *writer) const;
  static absl::StatusOr<WeatherReport> DeserializeBcs(BcsReader *reader);

  // Returns {"location": ..., "temperature": ...}, or OUT_OF_RANGE if
  // |temperature| has no exact JSON representation.
  absl::StatusOr<google::protobuf::Value> ToJsonValue() const;
};

bool operator==(const WeatherReport &lhs, const WeatherReport &rhs);
bool operator!=(const WeatherReport &lhs, const WeatherReport &rhs);

// A report together with the time at which the provider last updated it.
struct WeatherObservation {
  WeatherReport report;
  uint64_t last_updated_ms = 0;
};

// Extracts an observation from a current-conditions document of the form
//
//   {"location": {"name": "..."},
//    "current": {"temp_c": 13.4, "last_updated_epoch": 1744038900}}
//
// Missing fields default to location "Unknown", temperature 0 and timestamp
// 0. Returns INVALID_ARGUMENT if |json| is not a JSON object.
absl::StatusOr<WeatherObservation> ParseWeatherObservation(
    absl::string_view json);

// Signs |observation| under IntentScope::kWeather, stamped with its
// last-updated time. Returns FAILED_PRECONDITION if the observation is more
// than kWeatherMaxAgeMs older than |now_ms|.
absl::StatusOr<SignedResponse<WeatherReport>> SignWeatherObservation(
    const EnclaveService &service, WeatherObservation observation,
    uint64_t now_ms);

}  // namespace veritas

#endif  // VERITAS_EXAMPLES_WEATHER_WEATHER_REPORT_H_
