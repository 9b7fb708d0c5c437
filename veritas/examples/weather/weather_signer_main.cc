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

// weather_signer reads a current-conditions document, signs the observation
// with a freshly generated enclave identity and prints the signed envelope as
// JSON. With --attest it also prints an attestation document for the
// identity.

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "veritas/examples/weather/weather_report.h"
#include "veritas/identity/ephemeral_identity.h"
#include "veritas/identity/freshness.h"
#include "veritas/service/enclave_service.h"
#include "veritas/util/logging.h"

ABSL_FLAG(std::string, config, "",
          "Path of a text-format EnclaveServiceConfig. Defaults apply if "
          "empty");

ABSL_FLAG(std::string, weather_json, "",
          "Path of the current-conditions JSON document to sign");

ABSL_FLAG(bool, attest, false,
          "Also print an attestation document binding the public key");

ABSL_FLAG(int, vlog_level, 0, "The VLOG verbosity threshold");

int main(int argc, char **argv) {
  absl::ParseCommandLine(argc, argv);
  veritas::InitLogging("", argv[0], absl::GetFlag(FLAGS_vlog_level));

  std::string weather_path = absl::GetFlag(FLAGS_weather_json);
  LOG_IF(QFATAL, weather_path.empty()) << "--weather_json must be set";

  veritas::EnclaveServiceConfig config;
  std::string config_path = absl::GetFlag(FLAGS_config);
  if (!config_path.empty()) {
    auto config_result = veritas::LoadEnclaveServiceConfig(config_path);
    LOG_IF(QFATAL, !config_result.ok())
        << "Failed to load config: " << config_result.status();
    config = std::move(config_result).value();
  }

  // An enclave without a key cannot vouch for anything.
  auto identity_result = veritas::EphemeralIdentity::Generate();
  LOG_IF(FATAL, !identity_result.ok())
      << "Failed to generate enclave identity: " << identity_result.status();
  std::shared_ptr<const veritas::EphemeralIdentity> identity =
      std::move(identity_result).value();
  LOG(INFO) << "Enclave public key: " << identity->public_key_hex();

  std::unique_ptr<veritas::EnclaveService> service =
      veritas::EnclaveService::Create(identity, std::move(config));

  if (absl::GetFlag(FLAGS_attest)) {
    auto attestation = service->GetAttestation();
    LOG_IF(QFATAL, !attestation.ok())
        << "Attestation failed: " << attestation.status();
    auto json = veritas::MessageToJson(*attestation);
    LOG_IF(QFATAL, !json.ok()) << json.status();
    std::cout << *json << std::endl;
  }

  std::ifstream weather_file(weather_path);
  LOG_IF(QFATAL, !weather_file) << "Could not open " << weather_path;
  std::stringstream contents;
  contents << weather_file.rdbuf();

  auto observation = veritas::ParseWeatherObservation(contents.str());
  LOG_IF(QFATAL, !observation.ok()) << observation.status();

  auto signed_response = veritas::SignWeatherObservation(
      *service, std::move(observation).value(), veritas::UnixMillisNow());
  LOG_IF(QFATAL, !signed_response.ok())
      << "Refusing to sign: " << signed_response.status();

  // Check the envelope against the published key before releasing it.
  auto published_identity = service->GetIdentity();
  LOG_IF(QFATAL, !published_identity.ok()) << published_identity.status();
  absl::Status verified =
      veritas::VerifyWithIdentity(*published_identity, *signed_response);
  LOG_IF(FATAL, !verified.ok())
      << "Signed response does not verify: " << verified;

  auto json = veritas::SignedResponseToJson(*signed_response);
  LOG_IF(QFATAL, !json.ok()) << json.status();
  std::cout << *json << std::endl;
  return 0;
}
