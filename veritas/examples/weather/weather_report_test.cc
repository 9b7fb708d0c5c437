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

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/util/json_util.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/memory/memory.h"
#include "veritas/crypto/ed25519_signing_key.h"
#include "veritas/encoding/bcs.h"
#include "veritas/identity/intent_message.h"
#include "veritas/identity/intent_signer.h"
#include "veritas/nsm/fake_nsm.h"
#include "veritas/test/util/status_matchers.h"
#include "veritas/util/hex_util.h"

namespace veritas {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::StrEq;

constexpr char kFixedSeedHex[] =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";

// BCS encoding of {Weather, 1744038900000, {"San Francisco", 13}}.
constexpr char kGoldenMessageHex[] =
    "0020b1d110960100000d53616e204672616e636973636f0d00000000000000";

constexpr char kGoldenSignatureHex[] =
    "023c13f7a24c26363591b93b467afbee9f208d040dcf724c19324e58d0cfbb984a10677a"
    "d011094f09ef05a210dfb503f99ac87d6afe268c5a44919b2f17490d";

constexpr uint64_t kTimestampMs = 1744038900000;

TEST(WeatherReportTest, CanonicalFormMatchesGoldenVector) {
  IntentMessage<WeatherReport> message;
  message.intent = IntentScope::kWeather;
  message.timestamp_ms = kTimestampMs;
  message.data = WeatherReport{"San Francisco", 13};

  std::vector<uint8_t> bytes;
  VERITAS_ASSERT_OK_AND_ASSIGN(bytes, CanonicalizeIntentMessage(message));
  EXPECT_THAT(BytesToHex(bytes), StrEq(kGoldenMessageHex));

  std::vector<uint8_t> golden;
  VERITAS_ASSERT_OK_AND_ASSIGN(golden, HexToBytes(kGoldenMessageHex));
  EXPECT_THAT(BcsDecode<IntentMessage<WeatherReport>>(golden),
              IsOkAndHolds(Eq(message)));
}

TEST(WeatherReportTest, JsonValue) {
  google::protobuf::Value value;
  VERITAS_ASSERT_OK_AND_ASSIGN(value,
                               (WeatherReport{"Lisbon", 21}.ToJsonValue()));
  ASSERT_TRUE(value.has_struct_value());
  const auto &fields = value.struct_value().fields();
  EXPECT_THAT(fields.at("location").string_value(), StrEq("Lisbon"));
  EXPECT_THAT(fields.at("temperature").number_value(), Eq(21));
}

TEST(WeatherReportTest, JsonValueRejectsInexactTemperature) {
  constexpr uint64_t kMaxExact = uint64_t{1} << 53;
  VERITAS_EXPECT_OK((WeatherReport{"Lisbon", kMaxExact}.ToJsonValue()));
  EXPECT_THAT((WeatherReport{"Lisbon", kMaxExact + 1}.ToJsonValue()),
              StatusIs(absl::StatusCode::kOutOfRange));
}

TEST(ParseWeatherObservationTest, ExtractsReportAndTimestamp) {
  WeatherObservation observation;
  VERITAS_ASSERT_OK_AND_ASSIGN(observation, ParseWeatherObservation(R"json({
        "location": {"name": "San Francisco", "region": "California"},
        "current": {"temp_c": 13.9, "last_updated_epoch": 1744038900}
      })json"));
  EXPECT_THAT(observation.report, Eq(WeatherReport{"San Francisco", 13}));
  EXPECT_THAT(observation.last_updated_ms, Eq(kTimestampMs));
}

TEST(ParseWeatherObservationTest, MissingFieldsTakeDefaults) {
  WeatherObservation observation;
  VERITAS_ASSERT_OK_AND_ASSIGN(observation,
                               ParseWeatherObservation(R"({"current": {}})"));
  EXPECT_THAT(observation.report, Eq(WeatherReport{"Unknown", 0}));
  EXPECT_THAT(observation.last_updated_ms, Eq(0));
}

TEST(ParseWeatherObservationTest, NegativeTemperatureIsZero) {
  WeatherObservation observation;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      observation,
      ParseWeatherObservation(R"({"current": {"temp_c": -4.5}})"));
  EXPECT_THAT(observation.report.temperature, Eq(0));
}

TEST(ParseWeatherObservationTest, RejectsMalformedDocument) {
  EXPECT_THAT(ParseWeatherObservation("not json"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

class SignWeatherObservationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::vector<uint8_t> seed;
    VERITAS_ASSERT_OK_AND_ASSIGN(seed, HexToBytes(kFixedSeedHex));
    std::unique_ptr<Ed25519SigningKey> signing_key;
    VERITAS_ASSERT_OK_AND_ASSIGN(signing_key,
                                 Ed25519SigningKey::CreateFromSeed(seed));
    std::unique_ptr<EphemeralIdentity> identity;
    VERITAS_ASSERT_OK_AND_ASSIGN(
        identity, EphemeralIdentity::FromSigningKey(std::move(signing_key)));
    service_ = absl::make_unique<EnclaveService>(
        std::move(identity), EnclaveServiceConfig(), nsm_.Opener());
  }

  WeatherObservation GoldenObservation() {
    return WeatherObservation{WeatherReport{"San Francisco", 13},
                              kTimestampMs};
  }

  FakeNsm nsm_;
  std::unique_ptr<EnclaveService> service_;
};

TEST_F(SignWeatherObservationTest, ProducesGoldenSignature) {
  SignedResponse<WeatherReport> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignWeatherObservation(*service_, GoldenObservation(), kTimestampMs));
  EXPECT_THAT(signed_response.signature, StrEq(kGoldenSignatureHex));
  EXPECT_THAT(signed_response.response.intent, Eq(IntentScope::kWeather));
  EXPECT_THAT(signed_response.response.timestamp_ms, Eq(kTimestampMs));

  std::unique_ptr<VerifyingKey> verifying_key;
  VERITAS_ASSERT_OK_AND_ASSIGN(verifying_key,
                               service_->identity().GetVerifyingKey());
  VERITAS_EXPECT_OK(VerifySignedResponse(*verifying_key, signed_response));
}

TEST_F(SignWeatherObservationTest, AcceptsObservationExactlyAtTheLimit) {
  VERITAS_EXPECT_OK(SignWeatherObservation(*service_, GoldenObservation(),
                                           kTimestampMs + kWeatherMaxAgeMs));
  VERITAS_EXPECT_OK(SignWeatherObservation(
      *service_, GoldenObservation(), kTimestampMs + kWeatherMaxAgeMs - 1));
}

TEST_F(SignWeatherObservationTest, RejectsStaleObservation) {
  EXPECT_THAT(
      SignWeatherObservation(*service_, GoldenObservation(),
                             kTimestampMs + kWeatherMaxAgeMs + 1),
      StatusIs(absl::StatusCode::kFailedPrecondition, HasSubstr("stale")));
}

TEST_F(SignWeatherObservationTest, EnvelopeJson) {
  SignedResponse<WeatherReport> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignWeatherObservation(*service_, GoldenObservation(), kTimestampMs));
  std::string json;
  VERITAS_ASSERT_OK_AND_ASSIGN(json, SignedResponseToJson(signed_response));
  EXPECT_THAT(json, HasSubstr("\"location\":\"San Francisco\""));
  EXPECT_THAT(json, HasSubstr(kGoldenSignatureHex));
}

TEST_F(SignWeatherObservationTest, EnvelopeRoundTripsThroughVerifier) {
  SignedResponse<WeatherReport> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignWeatherObservation(*service_, GoldenObservation(), kTimestampMs));
  std::string json;
  VERITAS_ASSERT_OK_AND_ASSIGN(json, SignedResponseToJson(signed_response));

  // Rebuild the message from the JSON alone and check it against the key the
  // service publishes.
  google::protobuf::Struct envelope;
  auto parse_status =
      google::protobuf::util::JsonStringToMessage(json, &envelope);
  ASSERT_TRUE(parse_status.ok()) << parse_status.ToString();
  const google::protobuf::Struct &response =
      envelope.fields().at("response").struct_value();
  const google::protobuf::Struct &data =
      response.fields().at("data").struct_value();
  SignedResponse<WeatherReport> rebuilt;
  rebuilt.response.intent = static_cast<IntentScope>(
      static_cast<uint8_t>(response.fields().at("intent").number_value()));
  rebuilt.response.timestamp_ms = static_cast<uint64_t>(
      response.fields().at("timestamp_ms").number_value());
  rebuilt.response.data.location = data.fields().at("location").string_value();
  rebuilt.response.data.temperature = static_cast<uint64_t>(
      data.fields().at("temperature").number_value());
  rebuilt.signature = envelope.fields().at("signature").string_value();

  IdentityResponse identity;
  VERITAS_ASSERT_OK_AND_ASSIGN(identity, service_->GetIdentity());
  VERITAS_EXPECT_OK(VerifyWithIdentity(identity, rebuilt));
}

TEST_F(SignWeatherObservationTest, InexactTemperatureIsNotRendered) {
  WeatherObservation observation = GoldenObservation();
  observation.report.temperature = (uint64_t{1} << 53) + 1;
  SignedResponse<WeatherReport> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignWeatherObservation(*service_, observation, kTimestampMs));
  EXPECT_THAT(SignedResponseToJson(signed_response),
              StatusIs(absl::StatusCode::kOutOfRange));
}

TEST_F(SignWeatherObservationTest, SaturatedTemperatureIsNotRendered) {
  WeatherObservation observation;
  VERITAS_ASSERT_OK_AND_ASSIGN(observation, ParseWeatherObservation(R"json({
        "current": {"temp_c": 1e300, "last_updated_epoch": 1744038900}
      })json"));
  SignedResponse<WeatherReport> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignWeatherObservation(*service_, observation, kTimestampMs));
  EXPECT_THAT(SignedResponseToJson(signed_response),
              StatusIs(absl::StatusCode::kOutOfRange));
}

}  // namespace
}  // namespace veritas
