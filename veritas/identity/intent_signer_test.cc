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

#include "veritas/identity/intent_signer.h"

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "veritas/crypto/ed25519_signing_key.h"
#include "veritas/identity/ephemeral_identity.h"
#include "veritas/test/util/status_matchers.h"
#include "veritas/util/hex_util.h"

namespace veritas {
namespace {

using ::testing::Eq;
using ::testing::Ne;
using ::testing::SizeIs;

// The seed of RFC 8032 test vector 1.
constexpr char kFixedSeedHex[] =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";

// Signature under kFixedSeedHex over the canonical bytes of
// {Weather, 1744038900000, {"San Francisco", 13}}.
constexpr char kGoldenSignatureHex[] =
    "023c13f7a24c26363591b93b467afbee9f208d040dcf724c19324e58d0cfbb984a10677a"
    "d011094f09ef05a210dfb503f99ac87d6afe268c5a44919b2f17490d";

struct Reading {
  std::string location;
  uint64_t temperature = 0;

  absl::Status SerializeBcs(BcsWriter *writer) const {
    VERITAS_RETURN_IF_ERROR(BcsSerialize(location, writer));
    return BcsSerialize(temperature, writer);
  }
};

// A payload whose encoding always fails.
struct Unencodable {
  absl::Status SerializeBcs(BcsWriter *writer) const {
    return absl::InvalidArgumentError("cannot encode");
  }
};

class IntentSignerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::vector<uint8_t> seed;
    VERITAS_ASSERT_OK_AND_ASSIGN(seed, HexToBytes(kFixedSeedHex));
    std::unique_ptr<Ed25519SigningKey> signing_key;
    VERITAS_ASSERT_OK_AND_ASSIGN(signing_key,
                                 Ed25519SigningKey::CreateFromSeed(seed));
    VERITAS_ASSERT_OK_AND_ASSIGN(
        identity_, EphemeralIdentity::FromSigningKey(std::move(signing_key)));
    VERITAS_ASSERT_OK_AND_ASSIGN(verifying_key_, identity_->GetVerifyingKey());
  }

  std::unique_ptr<EphemeralIdentity> identity_;
  std::unique_ptr<VerifyingKey> verifying_key_;
};

TEST_F(IntentSignerTest, SignsGoldenMessageDeterministically) {
  SignedResponse<Reading> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response, SignIntent(*identity_, Reading{"San Francisco", 13},
                                  1744038900000ULL, IntentScope::kWeather));
  EXPECT_THAT(signed_response.signature, Eq(kGoldenSignatureHex));
  EXPECT_THAT(signed_response.response.intent, Eq(IntentScope::kWeather));
  EXPECT_THAT(signed_response.response.timestamp_ms, Eq(1744038900000ULL));
  EXPECT_THAT(signed_response.response.data.location, Eq("San Francisco"));
  EXPECT_THAT(signed_response.response.data.temperature, Eq(13));
}

TEST_F(IntentSignerTest, SignatureVerifiesAfterIndependentCanonicalization) {
  SignedResponse<Reading> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignIntent(*identity_, Reading{"Zurich", 4}, 42, IntentScope::kWeather));
  EXPECT_THAT(signed_response.signature, SizeIs(2 * kEd25519SignatureSize));
  VERITAS_EXPECT_OK(VerifySignedResponse(*verifying_key_, signed_response));
}

TEST_F(IntentSignerTest, TamperedResponseFailsVerification) {
  SignedResponse<Reading> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignIntent(*identity_, Reading{"Zurich", 4}, 42, IntentScope::kWeather));

  SignedResponse<Reading> altered_data = signed_response;
  altered_data.response.data.temperature = 5;
  EXPECT_THAT(VerifySignedResponse(*verifying_key_, altered_data),
              StatusIs(absl::StatusCode::kUnauthenticated));

  SignedResponse<Reading> altered_time = signed_response;
  altered_time.response.timestamp_ms = 43;
  EXPECT_THAT(VerifySignedResponse(*verifying_key_, altered_time),
              StatusIs(absl::StatusCode::kUnauthenticated));
}

TEST_F(IntentSignerTest, ScopesProduceDistinctBytesAndSignatures) {
  IntentScope other_scope = static_cast<IntentScope>(1);
  IntentMessage<Reading> weather{IntentScope::kWeather, 7, {"Oslo", 1}};
  IntentMessage<Reading> other{other_scope, 7, {"Oslo", 1}};
  std::vector<uint8_t> weather_bytes;
  VERITAS_ASSERT_OK_AND_ASSIGN(weather_bytes,
                               CanonicalizeIntentMessage(weather));
  EXPECT_THAT(CanonicalizeIntentMessage(other),
              IsOkAndHolds(Ne(weather_bytes)));

  SignedResponse<Reading> signed_weather;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_weather,
      SignIntent(*identity_, Reading{"Oslo", 1}, 7, IntentScope::kWeather));
  SignedResponse<Reading> replayed = signed_weather;
  replayed.response.intent = other_scope;
  EXPECT_THAT(VerifySignedResponse(*verifying_key_, replayed),
              StatusIs(absl::StatusCode::kUnauthenticated));
}

TEST_F(IntentSignerTest, EncodingFailurePropagatesWithoutSignature) {
  EXPECT_THAT(SignIntent(*identity_, Unencodable{}, 1, IntentScope::kWeather),
              StatusIs(absl::StatusCode::kInvalidArgument, "cannot encode"));
}

TEST_F(IntentSignerTest, MalformedSignatureHexIsRejected) {
  SignedResponse<Reading> signed_response;
  VERITAS_ASSERT_OK_AND_ASSIGN(
      signed_response,
      SignIntent(*identity_, Reading{"Lima", 20}, 9, IntentScope::kWeather));
  signed_response.signature = "not hex";
  EXPECT_THAT(VerifySignedResponse(*verifying_key_, signed_response),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(IntentSignerTest, ConcurrentSigningSharesOneIdentity) {
  constexpr int kThreads = 8;
  constexpr int kSignaturesPerThread = 16;
  std::vector<std::string> signatures(kThreads * kSignaturesPerThread);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, t, &signatures]() {
      for (int i = 0; i < kSignaturesPerThread; ++i) {
        auto signed_or = SignIntent(*identity_, Reading{"San Francisco", 13},
                                    1744038900000ULL, IntentScope::kWeather);
        if (signed_or.ok()) {
          signatures[t * kSignaturesPerThread + i] = signed_or->signature;
        }
      }
    });
  }
  for (std::thread &thread : threads) {
    thread.join();
  }
  for (const std::string &signature : signatures) {
    EXPECT_THAT(signature, Eq(kGoldenSignatureHex));
  }
}

}  // namespace
}  // namespace veritas
