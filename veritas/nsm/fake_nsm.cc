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

#include "veritas/nsm/fake_nsm.h"

#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "veritas/encoding/cbor.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

CleansingVector<uint8_t> ToResponseBuffer(const std::vector<uint8_t> &encoded) {
  return CleansingVector<uint8_t>(encoded.begin(), encoded.end());
}

}  // namespace

class FakeNsm::Handle : public NsmDevice {
 public:
  explicit Handle(FakeNsm *nsm) : nsm_(nsm) {}

  ~Handle() override { nsm_->OnClose(); }

  absl::StatusOr<CleansingVector<uint8_t>> Transact(
      ByteContainerView request) override {
    return nsm_->Process(request);
  }

 private:
  FakeNsm *const nsm_;
};

NsmDeviceOpener FakeNsm::Opener() {
  return [this]() -> absl::StatusOr<std::unique_ptr<NsmDevice>> {
    absl::MutexLock lock(&mu_);
    if (!open_error_.ok()) {
      return open_error_;
    }
    ++open_handles_;
    ++total_opens_;
    return std::unique_ptr<NsmDevice>(absl::make_unique<Handle>(this));
  };
}

void FakeNsm::set_open_error(absl::Status status) {
  absl::MutexLock lock(&mu_);
  open_error_ = std::move(status);
}

void FakeNsm::set_transact_error(absl::Status status) {
  absl::MutexLock lock(&mu_);
  transact_error_ = std::move(status);
}

void FakeNsm::set_response_override(NsmResponse response) {
  absl::MutexLock lock(&mu_);
  response_override_ = std::move(response);
}

void FakeNsm::set_random_chunk_size(size_t size) {
  absl::MutexLock lock(&mu_);
  random_chunk_size_ = size;
}

int FakeNsm::open_handles() const {
  absl::MutexLock lock(&mu_);
  return open_handles_;
}

int FakeNsm::total_opens() const {
  absl::MutexLock lock(&mu_);
  return total_opens_;
}

int FakeNsm::request_count() const {
  absl::MutexLock lock(&mu_);
  return request_count_;
}

void FakeNsm::OnClose() {
  absl::MutexLock lock(&mu_);
  --open_handles_;
}

absl::StatusOr<CleansingVector<uint8_t>> FakeNsm::Process(
    ByteContainerView request) {
  absl::MutexLock lock(&mu_);
  ++request_count_;
  if (!transact_error_.ok()) {
    return transact_error_;
  }
  if (response_override_.has_value()) {
    return ToResponseBuffer(EncodeNsmResponse(*response_override_));
  }

  NsmRequest decoded;
  VERITAS_ASSIGN_OR_RETURN(decoded, DecodeNsmRequest(request));

  if (absl::holds_alternative<NsmGetRandomRequest>(decoded)) {
    NsmGetRandomResponse response;
    for (size_t i = 0; i < random_chunk_size_; ++i) {
      response.random.push_back(next_random_byte_++);
    }
    return ToResponseBuffer(EncodeNsmResponse(response));
  }

  const NsmAttestationRequest &attestation =
      absl::get<NsmAttestationRequest>(decoded);
  auto optional_bytes = [](const absl::optional<std::vector<uint8_t>> &field) {
    return field.has_value() ? CborValue::Bytes(*field) : CborValue::Null();
  };
  CborMap document;
  document.emplace_back(CborValue::Text("module_id"),
                        CborValue::Text(kFakeNsmModuleId));
  document.emplace_back(CborValue::Text("user_data"),
                        optional_bytes(attestation.user_data));
  document.emplace_back(CborValue::Text("nonce"),
                        optional_bytes(attestation.nonce));
  document.emplace_back(CborValue::Text("public_key"),
                        optional_bytes(attestation.public_key));

  NsmAttestationResponse response;
  response.document = EncodeCbor(CborValue::Map(std::move(document)));
  return ToResponseBuffer(EncodeNsmResponse(response));
}

}  // namespace veritas
