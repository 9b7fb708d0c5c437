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

#ifndef VERITAS_NSM_FAKE_NSM_H_
#define VERITAS_NSM_FAKE_NSM_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "veritas/nsm/nsm_device.h"
#include "veritas/nsm/nsm_messages.h"

namespace veritas {

// The module id written into documents produced by FakeNsm.
inline constexpr char kFakeNsmModuleId[] = "fake-nsm";

// FakeNsm simulates a Nitro Security Module for tests. Handles returned by
// Opener() share this object's state, which must outlive them.
//
// Attestation documents produced by the fake are CBOR maps with the text keys
// "module_id", "user_data", "nonce" and "public_key", carrying the request's
// fields unchanged. GetRandom returns a deterministic counting byte sequence.
// Both behaviors can be overridden to inject faults.
class FakeNsm {
 public:
  FakeNsm() = default;

  FakeNsm(const FakeNsm &other) = delete;
  FakeNsm &operator=(const FakeNsm &other) = delete;

  // Returns an opener for handles to this fake.
  NsmDeviceOpener Opener();

  // Makes every subsequent open fail with |status|.
  void set_open_error(absl::Status status);

  // Makes every subsequent exchange fail with |status|.
  void set_transact_error(absl::Status status);

  // Makes every subsequent exchange return |response| regardless of request.
  void set_response_override(NsmResponse response);

  // Sets the number of bytes returned by each GetRandom request.
  void set_random_chunk_size(size_t size);

  // Number of handles currently open.
  int open_handles() const;

  // Number of handles ever opened successfully.
  int total_opens() const;

  // Number of requests received.
  int request_count() const;

 private:
  class Handle;

  absl::StatusOr<CleansingVector<uint8_t>> Process(ByteContainerView request);
  void OnClose();

  mutable absl::Mutex mu_;
  absl::Status open_error_ ABSL_GUARDED_BY(mu_);
  absl::Status transact_error_ ABSL_GUARDED_BY(mu_);
  absl::optional<NsmResponse> response_override_ ABSL_GUARDED_BY(mu_);
  size_t random_chunk_size_ ABSL_GUARDED_BY(mu_) = 256;
  uint8_t next_random_byte_ ABSL_GUARDED_BY(mu_) = 0;
  int open_handles_ ABSL_GUARDED_BY(mu_) = 0;
  int total_opens_ ABSL_GUARDED_BY(mu_) = 0;
  int request_count_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace veritas

#endif  // VERITAS_NSM_FAKE_NSM_H_
