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

#include "veritas/crypto/ed25519_signing_key.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "veritas/crypto/bssl_util.h"
#include "veritas/util/cleansing_allocator.h"
#include "veritas/util/proto_enum_util.h"
#include "veritas/util/status_macros.h"

namespace veritas {
namespace {

using EvpMdCtxPtr = FunctionUniquePtr<EVP_MD_CTX, EVP_MD_CTX_free>;

absl::StatusOr<std::vector<uint8_t>> RawPublicKey(const EVP_PKEY *key) {
  std::vector<uint8_t> raw_key(kEd25519PublicKeySize);
  size_t raw_key_size = raw_key.size();
  if (EVP_PKEY_get_raw_public_key(key, raw_key.data(), &raw_key_size) != 1) {
    return absl::InternalError(absl::StrCat(
        "Failed to export Ed25519 public key: ", BsslLastErrorString()));
  }
  raw_key.resize(raw_key_size);
  return raw_key;
}

}  // namespace

absl::StatusOr<std::unique_ptr<Ed25519VerifyingKey>>
Ed25519VerifyingKey::Create(ByteContainerView raw_public_key) {
  if (raw_public_key.size() != kEd25519PublicKeySize) {
    return absl::InvalidArgumentError(
        absl::StrCat("Ed25519 public key must be ", kEd25519PublicKeySize,
                     " bytes, got ", raw_public_key.size()));
  }
  EvpPkeyPtr key(EVP_PKEY_new_raw_public_key(
      EVP_PKEY_ED25519, /*unused=*/nullptr, raw_public_key.data(),
      raw_public_key.size()));
  if (!key) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid Ed25519 public key: ", BsslLastErrorString()));
  }
  std::vector<uint8_t> raw_key(raw_public_key.begin(), raw_public_key.end());
  return absl::WrapUnique(
      new Ed25519VerifyingKey(std::move(key), std::move(raw_key)));
}

absl::StatusOr<std::unique_ptr<Ed25519VerifyingKey>>
Ed25519VerifyingKey::CreateFromProto(const VerifyingKeyProto &key_proto) {
  if (key_proto.signature_scheme() != ED25519) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Signature scheme of the key (",
        ProtoEnumValueName(key_proto.signature_scheme()),
        ") does not match the expected signature scheme (",
        ProtoEnumValueName(ED25519), ")"));
  }
  return Create(key_proto.key());
}

Ed25519VerifyingKey::Ed25519VerifyingKey(EvpPkeyPtr public_key,
                                         std::vector<uint8_t> raw_public_key)
    : public_key_(std::move(public_key)),
      raw_public_key_(std::move(raw_public_key)) {}

bool Ed25519VerifyingKey::operator==(const VerifyingKey &other) const {
  const Ed25519VerifyingKey *other_key =
      dynamic_cast<const Ed25519VerifyingKey *>(&other);
  if (other_key == nullptr) {
    return false;
  }
  return raw_public_key_ == other_key->raw_public_key_;
}

SignatureScheme Ed25519VerifyingKey::GetSignatureScheme() const {
  return ED25519;
}

std::vector<uint8_t> Ed25519VerifyingKey::SerializeToRaw() const {
  return raw_public_key_;
}

absl::Status Ed25519VerifyingKey::Verify(ByteContainerView message,
                                         ByteContainerView signature) const {
  if (signature.size() != kEd25519SignatureSize) {
    return absl::InvalidArgumentError(
        absl::StrCat("Ed25519 signature must be ", kEd25519SignatureSize,
                     " bytes, got ", signature.size()));
  }
  EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
  if (!md_ctx) {
    return absl::InternalError(BsslLastErrorString());
  }
  // Ed25519 hashes internally, so no message digest is configured.
  if (EVP_DigestVerifyInit(md_ctx.get(), /*pctx=*/nullptr, /*type=*/nullptr,
                           /*e=*/nullptr, public_key_.get()) != 1) {
    return absl::InternalError(absl::StrCat(
        "Failed to initialize Ed25519 verification: ", BsslLastErrorString()));
  }
  if (EVP_DigestVerify(md_ctx.get(), signature.data(), signature.size(),
                       message.data(), message.size()) != 1) {
    return absl::UnauthenticatedError(absl::StrCat(
        "Ed25519 signature verification failed: ", BsslLastErrorString()));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<Ed25519SigningKey>> Ed25519SigningKey::Create() {
  CleansingVector<uint8_t> seed(kEd25519SeedSize);
  if (RAND_bytes(seed.data(), seed.size()) != 1) {
    return absl::InternalError(absl::StrCat(
        "Failed to generate Ed25519 seed: ", BsslLastErrorString()));
  }
  return CreateFromSeed(seed);
}

absl::StatusOr<std::unique_ptr<Ed25519SigningKey>>
Ed25519SigningKey::CreateFromSeed(ByteContainerView seed) {
  if (seed.size() != kEd25519SeedSize) {
    return absl::InvalidArgumentError(
        absl::StrCat("Ed25519 seed must be ", kEd25519SeedSize, " bytes, got ",
                     seed.size()));
  }
  EvpPkeyPtr key(EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, /*unused=*/nullptr, seed.data(), seed.size()));
  if (!key) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid Ed25519 seed: ", BsslLastErrorString()));
  }
  return absl::WrapUnique(new Ed25519SigningKey(std::move(key)));
}

Ed25519SigningKey::Ed25519SigningKey(EvpPkeyPtr private_key)
    : private_key_(std::move(private_key)) {}

absl::StatusOr<std::vector<uint8_t>> Ed25519SigningKey::GetRawPublicKey()
    const {
  return RawPublicKey(private_key_.get());
}

SignatureScheme Ed25519SigningKey::GetSignatureScheme() const {
  return ED25519;
}

absl::StatusOr<std::unique_ptr<VerifyingKey>>
Ed25519SigningKey::GetVerifyingKey() const {
  std::vector<uint8_t> raw_public_key;
  VERITAS_ASSIGN_OR_RETURN(raw_public_key, GetRawPublicKey());
  std::unique_ptr<Ed25519VerifyingKey> verifying_key;
  VERITAS_ASSIGN_OR_RETURN(verifying_key,
                           Ed25519VerifyingKey::Create(raw_public_key));
  return std::unique_ptr<VerifyingKey>(std::move(verifying_key));
}

absl::Status Ed25519SigningKey::Sign(ByteContainerView message,
                                     std::vector<uint8_t> *signature) const {
  EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
  if (!md_ctx) {
    return absl::InternalError(BsslLastErrorString());
  }
  if (EVP_DigestSignInit(md_ctx.get(), /*pctx=*/nullptr, /*type=*/nullptr,
                         /*e=*/nullptr, private_key_.get()) != 1) {
    return absl::InternalError(absl::StrCat(
        "Failed to initialize Ed25519 signing: ", BsslLastErrorString()));
  }
  std::vector<uint8_t> result(kEd25519SignatureSize);
  size_t signature_size = result.size();
  if (EVP_DigestSign(md_ctx.get(), result.data(), &signature_size,
                     message.data(), message.size()) != 1) {
    return absl::InternalError(
        absl::StrCat("Ed25519 signing failed: ", BsslLastErrorString()));
  }
  result.resize(signature_size);
  *signature = std::move(result);
  return absl::OkStatus();
}

}  // namespace veritas
