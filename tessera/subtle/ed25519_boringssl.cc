// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
///////////////////////////////////////////////////////////////////////////////

#include "tessera/subtle/ed25519_boringssl.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "openssl/evp.h"
#include "tessera/internal/ec_util.h"
#include "tessera/internal/ssl_unique_ptr.h"
#include "tessera/internal/util.h"
#include "tessera/public_key_sign.h"
#include "tessera/public_key_verify.h"
#include "tessera/secret_data.h"
#include "tessera/util/errors.h"

namespace crypto {
namespace tessera {
namespace subtle {
namespace {

enum class KeyHalf { kPrivate, kPublic };

// Imports a raw 32-byte Ed25519 key into an EVP_PKEY.
absl::StatusOr<internal::SslUniquePtr<EVP_PKEY>> ImportRawKey(
    const uint8_t* bytes, size_t size, KeyHalf half) {
  const size_t expected_size = static_cast<size_t>(
      half == KeyHalf::kPrivate ? internal::Ed25519KeyPrivKeySize()
                                : internal::Ed25519KeyPubKeySize());
  if (size != expected_size) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Ed25519 %s key has %d bytes, want %d.",
                     half == KeyHalf::kPrivate ? "private" : "public", size,
                     expected_size);
  }
  internal::SslUniquePtr<EVP_PKEY> key(
      half == KeyHalf::kPrivate
          ? EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, bytes,
                                         size)
          : EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, bytes,
                                        size));
  if (key == nullptr) {
    return absl::Status(absl::StatusCode::kInternal,
                        "Could not import the Ed25519 key.");
  }
  return std::move(key);
}

}  // namespace

absl::StatusOr<std::unique_ptr<PublicKeySign>> Ed25519SignBoringSsl::New(
    const SecretData& private_key) {
  absl::StatusOr<internal::SslUniquePtr<EVP_PKEY>> key = ImportRawKey(
      private_key.data(), private_key.size(), KeyHalf::kPrivate);
  if (!key.ok()) return key.status();
  return {absl::WrapUnique(new Ed25519SignBoringSsl(*std::move(key)))};
}

absl::StatusOr<std::string> Ed25519SignBoringSsl::Sign(
    absl::string_view data) const {
  data = internal::EnsureStringNonNull(data);
  internal::SslUniquePtr<EVP_MD_CTX> ctx(EVP_MD_CTX_new());
  // Ed25519 hashes internally, so no digest is passed.
  if (ctx == nullptr ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
          1) {
    return absl::Status(absl::StatusCode::kInternal,
                        "Could not initialize Ed25519 signing.");
  }
  std::string signature(kEd25519SignatureSize, '\0');
  size_t signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<uint8_t*>(&signature[0]),
                     &signature_size,
                     reinterpret_cast<const uint8_t*>(data.data()),
                     data.size()) != 1 ||
      signature_size != static_cast<size_t>(kEd25519SignatureSize)) {
    return absl::Status(absl::StatusCode::kInternal, "Signing failed.");
  }
  return signature;
}

absl::StatusOr<std::unique_ptr<PublicKeyVerify>> Ed25519VerifyBoringSsl::New(
    absl::string_view public_key) {
  absl::StatusOr<internal::SslUniquePtr<EVP_PKEY>> key = ImportRawKey(
      reinterpret_cast<const uint8_t*>(public_key.data()), public_key.size(),
      KeyHalf::kPublic);
  if (!key.ok()) return key.status();
  return {absl::WrapUnique(new Ed25519VerifyBoringSsl(*std::move(key)))};
}

absl::Status Ed25519VerifyBoringSsl::Verify(absl::string_view signature,
                                            absl::string_view data) const {
  signature = internal::EnsureStringNonNull(signature);
  data = internal::EnsureStringNonNull(data);
  if (signature.size() != static_cast<size_t>(kEd25519SignatureSize)) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Ed25519 signature has %d bytes, want %d.",
                     signature.size(), kEd25519SignatureSize);
  }
  internal::SslUniquePtr<EVP_MD_CTX> ctx(EVP_MD_CTX_new());
  if (ctx == nullptr ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr,
                           key_.get()) != 1) {
    return absl::Status(absl::StatusCode::kInternal,
                        "Could not initialize Ed25519 verification.");
  }
  if (EVP_DigestVerify(ctx.get(),
                       reinterpret_cast<const uint8_t*>(signature.data()),
                       signature.size(),
                       reinterpret_cast<const uint8_t*>(data.data()),
                       data.size()) != 1) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Signature is not valid.");
  }
  return absl::OkStatus();
}

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto
