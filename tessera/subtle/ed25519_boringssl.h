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

#ifndef TESSERA_SUBTLE_ED25519_BORINGSSL_H_
#define TESSERA_SUBTLE_ED25519_BORINGSSL_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "openssl/evp.h"
#include "tessera/internal/ssl_unique_ptr.h"
#include "tessera/public_key_sign.h"
#include "tessera/public_key_verify.h"
#include "tessera/secret_data.h"

namespace crypto {
namespace tessera {
namespace subtle {

// Size in bytes of an Ed25519 signature (RFC 8032).
constexpr int kEd25519SignatureSize = 64;

// Pure Ed25519 signing over the EVP interface.
class Ed25519SignBoringSsl : public PublicKeySign {
 public:
  // `private_key` is the 32-byte seed.
  static absl::StatusOr<std::unique_ptr<PublicKeySign>> New(
      const SecretData& private_key);

  absl::StatusOr<std::string> Sign(absl::string_view data) const override;

 private:
  explicit Ed25519SignBoringSsl(internal::SslUniquePtr<EVP_PKEY> key)
      : key_(std::move(key)) {}

  const internal::SslUniquePtr<EVP_PKEY> key_;
};

class Ed25519VerifyBoringSsl : public PublicKeyVerify {
 public:
  // `public_key` is the 32-byte encoded point.
  static absl::StatusOr<std::unique_ptr<PublicKeyVerify>> New(
      absl::string_view public_key);

  absl::Status Verify(absl::string_view signature,
                      absl::string_view data) const override;

 private:
  explicit Ed25519VerifyBoringSsl(internal::SslUniquePtr<EVP_PKEY> key)
      : key_(std::move(key)) {}

  const internal::SslUniquePtr<EVP_PKEY> key_;
};

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SUBTLE_ED25519_BORINGSSL_H_
