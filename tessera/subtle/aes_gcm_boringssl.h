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

#ifndef TESSERA_SUBTLE_AES_GCM_BORINGSSL_H_
#define TESSERA_SUBTLE_AES_GCM_BORINGSSL_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "openssl/evp.h"
#include "tessera/aead.h"
#include "tessera/secret_data.h"

namespace crypto {
namespace tessera {
namespace subtle {

// AES-GCM with a 12-byte random IV and a 16-byte tag. The ciphertext is
// iv || encrypted_plaintext || tag.
class AesGcmBoringSsl : public Aead {
 public:
  static absl::StatusOr<std::unique_ptr<Aead>> New(SecretData key);

  absl::StatusOr<std::string> Encrypt(
      absl::string_view plaintext,
      absl::string_view associated_data) const override;

  absl::StatusOr<std::string> Decrypt(
      absl::string_view ciphertext,
      absl::string_view associated_data) const override;

  static constexpr int kIvSizeInBytes = 12;
  static constexpr int kTagSizeInBytes = 16;

 private:
  AesGcmBoringSsl(const EVP_CIPHER* cipher, SecretData key)
      : cipher_(cipher), key_(std::move(key)) {}

  // Owned by OpenSSL.
  const EVP_CIPHER* const cipher_;
  const SecretData key_;
};

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SUBTLE_AES_GCM_BORINGSSL_H_
