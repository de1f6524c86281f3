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

#ifndef TESSERA_SUBTLE_HMAC_BORINGSSL_H_
#define TESSERA_SUBTLE_HMAC_BORINGSSL_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "openssl/evp.h"
#include "tessera/mac.h"
#include "tessera/secret_data.h"
#include "tessera/subtle/common_enums.h"

namespace crypto {
namespace tessera {
namespace subtle {

class HmacBoringSsl : public Mac {
 public:
  static absl::StatusOr<std::unique_ptr<Mac>> New(HashType hash_type,
                                                  uint32_t tag_size,
                                                  SecretData key);

  // Returns the first tag_size bytes of HMAC(key, data).
  absl::StatusOr<std::string> ComputeMac(
      absl::string_view data) const override;

  // Compares in constant time against the truncated HMAC of `data`.
  absl::Status VerifyMac(absl::string_view mac,
                         absl::string_view data) const override;

  static constexpr size_t kMinKeySize = 16;

 private:
  HmacBoringSsl(const EVP_MD* md, uint32_t tag_size, SecretData key)
      : md_(md), tag_size_(tag_size), key_(std::move(key)) {}

  // Writes the untruncated HMAC of `data` to `out`, which must hold
  // EVP_MAX_MD_SIZE bytes.
  absl::Status FullTag(absl::string_view data, uint8_t* out) const;

  const EVP_MD* const md_;  // Static, owned by OpenSSL.
  const uint32_t tag_size_;
  const SecretData key_;
};

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SUBTLE_HMAC_BORINGSSL_H_
