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

#include "tessera/subtle/hmac_boringssl.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "openssl/crypto.h"
#include "openssl/evp.h"
#include "openssl/hmac.h"
#include "tessera/internal/md_util.h"
#include "tessera/internal/util.h"
#include "tessera/mac.h"
#include "tessera/secret_data.h"
#include "tessera/subtle/common_enums.h"
#include "tessera/util/errors.h"

namespace crypto {
namespace tessera {
namespace subtle {

absl::StatusOr<std::unique_ptr<Mac>> HmacBoringSsl::New(HashType hash_type,
                                                        uint32_t tag_size,
                                                        SecretData key) {
  absl::StatusOr<const EVP_MD*> md = internal::EvpHashFromHashType(hash_type);
  if (!md.ok()) return md.status();
  if (tag_size > static_cast<uint32_t>(EVP_MD_size(*md))) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Tag size %d exceeds the %s digest size.", tag_size,
                     EnumToString(hash_type));
  }
  if (key.size() < kMinKeySize) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "HMAC key has %d bytes, want at least %d.", key.size(),
                     kMinKeySize);
  }
  return {absl::WrapUnique(new HmacBoringSsl(*md, tag_size, std::move(key)))};
}

absl::Status HmacBoringSsl::FullTag(absl::string_view data,
                                    uint8_t* out) const {
  data = internal::EnsureStringNonNull(data);
  unsigned int out_len = 0;
  if (HMAC(md_, key_.data(), key_.size(),
           reinterpret_cast<const uint8_t*>(data.data()), data.size(), out,
           &out_len) == nullptr ||
      out_len < tag_size_) {
    return absl::Status(absl::StatusCode::kInternal, "HMAC failed.");
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> HmacBoringSsl::ComputeMac(
    absl::string_view data) const {
  SecretData tag(EVP_MAX_MD_SIZE);
  absl::Status status = FullTag(data, tag.data());
  if (!status.ok()) return status;
  return std::string(reinterpret_cast<const char*>(tag.data()), tag_size_);
}

absl::Status HmacBoringSsl::VerifyMac(absl::string_view mac,
                                      absl::string_view data) const {
  if (mac.size() != tag_size_) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "MAC has %d bytes, want %d.", mac.size(), tag_size_);
  }
  SecretData expected(EVP_MAX_MD_SIZE);
  absl::Status status = FullTag(data, expected.data());
  if (!status.ok()) return status;
  if (CRYPTO_memcmp(expected.data(), mac.data(), tag_size_) != 0) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "MAC verification failed.");
  }
  return absl::OkStatus();
}

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto
