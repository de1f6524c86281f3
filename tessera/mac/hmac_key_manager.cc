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

#include "tessera/mac/hmac_key_manager.h"

#include <cstdint>
#include <map>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/secret_data.h"
#include "tessera/subtle/hmac_boringssl.h"
#include "tessera/subtle/random.h"
#include "tessera/util/errors.h"
#include "tessera/util/secret_data.h"
#include "tessera/util/validation.h"
#include "proto/common.pb.h"
#include "proto/hmac.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::HashType;
using ::crypto::tessera::proto::HmacKey;
using ::crypto::tessera::proto::HmacKeyFormat;
using ::crypto::tessera::proto::HmacParams;

namespace {

constexpr uint32_t kMinTagSizeInBytes = 10;

absl::Status ValidateParams(const HmacParams& params) {
  static const std::map<HashType, uint32_t>* max_tag_size =
      new std::map<HashType, uint32_t>({{HashType::SHA1, 20},
                                        {HashType::SHA224, 28},
                                        {HashType::SHA256, 32},
                                        {HashType::SHA384, 48},
                                        {HashType::SHA512, 64}});
  auto it = max_tag_size->find(params.hash());
  if (it == max_tag_size->end()) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "HashType '%s' is not supported.",
                     proto::HashType_Name(params.hash()));
  }
  if (params.tag_size() < kMinTagSizeInBytes) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Invalid HmacParams: tag_size %d is too small.",
                     params.tag_size());
  }
  if (params.tag_size() > it->second) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Invalid HmacParams: tag_size %d is too big for "
                     "HashType '%s'.",
                     params.tag_size(), proto::HashType_Name(params.hash()));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<HmacKey> HmacKeyManager::CreateKey(
    const HmacKeyFormat& hmac_key_format) const {
  HmacKey hmac_key;
  hmac_key.set_version(get_version());
  *(hmac_key.mutable_params()) = hmac_key_format.params();
  SecretData key_value =
      subtle::Random::GetRandomKeyBytes(hmac_key_format.key_size());
  hmac_key.set_key_value(std::string(util::SecretDataAsStringView(key_value)));
  return hmac_key;
}

absl::Status HmacKeyManager::ValidateKey(const HmacKey& key) const {
  absl::Status status = ValidateVersion(key.version(), get_version());
  if (!status.ok()) return status;
  if (key.key_value().size() < subtle::HmacBoringSsl::kMinKeySize) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Invalid HmacKey: key_value is too short.");
  }
  return ValidateParams(key.params());
}

absl::Status HmacKeyManager::ValidateKeyFormat(
    const HmacKeyFormat& key_format) const {
  absl::Status status = ValidateVersion(key_format.version(), get_version());
  if (!status.ok()) return status;
  if (key_format.key_size() < subtle::HmacBoringSsl::kMinKeySize) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Invalid HmacKeyFormat: key_size is too small.");
  }
  return ValidateParams(key_format.params());
}

}  // namespace tessera
}  // namespace crypto
