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

#include "tessera/crypto_format.h"

#include <cstdint>
#include <string>

#include "absl/base/internal/endian.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

namespace {

using ::crypto::tessera::proto::KeysetInfo;
using ::crypto::tessera::proto::OutputPrefixType;

std::string PrefixWithKeyId(uint8_t start_byte, uint32_t key_id) {
  std::string prefix(CryptoFormat::kNonRawPrefixSize, '\0');
  prefix[0] = static_cast<char>(start_byte);
  absl::big_endian::Store32(&prefix[1], key_id);
  return prefix;
}

}  // namespace

// static
absl::StatusOr<std::string> CryptoFormat::GetOutputPrefix(
    const KeysetInfo::KeyInfo& key_info) {
  static_assert(sizeof(key_info.key_id()) == sizeof(uint32_t), "");
  switch (key_info.output_prefix_type()) {
    case OutputPrefixType::TINK:
      return PrefixWithKeyId(kTinkStartByte, key_info.key_id());
    case OutputPrefixType::CRUNCHY:
      // FALLTHROUGH
    case OutputPrefixType::LEGACY:
      return PrefixWithKeyId(kLegacyStartByte, key_info.key_id());
    case OutputPrefixType::RAW:
      return std::string(kRawPrefix);
    default:
      return absl::Status(absl::StatusCode::kInvalidArgument,
                          "The given key has invalid OutputPrefixType.");
  }
}

// static
bool CryptoFormat::HasNonRawPrefix(absl::string_view output) {
  if (output.size() < kNonRawPrefixSize) return false;
  uint8_t first_byte = static_cast<uint8_t>(output[0]);
  return first_byte == kTinkStartByte || first_byte == kLegacyStartByte;
}

}  // namespace tessera
}  // namespace crypto
