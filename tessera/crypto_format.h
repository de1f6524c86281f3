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

#ifndef TESSERA_CRYPTO_FORMAT_H_
#define TESSERA_CRYPTO_FORMAT_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Constants and convenience methods that deal with crypto format.
class CryptoFormat {
 public:
  // Prefix size of Tink, Legacy and Crunchy output prefix types.
  static constexpr int kNonRawPrefixSize = 5;

  // Legacy or Crunchy prefix starts with \x00 and followed by a 4-byte key id.
  static constexpr int kLegacyPrefixSize = kNonRawPrefixSize;
  static constexpr uint8_t kLegacyStartByte = 0x00;

  // Tink prefix starts with \x01 and followed by a 4-byte key id.
  static constexpr int kTinkPrefixSize = kNonRawPrefixSize;
  static constexpr uint8_t kTinkStartByte = 0x01;

  // Raw prefix is empty.
  static constexpr int kRawPrefixSize = 0;
  static constexpr absl::string_view kRawPrefix = "";

  // Byte appended to the data before computing MACs or signatures with keys
  // whose output prefix type is LEGACY.
  static constexpr char kLegacyMessageSuffix = '\x00';

  // Generates the prefix for the outputs handled by the specified `key_info`.
  // Returns an error if the prefix type of `key_info` is unknown.
  static absl::StatusOr<std::string> GetOutputPrefix(
      const proto::KeysetInfo::KeyInfo& key_info);

  // Returns true if `output` is long enough to carry a non-RAW prefix and
  // starts with the first byte of one.
  static bool HasNonRawPrefix(absl::string_view output);
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_CRYPTO_FORMAT_H_
