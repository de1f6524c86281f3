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

#ifndef TESSERA_SUBTLE_RANDOM_H_
#define TESSERA_SUBTLE_RANDOM_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/types/span.h"
#include "tessera/secret_data.h"

namespace crypto {
namespace tessera {
namespace subtle {

class Random {
 public:
  // Returns a random string of desired length.
  static std::string GetRandomBytes(size_t length);
  // Fills `buffer` with random bytes.
  static void GetRandomBytes(absl::Span<char> buffer);
  static uint32_t GetRandomUInt32();
  static uint16_t GetRandomUInt16();
  static uint8_t GetRandomUInt8();

  // Returns a random SecretData of desired length, to be used as key
  // material.
  static SecretData GetRandomKeyBytes(size_t length);
};

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SUBTLE_RANDOM_H_
