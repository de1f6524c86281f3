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

#include "tessera/subtle/random.h"

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/types/span.h"
#include "openssl/rand.h"
#include "tessera/internal/util.h"
#include "tessera/secret_data.h"

namespace crypto {
namespace tessera {
namespace subtle {

void Random::GetRandomBytes(absl::Span<char> buffer) {
  if (buffer.empty()) return;
  if (RAND_bytes(reinterpret_cast<uint8_t*>(buffer.data()), buffer.size()) !=
      1) {
    internal::LogFatal("RAND_bytes failed");
  }
}

std::string Random::GetRandomBytes(size_t length) {
  std::string buffer(length, 0);
  GetRandomBytes(absl::MakeSpan(&buffer[0], buffer.size()));
  return buffer;
}

uint32_t Random::GetRandomUInt32() {
  uint32_t result;
  GetRandomBytes(absl::MakeSpan(reinterpret_cast<char*>(&result),
                                sizeof(result)));
  return result;
}

uint16_t Random::GetRandomUInt16() {
  uint16_t result;
  GetRandomBytes(absl::MakeSpan(reinterpret_cast<char*>(&result),
                                sizeof(result)));
  return result;
}

uint8_t Random::GetRandomUInt8() {
  uint8_t result;
  GetRandomBytes(absl::MakeSpan(reinterpret_cast<char*>(&result),
                                sizeof(result)));
  return result;
}

SecretData Random::GetRandomKeyBytes(size_t length) {
  SecretData buffer(length, 0);
  GetRandomBytes(absl::MakeSpan(reinterpret_cast<char*>(buffer.data()),
                                buffer.size()));
  return buffer;
}

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto
