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

#ifndef TESSERA_SUBTLE_COMMON_ENUMS_H_
#define TESSERA_SUBTLE_COMMON_ENUMS_H_

#include <string>

namespace crypto {
namespace tessera {
namespace subtle {

// Hash functions used by the subtle primitives.
enum class HashType {
  UNKNOWN_HASH = 0,
  SHA1 = 1,  // SHA1 is only supported for HMAC.
  SHA224 = 2,
  SHA256 = 3,
  SHA384 = 4,
  SHA512 = 5,
};

std::string EnumToString(HashType type);

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SUBTLE_COMMON_ENUMS_H_
