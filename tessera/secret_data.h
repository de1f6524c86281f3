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

#ifndef TESSERA_SECRET_DATA_H_
#define TESSERA_SECRET_DATA_H_

#include <cstdint>
#include <vector>

#include "tessera/internal/sanitizing_allocator.h"

namespace crypto {
namespace tessera {

// Stores secret (sensitive) data and makes sure it's destroyed in a safe way.
// This should be the first choice when handling key/key derived values.
//
// Example:
// class MyCryptoPrimitive {
//  public:
//   MyCryptoPrimitive(absl::string_view key_value) :
//     key_(crypto::tessera::util::SecretDataFromStringView(key_value)) {}
//   [...]
//  private:
//   const crypto::tessera::SecretData key_;
// }
using SecretData =
    std::vector<uint8_t, internal::SanitizingAllocator<uint8_t>>;

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SECRET_DATA_H_
