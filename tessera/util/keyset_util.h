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

#ifndef TESSERA_UTIL_KEYSET_UTIL_H_
#define TESSERA_UTIL_KEYSET_UTIL_H_

#include <cstdint>

#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Returns a random key ID that is not used by any key of `keyset`.
uint32_t GenerateUnusedKeyId(const proto::Keyset& keyset);

// Returns true if `keyset` contains a key with ID `key_id`.
bool KeysetContainsKeyId(const proto::Keyset& keyset, uint32_t key_id);

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_KEYSET_UTIL_H_
