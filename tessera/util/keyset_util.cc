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

#include "tessera/util/keyset_util.h"

#include <cstdint>

#include "tessera/subtle/random.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::Keyset;

bool KeysetContainsKeyId(const Keyset& keyset, uint32_t key_id) {
  for (const Keyset::Key& key : keyset.key()) {
    if (key.key_id() == key_id) return true;
  }
  return false;
}

uint32_t GenerateUnusedKeyId(const Keyset& keyset) {
  while (true) {
    uint32_t key_id = subtle::Random::GetRandomUInt32();
    if (!KeysetContainsKeyId(keyset, key_id)) return key_id;
  }
}

}  // namespace tessera
}  // namespace crypto
