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

#ifndef TESSERA_INTERNAL_KEY_INFO_H_
#define TESSERA_INTERNAL_KEY_INFO_H_

#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Returns the KeyInfo of `key`, i.e. everything but the key material.
proto::KeysetInfo::KeyInfo KeyInfoFromKey(const proto::Keyset::Key& key);

// Returns the KeysetInfo of `keyset`, with the keys in keyset order.
proto::KeysetInfo KeysetInfoFromKeyset(const proto::Keyset& keyset);

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_KEY_INFO_H_
