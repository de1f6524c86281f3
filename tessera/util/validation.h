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

#ifndef TESSERA_UTIL_VALIDATION_H_
#define TESSERA_UTIL_VALIDATION_H_

#include <cstdint>

#include "absl/status/status.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Various validation helpers.

absl::Status ValidateAesKeySize(uint32_t key_size);

// Checks that `key` is usable as an entry of a keyset: it has a known status,
// a known output prefix type, and (unless it was destroyed) a key type.
absl::Status ValidateKey(const proto::Keyset::Key& key);

// Checks the invariants of a keyset: it is non-empty, its key IDs are unique,
// every key passes ValidateKey, and the primary key exists and is ENABLED.
absl::Status ValidateKeyset(const proto::Keyset& keyset);

// Checks that no key of `keyset` carries secret key material, i.e. all keys
// are ASYMMETRIC_PUBLIC or REMOTE. Fails with kFailedPrecondition otherwise.
absl::Status ValidateNoSecret(const proto::Keyset& keyset);

// Checks that the version of a key is supported by its key manager.
absl::Status ValidateVersion(uint32_t candidate, uint32_t max_expected);

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_VALIDATION_H_
