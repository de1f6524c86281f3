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

#ifndef TESSERA_INTERNAL_EC_UTIL_H_
#define TESSERA_INTERNAL_EC_UTIL_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "tessera/secret_data.h"

namespace crypto {
namespace tessera {
namespace internal {

struct Ed25519Key {
  std::string public_key;
  // The 32-byte seed.
  SecretData private_key;
};

int Ed25519KeyPubKeySize();
int Ed25519KeyPrivKeySize();

// Returns a new ED25519 key.
absl::StatusOr<std::unique_ptr<Ed25519Key>> NewEd25519Key();

// Returns a new ED25519 key generated from a 32-byte `secret_seed`.
absl::StatusOr<std::unique_ptr<Ed25519Key>> NewEd25519Key(
    const SecretData& secret_seed);

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_EC_UTIL_H_
