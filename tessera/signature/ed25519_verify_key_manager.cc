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

#include "tessera/signature/ed25519_verify_key_manager.h"

#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/public_key_verify.h"
#include "tessera/subtle/ed25519_boringssl.h"
#include "tessera/util/validation.h"
#include "proto/ed25519.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::Ed25519PublicKey;

absl::StatusOr<std::unique_ptr<PublicKeyVerify>>
Ed25519VerifyKeyManager::PublicKeyVerifyFactory::Create(
    const Ed25519PublicKey& public_key) const {
  return subtle::Ed25519VerifyBoringSsl::New(public_key.key_value());
}

absl::Status Ed25519VerifyKeyManager::ValidateKey(
    const Ed25519PublicKey& key) const {
  absl::Status status = ValidateVersion(key.version(), get_version());
  if (!status.ok()) return status;

  if (key.key_value().length() != 32) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "The ED25519 public key must be 32-bytes long.");
  }
  return absl::OkStatus();
}

}  // namespace tessera
}  // namespace crypto
