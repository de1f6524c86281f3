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

#include "tessera/signature/ed25519_sign_key_manager.h"

#include <cstddef>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/internal/ec_util.h"
#include "tessera/public_key_sign.h"
#include "tessera/signature/ed25519_verify_key_manager.h"
#include "tessera/subtle/ed25519_boringssl.h"
#include "tessera/util/secret_data.h"
#include "tessera/util/validation.h"
#include "proto/ed25519.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::Ed25519KeyFormat;
using ::crypto::tessera::proto::Ed25519PrivateKey;

absl::StatusOr<Ed25519PrivateKey> Ed25519SignKeyManager::CreateKey(
    const Ed25519KeyFormat& key_format) const {
  absl::StatusOr<std::unique_ptr<internal::Ed25519Key>> key =
      internal::NewEd25519Key();
  if (!key.ok()) return key.status();

  Ed25519PrivateKey private_key;
  private_key.set_version(get_version());
  private_key.set_key_value(
      std::string(util::SecretDataAsStringView((*key)->private_key)));
  private_key.mutable_public_key()->set_version(get_version());
  private_key.mutable_public_key()->set_key_value((*key)->public_key);
  return private_key;
}

absl::StatusOr<std::unique_ptr<PublicKeySign>>
Ed25519SignKeyManager::PublicKeySignFactory::Create(
    const Ed25519PrivateKey& private_key) const {
  return subtle::Ed25519SignBoringSsl::New(
      util::SecretDataFromStringView(private_key.key_value()));
}

absl::Status Ed25519SignKeyManager::ValidateKey(
    const Ed25519PrivateKey& key) const {
  absl::Status status = ValidateVersion(key.version(), get_version());
  if (!status.ok()) return status;
  if (key.key_value().size() !=
      static_cast<size_t>(internal::Ed25519KeyPrivKeySize())) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "The Ed25519 private key must be a 32-byte seed.");
  }
  status = Ed25519VerifyKeyManager().ValidateKey(key.public_key());
  if (!status.ok()) return status;
  // The embedded public key must belong to the seed.
  absl::StatusOr<std::unique_ptr<internal::Ed25519Key>> derived =
      internal::NewEd25519Key(
          util::SecretDataFromStringView(key.key_value()));
  if (!derived.ok()) return derived.status();
  if ((*derived)->public_key != key.public_key().key_value()) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "The Ed25519 public key does not match the seed.");
  }
  return absl::OkStatus();
}

absl::Status Ed25519SignKeyManager::ValidateKeyFormat(
    const Ed25519KeyFormat& key_format) const {
  return ValidateVersion(key_format.version(), get_version());
}

}  // namespace tessera
}  // namespace crypto
