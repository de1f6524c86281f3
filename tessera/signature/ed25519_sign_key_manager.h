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

#ifndef TESSERA_SIGNATURE_ED25519_SIGN_KEY_MANAGER_H_
#define TESSERA_SIGNATURE_ED25519_SIGN_KEY_MANAGER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tessera/core/private_key_type_manager.h"
#include "tessera/public_key_sign.h"
#include "tessera/util/constants.h"
#include "proto/ed25519.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

class Ed25519SignKeyManager
    : public PrivateKeyTypeManager<proto::Ed25519PrivateKey,
                                   proto::Ed25519KeyFormat,
                                   proto::Ed25519PublicKey, PublicKeySign> {
 public:
  class PublicKeySignFactory : public PrimitiveFactory {
    absl::StatusOr<std::unique_ptr<PublicKeySign>> Create(
        const proto::Ed25519PrivateKey& private_key) const override;
  };

  Ed25519SignKeyManager()
      : PrivateKeyTypeManager(absl::make_unique<PublicKeySignFactory>()) {}

  uint32_t get_version() const override { return 0; }

  proto::KeyData::KeyMaterialType key_material_type() const override {
    return proto::KeyData::ASYMMETRIC_PRIVATE;
  }

  const std::string& get_key_type() const override { return key_type_; }

  absl::Status ValidateKey(
      const proto::Ed25519PrivateKey& key) const override;

  absl::Status ValidateKeyFormat(
      const proto::Ed25519KeyFormat& key_format) const override;

  absl::StatusOr<proto::Ed25519PrivateKey> CreateKey(
      const proto::Ed25519KeyFormat& key_format) const override;

  absl::StatusOr<proto::Ed25519PublicKey> GetPublicKey(
      const proto::Ed25519PrivateKey& private_key) const override {
    return private_key.public_key();
  }

 private:
  const std::string key_type_ = absl::StrCat(
      kTypeGoogleapisCom, proto::Ed25519PrivateKey().GetTypeName());
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SIGNATURE_ED25519_SIGN_KEY_MANAGER_H_
