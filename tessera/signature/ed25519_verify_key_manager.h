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

#ifndef TESSERA_SIGNATURE_ED25519_VERIFY_KEY_MANAGER_H_
#define TESSERA_SIGNATURE_ED25519_VERIFY_KEY_MANAGER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tessera/core/key_type_manager.h"
#include "tessera/public_key_verify.h"
#include "tessera/util/constants.h"
#include "proto/ed25519.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

class Ed25519VerifyKeyManager
    : public KeyTypeManager<proto::Ed25519PublicKey, void, PublicKeyVerify> {
 public:
  class PublicKeyVerifyFactory : public PrimitiveFactory {
    absl::StatusOr<std::unique_ptr<PublicKeyVerify>> Create(
        const proto::Ed25519PublicKey& public_key) const override;
  };

  Ed25519VerifyKeyManager()
      : KeyTypeManager(absl::make_unique<PublicKeyVerifyFactory>()) {}

  uint32_t get_version() const override { return 0; }

  proto::KeyData::KeyMaterialType key_material_type() const override {
    return proto::KeyData::ASYMMETRIC_PUBLIC;
  }

  const std::string& get_key_type() const override { return key_type_; }

  absl::Status ValidateKey(const proto::Ed25519PublicKey& key) const override;

 private:
  const std::string key_type_ = absl::StrCat(
      kTypeGoogleapisCom, proto::Ed25519PublicKey().GetTypeName());
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SIGNATURE_ED25519_VERIFY_KEY_MANAGER_H_
