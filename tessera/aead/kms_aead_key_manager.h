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

#ifndef TESSERA_AEAD_KMS_AEAD_KEY_MANAGER_H_
#define TESSERA_AEAD_KMS_AEAD_KEY_MANAGER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tessera/aead.h"
#include "tessera/core/key_type_manager.h"
#include "tessera/util/constants.h"
#include "proto/kms_aead.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Key manager for keys that live in a remote KMS. The key only stores the key
// URI; the primitive is obtained from the KmsClient registered in KmsClients
// for that URI when the primitive is created.
class KmsAeadKeyManager
    : public KeyTypeManager<proto::KmsAeadKey, proto::KmsAeadKeyFormat, Aead> {
 public:
  class AeadFactory : public PrimitiveFactory {
    absl::StatusOr<std::unique_ptr<Aead>> Create(
        const proto::KmsAeadKey& key) const override;
  };

  KmsAeadKeyManager() : KeyTypeManager(absl::make_unique<AeadFactory>()) {}

  uint32_t get_version() const override { return 0; }

  proto::KeyData::KeyMaterialType key_material_type() const override {
    return proto::KeyData::REMOTE;
  }

  const std::string& get_key_type() const override { return key_type_; }

  absl::Status ValidateKey(const proto::KmsAeadKey& key) const override;

  absl::Status ValidateKeyFormat(
      const proto::KmsAeadKeyFormat& key_format) const override;

  absl::StatusOr<proto::KmsAeadKey> CreateKey(
      const proto::KmsAeadKeyFormat& key_format) const override;

 private:
  const std::string key_type_ =
      absl::StrCat(kTypeGoogleapisCom, proto::KmsAeadKey().GetTypeName());
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_AEAD_KMS_AEAD_KEY_MANAGER_H_
