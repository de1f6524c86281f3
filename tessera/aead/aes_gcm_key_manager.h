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

#ifndef TESSERA_AEAD_AES_GCM_KEY_MANAGER_H_
#define TESSERA_AEAD_AES_GCM_KEY_MANAGER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tessera/aead.h"
#include "tessera/core/key_type_manager.h"
#include "tessera/subtle/aes_gcm_boringssl.h"
#include "tessera/subtle/random.h"
#include "tessera/util/constants.h"
#include "tessera/util/secret_data.h"
#include "tessera/util/validation.h"
#include "proto/aes_gcm.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

class AesGcmKeyManager
    : public KeyTypeManager<proto::AesGcmKey, proto::AesGcmKeyFormat, Aead> {
 public:
  class AeadFactory : public PrimitiveFactory {
    absl::StatusOr<std::unique_ptr<Aead>> Create(
        const proto::AesGcmKey& key) const override {
      return subtle::AesGcmBoringSsl::New(
          util::SecretDataFromStringView(key.key_value()));
    }
  };

  AesGcmKeyManager() : KeyTypeManager(absl::make_unique<AeadFactory>()) {}

  uint32_t get_version() const override { return 0; }

  proto::KeyData::KeyMaterialType key_material_type() const override {
    return proto::KeyData::SYMMETRIC;
  }

  const std::string& get_key_type() const override { return key_type_; }

  absl::Status ValidateKey(const proto::AesGcmKey& key) const override {
    absl::Status status = ValidateVersion(key.version(), get_version());
    if (!status.ok()) return status;
    return ValidateAesKeySize(key.key_value().size());
  }

  absl::Status ValidateKeyFormat(
      const proto::AesGcmKeyFormat& key_format) const override {
    absl::Status status = ValidateVersion(key_format.version(), get_version());
    if (!status.ok()) return status;
    return ValidateAesKeySize(key_format.key_size());
  }

  absl::StatusOr<proto::AesGcmKey> CreateKey(
      const proto::AesGcmKeyFormat& key_format) const override {
    proto::AesGcmKey aes_gcm_key;
    aes_gcm_key.set_version(get_version());
    SecretData key_value =
        subtle::Random::GetRandomKeyBytes(key_format.key_size());
    aes_gcm_key.set_key_value(
        std::string(util::SecretDataAsStringView(key_value)));
    return aes_gcm_key;
  }

 private:
  const std::string key_type_ =
      absl::StrCat(kTypeGoogleapisCom, proto::AesGcmKey().GetTypeName());
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_AEAD_AES_GCM_KEY_MANAGER_H_
