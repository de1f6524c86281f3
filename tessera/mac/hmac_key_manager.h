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

#ifndef TESSERA_MAC_HMAC_KEY_MANAGER_H_
#define TESSERA_MAC_HMAC_KEY_MANAGER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tessera/core/key_type_manager.h"
#include "tessera/mac.h"
#include "tessera/subtle/hmac_boringssl.h"
#include "tessera/util/constants.h"
#include "tessera/util/enums.h"
#include "tessera/util/secret_data.h"
#include "proto/hmac.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

class HmacKeyManager
    : public KeyTypeManager<proto::HmacKey, proto::HmacKeyFormat, Mac> {
 public:
  class MacFactory : public PrimitiveFactory {
    absl::StatusOr<std::unique_ptr<Mac>> Create(
        const proto::HmacKey& hmac_key) const override {
      return subtle::HmacBoringSsl::New(
          util::Enums::ProtoToSubtle(hmac_key.params().hash()),
          hmac_key.params().tag_size(),
          util::SecretDataFromStringView(hmac_key.key_value()));
    }
  };

  HmacKeyManager() : KeyTypeManager(absl::make_unique<MacFactory>()) {}

  uint32_t get_version() const override { return 0; }

  proto::KeyData::KeyMaterialType key_material_type() const override {
    return proto::KeyData::SYMMETRIC;
  }

  const std::string& get_key_type() const override { return key_type_; }

  absl::Status ValidateKey(const proto::HmacKey& key) const override;

  absl::Status ValidateKeyFormat(
      const proto::HmacKeyFormat& key_format) const override;

  absl::StatusOr<proto::HmacKey> CreateKey(
      const proto::HmacKeyFormat& key_format) const override;

 private:
  const std::string key_type_ =
      absl::StrCat(kTypeGoogleapisCom, proto::HmacKey().GetTypeName());
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_MAC_HMAC_KEY_MANAGER_H_
