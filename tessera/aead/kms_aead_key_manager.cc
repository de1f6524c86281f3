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

#include "tessera/aead/kms_aead_key_manager.h"

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/aead.h"
#include "tessera/kms_client.h"
#include "tessera/kms_clients.h"
#include "tessera/util/validation.h"
#include "proto/kms_aead.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::KmsAeadKey;
using ::crypto::tessera::proto::KmsAeadKeyFormat;

absl::StatusOr<std::unique_ptr<Aead>> KmsAeadKeyManager::AeadFactory::Create(
    const KmsAeadKey& key) const {
  const std::string& key_uri = key.params().key_uri();
  absl::StatusOr<const KmsClient*> kms_client = KmsClients::Get(key_uri);
  if (!kms_client.ok()) return kms_client.status();
  return (*kms_client)->GetAead(key_uri);
}

absl::Status KmsAeadKeyManager::ValidateKey(const KmsAeadKey& key) const {
  absl::Status status = ValidateVersion(key.version(), get_version());
  if (!status.ok()) return status;
  return ValidateKeyFormat(key.params());
}

absl::Status KmsAeadKeyManager::ValidateKeyFormat(
    const KmsAeadKeyFormat& key_format) const {
  if (key_format.key_uri().empty()) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Missing key_uri.");
  }
  return absl::OkStatus();
}

absl::StatusOr<KmsAeadKey> KmsAeadKeyManager::CreateKey(
    const KmsAeadKeyFormat& key_format) const {
  KmsAeadKey kms_aead_key;
  kms_aead_key.set_version(get_version());
  *(kms_aead_key.mutable_params()) = key_format;
  return kms_aead_key;
}

}  // namespace tessera
}  // namespace crypto
