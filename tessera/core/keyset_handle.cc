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

#include "tessera/keyset_handle.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/internal/key_info.h"
#include "tessera/registry.h"
#include "tessera/util/errors.h"
#include "tessera/util/keyset_util.h"
#include "tessera/util/secret_proto.h"
#include "tessera/util/validation.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::KeyData;
using ::crypto::tessera::proto::Keyset;
using ::crypto::tessera::proto::KeysetInfo;
using ::crypto::tessera::proto::KeyStatusType;
using ::crypto::tessera::proto::KeyTemplate;
using ::crypto::tessera::proto::OutputPrefixType;

namespace {

// Replaces the private key material of `key` with its public counterpart,
// keeping id, status and output prefix type.
absl::Status ToPublicKey(const Keyset::Key& key, Keyset::Key* public_key) {
  if (key.key_data().key_material_type() != KeyData::ASYMMETRIC_PRIVATE) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Key %d holds no private key.", key.key_id());
  }
  absl::StatusOr<std::unique_ptr<KeyData>> key_data =
      Registry::GetPublicKeyData(key.key_data().type_url(),
                                 key.key_data().value());
  if (!key_data.ok()) return key_data.status();
  public_key->set_key_id(key.key_id());
  public_key->set_status(key.status());
  public_key->set_output_prefix_type(key.output_prefix_type());
  public_key->mutable_key_data()->Swap(key_data->get());
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::unique_ptr<KeysetHandle>> KeysetHandle::GenerateNew(
    const KeyTemplate& key_template) {
  util::SecretProto<Keyset> keyset;
  absl::StatusOr<uint32_t> key_id =
      AddToKeyset(key_template, /*as_primary=*/true, keyset.get());
  if (!key_id.ok()) return key_id.status();
  return absl::WrapUnique(new KeysetHandle(std::move(keyset)));
}

absl::StatusOr<std::unique_ptr<KeysetHandle>> KeysetHandle::ReadNoSecret(
    absl::string_view serialized_keyset) {
  util::SecretProto<Keyset> keyset;
  if (!keyset->ParseFromArray(serialized_keyset.data(),
                              serialized_keyset.size())) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Could not parse the input as a Keyset.");
  }
  absl::Status status = ValidateNoSecret(*keyset);
  if (!status.ok()) return status;
  status = ValidateKeyset(*keyset);
  if (!status.ok()) return status;
  return absl::WrapUnique(new KeysetHandle(std::move(keyset)));
}

KeysetInfo KeysetHandle::GetKeysetInfo() const {
  return KeysetInfoFromKeyset(*keyset_);
}

absl::StatusOr<std::unique_ptr<KeysetHandle>>
KeysetHandle::GetPublicKeysetHandle() const {
  util::SecretProto<Keyset> public_keyset;
  public_keyset->set_primary_key_id(keyset_->primary_key_id());
  for (const Keyset::Key& key : keyset_->key()) {
    // Nothing to derive from.
    if (key.status() == KeyStatusType::DESTROYED) continue;
    absl::Status status = ToPublicKey(key, public_keyset->add_key());
    if (!status.ok()) return status;
  }
  return absl::WrapUnique(new KeysetHandle(std::move(public_keyset)));
}

absl::StatusOr<uint32_t> KeysetHandle::AddToKeyset(
    const KeyTemplate& key_template, bool as_primary, Keyset* keyset) {
  const OutputPrefixType prefix_type = key_template.output_prefix_type();
  if (!proto::OutputPrefixType_IsValid(prefix_type) ||
      prefix_type == OutputPrefixType::UNKNOWN_PREFIX) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "The key template has an unknown output prefix type %d.",
                     static_cast<int>(prefix_type));
  }
  absl::StatusOr<std::unique_ptr<KeyData>> key_data =
      Registry::NewKeyData(key_template);
  if (!key_data.ok()) return key_data.status();

  // The new key is checked in full before the keyset is touched.
  util::SecretProto<Keyset::Key> key;
  key->set_key_id(GenerateUnusedKeyId(*keyset));
  key->set_status(KeyStatusType::ENABLED);
  key->set_output_prefix_type(prefix_type);
  key->mutable_key_data()->Swap(key_data->get());
  absl::Status status = ValidateKey(*key);
  if (!status.ok()) return status;

  const uint32_t key_id = key->key_id();
  keyset->add_key()->Swap(key.get());
  if (as_primary) keyset->set_primary_key_id(key_id);
  return key_id;
}

}  // namespace tessera
}  // namespace crypto
