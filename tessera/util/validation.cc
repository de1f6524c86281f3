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

#include "tessera/util/validation.h"

#include <cstdint>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "tessera/util/errors.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::KeyData;
using ::crypto::tessera::proto::Keyset;
using ::crypto::tessera::proto::KeyStatusType;
using ::crypto::tessera::proto::OutputPrefixType;

absl::Status ValidateAesKeySize(uint32_t key_size) {
  if (key_size != 16 && key_size != 32) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "AES key has %d bytes; supported sizes: 16 or 32 bytes.",
                     key_size);
  }
  return absl::OkStatus();
}

absl::Status ValidateKey(const Keyset::Key& key) {
  switch (key.status()) {
    case KeyStatusType::ENABLED:
    case KeyStatusType::DISABLED:
    case KeyStatusType::DESTROYED:
      break;
    default:
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "key %d has unknown status", key.key_id());
  }
  switch (key.output_prefix_type()) {
    case OutputPrefixType::TINK:
    case OutputPrefixType::LEGACY:
    case OutputPrefixType::RAW:
    case OutputPrefixType::CRUNCHY:
      break;
    default:
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "key %d has unknown output prefix type", key.key_id());
  }
  if (key.status() == KeyStatusType::DESTROYED) {
    if (!key.key_data().value().empty()) {
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "destroyed key %d still carries key material",
                       key.key_id());
    }
    return absl::OkStatus();
  }
  if (key.key_data().type_url().empty()) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "key %d has no key type", key.key_id());
  }
  return absl::OkStatus();
}

absl::Status ValidateKeyset(const Keyset& keyset) {
  if (keyset.key_size() < 1) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "A valid keyset must contain at least one key.");
  }

  absl::flat_hash_set<uint32_t> key_ids;
  bool has_primary = false;
  for (const Keyset::Key& key : keyset.key()) {
    if (!key_ids.insert(key.key_id()).second) {
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "keyset contains multiple keys with id %d",
                       key.key_id());
    }
    absl::Status status = ValidateKey(key);
    if (!status.ok()) return status;
    if (key.key_id() == keyset.primary_key_id()) {
      if (key.status() != KeyStatusType::ENABLED) {
        return ToStatusF(absl::StatusCode::kInvalidArgument,
                         "primary key %d is not ENABLED", key.key_id());
      }
      has_primary = true;
    }
  }

  if (!has_primary) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "keyset does not contain the primary key %d",
                     keyset.primary_key_id());
  }
  return absl::OkStatus();
}

absl::Status ValidateNoSecret(const Keyset& keyset) {
  for (const Keyset::Key& key : keyset.key()) {
    if (key.key_data().key_material_type() != KeyData::ASYMMETRIC_PUBLIC &&
        key.key_data().key_material_type() != KeyData::REMOTE) {
      return absl::Status(
          absl::StatusCode::kFailedPrecondition,
          "Cannot create KeysetHandle with secret key material from "
          "potentially unencrypted source.");
    }
  }
  return absl::OkStatus();
}

absl::Status ValidateVersion(uint32_t candidate, uint32_t max_expected) {
  if (candidate > max_expected) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Key has version '%d'; "
                     "only keys with version in range [0..%d] are supported.",
                     candidate, max_expected);
  }
  return absl::OkStatus();
}

}  // namespace tessera
}  // namespace crypto
