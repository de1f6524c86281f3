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

#include "tessera/keyset_manager.h"

#include <cstdint>
#include <memory>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "tessera/keyset_handle.h"
#include "tessera/util/errors.h"
#include "tessera/util/secret_data.h"
#include "tessera/util/secret_proto.h"
#include "tessera/util/validation.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::Keyset;
using ::crypto::tessera::proto::KeyStatusType;
using ::crypto::tessera::proto::KeyTemplate;

// static
absl::StatusOr<std::unique_ptr<KeysetManager>> KeysetManager::New(
    const KeyTemplate& key_template) {
  auto manager = absl::make_unique<KeysetManager>();
  absl::StatusOr<uint32_t> rotate_result = manager->Rotate(key_template);
  if (!rotate_result.ok()) return rotate_result.status();
  return std::move(manager);
}

// static
absl::StatusOr<std::unique_ptr<KeysetManager>> KeysetManager::New(
    const KeysetHandle& keyset_handle) {
  auto manager = absl::make_unique<KeysetManager>();
  absl::MutexLock lock(&manager->keyset_mutex_);
  *manager->keyset_ = keyset_handle.get_keyset();
  return std::move(manager);
}

absl::StatusOr<Keyset::Key*> KeysetManager::FindKey(uint32_t key_id) {
  for (Keyset::Key& key : *keyset_->mutable_key()) {
    if (key.key_id() == key_id) return &key;
  }
  return ToStatusF(absl::StatusCode::kNotFound,
                   "No key with key_id %d found in the keyset.", key_id);
}

absl::StatusOr<uint32_t> KeysetManager::Add(const KeyTemplate& key_template) {
  absl::MutexLock lock(&keyset_mutex_);
  return KeysetHandle::AddToKeyset(key_template, /*as_primary=*/false,
                                   keyset_.get());
}

absl::StatusOr<uint32_t> KeysetManager::Rotate(
    const KeyTemplate& key_template) {
  absl::MutexLock lock(&keyset_mutex_);
  return KeysetHandle::AddToKeyset(key_template, /*as_primary=*/true,
                                   keyset_.get());
}

absl::Status KeysetManager::Enable(uint32_t key_id) {
  absl::MutexLock lock(&keyset_mutex_);
  absl::StatusOr<Keyset::Key*> key = FindKey(key_id);
  if (!key.ok()) return key.status();
  if ((*key)->status() != KeyStatusType::DISABLED &&
      (*key)->status() != KeyStatusType::ENABLED) {
    return ToStatusF(absl::StatusCode::kFailedPrecondition,
                     "Cannot enable key with key_id %d and status %s.", key_id,
                     proto::KeyStatusType_Name((*key)->status()));
  }
  (*key)->set_status(KeyStatusType::ENABLED);
  return absl::OkStatus();
}

absl::Status KeysetManager::Disable(uint32_t key_id) {
  absl::MutexLock lock(&keyset_mutex_);
  absl::StatusOr<Keyset::Key*> key = FindKey(key_id);
  if (!key.ok()) return key.status();
  if (keyset_->primary_key_id() == key_id) {
    return ToStatusF(absl::StatusCode::kFailedPrecondition,
                     "Cannot disable primary key (key_id %d).", key_id);
  }
  if ((*key)->status() != KeyStatusType::DISABLED &&
      (*key)->status() != KeyStatusType::ENABLED) {
    return ToStatusF(absl::StatusCode::kFailedPrecondition,
                     "Cannot disable key with key_id %d and status %s.",
                     key_id, proto::KeyStatusType_Name((*key)->status()));
  }
  (*key)->set_status(KeyStatusType::DISABLED);
  return absl::OkStatus();
}

absl::Status KeysetManager::Delete(uint32_t key_id) {
  absl::MutexLock lock(&keyset_mutex_);
  auto* keys = keyset_->mutable_key();
  for (int i = 0; i < keys->size(); ++i) {
    if (keys->Get(i).key_id() == key_id) {
      if (keyset_->primary_key_id() == key_id) {
        return ToStatusF(absl::StatusCode::kFailedPrecondition,
                         "Cannot delete primary key (key_id %d).", key_id);
      }
      Keyset::Key* key = keys->Mutable(i);
      util::SafeZeroString(key->mutable_key_data()->mutable_value());
      keys->DeleteSubrange(i, 1);
      return absl::OkStatus();
    }
  }
  return ToStatusF(absl::StatusCode::kNotFound,
                   "No key with key_id %d found in the keyset.", key_id);
}

absl::Status KeysetManager::Destroy(uint32_t key_id) {
  absl::MutexLock lock(&keyset_mutex_);
  absl::StatusOr<Keyset::Key*> key = FindKey(key_id);
  if (!key.ok()) return key.status();
  if (keyset_->primary_key_id() == key_id) {
    return ToStatusF(absl::StatusCode::kFailedPrecondition,
                     "Cannot destroy primary key (key_id %d).", key_id);
  }
  if ((*key)->status() != KeyStatusType::DISABLED &&
      (*key)->status() != KeyStatusType::DESTROYED &&
      (*key)->status() != KeyStatusType::ENABLED) {
    return ToStatusF(absl::StatusCode::kFailedPrecondition,
                     "Cannot destroy key with key_id %d and status %s.",
                     key_id, proto::KeyStatusType_Name((*key)->status()));
  }
  util::SafeZeroString((*key)->mutable_key_data()->mutable_value());
  (*key)->mutable_key_data()->clear_value();
  (*key)->set_status(KeyStatusType::DESTROYED);
  return absl::OkStatus();
}

absl::Status KeysetManager::SetPrimary(uint32_t key_id) {
  absl::MutexLock lock(&keyset_mutex_);
  absl::StatusOr<Keyset::Key*> key = FindKey(key_id);
  if (!key.ok()) return key.status();
  if ((*key)->status() != KeyStatusType::ENABLED) {
    return ToStatusF(absl::StatusCode::kFailedPrecondition,
                     "The candidate for the primary key must be ENABLED "
                     "(key_id %d has status %s).",
                     key_id, proto::KeyStatusType_Name((*key)->status()));
  }
  keyset_->set_primary_key_id(key_id);
  return absl::OkStatus();
}

int KeysetManager::KeyCount() const {
  absl::MutexLock lock(&keyset_mutex_);
  return keyset_->key_size();
}

absl::StatusOr<std::unique_ptr<KeysetHandle>> KeysetManager::GetKeysetHandle()
    const {
  absl::MutexLock lock(&keyset_mutex_);
  absl::Status status = ValidateKeyset(*keyset_);
  if (!status.ok()) return status;
  return absl::WrapUnique(new KeysetHandle(keyset_));
}

}  // namespace tessera
}  // namespace crypto
