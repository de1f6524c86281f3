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

#ifndef TESSERA_KEYSET_MANAGER_H_
#define TESSERA_KEYSET_MANAGER_H_

#include <cstdint>
#include <memory>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "tessera/keyset_handle.h"
#include "tessera/util/secret_proto.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// KeysetManager allows generating and modifying keysets. Every method either
// applies its change completely or leaves the keyset untouched, and a
// KeysetManager may be shared between threads.
//
// Snapshots taken with GetKeysetHandle() are independent of the manager:
// later changes do not affect them.
class KeysetManager {
 public:
  // Constructs a KeysetManager with an empty Keyset.
  KeysetManager() = default;

  // Creates a new KeysetManager that contains a Keyset with a single key
  // generated freshly according the specification in `key_template`.
  static absl::StatusOr<std::unique_ptr<KeysetManager>> New(
      const proto::KeyTemplate& key_template);

  // Creates a new KeysetManager that contains a copy of the Keyset in
  // `keyset_handle`.
  static absl::StatusOr<std::unique_ptr<KeysetManager>> New(
      const KeysetHandle& keyset_handle);

  // Adds to the managed keyset a fresh key generated according to
  // `keyset_template` and returns the key_id of the added key.
  // The added key has status 'ENABLED'.
  absl::StatusOr<uint32_t> Add(const proto::KeyTemplate& key_template)
      ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Adds to the managed keyset a fresh key generated according to
  // `keyset_template`, sets the new key as the primary,
  // and returns the key_id of the added key.
  // The key that was primary prior to rotation remains 'ENABLED'.
  absl::StatusOr<uint32_t> Rotate(const proto::KeyTemplate& key_template)
      ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Sets the status of the specified key to 'ENABLED'.
  // Succeeds only if before the call the specified key
  // has status 'DISABLED' or 'ENABLED'.
  absl::Status Enable(uint32_t key_id) ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Sets the status of the specified key to 'DISABLED'.
  // Succeeds only if before the call the specified key
  // is not primary and has status 'DISABLED' or 'ENABLED'.
  absl::Status Disable(uint32_t key_id) ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Deletes the specified key from the managed keyset.
  // Succeeds only if the specified key is not primary.
  // After deletion the keyset contains one key fewer.
  absl::Status Delete(uint32_t key_id) ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Destroys the key material of the specified key and sets its status to
  // 'DESTROYED'. Succeeds only if the specified key is not primary.
  // The key entry stays in the keyset, so that its ID is not reused.
  absl::Status Destroy(uint32_t key_id) ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Sets the specified key as the primary.
  // Succeeds only if the specified key is 'ENABLED'.
  absl::Status SetPrimary(uint32_t key_id) ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Returns the count of all keys in the keyset.
  int KeyCount() const ABSL_LOCKS_EXCLUDED(keyset_mutex_);

  // Returns a handle with a copy of the managed keyset. Fails if the keyset
  // is not valid, e.g. because it is empty.
  absl::StatusOr<std::unique_ptr<KeysetHandle>> GetKeysetHandle() const
      ABSL_LOCKS_EXCLUDED(keyset_mutex_);

 private:
  // Returns the key with ID `key_id`, or kNotFound.
  absl::StatusOr<proto::Keyset::Key*> FindKey(uint32_t key_id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(keyset_mutex_);

  mutable absl::Mutex keyset_mutex_;
  util::SecretProto<proto::Keyset> keyset_ ABSL_GUARDED_BY(keyset_mutex_);
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_KEYSET_MANAGER_H_
