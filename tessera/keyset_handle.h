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

#ifndef TESSERA_KEYSET_HANDLE_H_
#define TESSERA_KEYSET_HANDLE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/internal/key_info.h"
#include "tessera/key_manager.h"
#include "tessera/primitive_set.h"
#include "tessera/registry.h"
#include "tessera/util/errors.h"
#include "tessera/util/secret_proto.h"
#include "tessera/util/validation.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// KeysetHandle provides abstracted access to Keysets, to limit
// the exposure of actual protocol buffers that hold sensitive
// key material. A KeysetHandle is an immutable snapshot of a keyset; use
// KeysetManager to derive modified keysets.
class KeysetHandle {
 public:
  KeysetHandle(const KeysetHandle& other) = default;
  KeysetHandle& operator=(const KeysetHandle& other) = default;
  KeysetHandle(KeysetHandle&& other) = default;
  KeysetHandle& operator=(KeysetHandle&& other) = default;

  // Returns a KeysetHandle with a single new ENABLED primary key generated
  // according to `key_template`.
  static absl::StatusOr<std::unique_ptr<KeysetHandle>> GenerateNew(
      const proto::KeyTemplate& key_template);

  // Creates a KeysetHandle from a serialized keyset `serialized_keyset` which
  // contains no secret key material. This can be used to load public keysets
  // or envelope encryption keysets.
  static absl::StatusOr<std::unique_ptr<KeysetHandle>> ReadNoSecret(
      absl::string_view serialized_keyset);

  // Returns KeysetInfo, a "safe" Keyset that doesn't contain any actual
  // key material, thus can be used for logging or monitoring.
  proto::KeysetInfo GetKeysetInfo() const;

  // Returns a new KeysetHandle containing public keys corresponding to the
  // private keys in this handle. Returns an error if this handle contains
  // keys that are not private keys.
  absl::StatusOr<std::unique_ptr<KeysetHandle>> GetPublicKeysetHandle() const;

  // Returns the number of keys in the keyset, including DISABLED and
  // DESTROYED ones.
  int size() const { return keyset_->key_size(); }

  // Creates a wrapped primitive corresponding to this keyset, using the key
  // managers and the wrapper for P in the Registry.
  template <class P>
  absl::StatusOr<std::unique_ptr<P>> GetPrimitive(
      const PrimitiveSetOptions& options = PrimitiveSetOptions()) const;

  // Creates a wrapped primitive corresponding to this keyset. The given
  // KeyManager is used for the keys it supports; the Registry for all others.
  template <class P>
  absl::StatusOr<std::unique_ptr<P>> GetPrimitive(
      const KeyManager<P>* custom_manager) const;

 private:
  // The classes below need access to get_keyset().
  friend class CleartextKeysetHandle;
  friend class KeysetManager;

  // TestKeysetHandle::GetKeyset() provides access to get_keyset().
  friend class TestKeysetHandle;

  // Creates a handle that contains the given keyset.
  explicit KeysetHandle(util::SecretProto<proto::Keyset> keyset)
      : keyset_(std::move(keyset)) {}

  // Generates a key from `key_template` and adds it to `keyset` as an ENABLED
  // key with a fresh random ID. Returns the ID of the new key.
  static absl::StatusOr<uint32_t> AddToKeyset(
      const proto::KeyTemplate& key_template, bool as_primary,
      proto::Keyset* keyset);

  // Returns keyset held by this handle.
  const proto::Keyset& get_keyset() const { return *keyset_; }

  // Creates a set of primitives corresponding to the usable keys of the
  // keyset. DESTROYED keys are always skipped, DISABLED keys unless
  // `options` asks for them.
  //
  // The returned set is usually later "wrapped" into a class that
  // implements the corresponding Primitive-interface.
  template <class P>
  absl::StatusOr<std::unique_ptr<PrimitiveSet<P>>> GetPrimitives(
      const KeyManager<P>* custom_manager,
      const PrimitiveSetOptions& options) const;

  util::SecretProto<proto::Keyset> keyset_;
};

///////////////////////////////////////////////////////////////////////////////
// Implementation details of templated methods.

template <class P>
absl::StatusOr<std::unique_ptr<PrimitiveSet<P>>> KeysetHandle::GetPrimitives(
    const KeyManager<P>* custom_manager,
    const PrimitiveSetOptions& options) const {
  absl::Status status = ValidateKeyset(*keyset_);
  if (!status.ok()) return status;
  typename PrimitiveSet<P>::Builder primitives_builder;
  for (const proto::Keyset::Key& key : keyset_->key()) {
    if (key.status() == proto::KeyStatusType::DESTROYED) continue;
    if (key.status() == proto::KeyStatusType::DISABLED &&
        !options.include_disabled_keys) {
      continue;
    }
    absl::StatusOr<std::unique_ptr<P>> primitive;
    if (custom_manager != nullptr &&
        custom_manager->DoesSupport(key.key_data().type_url())) {
      primitive = custom_manager->GetPrimitive(key.key_data());
    } else {
      primitive = Registry::GetPrimitive<P>(key.key_data());
    }
    if (!primitive.ok()) {
      return ToStatusF(primitive.status().code(),
                       "Cannot create primitive for key %d: %s", key.key_id(),
                       primitive.status().message());
    }
    if (key.key_id() == keyset_->primary_key_id()) {
      primitives_builder.AddPrimaryPrimitive(*std::move(primitive),
                                             KeyInfoFromKey(key));
    } else {
      primitives_builder.AddPrimitive(*std::move(primitive),
                                      KeyInfoFromKey(key));
    }
  }
  absl::StatusOr<PrimitiveSet<P>> primitives =
      std::move(primitives_builder).Build();
  if (!primitives.ok()) return primitives.status();
  return absl::make_unique<PrimitiveSet<P>>(*std::move(primitives));
}

template <class P>
absl::StatusOr<std::unique_ptr<P>> KeysetHandle::GetPrimitive(
    const PrimitiveSetOptions& options) const {
  absl::StatusOr<std::unique_ptr<PrimitiveSet<P>>> primitives =
      GetPrimitives<P>(/*custom_manager=*/nullptr, options);
  if (!primitives.ok()) return primitives.status();
  return Registry::Wrap<P>(*std::move(primitives));
}

template <class P>
absl::StatusOr<std::unique_ptr<P>> KeysetHandle::GetPrimitive(
    const KeyManager<P>* custom_manager) const {
  if (custom_manager == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "custom_manager must not be null");
  }
  absl::StatusOr<std::unique_ptr<PrimitiveSet<P>>> primitives =
      GetPrimitives<P>(custom_manager, PrimitiveSetOptions());
  if (!primitives.ok()) return primitives.status();
  return Registry::Wrap<P>(*std::move(primitives));
}

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_KEYSET_HANDLE_H_
