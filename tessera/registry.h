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

#ifndef TESSERA_REGISTRY_H_
#define TESSERA_REGISTRY_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/internal/registry_impl.h"
#include "tessera/key_manager.h"
#include "tessera/primitive_set.h"
#include "tessera/primitive_wrapper.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Registry for KeyManagers and PrimitiveWrappers.
//
// It is essentially a big container (map) that for each supported key type
// holds a corresponding KeyManager object, which "understands" the key type
// (i.e. the KeyManager can instantiate the primitive corresponding to given
// key, or can generate new keys of the supported key type). It holds also a
// PrimitiveWrapper for each supported primitive, so that it can wrap a set
// of primitives (corresponding to a keyset) into a single primitive.
//
// Registry is initialized at startup (usually through one of the Config
// classes, e.g. AeadConfig::Register()), and is later used to instantiate
// primitives for given keys or keysets.
//
// Note that regular users will usually not work directly with Registry, but
// rather via KeysetHandle::GetPrimitive()-methods, which in the background
// query the Registry for specific KeyManagers and PrimitiveWrappers.
// Registry is public though, so that applications can register key types of
// their own.
//
// Registry is thread-safe.
class Registry {
 public:
  // Registers the given `manager` for the key type `manager->get_key_type()`.
  // Registering the same kind of manager again is a no-op, except that it
  // may forbid `new_key_allowed` which was allowed before. Registering a
  // different manager for a known key type fails with kAlreadyExists.
  template <class P>
  static absl::Status RegisterKeyManager(
      std::unique_ptr<KeyManager<P>> manager, bool new_key_allowed = true) {
    return internal::RegistryImpl::GlobalInstance().RegisterKeyManager(
        std::move(manager), new_key_allowed);
  }

  template <class KTManager>
  static absl::Status RegisterKeyTypeManager(
      std::unique_ptr<KTManager> manager, bool new_key_allowed) {
    return internal::RegistryImpl::GlobalInstance().RegisterKeyTypeManager(
        std::move(manager), new_key_allowed);
  }

  // Registers a private key type together with its public counterpart.
  template <class PrivateKeyTypeManager, class KeyTypeManager>
  static absl::Status RegisterAsymmetricKeyManagers(
      std::unique_ptr<PrivateKeyTypeManager> private_key_manager,
      std::unique_ptr<KeyTypeManager> public_key_manager,
      bool new_key_allowed) {
    return internal::RegistryImpl::GlobalInstance()
        .RegisterAsymmetricKeyManagers(std::move(private_key_manager),
                                       std::move(public_key_manager),
                                       new_key_allowed);
  }

  // Registers the wrapper for the primitive P. Registering a wrapper of the
  // same class again is a no-op.
  template <class P>
  static absl::Status RegisterPrimitiveWrapper(
      std::unique_ptr<PrimitiveWrapper<P, P>> wrapper) {
    return internal::RegistryImpl::GlobalInstance().RegisterPrimitiveWrapper(
        std::move(wrapper));
  }

  // Returns a key manager for the given `type_url` (if any found).
  // Keeps the ownership of the manager.
  template <class P>
  static absl::StatusOr<const KeyManager<P>*> get_key_manager(
      absl::string_view type_url) {
    return internal::RegistryImpl::GlobalInstance().get_key_manager<P>(
        type_url);
  }

  // Convenience method for creating a new primitive for the key given
  // in `key_data`. It looks up a KeyManager identified by
  // `key_data.type_url`, and calls manager's GetPrimitive(key_data)-method.
  template <class P>
  static absl::StatusOr<std::unique_ptr<P>> GetPrimitive(
      const proto::KeyData& key_data) {
    return internal::RegistryImpl::GlobalInstance().GetPrimitive<P>(key_data);
  }

  // Convenience method for creating a new primitive for the serialized key
  // `serialized_key` of key type `type_url`.
  template <class P>
  static absl::StatusOr<std::unique_ptr<P>> GetPrimitive(
      absl::string_view type_url, absl::string_view serialized_key) {
    proto::KeyData key_data;
    key_data.set_type_url(std::string(type_url));
    key_data.set_value(std::string(serialized_key));
    return GetPrimitive<P>(key_data);
  }

  // Generates a new KeyData for the specified `key_template`.
  // It looks up a KeyManager identified by `key_template.type_url`,
  // and calls KeyManager::NewKeyData.
  static absl::StatusOr<std::unique_ptr<proto::KeyData>> NewKeyData(
      const proto::KeyTemplate& key_template);

  // Convenience method for extracting the public key data. The key manager
  // identified by `type_url` must have a PrivateKeyFactory.
  static absl::StatusOr<std::unique_ptr<proto::KeyData>> GetPublicKeyData(
      absl::string_view type_url, absl::string_view serialized_private_key);

  // Looks up the globally registered PrimitiveWrapper for this primitive
  // and wraps the given PrimitiveSet with it.
  template <class P>
  static absl::StatusOr<std::unique_ptr<P>> Wrap(
      std::unique_ptr<PrimitiveSet<P>> primitive_set) {
    return internal::RegistryImpl::GlobalInstance().Wrap<P>(
        std::move(primitive_set));
  }

  // Resets the registry.
  // After reset the registry contains no key managers, wrappers or
  // monitoring factory. This method is intended for testing only.
  static void Reset();
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_REGISTRY_H_
