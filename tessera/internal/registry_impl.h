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

#ifndef TESSERA_INTERNAL_REGISTRY_IMPL_H_
#define TESSERA_INTERNAL_REGISTRY_IMPL_H_

#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "tessera/core/key_manager_impl.h"
#include "tessera/core/private_key_manager_impl.h"
#include "tessera/internal/monitoring.h"
#include "tessera/key_manager.h"
#include "tessera/primitive_set.h"
#include "tessera/primitive_wrapper.h"
#include "tessera/util/errors.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace internal {

// The state behind the static Registry facade. Registration takes the lock
// exclusively; lookups share it. Managers and wrappers handed out by lookups
// stay valid until Reset().
class RegistryImpl {
 public:
  // The process-wide instance. Created on first use and never destroyed.
  static RegistryImpl& GlobalInstance() {
    static RegistryImpl* instance = new RegistryImpl();
    return *instance;
  }

  RegistryImpl() = default;
  RegistryImpl(const RegistryImpl&) = delete;
  RegistryImpl& operator=(const RegistryImpl&) = delete;

  template <class P>
  absl::Status RegisterKeyManager(std::unique_ptr<KeyManager<P>> manager,
                                  bool new_key_allowed)
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  template <class KeyTypeManagerT>
  absl::Status RegisterKeyTypeManager(
      std::unique_ptr<KeyTypeManagerT> manager, bool new_key_allowed)
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  template <class PrivateKeyTypeManagerT, class PublicKeyTypeManagerT>
  absl::Status RegisterAsymmetricKeyManagers(
      std::unique_ptr<PrivateKeyTypeManagerT> private_key_manager,
      std::unique_ptr<PublicKeyTypeManagerT> public_key_manager,
      bool new_key_allowed) ABSL_LOCKS_EXCLUDED(maps_mutex_);

  template <class P, class Q>
  absl::Status RegisterPrimitiveWrapper(
      std::unique_ptr<PrimitiveWrapper<P, Q>> wrapper)
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  template <class P>
  absl::StatusOr<const KeyManager<P>*> get_key_manager(
      absl::string_view type_url) const ABSL_LOCKS_EXCLUDED(maps_mutex_);

  template <class P>
  absl::StatusOr<std::unique_ptr<P>> GetPrimitive(
      const proto::KeyData& key_data) const ABSL_LOCKS_EXCLUDED(maps_mutex_);

  template <class P>
  absl::StatusOr<std::unique_ptr<P>> Wrap(
      std::unique_ptr<PrimitiveSet<P>> primitive_set) const
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  absl::StatusOr<std::unique_ptr<proto::KeyData>> NewKeyData(
      const proto::KeyTemplate& key_template) const
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  absl::StatusOr<std::unique_ptr<proto::KeyData>> GetPublicKeyData(
      absl::string_view type_url,
      absl::string_view serialized_private_key) const
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  absl::Status RegisterMonitoringClientFactory(
      std::unique_ptr<MonitoringClientFactory> factory)
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  // Returns the registered monitoring client factory, or nullptr.
  MonitoringClientFactory* GetMonitoringClientFactory() const
      ABSL_LOCKS_EXCLUDED(maps_mutex_);

  // Drops all key managers, wrappers and the monitoring factory.
  void Reset() ABSL_LOCKS_EXCLUDED(maps_mutex_);

 private:
  // Everything the registry knows about one key type.
  struct KeyTypeInfo {
    KeyTypeInfo(std::type_index key_manager_type_index,
                std::type_index primitive_type_index,
                std::unique_ptr<KeyManagerBase> key_manager,
                bool new_key_allowed)
        : key_manager_type_index(key_manager_type_index),
          primitive_type_index(primitive_type_index),
          key_manager(std::move(key_manager)),
          new_key_allowed(new_key_allowed) {}

    // Type of the registered (key type) manager, used to decide whether a
    // second registration for the same type URL is a repetition.
    const std::type_index key_manager_type_index;
    const std::type_index primitive_type_index;
    const std::unique_ptr<KeyManagerBase> key_manager;
    bool new_key_allowed;
    // Type URL of the public key type, set for private key types only.
    std::string public_key_type;
  };

  class WrapperInfoBase {
   public:
    virtual ~WrapperInfoBase() = default;
    virtual std::type_index wrapper_type_index() const = 0;
  };

  template <class P>
  class WrapperInfo : public WrapperInfoBase {
   public:
    explicit WrapperInfo(std::unique_ptr<PrimitiveWrapper<P, P>> wrapper)
        : wrapper_(std::move(wrapper)) {}
    std::type_index wrapper_type_index() const override {
      return std::type_index(typeid(*wrapper_));
    }
    const PrimitiveWrapper<P, P>& wrapper() const { return *wrapper_; }

   private:
    std::unique_ptr<PrimitiveWrapper<P, P>> wrapper_;
  };

  // Returns OK if a manager described by the arguments may be registered for
  // `type_url`, or the error explaining the conflict otherwise. Sets
  // `*already_registered` if an equivalent manager is present.
  absl::Status CheckInsertable(absl::string_view type_url,
                               std::type_index key_manager_type_index,
                               std::type_index primitive_type_index,
                               proto::KeyData::KeyMaterialType material_type,
                               bool new_key_allowed,
                               bool* already_registered) const
      ABSL_SHARED_LOCKS_REQUIRED(maps_mutex_);

  // Inserts `info`, or only downgrades `new_key_allowed` of the present entry
  // if `already_registered`.
  void InsertOrUpdate(absl::string_view type_url,
                      std::unique_ptr<KeyTypeInfo> info,
                      bool already_registered)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(maps_mutex_);

  absl::StatusOr<const KeyTypeInfo*> get_key_type_info(
      absl::string_view type_url) const ABSL_SHARED_LOCKS_REQUIRED(maps_mutex_);

  mutable absl::Mutex maps_mutex_;
  absl::flat_hash_map<std::string, std::unique_ptr<KeyTypeInfo>>
      type_url_to_info_ ABSL_GUARDED_BY(maps_mutex_);
  absl::flat_hash_map<std::type_index, std::unique_ptr<WrapperInfoBase>>
      primitive_to_wrapper_ ABSL_GUARDED_BY(maps_mutex_);
  std::unique_ptr<MonitoringClientFactory> monitoring_factory_
      ABSL_GUARDED_BY(maps_mutex_);
};

template <class P>
absl::Status RegistryImpl::RegisterKeyManager(
    std::unique_ptr<KeyManager<P>> manager, bool new_key_allowed) {
  if (manager == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Parameter 'manager' must be non-null.");
  }
  std::string type_url = manager->get_key_type();
  auto info = absl::make_unique<KeyTypeInfo>(
      std::type_index(typeid(*manager)), std::type_index(typeid(P)),
      std::move(manager), new_key_allowed);
  absl::MutexLock lock(&maps_mutex_);
  bool already_registered = false;
  absl::Status status = CheckInsertable(
      type_url, info->key_manager_type_index, info->primitive_type_index,
      info->key_manager->key_material_type(), new_key_allowed,
      &already_registered);
  if (!status.ok()) return status;
  InsertOrUpdate(type_url, std::move(info), already_registered);
  return absl::OkStatus();
}

template <class KeyTypeManagerT>
absl::Status RegistryImpl::RegisterKeyTypeManager(
    std::unique_ptr<KeyTypeManagerT> manager, bool new_key_allowed) {
  if (manager == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Parameter 'manager' must be non-null.");
  }
  using Primitive = typename KeyTypeManagerT::Primitive;
  std::type_index key_manager_type_index(typeid(*manager));
  std::string type_url = manager->get_key_type();
  std::unique_ptr<KeyManagerBase> key_manager =
      MakeKeyManager<Primitive>(std::move(manager));
  auto info = absl::make_unique<KeyTypeInfo>(
      key_manager_type_index, std::type_index(typeid(Primitive)),
      std::move(key_manager), new_key_allowed);
  absl::MutexLock lock(&maps_mutex_);
  bool already_registered = false;
  absl::Status status = CheckInsertable(
      type_url, info->key_manager_type_index, info->primitive_type_index,
      info->key_manager->key_material_type(), new_key_allowed,
      &already_registered);
  if (!status.ok()) return status;
  InsertOrUpdate(type_url, std::move(info), already_registered);
  return absl::OkStatus();
}

template <class PrivateKeyTypeManagerT, class PublicKeyTypeManagerT>
absl::Status RegistryImpl::RegisterAsymmetricKeyManagers(
    std::unique_ptr<PrivateKeyTypeManagerT> private_key_manager,
    std::unique_ptr<PublicKeyTypeManagerT> public_key_manager,
    bool new_key_allowed) {
  if (private_key_manager == nullptr || public_key_manager == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Key managers must be non-null.");
  }
  using PrivatePrimitive = typename PrivateKeyTypeManagerT::Primitive;
  using PublicPrimitive = typename PublicKeyTypeManagerT::Primitive;
  std::type_index private_type_index(typeid(*private_key_manager));
  std::type_index public_type_index(typeid(*public_key_manager));
  std::string private_type_url = private_key_manager->get_key_type();
  std::string public_type_url = public_key_manager->get_key_type();

  // The private key factory points to the public key type manager, which is
  // owned by the public key manager below.
  const PublicKeyTypeManagerT* public_key_type_manager =
      public_key_manager.get();
  auto public_info = absl::make_unique<KeyTypeInfo>(
      public_type_index, std::type_index(typeid(PublicPrimitive)),
      MakeKeyManager<PublicPrimitive>(std::move(public_key_manager)),
      new_key_allowed);
  auto private_info = absl::make_unique<KeyTypeInfo>(
      private_type_index, std::type_index(typeid(PrivatePrimitive)),
      MakePrivateKeyManager<PrivatePrimitive>(std::move(private_key_manager),
                                              public_key_type_manager),
      new_key_allowed);
  private_info->public_key_type = public_type_url;

  absl::MutexLock lock(&maps_mutex_);
  bool private_registered = false;
  absl::Status status = CheckInsertable(
      private_type_url, private_info->key_manager_type_index,
      private_info->primitive_type_index,
      private_info->key_manager->key_material_type(), new_key_allowed,
      &private_registered);
  if (!status.ok()) return status;
  bool public_registered = false;
  status = CheckInsertable(
      public_type_url, public_info->key_manager_type_index,
      public_info->primitive_type_index,
      public_info->key_manager->key_material_type(), new_key_allowed,
      &public_registered);
  if (!status.ok()) return status;

  if (private_registered != public_registered) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Key types '%s' and '%s' must be registered together.",
                     private_type_url, public_type_url);
  }
  if (private_registered &&
      type_url_to_info_.at(private_type_url)->public_key_type !=
          public_type_url) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Private key type '%s' was registered with a different "
                     "public key type than '%s'.",
                     private_type_url, public_type_url);
  }
  InsertOrUpdate(private_type_url, std::move(private_info),
                 private_registered);
  InsertOrUpdate(public_type_url, std::move(public_info), public_registered);
  return absl::OkStatus();
}

template <class P, class Q>
absl::Status RegistryImpl::RegisterPrimitiveWrapper(
    std::unique_ptr<PrimitiveWrapper<P, Q>> wrapper) {
  static_assert(std::is_same<P, Q>::value,
                "Only wrappers producing their input primitive can be "
                "registered.");
  if (wrapper == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Parameter 'wrapper' must be non-null.");
  }
  auto info = absl::make_unique<WrapperInfo<P>>(std::move(wrapper));
  std::type_index primitive_type_index(typeid(P));
  absl::MutexLock lock(&maps_mutex_);
  auto it = primitive_to_wrapper_.find(primitive_type_index);
  if (it != primitive_to_wrapper_.end()) {
    if (it->second->wrapper_type_index() != info->wrapper_type_index()) {
      return ToStatusF(absl::StatusCode::kAlreadyExists,
                       "A wrapper named '%s' is already registered for "
                       "primitive '%s'.",
                       it->second->wrapper_type_index().name(),
                       primitive_type_index.name());
    }
    return absl::OkStatus();
  }
  primitive_to_wrapper_.emplace(primitive_type_index, std::move(info));
  return absl::OkStatus();
}

template <class P>
absl::StatusOr<const KeyManager<P>*> RegistryImpl::get_key_manager(
    absl::string_view type_url) const {
  absl::ReaderMutexLock lock(&maps_mutex_);
  absl::StatusOr<const KeyTypeInfo*> info = get_key_type_info(type_url);
  if (!info.ok()) return info.status();
  if ((*info)->primitive_type_index != std::type_index(typeid(P))) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Primitive type '%s' not among supported primitives "
                     "for key type '%s'.",
                     typeid(P).name(), type_url);
  }
  return static_cast<const KeyManager<P>*>((*info)->key_manager.get());
}

template <class P>
absl::StatusOr<std::unique_ptr<P>> RegistryImpl::GetPrimitive(
    const proto::KeyData& key_data) const {
  absl::StatusOr<const KeyManager<P>*> key_manager =
      get_key_manager<P>(key_data.type_url());
  if (!key_manager.ok()) return key_manager.status();
  return (*key_manager)->GetPrimitive(key_data);
}

template <class P>
absl::StatusOr<std::unique_ptr<P>> RegistryImpl::Wrap(
    std::unique_ptr<PrimitiveSet<P>> primitive_set) const {
  if (primitive_set == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Parameter 'primitive_set' must be non-null.");
  }
  const PrimitiveWrapper<P, P>* wrapper = nullptr;
  {
    absl::ReaderMutexLock lock(&maps_mutex_);
    auto it = primitive_to_wrapper_.find(std::type_index(typeid(P)));
    if (it == primitive_to_wrapper_.end()) {
      return ToStatusF(absl::StatusCode::kNotFound,
                       "No wrapper registered for type '%s'.",
                       typeid(P).name());
    }
    wrapper =
        &static_cast<const WrapperInfo<P>*>(it->second.get())->wrapper();
  }
  return wrapper->Wrap(std::move(primitive_set));
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_REGISTRY_IMPL_H_
