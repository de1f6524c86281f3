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

#include "tessera/internal/registry_impl.h"

#include <memory>
#include <string>
#include <typeindex>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "tessera/internal/monitoring.h"
#include "tessera/key_manager.h"
#include "tessera/util/errors.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace internal {

using ::crypto::tessera::proto::KeyData;
using ::crypto::tessera::proto::KeyTemplate;

absl::Status RegistryImpl::CheckInsertable(
    absl::string_view type_url, std::type_index key_manager_type_index,
    std::type_index primitive_type_index,
    KeyData::KeyMaterialType material_type, bool new_key_allowed,
    bool* already_registered) const {
  *already_registered = false;
  auto it = type_url_to_info_.find(type_url);
  if (it == type_url_to_info_.end()) return absl::OkStatus();
  const KeyTypeInfo& info = *it->second;
  if (info.key_manager_type_index != key_manager_type_index) {
    return ToStatusF(absl::StatusCode::kAlreadyExists,
                     "A manager for key type '%s' has been already "
                     "registered.",
                     type_url);
  }
  if (info.primitive_type_index != primitive_type_index) {
    return ToStatusF(absl::StatusCode::kAlreadyExists,
                     "Key type '%s' has been already registered for another "
                     "primitive.",
                     type_url);
  }
  if (info.key_manager->key_material_type() != material_type) {
    return ToStatusF(absl::StatusCode::kAlreadyExists,
                     "Key type '%s' has been already registered with another "
                     "key material type.",
                     type_url);
  }
  if (!info.new_key_allowed && new_key_allowed) {
    return ToStatusF(absl::StatusCode::kAlreadyExists,
                     "A manager for key type '%s' has been already "
                     "registered with forbidden new key operation.",
                     type_url);
  }
  *already_registered = true;
  return absl::OkStatus();
}

void RegistryImpl::InsertOrUpdate(absl::string_view type_url,
                                  std::unique_ptr<KeyTypeInfo> info,
                                  bool already_registered) {
  if (already_registered) {
    type_url_to_info_.at(type_url)->new_key_allowed = info->new_key_allowed;
    return;
  }
  type_url_to_info_.emplace(std::string(type_url), std::move(info));
}

absl::StatusOr<const RegistryImpl::KeyTypeInfo*>
RegistryImpl::get_key_type_info(absl::string_view type_url) const {
  auto it = type_url_to_info_.find(type_url);
  if (it == type_url_to_info_.end()) {
    return ToStatusF(absl::StatusCode::kNotFound,
                     "No manager for type '%s' has been registered.",
                     type_url);
  }
  return it->second.get();
}

absl::StatusOr<std::unique_ptr<KeyData>> RegistryImpl::NewKeyData(
    const KeyTemplate& key_template) const {
  const KeyManagerBase* key_manager = nullptr;
  {
    absl::ReaderMutexLock lock(&maps_mutex_);
    absl::StatusOr<const KeyTypeInfo*> info =
        get_key_type_info(key_template.type_url());
    if (!info.ok()) return info.status();
    if (!(*info)->new_key_allowed) {
      return ToStatusF(absl::StatusCode::kFailedPrecondition,
                       "KeyManager for type '%s' does not allow "
                       "creation of new keys.",
                       key_template.type_url());
    }
    key_manager = (*info)->key_manager.get();
  }
  return key_manager->get_key_factory().NewKeyData(key_template.value());
}

absl::StatusOr<std::unique_ptr<KeyData>> RegistryImpl::GetPublicKeyData(
    absl::string_view type_url,
    absl::string_view serialized_private_key) const {
  const KeyManagerBase* key_manager = nullptr;
  {
    absl::ReaderMutexLock lock(&maps_mutex_);
    absl::StatusOr<const KeyTypeInfo*> info = get_key_type_info(type_url);
    if (!info.ok()) return info.status();
    key_manager = (*info)->key_manager.get();
  }
  const auto* factory =
      dynamic_cast<const PrivateKeyFactory*>(&key_manager->get_key_factory());
  if (factory == nullptr) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "KeyManager for type '%s' does not have "
                     "a PrivateKeyFactory.",
                     type_url);
  }
  return factory->GetPublicKeyData(serialized_private_key);
}

absl::Status RegistryImpl::RegisterMonitoringClientFactory(
    std::unique_ptr<MonitoringClientFactory> factory) {
  if (factory == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Monitoring factory must not be null.");
  }
  absl::MutexLock lock(&maps_mutex_);
  if (monitoring_factory_ != nullptr) {
    return absl::Status(absl::StatusCode::kAlreadyExists,
                        "A monitoring factory is already registered.");
  }
  monitoring_factory_ = std::move(factory);
  return absl::OkStatus();
}

MonitoringClientFactory* RegistryImpl::GetMonitoringClientFactory() const {
  absl::ReaderMutexLock lock(&maps_mutex_);
  return monitoring_factory_.get();
}

void RegistryImpl::Reset() {
  absl::MutexLock lock(&maps_mutex_);
  type_url_to_info_.clear();
  primitive_to_wrapper_.clear();
  monitoring_factory_.reset();
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto
