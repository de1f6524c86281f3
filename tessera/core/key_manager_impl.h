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

#ifndef TESSERA_CORE_KEY_MANAGER_IMPL_H_
#define TESSERA_CORE_KEY_MANAGER_IMPL_H_

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/core/key_type_manager.h"
#include "tessera/key_manager.h"
#include "tessera/util/errors.h"
#include "tessera/util/secret_proto.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace internal {

// Parses `serialized` into a KeyProto and validates it with
// `key_type_manager`.
template <class KeyTypeManagerT>
absl::StatusOr<util::SecretProto<typename KeyTypeManagerT::KeyProto>>
ParseAndValidateKey(const KeyTypeManagerT& key_type_manager,
                    absl::string_view serialized) {
  util::SecretProto<typename KeyTypeManagerT::KeyProto> key;
  if (!key->ParseFromString(std::string(serialized))) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Could not parse key_data.value as key type '%s'.",
                     key_type_manager.get_key_type());
  }
  absl::Status status = key_type_manager.ValidateKey(*key);
  if (!status.ok()) return status;
  return std::move(key);
}

// Wraps the key creation of a KeyTypeManager into a KeyFactory.
template <class KeyTypeManagerT>
class KeyFactoryImpl : public virtual KeyFactory {
 public:
  explicit KeyFactoryImpl(const KeyTypeManagerT* key_type_manager)
      : key_type_manager_(key_type_manager) {}

  absl::StatusOr<std::unique_ptr<proto::KeyData>> NewKeyData(
      absl::string_view serialized_key_format) const override {
    typename KeyTypeManagerT::KeyFormatProto key_format;
    if (!key_format.ParseFromString(std::string(serialized_key_format))) {
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "Could not parse the key format of key type '%s'.",
                       key_type_manager_->get_key_type());
    }
    absl::Status status = key_type_manager_->ValidateKeyFormat(key_format);
    if (!status.ok()) return status;
    absl::StatusOr<typename KeyTypeManagerT::KeyProto> key =
        key_type_manager_->CreateKey(key_format);
    if (!key.ok()) return key.status();
    util::SecretProto<typename KeyTypeManagerT::KeyProto> secret_key(
        *std::move(key));
    auto key_data = absl::make_unique<proto::KeyData>();
    key_data->set_type_url(key_type_manager_->get_key_type());
    key_data->set_value(secret_key->SerializeAsString());
    key_data->set_key_material_type(key_type_manager_->key_material_type());
    return std::move(key_data);
  }

 protected:
  const KeyTypeManagerT* key_type_manager_;
};

// Factory for key types that do not support key generation.
class KeyFactoryNotSupported : public KeyFactory {
 public:
  explicit KeyFactoryNotSupported(absl::string_view key_type)
      : key_type_(key_type) {}

  absl::StatusOr<std::unique_ptr<proto::KeyData>> NewKeyData(
      absl::string_view serialized_key_format) const override {
    return ToStatusF(absl::StatusCode::kUnimplemented,
                     "Creating new keys of type '%s' is not supported.",
                     key_type_);
  }

 private:
  const std::string key_type_;
};

// KeyManager<Primitive> backed by a KeyTypeManager. Owns the KeyTypeManager.
template <class Primitive, class KeyTypeManagerT>
class KeyManagerImpl : public KeyManager<Primitive> {
 public:
  explicit KeyManagerImpl(std::unique_ptr<KeyTypeManagerT> key_type_manager,
                          std::unique_ptr<KeyFactory> key_factory)
      : key_type_manager_(std::move(key_type_manager)),
        key_factory_(std::move(key_factory)) {}

  absl::StatusOr<std::unique_ptr<Primitive>> GetPrimitive(
      const proto::KeyData& key_data) const override {
    if (!this->DoesSupport(key_data.type_url())) {
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "Key type '%s' is not supported by this manager.",
                       key_data.type_url());
    }
    auto key = ParseAndValidateKey(*key_type_manager_, key_data.value());
    if (!key.ok()) return key.status();
    return key_type_manager_->GetPrimitive(**key);
  }

  const std::string& get_key_type() const override {
    return key_type_manager_->get_key_type();
  }

  proto::KeyData::KeyMaterialType key_material_type() const override {
    return key_type_manager_->key_material_type();
  }

  uint32_t get_version() const override {
    return key_type_manager_->get_version();
  }

  const KeyFactory& get_key_factory() const override { return *key_factory_; }

  const KeyTypeManagerT& key_type_manager() const {
    return *key_type_manager_;
  }

 private:
  std::unique_ptr<KeyTypeManagerT> key_type_manager_;
  std::unique_ptr<KeyFactory> key_factory_;
};

template <class KeyTypeManagerT>
std::unique_ptr<KeyFactory> MakeKeyFactory(const KeyTypeManagerT* manager,
                                           std::false_type /*no_format*/) {
  return absl::make_unique<KeyFactoryImpl<KeyTypeManagerT>>(manager);
}

template <class KeyTypeManagerT>
std::unique_ptr<KeyFactory> MakeKeyFactory(const KeyTypeManagerT* manager,
                                           std::true_type /*no_format*/) {
  return absl::make_unique<KeyFactoryNotSupported>(manager->get_key_type());
}

// Creates a KeyManager<Primitive> out of a KeyTypeManager.
template <class Primitive, class KeyTypeManagerT>
std::unique_ptr<KeyManagerImpl<Primitive, KeyTypeManagerT>> MakeKeyManager(
    std::unique_ptr<KeyTypeManagerT> key_type_manager) {
  std::unique_ptr<KeyFactory> key_factory = MakeKeyFactory(
      key_type_manager.get(),
      std::is_void<typename KeyTypeManagerT::KeyFormatProto>());
  return absl::make_unique<KeyManagerImpl<Primitive, KeyTypeManagerT>>(
      std::move(key_type_manager), std::move(key_factory));
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_CORE_KEY_MANAGER_IMPL_H_
