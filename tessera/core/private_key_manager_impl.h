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

#ifndef TESSERA_CORE_PRIVATE_KEY_MANAGER_IMPL_H_
#define TESSERA_CORE_PRIVATE_KEY_MANAGER_IMPL_H_

#include <memory>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/core/key_manager_impl.h"
#include "tessera/key_manager.h"
#include "tessera/util/secret_proto.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace internal {

// KeyFactory for a private key type. In addition to generating private keys
// it extracts the public KeyData from a serialized private key, using
// `public_key_type_manager` to name and validate the result.
template <class PrivateKeyTypeManagerT, class PublicKeyTypeManagerT>
class PrivateKeyFactoryImpl : public PrivateKeyFactory,
                              public KeyFactoryImpl<PrivateKeyTypeManagerT> {
 public:
  PrivateKeyFactoryImpl(const PrivateKeyTypeManagerT* private_key_manager,
                        const PublicKeyTypeManagerT* public_key_manager)
      : KeyFactoryImpl<PrivateKeyTypeManagerT>(private_key_manager),
        public_key_type_manager_(public_key_manager) {}

  absl::StatusOr<std::unique_ptr<proto::KeyData>> NewKeyData(
      absl::string_view serialized_key_format) const override {
    return KeyFactoryImpl<PrivateKeyTypeManagerT>::NewKeyData(
        serialized_key_format);
  }

  absl::StatusOr<std::unique_ptr<proto::KeyData>> GetPublicKeyData(
      absl::string_view serialized_private_key) const override {
    auto private_key =
        ParseAndValidateKey(*this->key_type_manager_, serialized_private_key);
    if (!private_key.ok()) return private_key.status();
    absl::StatusOr<typename PrivateKeyTypeManagerT::PublicKeyProto> public_key =
        this->key_type_manager_->GetPublicKey(**private_key);
    if (!public_key.ok()) return public_key.status();
    absl::Status status = public_key_type_manager_->ValidateKey(*public_key);
    if (!status.ok()) return status;
    auto key_data = absl::make_unique<proto::KeyData>();
    key_data->set_type_url(public_key_type_manager_->get_key_type());
    key_data->set_value(public_key->SerializeAsString());
    key_data->set_key_material_type(
        public_key_type_manager_->key_material_type());
    return std::move(key_data);
  }

 private:
  const PublicKeyTypeManagerT* public_key_type_manager_;
};

// Creates a KeyManager<Primitive> for a private key type. The returned manager
// keeps a pointer to `public_key_manager`, which must outlive it.
template <class Primitive, class PrivateKeyTypeManagerT,
          class PublicKeyTypeManagerT>
std::unique_ptr<KeyManagerImpl<Primitive, PrivateKeyTypeManagerT>>
MakePrivateKeyManager(
    std::unique_ptr<PrivateKeyTypeManagerT> private_key_manager,
    const PublicKeyTypeManagerT* public_key_manager) {
  auto key_factory = absl::make_unique<
      PrivateKeyFactoryImpl<PrivateKeyTypeManagerT, PublicKeyTypeManagerT>>(
      private_key_manager.get(), public_key_manager);
  return absl::make_unique<KeyManagerImpl<Primitive, PrivateKeyTypeManagerT>>(
      std::move(private_key_manager), std::move(key_factory));
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_CORE_PRIVATE_KEY_MANAGER_IMPL_H_
