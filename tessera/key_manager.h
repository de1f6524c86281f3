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

#ifndef TESSERA_KEY_MANAGER_H_
#define TESSERA_KEY_MANAGER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Auxiliary class that supports key generation.
class KeyFactory {
 public:
  // Generates a new random key, based on the specified `serialized_key_format`
  // (a serialized protocol buffer of the key format matching the key type),
  // and returns it wrapped in a KeyData proto.
  virtual absl::StatusOr<std::unique_ptr<proto::KeyData>> NewKeyData(
      absl::string_view serialized_key_format) const = 0;

  virtual ~KeyFactory() = default;
};

// Key factory for key types with a public counterpart.
class PrivateKeyFactory : public virtual KeyFactory {
 public:
  // Returns the public key matching `serialized_private_key`, wrapped in a
  // KeyData proto of material type ASYMMETRIC_PUBLIC.
  virtual absl::StatusOr<std::unique_ptr<proto::KeyData>> GetPublicKeyData(
      absl::string_view serialized_private_key) const = 0;

  ~PrivateKeyFactory() override = default;
};

// The part of a KeyManager that does not depend on the primitive it creates.
// The Registry keeps key managers through this type.
class KeyManagerBase {
 public:
  // Returns the type_url identifying the key type handled by this manager.
  virtual const std::string& get_key_type() const = 0;

  // Returns the material class of the keys handled by this manager.
  virtual proto::KeyData::KeyMaterialType key_material_type() const = 0;

  // Returns the version of this key manager.
  virtual uint32_t get_version() const = 0;

  // Returns a factory that generates keys of the key type handled by this
  // manager.
  virtual const KeyFactory& get_key_factory() const = 0;

  bool DoesSupport(absl::string_view key_type) const {
    return key_type == get_key_type();
  }

  virtual ~KeyManagerBase() = default;
};

// KeyManager<P> "understands" keys of a specific key type: it can generate
// keys of the supported type and create primitives of type P for them.
template <class P>
class KeyManager : public KeyManagerBase {
 public:
  // Constructs an instance of P for the key given in `key_data`.
  virtual absl::StatusOr<std::unique_ptr<P>> GetPrimitive(
      const proto::KeyData& key_data) const = 0;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_KEY_MANAGER_H_
