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

#ifndef TESSERA_CORE_KEY_TYPE_MANAGER_H_
#define TESSERA_CORE_KEY_TYPE_MANAGER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// A KeyTypeManager manages a single key proto. This includes
//  * parsing and validating keys
//  * parsing and validating key formats (in order to generate keys)
//  * creating the primitive for a key.
//
// A KeyTypeManager is not registered directly. The Registry turns it into a
// KeyManager<Primitive> (see core/key_manager_impl.h), which handles the
// (de)serialization of KeyData and the dispatch on the key type.
//
// Example:
//   class AesGcmKeyManager
//       : public KeyTypeManager<AesGcmKey, AesGcmKeyFormat, Aead> {
//    public:
//     class AeadFactory : public PrimitiveFactory {
//       absl::StatusOr<std::unique_ptr<Aead>> Create(
//           const AesGcmKey& key) const override { ... }
//     };
//     AesGcmKeyManager()
//         : KeyTypeManager(absl::make_unique<AeadFactory>()) {}
//     ...
//   };
template <typename KeyProtoParam, typename KeyFormatProtoParam,
          typename PrimitiveParam>
class KeyTypeManager {
 public:
  using KeyProto = KeyProtoParam;
  using KeyFormatProto = KeyFormatProtoParam;
  using Primitive = PrimitiveParam;

  // Creates a primitive from a validated key proto.
  class PrimitiveFactory {
   public:
    virtual absl::StatusOr<std::unique_ptr<Primitive>> Create(
        const KeyProto& key) const = 0;
    virtual ~PrimitiveFactory() = default;
  };

  explicit KeyTypeManager(std::unique_ptr<PrimitiveFactory> primitive_factory)
      : primitive_factory_(std::move(primitive_factory)) {}

  virtual ~KeyTypeManager() = default;

  // Returns the version of the key type. Keys with a larger version are
  // rejected.
  virtual uint32_t get_version() const = 0;

  virtual proto::KeyData::KeyMaterialType key_material_type() const = 0;

  // Returns the type URL of KeyProto.
  virtual const std::string& get_key_type() const = 0;

  virtual absl::Status ValidateKey(const KeyProto& key) const = 0;

  virtual absl::Status ValidateKeyFormat(
      const KeyFormatProto& key_format) const = 0;

  // Generates a new key. `key_format` has already been validated.
  virtual absl::StatusOr<KeyProto> CreateKey(
      const KeyFormatProto& key_format) const = 0;

  // Creates the primitive for `key`, which must already have been validated.
  absl::StatusOr<std::unique_ptr<Primitive>> GetPrimitive(
      const KeyProto& key) const {
    return primitive_factory_->Create(key);
  }

 private:
  std::unique_ptr<PrimitiveFactory> primitive_factory_;
};

// Specialization for key types which cannot be generated on their own, for
// example public keys, which are always derived from a private key.
template <typename KeyProtoParam, typename PrimitiveParam>
class KeyTypeManager<KeyProtoParam, void, PrimitiveParam> {
 public:
  using KeyProto = KeyProtoParam;
  using KeyFormatProto = void;
  using Primitive = PrimitiveParam;

  class PrimitiveFactory {
   public:
    virtual absl::StatusOr<std::unique_ptr<Primitive>> Create(
        const KeyProto& key) const = 0;
    virtual ~PrimitiveFactory() = default;
  };

  explicit KeyTypeManager(std::unique_ptr<PrimitiveFactory> primitive_factory)
      : primitive_factory_(std::move(primitive_factory)) {}

  virtual ~KeyTypeManager() = default;

  virtual uint32_t get_version() const = 0;
  virtual proto::KeyData::KeyMaterialType key_material_type() const = 0;
  virtual const std::string& get_key_type() const = 0;
  virtual absl::Status ValidateKey(const KeyProto& key) const = 0;

  absl::StatusOr<std::unique_ptr<Primitive>> GetPrimitive(
      const KeyProto& key) const {
    return primitive_factory_->Create(key);
  }

 private:
  std::unique_ptr<PrimitiveFactory> primitive_factory_;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_CORE_KEY_TYPE_MANAGER_H_
