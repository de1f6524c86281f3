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

#ifndef TESSERA_CORE_PRIVATE_KEY_TYPE_MANAGER_H_
#define TESSERA_CORE_PRIVATE_KEY_TYPE_MANAGER_H_

#include <memory>
#include <utility>

#include "absl/status/statusor.h"
#include "tessera/core/key_type_manager.h"

namespace crypto {
namespace tessera {

// A KeyTypeManager for private keys, which additionally knows how to extract
// the public key proto out of a private key proto.
template <typename PrivateKeyProto, typename KeyFormatProto,
          typename PublicKeyProtoParam, typename Primitive>
class PrivateKeyTypeManager
    : public KeyTypeManager<PrivateKeyProto, KeyFormatProto, Primitive> {
 public:
  using PublicKeyProto = PublicKeyProtoParam;

  explicit PrivateKeyTypeManager(
      std::unique_ptr<typename KeyTypeManager<
          PrivateKeyProto, KeyFormatProto, Primitive>::PrimitiveFactory>
          primitive_factory)
      : KeyTypeManager<PrivateKeyProto, KeyFormatProto, Primitive>(
            std::move(primitive_factory)) {}

  // `private_key` has already been validated.
  virtual absl::StatusOr<PublicKeyProto> GetPublicKey(
      const PrivateKeyProto& private_key) const = 0;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_CORE_PRIVATE_KEY_TYPE_MANAGER_H_
