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

#ifndef TESSERA_AEAD_AEAD_WRAPPER_H_
#define TESSERA_AEAD_AEAD_WRAPPER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "tessera/aead.h"
#include "tessera/primitive_set.h"
#include "tessera/primitive_wrapper.h"

namespace crypto {
namespace tessera {

// Wraps a set of Aead-instances that correspond to a keyset,
// and combines them into a single Aead-primitive, that uses the provided
// instances, depending on the context:
//   * Aead::Encrypt(...) uses the primary instance from the set
//   * Aead::Decrypt(...) uses the instance that matches the ciphertext prefix.
class AeadWrapper : public PrimitiveWrapper<Aead, Aead> {
 public:
  // Returns an Aead-primitive that uses Aead-instances provided in 'aead_set',
  // which must be non-NULL and must contain a primary instance.
  absl::StatusOr<std::unique_ptr<Aead>> Wrap(
      std::unique_ptr<PrimitiveSet<Aead>> aead_set) const override;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_AEAD_AEAD_WRAPPER_H_
