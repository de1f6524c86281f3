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

#ifndef TESSERA_SIGNATURE_PUBLIC_KEY_SIGN_WRAPPER_H_
#define TESSERA_SIGNATURE_PUBLIC_KEY_SIGN_WRAPPER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "tessera/primitive_set.h"
#include "tessera/primitive_wrapper.h"
#include "tessera/public_key_sign.h"

namespace crypto {
namespace tessera {

// Wraps a set of PublicKeySign-instances that correspond to a keyset,
// and combines them into a single PublicKeySign-primitive, that uses
// the primary instance to compute the signature.
class PublicKeySignWrapper
    : public PrimitiveWrapper<PublicKeySign, PublicKeySign> {
 public:
  absl::StatusOr<std::unique_ptr<PublicKeySign>> Wrap(
      std::unique_ptr<PrimitiveSet<PublicKeySign>> public_key_sign_set)
      const override;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SIGNATURE_PUBLIC_KEY_SIGN_WRAPPER_H_
