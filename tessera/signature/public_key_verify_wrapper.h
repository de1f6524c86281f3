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

#ifndef TESSERA_SIGNATURE_PUBLIC_KEY_VERIFY_WRAPPER_H_
#define TESSERA_SIGNATURE_PUBLIC_KEY_VERIFY_WRAPPER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "tessera/primitive_set.h"
#include "tessera/primitive_wrapper.h"
#include "tessera/public_key_verify.h"

namespace crypto {
namespace tessera {

// Wraps a set of PublicKeyVerify-instances that correspond to a keyset,
// and combines them into a single PublicKeyVerify-primitive, that selects
// the instance to verify with by the prefix of the signature.
class PublicKeyVerifyWrapper
    : public PrimitiveWrapper<PublicKeyVerify, PublicKeyVerify> {
 public:
  absl::StatusOr<std::unique_ptr<PublicKeyVerify>> Wrap(
      std::unique_ptr<PrimitiveSet<PublicKeyVerify>> public_key_verify_set)
      const override;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SIGNATURE_PUBLIC_KEY_VERIFY_WRAPPER_H_
