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

#ifndef TESSERA_MAC_MAC_WRAPPER_H_
#define TESSERA_MAC_MAC_WRAPPER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "tessera/mac.h"
#include "tessera/primitive_set.h"
#include "tessera/primitive_wrapper.h"

namespace crypto {
namespace tessera {

// Wraps a set of Mac-instances that correspond to a keyset,
// and combines them into a single Mac-primitive, that uses the provided
// instances, depending on the context:
//   * Mac::ComputeMac(...) uses the primary instance from the set
//   * Mac::VerifyMac(...) uses the instance that matches the MAC prefix.
// Keys with output prefix type LEGACY compute the MAC over data || 0x00.
class MacWrapper : public PrimitiveWrapper<Mac, Mac> {
 public:
  absl::StatusOr<std::unique_ptr<Mac>> Wrap(
      std::unique_ptr<PrimitiveSet<Mac>> mac_set) const override;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_MAC_MAC_WRAPPER_H_
