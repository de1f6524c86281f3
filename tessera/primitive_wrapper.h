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

#ifndef TESSERA_PRIMITIVE_WRAPPER_H_
#define TESSERA_PRIMITIVE_WRAPPER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "tessera/primitive_set.h"

namespace crypto {
namespace tessera {

// A PrimitiveWrapper knows how to wrap multiple instances of a primitive
// into a single instance of that primitive. The wrapping is done by using the
// primitive set to dispatch each call to the right key.
//
// Wrappers are registered with the Registry, one per primitive. Q is the
// primitive produced by the wrapper; in the shipped wrappers it is the same
// type as P.
template <typename P, typename Q>
class PrimitiveWrapper {
 public:
  using InputPrimitive = P;
  using Primitive = Q;

  virtual ~PrimitiveWrapper() = default;

  virtual absl::StatusOr<std::unique_ptr<Q>> Wrap(
      std::unique_ptr<PrimitiveSet<P>> primitive_set) const = 0;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_PRIMITIVE_WRAPPER_H_
