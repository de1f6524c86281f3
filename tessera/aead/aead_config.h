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

#ifndef TESSERA_AEAD_AEAD_CONFIG_H_
#define TESSERA_AEAD_AEAD_CONFIG_H_

#include "absl/status/status.h"

namespace crypto {
namespace tessera {

///////////////////////////////////////////////////////////////////////////////
// Static methods and constants for registering with the Registry
// all instances of Aead key types supported in a particular release of
// Tessera, i.e. key types that correspond to "tessera.Aead" primitive.
//
// To register all Aead key types one can do:
//
//   auto status = AeadConfig::Register();
//
class AeadConfig {
 public:
  // Registers Aead primitive wrapper and key managers for all Aead key types
  // from the current Tessera release.
  static absl::Status Register();

 private:
  AeadConfig() = default;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_AEAD_AEAD_CONFIG_H_
