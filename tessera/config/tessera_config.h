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

#ifndef TESSERA_CONFIG_TESSERA_CONFIG_H_
#define TESSERA_CONFIG_TESSERA_CONFIG_H_

#include "absl/status/status.h"

namespace crypto {
namespace tessera {

///////////////////////////////////////////////////////////////////////////////
// Static methods for registering with the Registry all instances of all key
// types supported in a particular release of Tessera.
//
// To register all key types one can do:
//
//   auto status = TesseraConfig::Register();
//
class TesseraConfig {
 public:
  // Registers key managers and primitive wrappers for the Aead, Mac,
  // PublicKeySign and PublicKeyVerify primitives.
  static absl::Status Register();

 private:
  TesseraConfig() = default;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_CONFIG_TESSERA_CONFIG_H_
