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

#include "tessera/config/tessera_config.h"

#include "absl/status/status.h"
#include "tessera/aead/aead_config.h"
#include "tessera/mac/mac_config.h"
#include "tessera/signature/signature_config.h"

namespace crypto {
namespace tessera {

// static
absl::Status TesseraConfig::Register() {
  absl::Status status = MacConfig::Register();
  if (!status.ok()) return status;
  status = AeadConfig::Register();
  if (!status.ok()) return status;
  return SignatureConfig::Register();
}

}  // namespace tessera
}  // namespace crypto
