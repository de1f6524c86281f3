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

#include "tessera/aead/aead_config.h"

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "tessera/aead/aead_wrapper.h"
#include "tessera/aead/aes_gcm_key_manager.h"
#include "tessera/aead/kms_aead_key_manager.h"
#include "tessera/registry.h"

namespace crypto {
namespace tessera {

// static
absl::Status AeadConfig::Register() {
  // Register primitive wrapper.
  absl::Status status = Registry::RegisterPrimitiveWrapper<Aead>(
      absl::make_unique<AeadWrapper>());
  if (!status.ok()) return status;

  // Register key managers.
  status = Registry::RegisterKeyTypeManager(
      absl::make_unique<AesGcmKeyManager>(), true);
  if (!status.ok()) return status;
  return Registry::RegisterKeyTypeManager(
      absl::make_unique<KmsAeadKeyManager>(), true);
}

}  // namespace tessera
}  // namespace crypto
