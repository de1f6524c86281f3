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

#include "tessera/signature/signature_config.h"

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "tessera/registry.h"
#include "tessera/signature/ed25519_sign_key_manager.h"
#include "tessera/signature/ed25519_verify_key_manager.h"
#include "tessera/signature/public_key_sign_wrapper.h"
#include "tessera/signature/public_key_verify_wrapper.h"

namespace crypto {
namespace tessera {

// static
absl::Status SignatureConfig::Register() {
  // Register primitive wrappers.
  absl::Status status = Registry::RegisterPrimitiveWrapper<PublicKeySign>(
      absl::make_unique<PublicKeySignWrapper>());
  if (!status.ok()) return status;
  status = Registry::RegisterPrimitiveWrapper<PublicKeyVerify>(
      absl::make_unique<PublicKeyVerifyWrapper>());
  if (!status.ok()) return status;

  // Register key managers.
  return Registry::RegisterAsymmetricKeyManagers(
      absl::make_unique<Ed25519SignKeyManager>(),
      absl::make_unique<Ed25519VerifyKeyManager>(), true);
}

}  // namespace tessera
}  // namespace crypto
