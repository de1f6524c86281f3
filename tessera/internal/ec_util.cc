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

#include "tessera/internal/ec_util.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "openssl/evp.h"
#include "tessera/internal/ssl_unique_ptr.h"
#include "tessera/secret_data.h"
#include "tessera/subtle/random.h"
#include "tessera/util/errors.h"

namespace crypto {
namespace tessera {
namespace internal {

constexpr int kEd25519KeySize = 32;

int Ed25519KeyPubKeySize() { return kEd25519KeySize; }

int Ed25519KeyPrivKeySize() { return kEd25519KeySize; }

absl::StatusOr<std::unique_ptr<Ed25519Key>> NewEd25519Key() {
  return NewEd25519Key(subtle::Random::GetRandomKeyBytes(kEd25519KeySize));
}

absl::StatusOr<std::unique_ptr<Ed25519Key>> NewEd25519Key(
    const SecretData& secret_seed) {
  if (secret_seed.size() != kEd25519KeySize) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Invalid seed of length %d; expected %d",
                     secret_seed.size(), kEd25519KeySize);
  }
  SslUniquePtr<EVP_PKEY> priv_key(EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, /*unused=*/nullptr, secret_seed.data(),
      kEd25519KeySize));
  if (priv_key == nullptr) {
    return absl::Status(absl::StatusCode::kInternal,
                        "EVP_PKEY_new_raw_private_key failed");
  }

  auto key = absl::make_unique<Ed25519Key>();
  key->private_key = secret_seed;
  key->public_key.resize(kEd25519KeySize);
  size_t len = kEd25519KeySize;
  if (EVP_PKEY_get_raw_public_key(
          priv_key.get(), reinterpret_cast<uint8_t*>(&key->public_key[0]),
          &len) != 1 ||
      len != kEd25519KeySize) {
    return absl::Status(absl::StatusCode::kInternal,
                        "EVP_PKEY_get_raw_public_key failed");
  }
  return std::move(key);
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto
