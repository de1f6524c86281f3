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

#include "tessera/internal/md_util.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "openssl/evp.h"
#include "tessera/subtle/common_enums.h"
#include "tessera/util/errors.h"

namespace crypto {
namespace tessera {
namespace internal {

absl::StatusOr<const EVP_MD*> EvpHashFromHashType(subtle::HashType hash_type) {
  switch (hash_type) {
    case subtle::HashType::SHA1:
      return EVP_sha1();
    case subtle::HashType::SHA224:
      return EVP_sha224();
    case subtle::HashType::SHA256:
      return EVP_sha256();
    case subtle::HashType::SHA384:
      return EVP_sha384();
    case subtle::HashType::SHA512:
      return EVP_sha512();
    default:
      return ToStatusF(absl::StatusCode::kUnimplemented,
                       "Unsupported hash %s",
                       subtle::EnumToString(hash_type));
  }
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto
