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

#ifndef TESSERA_INTERNAL_MD_UTIL_H_
#define TESSERA_INTERNAL_MD_UTIL_H_

#include "absl/status/statusor.h"
#include "openssl/evp.h"
#include "tessera/subtle/common_enums.h"

namespace crypto {
namespace tessera {
namespace internal {

// Returns an EVP structure for a hash function. The EVP_MD instance is owned
// by OpenSSL and must not be freed.
absl::StatusOr<const EVP_MD*> EvpHashFromHashType(subtle::HashType hash_type);

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_MD_UTIL_H_
