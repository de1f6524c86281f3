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

#ifndef TESSERA_CLEARTEXT_KEYSET_HANDLE_H_
#define TESSERA_CLEARTEXT_KEYSET_HANDLE_H_

#include <memory>

#include "absl/status/statusor.h"
#include "tessera/keyset_handle.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Creates keyset handles from cleartext keysets, and exposes the keyset of a
// handle. Prefer ParseKeysetFromProtoKeysetFormat() and
// SerializeKeysetToProtoKeysetFormat(), which make the access to secret key
// material explicit with a SecretKeyAccessToken.
class CleartextKeysetHandle {
 public:
  // Creates a KeysetHandle object from the given `keyset`, after checking
  // that it is valid.
  static absl::StatusOr<std::unique_ptr<KeysetHandle>> GetKeysetHandle(
      const proto::Keyset& keyset);

  // Returns a Keyset-proto from the given `keyset_handle`.
  static const proto::Keyset& GetKeyset(const KeysetHandle& keyset_handle);

 private:
  CleartextKeysetHandle() = default;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_CLEARTEXT_KEYSET_HANDLE_H_
