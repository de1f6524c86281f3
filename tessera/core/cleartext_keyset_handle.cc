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

#include "tessera/cleartext_keyset_handle.h"

#include <memory>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/keyset_handle.h"
#include "tessera/util/secret_proto.h"
#include "tessera/util/validation.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::Keyset;

// static
absl::StatusOr<std::unique_ptr<KeysetHandle>>
CleartextKeysetHandle::GetKeysetHandle(const Keyset& keyset) {
  absl::Status status = ValidateKeyset(keyset);
  if (!status.ok()) return status;
  return absl::WrapUnique(new KeysetHandle(util::SecretProto<Keyset>(keyset)));
}

// static
const Keyset& CleartextKeysetHandle::GetKeyset(
    const KeysetHandle& keyset_handle) {
  return keyset_handle.get_keyset();
}

}  // namespace tessera
}  // namespace crypto
