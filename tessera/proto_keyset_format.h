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

#ifndef TESSERA_PROTO_KEYSET_FORMAT_H_
#define TESSERA_PROTO_KEYSET_FORMAT_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/aead.h"
#include "tessera/keyset_handle.h"
#include "tessera/secret_data.h"
#include "tessera/secret_key_access_token.h"

namespace crypto {
namespace tessera {

// Binary keyset format: the wire encoding of the Keyset proto.
//
// The cleartext variants taking a SecretKeyAccessToken accept keysets with
// secret key material; the "WithoutSecret" variants fail if any key is
// SYMMETRIC, ASYMMETRIC_PRIVATE or UNKNOWN_KEYMATERIAL.

absl::StatusOr<SecretData> SerializeKeysetToProtoKeysetFormat(
    const KeysetHandle& keyset_handle, SecretKeyAccessToken token);
absl::StatusOr<KeysetHandle> ParseKeysetFromProtoKeysetFormat(
    absl::string_view serialized_keyset, SecretKeyAccessToken token);

absl::StatusOr<std::string> SerializeKeysetWithoutSecretToProtoKeysetFormat(
    const KeysetHandle& keyset_handle);
absl::StatusOr<KeysetHandle> ParseKeysetWithoutSecretFromProtoKeysetFormat(
    absl::string_view serialized_keyset);

// Encrypted keyset format: an EncryptedKeyset proto holding the keyset
// encrypted under `keyset_encryption_aead` (usually a KMS-backed Aead), bound
// to `associated_data`, next to its cleartext KeysetInfo.
absl::StatusOr<std::string> SerializeKeysetToEncryptedKeysetFormat(
    const KeysetHandle& keyset_handle, const Aead& keyset_encryption_aead,
    absl::string_view associated_data);
absl::StatusOr<KeysetHandle> ParseKeysetFromEncryptedKeysetFormat(
    absl::string_view encrypted_keyset, const Aead& keyset_encryption_aead,
    absl::string_view associated_data);

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_PROTO_KEYSET_FORMAT_H_
