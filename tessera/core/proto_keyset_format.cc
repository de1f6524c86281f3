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

#include "tessera/proto_keyset_format.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/aead.h"
#include "tessera/cleartext_keyset_handle.h"
#include "tessera/internal/key_info.h"
#include "tessera/keyset_handle.h"
#include "tessera/secret_data.h"
#include "tessera/secret_key_access_token.h"
#include "tessera/util/secret_data.h"
#include "tessera/util/secret_proto.h"
#include "tessera/util/validation.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::EncryptedKeyset;
using ::crypto::tessera::proto::Keyset;

namespace {

// Parses `serialized` as a Keyset and validates it into a handle. The parsed
// proto is wiped when it goes out of scope.
absl::StatusOr<KeysetHandle> ParseToHandle(absl::string_view serialized) {
  util::SecretProto<Keyset> keyset;
  if (!keyset->ParseFromArray(serialized.data(), serialized.size())) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Could not parse the input as a Keyset.");
  }
  absl::StatusOr<std::unique_ptr<KeysetHandle>> handle =
      CleartextKeysetHandle::GetKeysetHandle(*keyset);
  if (!handle.ok()) return handle.status();
  return std::move(**handle);
}

SecretData SerializeToSecretData(const Keyset& keyset) {
  SecretData result(keyset.ByteSizeLong());
  keyset.SerializeWithCachedSizesToArray(result.data());
  return result;
}

}  // namespace

absl::StatusOr<SecretData> SerializeKeysetToProtoKeysetFormat(
    const KeysetHandle& keyset_handle, SecretKeyAccessToken token) {
  return SerializeToSecretData(CleartextKeysetHandle::GetKeyset(keyset_handle));
}

absl::StatusOr<KeysetHandle> ParseKeysetFromProtoKeysetFormat(
    absl::string_view serialized_keyset, SecretKeyAccessToken token) {
  return ParseToHandle(serialized_keyset);
}

absl::StatusOr<std::string> SerializeKeysetWithoutSecretToProtoKeysetFormat(
    const KeysetHandle& keyset_handle) {
  const Keyset& keyset = CleartextKeysetHandle::GetKeyset(keyset_handle);
  absl::Status status = ValidateNoSecret(keyset);
  if (!status.ok()) return status;
  return keyset.SerializeAsString();
}

absl::StatusOr<KeysetHandle> ParseKeysetWithoutSecretFromProtoKeysetFormat(
    absl::string_view serialized_keyset) {
  absl::StatusOr<std::unique_ptr<KeysetHandle>> handle =
      KeysetHandle::ReadNoSecret(serialized_keyset);
  if (!handle.ok()) return handle.status();
  return std::move(**handle);
}

absl::StatusOr<std::string> SerializeKeysetToEncryptedKeysetFormat(
    const KeysetHandle& keyset_handle, const Aead& keyset_encryption_aead,
    absl::string_view associated_data) {
  const Keyset& keyset = CleartextKeysetHandle::GetKeyset(keyset_handle);
  absl::StatusOr<std::string> ciphertext = keyset_encryption_aead.Encrypt(
      util::SecretDataAsStringView(SerializeToSecretData(keyset)),
      associated_data);
  if (!ciphertext.ok()) return ciphertext.status();
  EncryptedKeyset encrypted;
  encrypted.set_encrypted_keyset(*std::move(ciphertext));
  *encrypted.mutable_keyset_info() = KeysetInfoFromKeyset(keyset);
  return encrypted.SerializeAsString();
}

absl::StatusOr<KeysetHandle> ParseKeysetFromEncryptedKeysetFormat(
    absl::string_view encrypted_keyset, const Aead& keyset_encryption_aead,
    absl::string_view associated_data) {
  EncryptedKeyset encrypted;
  if (!encrypted.ParseFromArray(encrypted_keyset.data(),
                                encrypted_keyset.size())) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Could not parse the input as an EncryptedKeyset.");
  }
  if (encrypted.encrypted_keyset().empty()) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "The EncryptedKeyset holds no ciphertext.");
  }
  absl::StatusOr<std::string> cleartext = keyset_encryption_aead.Decrypt(
      encrypted.encrypted_keyset(), associated_data);
  if (!cleartext.ok()) return cleartext.status();
  absl::StatusOr<KeysetHandle> handle = ParseToHandle(*cleartext);
  util::SafeZeroString(&*cleartext);
  return handle;
}

}  // namespace tessera
}  // namespace crypto
