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

#include "tessera/util/fake_kms_client.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "tessera/aead.h"
#include "tessera/aead/aead_key_templates.h"
#include "tessera/cleartext_keyset_handle.h"
#include "tessera/keyset_handle.h"
#include "tessera/kms_clients.h"
#include "tessera/util/errors.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace test {
namespace {

constexpr absl::string_view kKeyUriPrefix = "fake-kms://";

}  // namespace

// static
absl::StatusOr<std::unique_ptr<FakeKmsClient>> FakeKmsClient::New(
    absl::string_view key_uri) {
  if (!key_uri.empty() && !absl::StartsWith(key_uri, kKeyUriPrefix)) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "Key '%s' not supported", key_uri);
  }
  return absl::WrapUnique(new FakeKmsClient(key_uri));
}

// static
absl::Status FakeKmsClient::RegisterNewClient(absl::string_view key_uri) {
  absl::StatusOr<std::unique_ptr<FakeKmsClient>> client =
      FakeKmsClient::New(key_uri);
  if (!client.ok()) return client.status();
  return KmsClients::Add(*std::move(client));
}

// static
absl::StatusOr<std::string> FakeKmsClient::CreateFakeKeyUri() {
  // The key_uri contains an encoded keyset with a new AES-GCM key.
  absl::StatusOr<std::unique_ptr<KeysetHandle>> handle =
      KeysetHandle::GenerateNew(AeadKeyTemplates::Aes128Gcm());
  if (!handle.ok()) return handle.status();
  std::string serialized_keyset =
      CleartextKeysetHandle::GetKeyset(**handle).SerializeAsString();
  return absl::StrCat(kKeyUriPrefix,
                      absl::WebSafeBase64Escape(serialized_keyset));
}

bool FakeKmsClient::DoesSupport(absl::string_view key_uri) const {
  if (!key_uri_.empty()) return key_uri_ == key_uri;
  return absl::StartsWith(key_uri, kKeyUriPrefix);
}

absl::StatusOr<std::unique_ptr<Aead>> FakeKmsClient::GetAead(
    absl::string_view key_uri) const {
  if (!DoesSupport(key_uri)) {
    return ToStatusF(absl::StatusCode::kInvalidArgument,
                     "This client does not support key '%s'", key_uri);
  }
  std::string serialized_keyset;
  if (!absl::WebSafeBase64Unescape(absl::StripPrefix(key_uri, kKeyUriPrefix),
                                   &serialized_keyset)) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "The key URI does not contain a valid keyset.");
  }
  proto::Keyset keyset;
  if (!keyset.ParseFromString(serialized_keyset)) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "The key URI does not contain a valid keyset.");
  }
  absl::StatusOr<std::unique_ptr<KeysetHandle>> handle =
      CleartextKeysetHandle::GetKeysetHandle(keyset);
  if (!handle.ok()) return handle.status();
  return (*handle)->GetPrimitive<Aead>();
}

}  // namespace test
}  // namespace tessera
}  // namespace crypto
