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

#ifndef TESSERA_UTIL_FAKE_KMS_CLIENT_H_
#define TESSERA_UTIL_FAKE_KMS_CLIENT_H_

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/aead.h"
#include "tessera/kms_client.h"

namespace crypto {
namespace tessera {
namespace test {

// FakeKmsClient is a fake implementation of KmsClient.
//
// Normally, a 'key_uri' identifies a key that is stored remotely by the KMS,
// and every operation is executed remotely using a RPC call to the KMS, since
// the key should not be sent to the client.
// In this fake implementation we want to avoid these RPC calls. We achieve
// this by encoding the key in the 'key_uri'. So the client simply needs to
// decode the key and generate an AEAD out of it. This is of course insecure
// and should only be used in testing.
//
// A key URI has the form "fake-kms://<keyset>", where <keyset> is a
// serialized AES-GCM keyset in web-safe base64 without padding. The Aead
// config must be registered to use the client.
class FakeKmsClient : public KmsClient {
 public:
  // Creates a new FakeKmsClient that is bound to the key specified in
  // 'key_uri'. If 'key_uri' is empty, the client is unbound and supports all
  // fake-kms key URIs.
  static absl::StatusOr<std::unique_ptr<FakeKmsClient>> New(
      absl::string_view key_uri);

  // Creates a new client and adds it to KmsClients.
  static absl::Status RegisterNewClient(absl::string_view key_uri);

  // Returns a new, random fake key_uri.
  static absl::StatusOr<std::string> CreateFakeKeyUri();

  // Returns true iff this client does support KMS key specified in 'key_uri'.
  bool DoesSupport(absl::string_view key_uri) const override;

  // Returns an Aead-primitive backed by KMS key specified by 'key_uri',
  // provided that this KmsClient does support 'key_uri'.
  absl::StatusOr<std::unique_ptr<Aead>> GetAead(
      absl::string_view key_uri) const override;

 private:
  explicit FakeKmsClient(absl::string_view key_uri) : key_uri_(key_uri) {}

  std::string key_uri_;
};

}  // namespace test
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_FAKE_KMS_CLIENT_H_
