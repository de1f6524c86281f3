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

#ifndef TESSERA_AEAD_AEAD_KEY_TEMPLATES_H_
#define TESSERA_AEAD_AEAD_KEY_TEMPLATES_H_

#include "absl/strings/string_view.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

///////////////////////////////////////////////////////////////////////////////
// Pre-generated KeyTemplate for Aead key types. One can use these templates
// to generate new KeysetHandle object with fresh keys.
// To generate a new keyset that contains a single AesGcmKey, one can do:
//
//   auto status = AeadConfig::Register();
//   if (!status.ok()) { /* fail with error */ }
//   auto handle_result =
//       KeysetHandle::GenerateNew(AeadKeyTemplates::Aes128Gcm());
//   if (!handle_result.ok()) { /* fail with error */ }
//   auto keyset_handle = std::move(handle_result.value());
class AeadKeyTemplates {
 public:
  // Returns a KeyTemplate that generates new instances of AesGcmKey
  // with the following parameters:
  //   - key size: 16 bytes
  //   - IV size: 12 bytes
  //   - tag size: 16 bytes
  //   - OutputPrefixType: TINK
  static const proto::KeyTemplate& Aes128Gcm();

  // Returns a KeyTemplate that generates new instances of AesGcmKey
  // with the following parameters:
  //   - key size: 32 bytes
  //   - IV size: 12 bytes
  //   - tag size: 16 bytes
  //   - OutputPrefixType: TINK
  static const proto::KeyTemplate& Aes256Gcm();

  // Same as Aes256Gcm(), but without an output prefix.
  static const proto::KeyTemplate& Aes256GcmNoPrefix();

  // Returns a KeyTemplate that generates new instances of KmsAeadKey
  // pointing to the remote key `key_uri`, with OutputPrefixType TINK.
  static proto::KeyTemplate KmsAeadKey(absl::string_view key_uri);
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_AEAD_AEAD_KEY_TEMPLATES_H_
