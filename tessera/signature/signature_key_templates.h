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

#ifndef TESSERA_SIGNATURE_SIGNATURE_KEY_TEMPLATES_H_
#define TESSERA_SIGNATURE_SIGNATURE_KEY_TEMPLATES_H_

#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

///////////////////////////////////////////////////////////////////////////////
// Pre-generated KeyTemplate for signature key types. One can use these
// templates to generate new KeysetHandle object with fresh keys.
// To generate a new keyset that contains a single Ed25519PrivateKey, one can
// do:
//
//   auto status = SignatureConfig::Register();
//   if (!status.ok()) { /* fail with error */ }
//   auto handle_result =
//       KeysetHandle::GenerateNew(SignatureKeyTemplates::Ed25519());
//   if (!handle_result.ok()) { /* fail with error */ }
//   auto keyset_handle = std::move(handle_result.value());
class SignatureKeyTemplates {
 public:
  // Returns a KeyTemplate that generates new instances of Ed25519PrivateKey
  // with OutputPrefixType TINK.
  static const proto::KeyTemplate& Ed25519();

  // Same as Ed25519(), but the signatures carry no prefix.
  static const proto::KeyTemplate& Ed25519WithRawOutput();
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SIGNATURE_SIGNATURE_KEY_TEMPLATES_H_
