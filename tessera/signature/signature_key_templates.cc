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

#include "tessera/signature/signature_key_templates.h"

#include "absl/strings/str_cat.h"
#include "tessera/util/constants.h"
#include "proto/ed25519.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::proto::KeyTemplate;
using ::crypto::tessera::proto::OutputPrefixType;

KeyTemplate* NewEd25519KeyTemplate(OutputPrefixType output_prefix_type) {
  KeyTemplate* key_template = new KeyTemplate;
  key_template->set_type_url(absl::StrCat(
      kTypeGoogleapisCom, proto::Ed25519PrivateKey().GetTypeName()));
  key_template->set_output_prefix_type(output_prefix_type);
  proto::Ed25519KeyFormat().SerializeToString(key_template->mutable_value());
  return key_template;
}

}  // anonymous namespace

// static
const KeyTemplate& SignatureKeyTemplates::Ed25519() {
  static const KeyTemplate* key_template =
      NewEd25519KeyTemplate(OutputPrefixType::TINK);
  return *key_template;
}

// static
const KeyTemplate& SignatureKeyTemplates::Ed25519WithRawOutput() {
  static const KeyTemplate* key_template =
      NewEd25519KeyTemplate(OutputPrefixType::RAW);
  return *key_template;
}

}  // namespace tessera
}  // namespace crypto
