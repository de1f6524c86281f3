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

#include "tessera/aead/aead_key_templates.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tessera/util/constants.h"
#include "proto/aes_gcm.pb.h"
#include "proto/kms_aead.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::proto::AesGcmKeyFormat;
using ::crypto::tessera::proto::KeyTemplate;
using ::crypto::tessera::proto::KmsAeadKeyFormat;
using ::crypto::tessera::proto::OutputPrefixType;

KeyTemplate* NewAesGcmKeyTemplate(int key_size_in_bytes,
                                  OutputPrefixType output_prefix_type) {
  KeyTemplate* key_template = new KeyTemplate;
  key_template->set_type_url(
      absl::StrCat(kTypeGoogleapisCom, proto::AesGcmKey().GetTypeName()));
  key_template->set_output_prefix_type(output_prefix_type);
  AesGcmKeyFormat key_format;
  key_format.set_key_size(key_size_in_bytes);
  key_format.SerializeToString(key_template->mutable_value());
  return key_template;
}

}  // anonymous namespace

// static
const KeyTemplate& AeadKeyTemplates::Aes128Gcm() {
  static const KeyTemplate* key_template =
      NewAesGcmKeyTemplate(/*key_size_in_bytes=*/16, OutputPrefixType::TINK);
  return *key_template;
}

// static
const KeyTemplate& AeadKeyTemplates::Aes256Gcm() {
  static const KeyTemplate* key_template =
      NewAesGcmKeyTemplate(/*key_size_in_bytes=*/32, OutputPrefixType::TINK);
  return *key_template;
}

// static
const KeyTemplate& AeadKeyTemplates::Aes256GcmNoPrefix() {
  static const KeyTemplate* key_template =
      NewAesGcmKeyTemplate(/*key_size_in_bytes=*/32, OutputPrefixType::RAW);
  return *key_template;
}

// static
KeyTemplate AeadKeyTemplates::KmsAeadKey(absl::string_view key_uri) {
  KeyTemplate key_template;
  key_template.set_type_url(
      absl::StrCat(kTypeGoogleapisCom, proto::KmsAeadKey().GetTypeName()));
  key_template.set_output_prefix_type(OutputPrefixType::TINK);
  KmsAeadKeyFormat key_format;
  key_format.set_key_uri(std::string(key_uri));
  key_format.SerializeToString(key_template.mutable_value());
  return key_template;
}

}  // namespace tessera
}  // namespace crypto
