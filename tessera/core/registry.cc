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

#include "tessera/registry.h"

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/internal/registry_impl.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

using ::crypto::tessera::proto::KeyData;
using ::crypto::tessera::proto::KeyTemplate;

absl::StatusOr<std::unique_ptr<KeyData>> Registry::NewKeyData(
    const KeyTemplate& key_template) {
  return internal::RegistryImpl::GlobalInstance().NewKeyData(key_template);
}

absl::StatusOr<std::unique_ptr<KeyData>> Registry::GetPublicKeyData(
    absl::string_view type_url, absl::string_view serialized_private_key) {
  return internal::RegistryImpl::GlobalInstance().GetPublicKeyData(
      type_url, serialized_private_key);
}

void Registry::Reset() { internal::RegistryImpl::GlobalInstance().Reset(); }

}  // namespace tessera
}  // namespace crypto
