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

#ifndef TESSERA_UTIL_SECRET_DATA_H_
#define TESSERA_UTIL_SECRET_DATA_H_

#include <string>

#include "absl/strings/string_view.h"
#include "openssl/crypto.h"
#include "tessera/secret_data.h"

namespace crypto {
namespace tessera {
namespace util {

inline SecretData SecretDataFromStringView(absl::string_view secret) {
  return {secret.begin(), secret.end()};
}

inline absl::string_view SecretDataAsStringView(const SecretData& secret) {
  return {reinterpret_cast<const char*>(secret.data()), secret.size()};
}

// Overwrites the contents of `str` with zeros. The size is left unchanged.
inline void SafeZeroString(std::string* str) {
  OPENSSL_cleanse(&(*str)[0], str->size());
}

}  // namespace util
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_SECRET_DATA_H_
