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

#ifndef TESSERA_INSECURE_SECRET_KEY_ACCESS_H_
#define TESSERA_INSECURE_SECRET_KEY_ACCESS_H_

#include "tessera/secret_key_access_token.h"

namespace crypto {
namespace tessera {

class InsecureSecretKeyAccess {
 public:
  // Returns a token that allows access to secret key material.
  static SecretKeyAccessToken Get() { return SecretKeyAccessToken(); }
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INSECURE_SECRET_KEY_ACCESS_H_
