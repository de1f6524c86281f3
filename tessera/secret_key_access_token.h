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

#ifndef TESSERA_SECRET_KEY_ACCESS_TOKEN_H_
#define TESSERA_SECRET_KEY_ACCESS_TOKEN_H_

namespace crypto {
namespace tessera {

// Token required by functions that expose secret key material, such as
// serializing a keyset in cleartext. Only InsecureSecretKeyAccess can create
// one, which makes every such call site easy to find.
class SecretKeyAccessToken {
 public:
  SecretKeyAccessToken(const SecretKeyAccessToken& other) = default;
  SecretKeyAccessToken& operator=(const SecretKeyAccessToken& other) = default;
  SecretKeyAccessToken(SecretKeyAccessToken&& other) = default;
  SecretKeyAccessToken& operator=(SecretKeyAccessToken&& other) = default;

 private:
  SecretKeyAccessToken() = default;

  friend class InsecureSecretKeyAccess;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_SECRET_KEY_ACCESS_TOKEN_H_
