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

#ifndef TESSERA_INTERNAL_SSL_UNIQUE_PTR_H_
#define TESSERA_INTERNAL_SSL_UNIQUE_PTR_H_

#include <memory>

#include "openssl/evp.h"

namespace crypto {
namespace tessera {
namespace internal {

// Deleter for the OpenSSL/BoringSSL objects owned through SslUniquePtr.
template <typename T>
struct Deleter;

template <>
struct Deleter<EVP_PKEY> {
  void operator()(EVP_PKEY* ptr) { EVP_PKEY_free(ptr); }
};

template <>
struct Deleter<EVP_CIPHER_CTX> {
  void operator()(EVP_CIPHER_CTX* ptr) { EVP_CIPHER_CTX_free(ptr); }
};

template <>
struct Deleter<EVP_MD_CTX> {
  void operator()(EVP_MD_CTX* ptr) { EVP_MD_CTX_free(ptr); }
};

template <typename T>
using SslUniquePtr = std::unique_ptr<T, Deleter<T>>;

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_SSL_UNIQUE_PTR_H_
