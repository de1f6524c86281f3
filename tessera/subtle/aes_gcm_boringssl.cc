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

#include "tessera/subtle/aes_gcm_boringssl.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "openssl/evp.h"
#include "tessera/aead.h"
#include "tessera/internal/ssl_unique_ptr.h"
#include "tessera/internal/util.h"
#include "tessera/secret_data.h"
#include "tessera/subtle/random.h"
#include "tessera/util/errors.h"

namespace crypto {
namespace tessera {
namespace subtle {
namespace {

absl::StatusOr<const EVP_CIPHER*> GetAesGcmCipherForKeySize(
    size_t key_size_in_bytes) {
  switch (key_size_in_bytes) {
    case 16:
      return EVP_aes_128_gcm();
    case 32:
      return EVP_aes_256_gcm();
    default:
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "Invalid key size %d", key_size_in_bytes);
  }
}

// Returns a new EVP_CIPHER_CTX for encryption (`encryption` == true) or
// decryption (`encryption` == false) with the given `key` and `iv`.
absl::StatusOr<internal::SslUniquePtr<EVP_CIPHER_CTX>> NewContext(
    const EVP_CIPHER* cipher, const SecretData& key, absl::string_view iv,
    bool encryption) {
  internal::SslUniquePtr<EVP_CIPHER_CTX> context(EVP_CIPHER_CTX_new());
  if (context == nullptr) {
    return absl::Status(absl::StatusCode::kInternal,
                        "EVP_CIPHER_CTX_new failed");
  }
  const int encryption_flag = encryption ? 1 : 0;
  if (EVP_CipherInit_ex(context.get(), cipher, /*impl=*/nullptr,
                        /*key=*/nullptr, /*iv=*/nullptr,
                        encryption_flag) <= 0) {
    return absl::Status(absl::StatusCode::kInternal,
                        "Context initialization failed");
  }
  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, iv.size(),
                          /*ptr=*/nullptr) <= 0) {
    return absl::Status(absl::StatusCode::kInternal,
                        "Failed to set the IV size");
  }
  if (EVP_CipherInit_ex(context.get(), /*cipher=*/nullptr, /*impl=*/nullptr,
                        key.data(), reinterpret_cast<const uint8_t*>(iv.data()),
                        encryption_flag) <= 0) {
    return absl::Status(absl::StatusCode::kInternal,
                        "Failed to set the key and IV");
  }
  return std::move(context);
}

}  // namespace

absl::StatusOr<std::unique_ptr<Aead>> AesGcmBoringSsl::New(SecretData key) {
  absl::StatusOr<const EVP_CIPHER*> cipher =
      GetAesGcmCipherForKeySize(key.size());
  if (!cipher.ok()) return cipher.status();
  return {absl::WrapUnique(new AesGcmBoringSsl(*cipher, std::move(key)))};
}

absl::StatusOr<std::string> AesGcmBoringSsl::Encrypt(
    absl::string_view plaintext, absl::string_view associated_data) const {
  plaintext = internal::EnsureStringNonNull(plaintext);
  associated_data = internal::EnsureStringNonNull(associated_data);

  std::string iv = Random::GetRandomBytes(kIvSizeInBytes);
  absl::StatusOr<internal::SslUniquePtr<EVP_CIPHER_CTX>> context =
      NewContext(cipher_, key_, iv, /*encryption=*/true);
  if (!context.ok()) return context.status();

  int len = 0;
  if (!EVP_EncryptUpdate(
          context->get(), /*out=*/nullptr, &len,
          reinterpret_cast<const uint8_t*>(associated_data.data()),
          associated_data.size())) {
    return absl::Status(absl::StatusCode::kInternal, "Encryption failed");
  }

  std::string ciphertext(kIvSizeInBytes + plaintext.size() + kTagSizeInBytes,
                         '\0');
  ciphertext.replace(0, kIvSizeInBytes, iv);
  uint8_t* out = reinterpret_cast<uint8_t*>(&ciphertext[kIvSizeInBytes]);
  if (!EVP_EncryptUpdate(context->get(), out, &len,
                         reinterpret_cast<const uint8_t*>(plaintext.data()),
                         plaintext.size())) {
    return absl::Status(absl::StatusCode::kInternal, "Encryption failed");
  }
  int final_len = 0;
  if (!EVP_EncryptFinal_ex(context->get(), out + len, &final_len)) {
    return absl::Status(absl::StatusCode::kInternal, "Encryption failed");
  }
  if (!EVP_CIPHER_CTX_ctrl(
          context->get(), EVP_CTRL_GCM_GET_TAG, kTagSizeInBytes,
          &ciphertext[kIvSizeInBytes + plaintext.size()])) {
    return absl::Status(absl::StatusCode::kInternal, "Encryption failed");
  }
  return ciphertext;
}

absl::StatusOr<std::string> AesGcmBoringSsl::Decrypt(
    absl::string_view ciphertext, absl::string_view associated_data) const {
  associated_data = internal::EnsureStringNonNull(associated_data);

  if (ciphertext.size() < kIvSizeInBytes + kTagSizeInBytes) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Ciphertext too short");
  }
  absl::string_view iv = ciphertext.substr(0, kIvSizeInBytes);
  absl::string_view encrypted = ciphertext.substr(
      kIvSizeInBytes, ciphertext.size() - kIvSizeInBytes - kTagSizeInBytes);
  std::string tag(ciphertext.substr(ciphertext.size() - kTagSizeInBytes));

  absl::StatusOr<internal::SslUniquePtr<EVP_CIPHER_CTX>> context =
      NewContext(cipher_, key_, iv, /*encryption=*/false);
  if (!context.ok()) return context.status();

  int len = 0;
  if (!EVP_DecryptUpdate(
          context->get(), /*out=*/nullptr, &len,
          reinterpret_cast<const uint8_t*>(associated_data.data()),
          associated_data.size())) {
    return absl::Status(absl::StatusCode::kInternal, "Decryption failed");
  }

  std::string plaintext(encrypted.size(), '\0');
  uint8_t* out = reinterpret_cast<uint8_t*>(&plaintext[0]);
  encrypted = internal::EnsureStringNonNull(encrypted);
  if (!EVP_DecryptUpdate(context->get(), out, &len,
                         reinterpret_cast<const uint8_t*>(encrypted.data()),
                         encrypted.size())) {
    return absl::Status(absl::StatusCode::kInternal, "Decryption failed");
  }
  if (!EVP_CIPHER_CTX_ctrl(context->get(), EVP_CTRL_GCM_SET_TAG,
                           kTagSizeInBytes, &tag[0])) {
    return absl::Status(absl::StatusCode::kInternal,
                        "Could not set authentication tag");
  }
  // Verify authentication tag.
  int final_len = 0;
  if (!EVP_DecryptFinal_ex(context->get(), out + len, &final_len)) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "Authentication failed");
  }
  return plaintext;
}

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto
