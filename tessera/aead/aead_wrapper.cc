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

#include "tessera/aead/aead_wrapper.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tessera/aead.h"
#include "tessera/crypto_format.h"
#include "tessera/internal/monitoring.h"
#include "tessera/internal/monitoring_util.h"
#include "tessera/internal/registry_impl.h"
#include "tessera/internal/util.h"
#include "tessera/primitive_set.h"

namespace crypto {
namespace tessera {
namespace {

constexpr absl::string_view kPrimitive = "aead";
constexpr absl::string_view kEncryptApi = "encrypt";
constexpr absl::string_view kDecryptApi = "decrypt";

class AeadSetWrapper : public Aead {
 public:
  explicit AeadSetWrapper(
      std::unique_ptr<PrimitiveSet<Aead>> aead_set,
      std::unique_ptr<internal::MonitoringClient> monitoring_encryption_client =
          nullptr,
      std::unique_ptr<internal::MonitoringClient> monitoring_decryption_client =
          nullptr)
      : aead_set_(std::move(aead_set)),
        monitoring_encryption_client_(std::move(monitoring_encryption_client)),
        monitoring_decryption_client_(
            std::move(monitoring_decryption_client)) {}

  absl::StatusOr<std::string> Encrypt(
      absl::string_view plaintext,
      absl::string_view associated_data) const override;

  absl::StatusOr<std::string> Decrypt(
      absl::string_view ciphertext,
      absl::string_view associated_data) const override;

  ~AeadSetWrapper() override = default;

 private:
  std::unique_ptr<PrimitiveSet<Aead>> aead_set_;
  std::unique_ptr<internal::MonitoringClient> monitoring_encryption_client_;
  std::unique_ptr<internal::MonitoringClient> monitoring_decryption_client_;
};

absl::StatusOr<std::string> AeadSetWrapper::Encrypt(
    absl::string_view plaintext, absl::string_view associated_data) const {
  // OpenSSL expects a non-null pointer for plaintext and associated_data,
  // regardless of whether the size is 0.
  plaintext = internal::EnsureStringNonNull(plaintext);
  associated_data = internal::EnsureStringNonNull(associated_data);

  const PrimitiveSet<Aead>::Entry* primary = aead_set_->get_primary();
  absl::StatusOr<std::string> encrypt_result =
      primary->get_primitive().Encrypt(plaintext, associated_data);
  if (!encrypt_result.ok()) {
    if (monitoring_encryption_client_ != nullptr) {
      monitoring_encryption_client_->LogFailure();
    }
    return encrypt_result.status();
  }
  if (monitoring_encryption_client_ != nullptr) {
    monitoring_encryption_client_->Log(primary->get_key_id(),
                                       plaintext.size());
  }
  return absl::StrCat(primary->get_identifier(), *encrypt_result);
}

absl::StatusOr<std::string> AeadSetWrapper::Decrypt(
    absl::string_view ciphertext, absl::string_view associated_data) const {
  associated_data = internal::EnsureStringNonNull(associated_data);

  if (CryptoFormat::HasNonRawPrefix(ciphertext)) {
    absl::string_view key_id =
        ciphertext.substr(0, CryptoFormat::kNonRawPrefixSize);
    auto primitives_result = aead_set_->get_primitives(key_id);
    if (primitives_result.ok()) {
      absl::string_view raw_ciphertext =
          ciphertext.substr(CryptoFormat::kNonRawPrefixSize);
      for (auto& aead_entry : **primitives_result) {
        Aead& aead = aead_entry->get_primitive();
        absl::StatusOr<std::string> decrypt_result =
            aead.Decrypt(raw_ciphertext, associated_data);
        if (decrypt_result.ok()) {
          if (monitoring_decryption_client_ != nullptr) {
            monitoring_decryption_client_->Log(aead_entry->get_key_id(),
                                               raw_ciphertext.size());
          }
          return std::move(decrypt_result.value());
        }
      }
    }
  }

  // No matching key succeeded with decryption, try all RAW keys.
  auto raw_primitives_result = aead_set_->get_raw_primitives();
  if (raw_primitives_result.ok()) {
    for (auto& aead_entry : **raw_primitives_result) {
      Aead& aead = aead_entry->get_primitive();
      absl::StatusOr<std::string> decrypt_result =
          aead.Decrypt(ciphertext, associated_data);
      if (decrypt_result.ok()) {
        if (monitoring_decryption_client_ != nullptr) {
          monitoring_decryption_client_->Log(aead_entry->get_key_id(),
                                             ciphertext.size());
        }
        return std::move(decrypt_result.value());
      }
    }
  }
  if (monitoring_decryption_client_ != nullptr) {
    monitoring_decryption_client_->LogFailure();
  }
  return absl::Status(absl::StatusCode::kUnauthenticated, "decryption failed");
}

absl::Status Validate(PrimitiveSet<Aead>* aead_set) {
  if (aead_set == nullptr) {
    return absl::Status(absl::StatusCode::kInternal,
                        "aead_set must be non-NULL");
  }
  if (aead_set->get_primary() == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "aead_set has no primary");
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::unique_ptr<Aead>> AeadWrapper::Wrap(
    std::unique_ptr<PrimitiveSet<Aead>> aead_set) const {
  absl::Status status = Validate(aead_set.get());
  if (!status.ok()) return status;

  std::vector<std::unique_ptr<internal::MonitoringClient>> clients;
  status = internal::CreateMonitoringClients(
      internal::RegistryImpl::GlobalInstance().GetMonitoringClientFactory(),
      *aead_set, kPrimitive, {kEncryptApi, kDecryptApi}, &clients);
  if (!status.ok()) return status;

  // Monitoring is not enabled. Create a wrapper without monitoring clients.
  if (clients.empty()) {
    return {absl::make_unique<AeadSetWrapper>(std::move(aead_set))};
  }
  return {absl::make_unique<AeadSetWrapper>(
      std::move(aead_set), std::move(clients[0]), std::move(clients[1]))};
}

}  // namespace tessera
}  // namespace crypto
