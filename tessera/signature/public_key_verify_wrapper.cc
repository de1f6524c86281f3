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

#include "tessera/signature/public_key_verify_wrapper.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tessera/crypto_format.h"
#include "tessera/internal/monitoring.h"
#include "tessera/internal/monitoring_util.h"
#include "tessera/internal/registry_impl.h"
#include "tessera/internal/util.h"
#include "tessera/primitive_set.h"
#include "tessera/public_key_verify.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

constexpr absl::string_view kPrimitive = "public_key_verify";
constexpr absl::string_view kVerifyApi = "verify";

absl::Status Validate(PrimitiveSet<PublicKeyVerify>* public_key_verify_set) {
  if (public_key_verify_set == nullptr) {
    return absl::Status(absl::StatusCode::kInternal,
                        "public_key_verify_set must be non-NULL");
  }
  if (public_key_verify_set->get_primary() == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "public_key_verify_set has no primary");
  }
  return absl::OkStatus();
}

class PublicKeyVerifySetWrapper : public PublicKeyVerify {
 public:
  explicit PublicKeyVerifySetWrapper(
      std::unique_ptr<PrimitiveSet<PublicKeyVerify>> public_key_verify_set,
      std::unique_ptr<internal::MonitoringClient> monitoring_verify_client =
          nullptr)
      : public_key_verify_set_(std::move(public_key_verify_set)),
        monitoring_verify_client_(std::move(monitoring_verify_client)) {}

  absl::Status Verify(absl::string_view signature,
                      absl::string_view data) const override;

  ~PublicKeyVerifySetWrapper() override = default;

 private:
  std::unique_ptr<PrimitiveSet<PublicKeyVerify>> public_key_verify_set_;
  std::unique_ptr<internal::MonitoringClient> monitoring_verify_client_;
};

absl::Status PublicKeyVerifySetWrapper::Verify(absl::string_view signature,
                                               absl::string_view data) const {
  data = internal::EnsureStringNonNull(data);
  signature = internal::EnsureStringNonNull(signature);

  if (CryptoFormat::HasNonRawPrefix(signature)) {
    absl::string_view key_id =
        signature.substr(0, CryptoFormat::kNonRawPrefixSize);
    auto primitives_result = public_key_verify_set_->get_primitives(key_id);
    if (primitives_result.ok()) {
      absl::string_view raw_signature =
          signature.substr(CryptoFormat::kNonRawPrefixSize);
      for (const auto* public_key_verify_entry : **primitives_result) {
        const PublicKeyVerify& public_key_verify =
            public_key_verify_entry->get_primitive();
        absl::Status verify_status;
        if (public_key_verify_entry->get_output_prefix_type() ==
            proto::OutputPrefixType::LEGACY) {
          verify_status = public_key_verify.Verify(
              raw_signature,
              absl::StrCat(data,
                           std::string(1, CryptoFormat::kLegacyMessageSuffix)));
        } else {
          verify_status = public_key_verify.Verify(raw_signature, data);
        }
        if (verify_status.ok()) {
          if (monitoring_verify_client_ != nullptr) {
            monitoring_verify_client_->Log(
                public_key_verify_entry->get_key_id(), data.size());
          }
          return absl::OkStatus();
        }
      }
    }
  }

  // No matching key succeeded with verification, try all RAW keys.
  auto raw_primitives_result = public_key_verify_set_->get_raw_primitives();
  if (raw_primitives_result.ok()) {
    for (const auto* public_key_verify_entry : **raw_primitives_result) {
      const PublicKeyVerify& public_key_verify =
          public_key_verify_entry->get_primitive();
      if (public_key_verify.Verify(signature, data).ok()) {
        if (monitoring_verify_client_ != nullptr) {
          monitoring_verify_client_->Log(public_key_verify_entry->get_key_id(),
                                         data.size());
        }
        return absl::OkStatus();
      }
    }
  }
  if (monitoring_verify_client_ != nullptr) {
    monitoring_verify_client_->LogFailure();
  }
  return absl::Status(absl::StatusCode::kUnauthenticated,
                      "verification failed");
}

}  // namespace

absl::StatusOr<std::unique_ptr<PublicKeyVerify>> PublicKeyVerifyWrapper::Wrap(
    std::unique_ptr<PrimitiveSet<PublicKeyVerify>> public_key_verify_set)
    const {
  absl::Status status = Validate(public_key_verify_set.get());
  if (!status.ok()) return status;

  std::vector<std::unique_ptr<internal::MonitoringClient>> clients;
  status = internal::CreateMonitoringClients(
      internal::RegistryImpl::GlobalInstance().GetMonitoringClientFactory(),
      *public_key_verify_set, kPrimitive, {kVerifyApi}, &clients);
  if (!status.ok()) return status;

  if (clients.empty()) {
    return {absl::make_unique<PublicKeyVerifySetWrapper>(
        std::move(public_key_verify_set))};
  }
  return {absl::make_unique<PublicKeyVerifySetWrapper>(
      std::move(public_key_verify_set), std::move(clients[0]))};
}

}  // namespace tessera
}  // namespace crypto
