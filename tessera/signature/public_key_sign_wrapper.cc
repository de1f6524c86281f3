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

#include "tessera/signature/public_key_sign_wrapper.h"

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
#include "tessera/public_key_sign.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

constexpr absl::string_view kPrimitive = "public_key_sign";
constexpr absl::string_view kSignApi = "sign";

absl::Status Validate(PrimitiveSet<PublicKeySign>* public_key_sign_set) {
  if (public_key_sign_set == nullptr) {
    return absl::Status(absl::StatusCode::kInternal,
                        "public_key_sign_set must be non-NULL");
  }
  if (public_key_sign_set->get_primary() == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "public_key_sign_set has no primary");
  }
  return absl::OkStatus();
}

class PublicKeySignSetWrapper : public PublicKeySign {
 public:
  explicit PublicKeySignSetWrapper(
      std::unique_ptr<PrimitiveSet<PublicKeySign>> public_key_sign_set,
      std::unique_ptr<internal::MonitoringClient> monitoring_sign_client =
          nullptr)
      : public_key_sign_set_(std::move(public_key_sign_set)),
        monitoring_sign_client_(std::move(monitoring_sign_client)) {}

  absl::StatusOr<std::string> Sign(absl::string_view data) const override;

  ~PublicKeySignSetWrapper() override = default;

 private:
  std::unique_ptr<PrimitiveSet<PublicKeySign>> public_key_sign_set_;
  std::unique_ptr<internal::MonitoringClient> monitoring_sign_client_;
};

absl::StatusOr<std::string> PublicKeySignSetWrapper::Sign(
    absl::string_view data) const {
  // OpenSSL expects a non-null pointer for data,
  // regardless of whether the size is 0.
  data = internal::EnsureStringNonNull(data);

  const PrimitiveSet<PublicKeySign>::Entry* primary =
      public_key_sign_set_->get_primary();
  absl::StatusOr<std::string> sign_result;
  if (primary->get_output_prefix_type() == proto::OutputPrefixType::LEGACY) {
    sign_result = primary->get_primitive().Sign(
        absl::StrCat(data, std::string(1, CryptoFormat::kLegacyMessageSuffix)));
  } else {
    sign_result = primary->get_primitive().Sign(data);
  }
  if (!sign_result.ok()) {
    if (monitoring_sign_client_ != nullptr) {
      monitoring_sign_client_->LogFailure();
    }
    return sign_result.status();
  }
  if (monitoring_sign_client_ != nullptr) {
    monitoring_sign_client_->Log(primary->get_key_id(), data.size());
  }
  return absl::StrCat(primary->get_identifier(), *sign_result);
}

}  // namespace

absl::StatusOr<std::unique_ptr<PublicKeySign>> PublicKeySignWrapper::Wrap(
    std::unique_ptr<PrimitiveSet<PublicKeySign>> public_key_sign_set) const {
  absl::Status status = Validate(public_key_sign_set.get());
  if (!status.ok()) return status;

  std::vector<std::unique_ptr<internal::MonitoringClient>> clients;
  status = internal::CreateMonitoringClients(
      internal::RegistryImpl::GlobalInstance().GetMonitoringClientFactory(),
      *public_key_sign_set, kPrimitive, {kSignApi}, &clients);
  if (!status.ok()) return status;

  if (clients.empty()) {
    return {absl::make_unique<PublicKeySignSetWrapper>(
        std::move(public_key_sign_set))};
  }
  return {absl::make_unique<PublicKeySignSetWrapper>(
      std::move(public_key_sign_set), std::move(clients[0]))};
}

}  // namespace tessera
}  // namespace crypto
