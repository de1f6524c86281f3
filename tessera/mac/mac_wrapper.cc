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

#include "tessera/mac/mac_wrapper.h"

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
#include "tessera/mac.h"
#include "tessera/primitive_set.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

constexpr absl::string_view kPrimitive = "mac";
constexpr absl::string_view kComputeApi = "compute";
constexpr absl::string_view kVerifyApi = "verify";

class MacSetWrapper : public Mac {
 public:
  explicit MacSetWrapper(
      std::unique_ptr<PrimitiveSet<Mac>> mac_set,
      std::unique_ptr<internal::MonitoringClient> monitoring_compute_client =
          nullptr,
      std::unique_ptr<internal::MonitoringClient> monitoring_verify_client =
          nullptr)
      : mac_set_(std::move(mac_set)),
        monitoring_compute_client_(std::move(monitoring_compute_client)),
        monitoring_verify_client_(std::move(monitoring_verify_client)) {}

  absl::StatusOr<std::string> ComputeMac(
      absl::string_view data) const override;

  absl::Status VerifyMac(absl::string_view mac_value,
                         absl::string_view data) const override;

  ~MacSetWrapper() override = default;

 private:
  // Tries every entry of `entries` on (`mac_value`, `data`) and returns the
  // first one that verifies, or nullptr.
  const PrimitiveSet<Mac>::Entry* VerifyWithEntries(
      const PrimitiveSet<Mac>::Primitives& entries,
      absl::string_view mac_value, absl::string_view data) const;

  std::unique_ptr<PrimitiveSet<Mac>> mac_set_;
  std::unique_ptr<internal::MonitoringClient> monitoring_compute_client_;
  std::unique_ptr<internal::MonitoringClient> monitoring_verify_client_;
};

absl::StatusOr<std::string> MacSetWrapper::ComputeMac(
    absl::string_view data) const {
  // OpenSSL expects a non-null pointer for data,
  // regardless of whether the size is 0.
  data = internal::EnsureStringNonNull(data);

  const PrimitiveSet<Mac>::Entry* primary = mac_set_->get_primary();
  absl::StatusOr<std::string> compute_mac_result;
  if (primary->get_output_prefix_type() == proto::OutputPrefixType::LEGACY) {
    compute_mac_result = primary->get_primitive().ComputeMac(
        absl::StrCat(data, std::string(1, CryptoFormat::kLegacyMessageSuffix)));
  } else {
    compute_mac_result = primary->get_primitive().ComputeMac(data);
  }
  if (!compute_mac_result.ok()) {
    if (monitoring_compute_client_ != nullptr) {
      monitoring_compute_client_->LogFailure();
    }
    return compute_mac_result.status();
  }
  if (monitoring_compute_client_ != nullptr) {
    monitoring_compute_client_->Log(primary->get_key_id(), data.size());
  }
  return absl::StrCat(primary->get_identifier(), *compute_mac_result);
}

const PrimitiveSet<Mac>::Entry* MacSetWrapper::VerifyWithEntries(
    const PrimitiveSet<Mac>::Primitives& entries, absl::string_view mac_value,
    absl::string_view data) const {
  for (const PrimitiveSet<Mac>::Entry* mac_entry : entries) {
    const Mac& mac = mac_entry->get_primitive();
    absl::Status status;
    if (mac_entry->get_output_prefix_type() ==
        proto::OutputPrefixType::LEGACY) {
      status = mac.VerifyMac(
          mac_value,
          absl::StrCat(data,
                       std::string(1, CryptoFormat::kLegacyMessageSuffix)));
    } else {
      status = mac.VerifyMac(mac_value, data);
    }
    if (status.ok()) return mac_entry;
  }
  return nullptr;
}

absl::Status MacSetWrapper::VerifyMac(absl::string_view mac_value,
                                      absl::string_view data) const {
  data = internal::EnsureStringNonNull(data);
  mac_value = internal::EnsureStringNonNull(mac_value);

  if (CryptoFormat::HasNonRawPrefix(mac_value)) {
    absl::string_view key_id =
        mac_value.substr(0, CryptoFormat::kNonRawPrefixSize);
    auto primitives_result = mac_set_->get_primitives(key_id);
    if (primitives_result.ok()) {
      const PrimitiveSet<Mac>::Entry* verified = VerifyWithEntries(
          **primitives_result,
          mac_value.substr(CryptoFormat::kNonRawPrefixSize), data);
      if (verified != nullptr) {
        if (monitoring_verify_client_ != nullptr) {
          monitoring_verify_client_->Log(verified->get_key_id(), data.size());
        }
        return absl::OkStatus();
      }
    }
  }

  // No matching key succeeded with verification, try all RAW keys.
  auto raw_primitives_result = mac_set_->get_raw_primitives();
  if (raw_primitives_result.ok()) {
    const PrimitiveSet<Mac>::Entry* verified =
        VerifyWithEntries(**raw_primitives_result, mac_value, data);
    if (verified != nullptr) {
      if (monitoring_verify_client_ != nullptr) {
        monitoring_verify_client_->Log(verified->get_key_id(), data.size());
      }
      return absl::OkStatus();
    }
  }
  if (monitoring_verify_client_ != nullptr) {
    monitoring_verify_client_->LogFailure();
  }
  return absl::Status(absl::StatusCode::kUnauthenticated,
                      "verification failed");
}

absl::Status Validate(PrimitiveSet<Mac>* mac_set) {
  if (mac_set == nullptr) {
    return absl::Status(absl::StatusCode::kInternal,
                        "mac_set must be non-NULL");
  }
  if (mac_set->get_primary() == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "mac_set has no primary");
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::unique_ptr<Mac>> MacWrapper::Wrap(
    std::unique_ptr<PrimitiveSet<Mac>> mac_set) const {
  absl::Status status = Validate(mac_set.get());
  if (!status.ok()) return status;

  std::vector<std::unique_ptr<internal::MonitoringClient>> clients;
  status = internal::CreateMonitoringClients(
      internal::RegistryImpl::GlobalInstance().GetMonitoringClientFactory(),
      *mac_set, kPrimitive, {kComputeApi, kVerifyApi}, &clients);
  if (!status.ok()) return status;

  if (clients.empty()) {
    return {absl::make_unique<MacSetWrapper>(std::move(mac_set))};
  }
  return {absl::make_unique<MacSetWrapper>(
      std::move(mac_set), std::move(clients[0]), std::move(clients[1]))};
}

}  // namespace tessera
}  // namespace crypto
