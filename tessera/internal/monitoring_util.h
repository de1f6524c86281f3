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

#ifndef TESSERA_INTERNAL_MONITORING_UTIL_H_
#define TESSERA_INTERNAL_MONITORING_UTIL_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/internal/monitoring.h"
#include "tessera/primitive_set.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace internal {

// Describes the keys of `primitive_set` for a monitoring client of `api`.
template <class P>
absl::StatusOr<MonitoringContext> MonitoringContextFromPrimitiveSet(
    const PrimitiveSet<P>& primitive_set, absl::string_view primitive,
    absl::string_view api) {
  if (primitive_set.get_primary() == nullptr) {
    return absl::Status(absl::StatusCode::kInvalidArgument,
                        "The primitive set has no primary.");
  }
  MonitoringContext context;
  context.primitive = std::string(primitive);
  context.api = std::string(api);
  context.primary_key_id = primitive_set.get_primary()->get_key_id();
  for (const auto* entry : primitive_set.get_all()) {
    context.keys.push_back(MonitoredKey{
        entry->get_key_id(), proto::KeyStatusType_Name(entry->get_status()),
        std::string(entry->get_key_type_url()),
        proto::OutputPrefixType_Name(entry->get_output_prefix_type())});
  }
  return std::move(context);
}

// Creates one monitoring client per API name in `apis` for `primitive_set`
// when `factory` is non-null. Leaves `clients` empty otherwise.
template <class P>
absl::Status CreateMonitoringClients(
    MonitoringClientFactory* factory, const PrimitiveSet<P>& primitive_set,
    absl::string_view primitive,
    const std::vector<absl::string_view>& apis,
    std::vector<std::unique_ptr<MonitoringClient>>* clients) {
  if (factory == nullptr) return absl::OkStatus();
  for (absl::string_view api : apis) {
    absl::StatusOr<MonitoringContext> context =
        MonitoringContextFromPrimitiveSet(primitive_set, primitive, api);
    if (!context.ok()) return context.status();
    absl::StatusOr<std::unique_ptr<MonitoringClient>> client =
        factory->New(*context);
    if (!client.ok()) return client.status();
    clients->push_back(*std::move(client));
  }
  return absl::OkStatus();
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_MONITORING_UTIL_H_
