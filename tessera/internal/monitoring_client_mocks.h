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

#ifndef TESSERA_INTERNAL_MONITORING_CLIENT_MOCKS_H_
#define TESSERA_INTERNAL_MONITORING_CLIENT_MOCKS_H_

#include <cstdint>
#include <memory>

#include "gmock/gmock.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "tessera/internal/monitoring.h"

namespace crypto {
namespace tessera {
namespace internal {

// Matches a MonitoringContext built for the `api` call of `primitive`, e.g.
// EXPECT_CALL(factory, New(IsContextFor("aead", "decrypt"))).
MATCHER_P2(IsContextFor, primitive, api,
           absl::StrCat("is the context of ", primitive, ".", api)) {
  return arg.primitive == primitive && arg.api == api;
}

// The factory hands out one client per (primitive, api) pair.
class MockMonitoringClientFactory : public MonitoringClientFactory {
 public:
  MOCK_METHOD(absl::StatusOr<std::unique_ptr<MonitoringClient>>, New,
              (const MonitoringContext& context), (override));
};

class MockMonitoringClient : public MonitoringClient {
 public:
  MOCK_METHOD(void, Log, (uint32_t key_id, int64_t num_bytes_as_input),
              (override));
  MOCK_METHOD(void, LogFailure, (), (override));
};

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_MONITORING_CLIENT_MOCKS_H_
