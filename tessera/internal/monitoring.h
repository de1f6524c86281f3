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

#ifndef TESSERA_INTERNAL_MONITORING_H_
#define TESSERA_INTERNAL_MONITORING_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace crypto {
namespace tessera {
namespace internal {

// Non-secret description of one key of a wrapped keyset.
struct MonitoredKey {
  uint32_t key_id;
  std::string status;         // e.g. "ENABLED"
  std::string key_type;       // the type URL
  std::string output_prefix;  // e.g. "LEGACY"
};

// What a monitoring client observes: one API of one wrapped primitive.
struct MonitoringContext {
  std::string primitive;  // "aead", "mac", "public_key_sign", ...
  std::string api;        // "encrypt", "verify", ...
  uint32_t primary_key_id;
  std::vector<MonitoredKey> keys;
};

// Receives usage events from a wrapped primitive. Log() is called on every
// successful operation and must be cheap.
class MonitoringClient {
 public:
  virtual ~MonitoringClient() = default;

  virtual void Log(uint32_t key_id, int64_t num_bytes_as_input) = 0;

  // A failed operation. Never attributed to a key.
  virtual void LogFailure() = 0;
};

class MonitoringClientFactory {
 public:
  virtual ~MonitoringClientFactory() = default;

  virtual absl::StatusOr<std::unique_ptr<MonitoringClient>> New(
      const MonitoringContext& context) = 0;
};

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_MONITORING_H_
