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

#include "tessera/internal/util.h"

#include <cstdlib>

#include "absl/log/absl_log.h"
#include "absl/strings/string_view.h"

namespace crypto {
namespace tessera {
namespace internal {

absl::string_view EnsureStringNonNull(absl::string_view str) {
  if (str.empty() && str.data() == nullptr) {
    return absl::string_view("");
  }
  return str;
}

void LogFatal(absl::string_view msg) {
  ABSL_LOG(FATAL) << msg;
  abort();
}

}  // namespace internal
}  // namespace tessera
}  // namespace crypto
