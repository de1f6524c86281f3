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

#ifndef TESSERA_UTIL_ERRORS_H_
#define TESSERA_UTIL_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/str_format.h"

namespace crypto {
namespace tessera {

// Constructs a Status object given a printf-style va list.
template <typename... Args>
absl::Status ToStatusF(absl::StatusCode code,
                       const absl::FormatSpec<Args...>& format,
                       const Args&... args) {
  return absl::Status(code, absl::StrFormat(format, args...));
}

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_ERRORS_H_
