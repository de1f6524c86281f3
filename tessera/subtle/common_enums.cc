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

#include "tessera/subtle/common_enums.h"

#include <string>

namespace crypto {
namespace tessera {
namespace subtle {

std::string EnumToString(HashType type) {
  switch (type) {
    case HashType::SHA1:
      return "SHA1";
    case HashType::SHA224:
      return "SHA224";
    case HashType::SHA256:
      return "SHA256";
    case HashType::SHA384:
      return "SHA384";
    case HashType::SHA512:
      return "SHA512";
    case HashType::UNKNOWN_HASH:
      return "UNKNOWN_HASH";
  }
  return "UNKNOWN HASH: " + std::to_string(static_cast<int>(type));
}

}  // namespace subtle
}  // namespace tessera
}  // namespace crypto
