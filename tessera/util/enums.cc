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

#include "tessera/util/enums.h"

#include "tessera/subtle/common_enums.h"
#include "proto/common.pb.h"

namespace crypto {
namespace tessera {
namespace util {

// static
subtle::HashType Enums::ProtoToSubtle(proto::HashType type) {
  switch (type) {
    case proto::HashType::SHA1:
      return subtle::HashType::SHA1;
    case proto::HashType::SHA224:
      return subtle::HashType::SHA224;
    case proto::HashType::SHA256:
      return subtle::HashType::SHA256;
    case proto::HashType::SHA384:
      return subtle::HashType::SHA384;
    case proto::HashType::SHA512:
      return subtle::HashType::SHA512;
    default:
      return subtle::HashType::UNKNOWN_HASH;
  }
}

}  // namespace util
}  // namespace tessera
}  // namespace crypto
