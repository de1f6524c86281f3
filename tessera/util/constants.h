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

#ifndef TESSERA_UTIL_CONSTANTS_H_
#define TESSERA_UTIL_CONSTANTS_H_

namespace crypto {
namespace tessera {

// Prefix of the type URLs of all key types, followed by the full name of the
// key proto.
constexpr char kTypeGoogleapisCom[] = "type.googleapis.com/";

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_CONSTANTS_H_
