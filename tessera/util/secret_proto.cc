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

#include "tessera/util/secret_proto.h"

#include <string>
#include <vector>

#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "openssl/crypto.h"

namespace crypto {
namespace tessera {
namespace util {
namespace internal {

namespace {

using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::Message;
using ::google::protobuf::Reflection;

// Reflection only hands out const references to string fields; the storage
// itself belongs to `message`, which we are allowed to mutate.
void ZeroStringStorage(const std::string& value) {
  if (!value.empty()) {
    OPENSSL_cleanse(const_cast<char*>(value.data()), value.size());
  }
}

}  // namespace

void SanitizeMessage(Message* message) {
  const Reflection* reflection = message->GetReflection();
  std::vector<const FieldDescriptor*> fields;
  reflection->ListFields(*message, &fields);
  for (const FieldDescriptor* field : fields) {
    if (field->cpp_type() == FieldDescriptor::CPPTYPE_STRING) {
      std::string scratch;
      if (field->is_repeated()) {
        for (int i = 0; i < reflection->FieldSize(*message, field); ++i) {
          const std::string& value = reflection->GetRepeatedStringReference(
              *message, field, i, &scratch);
          if (&value != &scratch) ZeroStringStorage(value);
        }
      } else {
        const std::string& value =
            reflection->GetStringReference(*message, field, &scratch);
        if (&value != &scratch) ZeroStringStorage(value);
      }
    } else if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
      if (field->is_repeated()) {
        for (int i = 0; i < reflection->FieldSize(*message, field); ++i) {
          SanitizeMessage(
              reflection->MutableRepeatedMessage(message, field, i));
        }
      } else {
        SanitizeMessage(reflection->MutableMessage(message, field));
      }
    }
  }
  message->Clear();
}

}  // namespace internal
}  // namespace util
}  // namespace tessera
}  // namespace crypto
