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

#ifndef TESSERA_UTIL_SECRET_PROTO_H_
#define TESSERA_UTIL_SECRET_PROTO_H_

#include <memory>
#include <utility>

#include "absl/memory/memory.h"
#include "google/protobuf/message.h"

namespace crypto {
namespace tessera {
namespace util {

namespace internal {

// Overwrites every string and bytes field of `message`, recursively, with
// zeros and then clears the message.
void SanitizeMessage(google::protobuf::Message* message);

}  // namespace internal

// Holds a proto message that contains key material. The contents of all
// string and bytes fields are zeroed when the holder is destroyed or
// overwritten.
template <typename T>
class SecretProto {
 public:
  SecretProto() : value_(absl::make_unique<T>()) {}
  explicit SecretProto(const T& value) : value_(absl::make_unique<T>(value)) {}
  explicit SecretProto(T&& value)
      : value_(absl::make_unique<T>(std::move(value))) {}

  SecretProto(const SecretProto& other) : SecretProto(*other) {}
  // Leaves `other` holding an empty message.
  SecretProto(SecretProto&& other) : value_(absl::make_unique<T>()) {
    value_.swap(other.value_);
  }

  SecretProto& operator=(const SecretProto& other) {
    if (this != &other) {
      *this = SecretProto(other);
    }
    return *this;
  }
  SecretProto& operator=(SecretProto&& other) noexcept {
    using std::swap;
    swap(value_, other.value_);
    return *this;
  }

  ~SecretProto() {
    if (value_ != nullptr) {
      internal::SanitizeMessage(value_.get());
    }
  }

  T* get() { return value_.get(); }
  const T* get() const { return value_.get(); }

  T& operator*() { return *value_; }
  const T& operator*() const { return *value_; }

  T* operator->() { return value_.get(); }
  const T* operator->() const { return value_.get(); }

 private:
  std::unique_ptr<T> value_;
};

}  // namespace util
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_SECRET_PROTO_H_
