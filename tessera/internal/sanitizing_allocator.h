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

#ifndef TESSERA_INTERNAL_SANITIZING_ALLOCATOR_H_
#define TESSERA_INTERNAL_SANITIZING_ALLOCATOR_H_

#include <cstddef>
#include <memory>

#include "openssl/crypto.h"

namespace crypto {
namespace tessera {
namespace internal {

// An allocator that zeroes the memory it hands back on deallocation. Used
// for containers that hold key material.
template <typename T>
struct SanitizingAllocator {
  typedef T value_type;

  SanitizingAllocator() = default;
  template <class U>
  explicit constexpr SanitizingAllocator(
      const SanitizingAllocator<U>&) noexcept {}

  T* allocate(std::size_t n) { return std::allocator<T>().allocate(n); }

  void deallocate(T* ptr, std::size_t n) noexcept {
    OPENSSL_cleanse(ptr, n * sizeof(T));
    std::allocator<T>().deallocate(ptr, n);
  }

  // Allocator requirements mandate definition of eq and neq operators.
  bool operator==(const SanitizingAllocator&) const { return true; }
  bool operator!=(const SanitizingAllocator&) const { return false; }
};

// Specialization for malloc-like aligned storage.
template <>
struct SanitizingAllocator<void> {
  typedef void value_type;
};

}  // namespace internal
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_INTERNAL_SANITIZING_ALLOCATOR_H_
