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

#ifndef TESSERA_PRIMITIVE_SET_H_
#define TESSERA_PRIMITIVE_SET_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tessera/crypto_format.h"
#include "tessera/util/errors.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {

// Options controlling which keys of a keyset end up in a PrimitiveSet.
struct PrimitiveSetOptions {
  // DISABLED keys are skipped unless this is set. DESTROYED keys are always
  // skipped.
  bool include_disabled_keys = false;
};

// A container class for a set of primitives (i.e. implementations of
// cryptographic primitives offered by Tessera). It provides also
// additional properties for the primitives it holds. In particular,
// one of the primitives in the set can be distinguished as "the
// primary" one.
//
// PrimitiveSet is an auxiliary class used for supporting key rotation:
// primitives in a set correspond to keys in a keyset. Users will
// usually work with primitive instances, which essentially wrap
// primitive sets. For example an instance of an Aead-primitive for a
// given keyset holds a set of Aead-primitives corresponding to the
// keys in the keyset, and uses the set members to do the actual
// crypto operations: to encrypt data the primary Aead-primitive from
// the set is used, and upon decryption the ciphertext's prefix
// determines the identifier of the primitive from the set.
//
// PrimitiveSet is immutable once built and can be shared between threads.
template <class P>
class PrimitiveSet {
 public:
  // Entry-objects hold individual instances of primitives in the set.
  class Entry {
   public:
    static absl::StatusOr<std::unique_ptr<Entry>> New(
        std::unique_ptr<P> primitive,
        const proto::KeysetInfo::KeyInfo& key_info) {
      if (key_info.status() != proto::KeyStatusType::ENABLED &&
          key_info.status() != proto::KeyStatusType::DISABLED) {
        return ToStatusF(absl::StatusCode::kInvalidArgument,
                         "Key %d cannot be used: its status is not ENABLED "
                         "or DISABLED.",
                         key_info.key_id());
      }
      if (primitive == nullptr) {
        return absl::Status(absl::StatusCode::kInvalidArgument,
                            "The primitive must be non-null.");
      }
      absl::StatusOr<std::string> identifier =
          CryptoFormat::GetOutputPrefix(key_info);
      if (!identifier.ok()) return identifier.status();
      return absl::WrapUnique(new Entry(std::move(primitive), *identifier,
                                        key_info.status(), key_info.key_id(),
                                        key_info.output_prefix_type(),
                                        key_info.type_url()));
    }

    P& get_primitive() const { return *primitive_; }

    // The output prefix of the key, see CryptoFormat.
    const std::string& get_identifier() const { return identifier_; }

    proto::KeyStatusType get_status() const { return status_; }

    uint32_t get_key_id() const { return key_id_; }

    proto::OutputPrefixType get_output_prefix_type() const {
      return output_prefix_type_;
    }

    absl::string_view get_key_type_url() const { return key_type_url_; }

   private:
    Entry(std::unique_ptr<P> primitive, const std::string& identifier,
          proto::KeyStatusType status, uint32_t key_id,
          proto::OutputPrefixType output_prefix_type,
          absl::string_view key_type_url)
        : primitive_(std::move(primitive)),
          identifier_(identifier),
          status_(status),
          key_id_(key_id),
          output_prefix_type_(output_prefix_type),
          key_type_url_(key_type_url) {}

    std::unique_ptr<P> primitive_;
    std::string identifier_;
    proto::KeyStatusType status_;
    uint32_t key_id_;
    proto::OutputPrefixType output_prefix_type_;
    const std::string key_type_url_;
  };

  using Primitives = std::vector<Entry*>;
  using CiphertextPrefixToPrimitivesMap =
      absl::flat_hash_map<std::string, Primitives>;

  // Builder for a PrimitiveSet. The first error encountered is remembered and
  // returned by Build().
  class Builder {
   public:
    Builder() = default;
    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;
    Builder(Builder&&) = default;
    Builder& operator=(Builder&&) = default;

    // Adds `primitive`, which is backed by the key described by `key_info`.
    Builder& AddPrimitive(std::unique_ptr<P> primitive,
                          const proto::KeysetInfo::KeyInfo& key_info) & {
      AddPrimitiveImpl(std::move(primitive), key_info, /*is_primary=*/false);
      return *this;
    }
    Builder&& AddPrimitive(std::unique_ptr<P> primitive,
                           const proto::KeysetInfo::KeyInfo& key_info) && {
      AddPrimitiveImpl(std::move(primitive), key_info, /*is_primary=*/false);
      return std::move(*this);
    }

    // Adds `primitive` and makes it the primary. The key must be ENABLED.
    Builder& AddPrimaryPrimitive(
        std::unique_ptr<P> primitive,
        const proto::KeysetInfo::KeyInfo& key_info) & {
      AddPrimitiveImpl(std::move(primitive), key_info, /*is_primary=*/true);
      return *this;
    }
    Builder&& AddPrimaryPrimitive(
        std::unique_ptr<P> primitive,
        const proto::KeysetInfo::KeyInfo& key_info) && {
      AddPrimitiveImpl(std::move(primitive), key_info, /*is_primary=*/true);
      return std::move(*this);
    }

    absl::StatusOr<PrimitiveSet<P>> Build() && {
      if (!status_.ok()) return status_;
      return PrimitiveSet<P>(std::move(entries_), std::move(primitives_),
                             primary_);
    }

   private:
    void AddPrimitiveImpl(std::unique_ptr<P> primitive,
                          const proto::KeysetInfo::KeyInfo& key_info,
                          bool is_primary) {
      if (!status_.ok()) return;
      if (is_primary && primary_ != nullptr) {
        status_ = absl::Status(absl::StatusCode::kInvalidArgument,
                               "The primary was already set.");
        return;
      }
      if (is_primary && key_info.status() != proto::KeyStatusType::ENABLED) {
        status_ = ToStatusF(absl::StatusCode::kInvalidArgument,
                            "The primary key %d must be ENABLED.",
                            key_info.key_id());
        return;
      }
      absl::StatusOr<std::unique_ptr<Entry>> entry =
          Entry::New(std::move(primitive), key_info);
      if (!entry.ok()) {
        status_ = entry.status();
        return;
      }
      Entry* entry_ptr = entry->get();
      primitives_[entry_ptr->get_identifier()].push_back(entry_ptr);
      entries_.push_back(*std::move(entry));
      if (is_primary) primary_ = entry_ptr;
    }

    absl::Status status_;
    std::vector<std::unique_ptr<Entry>> entries_;
    CiphertextPrefixToPrimitivesMap primitives_;
    Entry* primary_ = nullptr;
  };

  PrimitiveSet(PrimitiveSet&&) = default;
  PrimitiveSet& operator=(PrimitiveSet&&) = default;
  PrimitiveSet(const PrimitiveSet&) = delete;
  PrimitiveSet& operator=(const PrimitiveSet&) = delete;

  // Returns the entries with the given `identifier` (a 5-byte output prefix
  // or the empty RAW prefix), in the order they were added.
  absl::StatusOr<const Primitives*> get_primitives(
      absl::string_view identifier) const {
    auto found = primitives_.find(identifier);
    if (found == primitives_.end()) {
      return absl::Status(absl::StatusCode::kNotFound,
                          "No primitives found for the given identifier.");
    }
    return &found->second;
  }

  // Returns all entries of keys with output prefix type RAW.
  absl::StatusOr<const Primitives*> get_raw_primitives() const {
    return get_primitives(CryptoFormat::kRawPrefix);
  }

  // Returns the entry of the primary key, or nullptr if there is none.
  const Entry* get_primary() const { return primary_; }

  // Returns all entries in the order in which they were added.
  std::vector<Entry*> get_all() const {
    std::vector<Entry*> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) result.push_back(entry.get());
    return result;
  }

 private:
  PrimitiveSet(std::vector<std::unique_ptr<Entry>> entries,
               CiphertextPrefixToPrimitivesMap primitives, Entry* primary)
      : entries_(std::move(entries)),
        primitives_(std::move(primitives)),
        primary_(primary) {}

  // Owns the entries; the map and the primary point into it.
  std::vector<std::unique_ptr<Entry>> entries_;
  CiphertextPrefixToPrimitivesMap primitives_;
  Entry* primary_ = nullptr;
};

}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_PRIMITIVE_SET_H_
