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

#ifndef TESSERA_UTIL_TEST_UTIL_H_
#define TESSERA_UTIL_TEST_UTIL_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message_lite.h"
#include "tessera/aead.h"
#include "tessera/key_manager.h"
#include "tessera/mac.h"
#include "tessera/public_key_sign.h"
#include "tessera/public_key_verify.h"
#include "tessera/util/errors.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace test {

// Various utilities for testing.
///////////////////////////////////////////////////////////////////////////////

// Converts a hexadecimal string into a string of bytes.
// Returns a status if the size of the input is odd or if the input contains
// characters that are not hexadecimal.
absl::StatusOr<std::string> HexDecode(absl::string_view hex);

// Converts a hexadecimal string into a string of bytes.
// Dies if the input is not a valid hexadecimal string.
std::string HexDecodeOrDie(absl::string_view hex);

// Converts a string of bytes into a hexadecimal string.
std::string HexEncode(absl::string_view bytes);

// Adds the given 'key' with the specified parameters and output prefix type
// TINK (resp. LEGACY, RAW, CRUNCHY) to the specified 'keyset'.
void AddTinkKey(const std::string& key_type, uint32_t key_id,
                const google::protobuf::MessageLite& key,
                proto::KeyStatusType key_status,
                proto::KeyData::KeyMaterialType material_type,
                proto::Keyset* keyset);

void AddLegacyKey(const std::string& key_type, uint32_t key_id,
                  const google::protobuf::MessageLite& key,
                  proto::KeyStatusType key_status,
                  proto::KeyData::KeyMaterialType material_type,
                  proto::Keyset* keyset);

void AddRawKey(const std::string& key_type, uint32_t key_id,
               const google::protobuf::MessageLite& key,
               proto::KeyStatusType key_status,
               proto::KeyData::KeyMaterialType material_type,
               proto::Keyset* keyset);

void AddCrunchyKey(const std::string& key_type, uint32_t key_id,
                   const google::protobuf::MessageLite& key,
                   proto::KeyStatusType key_status,
                   proto::KeyData::KeyMaterialType material_type,
                   proto::Keyset* keyset);

// A dummy implementation of Aead-interface.
// An instance of DummyAead can be identified by a name specified
// as a parameter of the constructor.
class DummyAead : public Aead {
 public:
  explicit DummyAead(absl::string_view aead_name) : aead_name_(aead_name) {}

  // Computes a dummy ciphertext, which is concatenation of provided
  // 'plaintext' with the name of this DummyAead.
  absl::StatusOr<std::string> Encrypt(
      absl::string_view plaintext,
      absl::string_view associated_data) const override {
    return absl::StrCat(aead_name_.size(), ":", associated_data.size(), ":",
                        aead_name_, associated_data, plaintext);
  }

  absl::StatusOr<std::string> Decrypt(
      absl::string_view ciphertext,
      absl::string_view associated_data) const override {
    std::string prefix =
        absl::StrCat(aead_name_.size(), ":", associated_data.size(), ":",
                     aead_name_, associated_data);
    if (!absl::StartsWith(ciphertext, prefix)) {
      return absl::Status(absl::StatusCode::kInvalidArgument,
                          "Dummy operation failed.");
    }
    ciphertext.remove_prefix(prefix.size());
    return std::string(ciphertext);
  }

 private:
  std::string aead_name_;
};

// A dummy implementation of Mac-interface.
// An instance of DummyMac can be identified by a name specified
// as a parameter of the constructor.
class DummyMac : public Mac {
 public:
  explicit DummyMac(absl::string_view mac_name) : mac_name_(mac_name) {}

  // Computes a dummy MAC, which is concatenation of provided 'data'
  // with the name of this DummyMac.
  absl::StatusOr<std::string> ComputeMac(
      absl::string_view data) const override {
    return absl::StrCat(data.size(), ":", mac_name_, data);
  }

  absl::Status VerifyMac(absl::string_view mac,
                         absl::string_view data) const override {
    if (mac != absl::StrCat(data.size(), ":", mac_name_, data)) {
      return absl::Status(absl::StatusCode::kInvalidArgument,
                          "Dummy operation failed.");
    }
    return absl::OkStatus();
  }

 private:
  std::string mac_name_;
};

// A dummy implementation of PublicKeySign-interface.
// An instance of DummyPublicKeySign can be identified by a name specified
// as a parameter of the constructor.
class DummyPublicKeySign : public PublicKeySign {
 public:
  explicit DummyPublicKeySign(absl::string_view signature_name)
      : signature_name_(signature_name) {}

  // Computes a dummy signature, which is a concatenation of 'data'
  // with the name of this DummyPublicKeySign.
  absl::StatusOr<std::string> Sign(absl::string_view data) const override {
    return absl::StrCat(data.size(), ":", signature_name_, data);
  }

 private:
  std::string signature_name_;
};

// A dummy implementation of PublicKeyVerify-interface, accepting the
// signatures of the DummyPublicKeySign with the same name.
class DummyPublicKeyVerify : public PublicKeyVerify {
 public:
  explicit DummyPublicKeyVerify(absl::string_view signature_name)
      : signature_name_(signature_name) {}

  absl::Status Verify(absl::string_view signature,
                      absl::string_view data) const override {
    if (signature != absl::StrCat(data.size(), ":", signature_name_, data)) {
      return absl::Status(absl::StatusCode::kInvalidArgument,
                          "Dummy operation failed.");
    }
    return absl::OkStatus();
  }

 private:
  std::string signature_name_;
};

// KeyFactory of DummyKeyManager. The value of each generated key is the
// serialized key format.
class DummyKeyFactory : public KeyFactory {
 public:
  DummyKeyFactory(absl::string_view key_type,
                  proto::KeyData::KeyMaterialType material_type)
      : key_type_(key_type), material_type_(material_type) {}

  absl::StatusOr<std::unique_ptr<proto::KeyData>> NewKeyData(
      absl::string_view serialized_key_format) const override {
    auto key_data = absl::make_unique<proto::KeyData>();
    key_data->set_type_url(key_type_);
    key_data->set_value(std::string(serialized_key_format));
    key_data->set_key_material_type(material_type_);
    return std::move(key_data);
  }

 private:
  const std::string key_type_;
  const proto::KeyData::KeyMaterialType material_type_;
};

// A KeyManager<P> for the key type `key_type`, which creates its primitives
// by calling `primitive_factory` on the value of the KeyData. Use it to
// exercise keysets without real cryptography, e.g.
//
//   DummyKeyManager<Aead> manager(
//       "some_key_type", proto::KeyData::SYMMETRIC,
//       [](absl::string_view value) {
//         return absl::make_unique<DummyAead>(value);
//       });
template <class P>
class DummyKeyManager : public KeyManager<P> {
 public:
  using PrimitiveFactory =
      std::function<std::unique_ptr<P>(absl::string_view key_value)>;

  DummyKeyManager(absl::string_view key_type,
                  proto::KeyData::KeyMaterialType material_type,
                  PrimitiveFactory primitive_factory)
      : key_type_(key_type),
        material_type_(material_type),
        primitive_factory_(std::move(primitive_factory)),
        key_factory_(key_type, material_type) {}

  absl::StatusOr<std::unique_ptr<P>> GetPrimitive(
      const proto::KeyData& key_data) const override {
    if (!this->DoesSupport(key_data.type_url())) {
      return ToStatusF(absl::StatusCode::kInvalidArgument,
                       "Key type '%s' is not supported by this manager.",
                       key_data.type_url());
    }
    return primitive_factory_(key_data.value());
  }

  const std::string& get_key_type() const override { return key_type_; }

  proto::KeyData::KeyMaterialType key_material_type() const override {
    return material_type_;
  }

  uint32_t get_version() const override { return 0; }

  const KeyFactory& get_key_factory() const override { return key_factory_; }

 private:
  const std::string key_type_;
  const proto::KeyData::KeyMaterialType material_type_;
  const PrimitiveFactory primitive_factory_;
  const DummyKeyFactory key_factory_;
};

}  // namespace test
}  // namespace tessera
}  // namespace crypto

#endif  // TESSERA_UTIL_TEST_UTIL_H_
