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

#include "tessera/mac/hmac_key_manager.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/mac.h"
#include "tessera/subtle/common_enums.h"
#include "tessera/subtle/hmac_boringssl.h"
#include "tessera/util/secret_data.h"
#include "tessera/util/test_matchers.h"
#include "proto/common.pb.h"
#include "proto/hmac.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::proto::HashType;
using ::crypto::tessera::proto::HmacKey;
using ::crypto::tessera::proto::HmacKeyFormat;
using ::crypto::tessera::proto::KeyData;
using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::IsOkAndHolds;
using ::crypto::tessera::test::StatusIs;
using ::testing::Eq;
using ::testing::Not;
using ::testing::SizeIs;

HmacKeyFormat ValidKeyFormat() {
  HmacKeyFormat key_format;
  key_format.set_key_size(32);
  key_format.mutable_params()->set_tag_size(16);
  key_format.mutable_params()->set_hash(HashType::SHA256);
  return key_format;
}

TEST(HmacKeyManagerTest, Basics) {
  EXPECT_THAT(HmacKeyManager().get_version(), Eq(0));
  EXPECT_THAT(HmacKeyManager().get_key_type(),
              Eq("type.googleapis.com/crypto.tessera.proto.HmacKey"));
  EXPECT_THAT(HmacKeyManager().key_material_type(), Eq(KeyData::SYMMETRIC));
}

TEST(HmacKeyManagerTest, ValidateEmptyKey) {
  EXPECT_THAT(HmacKeyManager().ValidateKey(HmacKey()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(HmacKeyManagerTest, ValidateKeyFormat) {
  EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(ValidKeyFormat()), IsOk());
}

TEST(HmacKeyManagerTest, ValidateKeyFormatSmallKey) {
  HmacKeyFormat key_format = ValidKeyFormat();
  key_format.set_key_size(15);
  EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format),
              StatusIs(absl::StatusCode::kInvalidArgument));
  key_format.set_key_size(16);
  EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), IsOk());
}

TEST(HmacKeyManagerTest, ValidateKeyFormatTagSizes) {
  struct TagSizeLimits {
    HashType hash;
    uint32_t max_tag_size;
  };
  for (const TagSizeLimits& limits :
       {TagSizeLimits{HashType::SHA1, 20}, TagSizeLimits{HashType::SHA224, 28},
        TagSizeLimits{HashType::SHA256, 32},
        TagSizeLimits{HashType::SHA384, 48},
        TagSizeLimits{HashType::SHA512, 64}}) {
    HmacKeyFormat key_format = ValidKeyFormat();
    key_format.mutable_params()->set_hash(limits.hash);
    key_format.mutable_params()->set_tag_size(9);
    EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), Not(IsOk()));
    key_format.mutable_params()->set_tag_size(10);
    EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), IsOk());
    key_format.mutable_params()->set_tag_size(limits.max_tag_size);
    EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), IsOk());
    key_format.mutable_params()->set_tag_size(limits.max_tag_size + 1);
    EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), Not(IsOk()));
  }
}

TEST(HmacKeyManagerTest, ValidateKeyFormatUnknownHash) {
  HmacKeyFormat key_format = ValidKeyFormat();
  key_format.mutable_params()->set_hash(HashType::UNKNOWN_HASH);
  EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(HmacKeyManagerTest, CreateKey) {
  HmacKeyFormat key_format = ValidKeyFormat();
  absl::StatusOr<HmacKey> key = HmacKeyManager().CreateKey(key_format);
  ASSERT_THAT(key, IsOk());
  EXPECT_THAT(key->version(), Eq(0));
  EXPECT_THAT(key->key_value(), SizeIs(key_format.key_size()));
  EXPECT_THAT(key->params().hash(), Eq(key_format.params().hash()));
  EXPECT_THAT(key->params().tag_size(), Eq(key_format.params().tag_size()));
  EXPECT_THAT(HmacKeyManager().ValidateKey(*key), IsOk());
}

TEST(HmacKeyManagerTest, ValidateKeyVersion) {
  absl::StatusOr<HmacKey> key = HmacKeyManager().CreateKey(ValidKeyFormat());
  ASSERT_THAT(key, IsOk());
  key->set_version(1);
  EXPECT_THAT(HmacKeyManager().ValidateKey(*key), Not(IsOk()));
}

TEST(HmacKeyManagerTest, ValidateKeyShortKey) {
  absl::StatusOr<HmacKey> key = HmacKeyManager().CreateKey(ValidKeyFormat());
  ASSERT_THAT(key, IsOk());
  key->set_key_value("0123456789abcde");
  EXPECT_THAT(HmacKeyManager().ValidateKey(*key),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(HmacKeyManagerTest, GetPrimitive) {
  absl::StatusOr<HmacKey> key = HmacKeyManager().CreateKey(ValidKeyFormat());
  ASSERT_THAT(key, IsOk());
  absl::StatusOr<std::unique_ptr<Mac>> manager_mac =
      HmacKeyManager().GetPrimitive(*key);
  ASSERT_THAT(manager_mac, IsOk());
  absl::StatusOr<std::string> mac_value =
      (*manager_mac)->ComputeMac("some plaintext");
  ASSERT_THAT(mac_value, IsOk());
  EXPECT_THAT(*mac_value, SizeIs(16));

  absl::StatusOr<std::unique_ptr<Mac>> direct_mac = subtle::HmacBoringSsl::New(
      subtle::HashType::SHA256, 16,
      util::SecretDataFromStringView(key->key_value()));
  ASSERT_THAT(direct_mac, IsOk());
  EXPECT_THAT((*direct_mac)->VerifyMac(*mac_value, "some plaintext"), IsOk());
  EXPECT_THAT((*direct_mac)->ComputeMac("some plaintext"),
              IsOkAndHolds(Eq(*mac_value)));
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
