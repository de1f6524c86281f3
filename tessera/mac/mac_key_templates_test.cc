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

#include "tessera/mac/mac_key_templates.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tessera/mac/hmac_key_manager.h"
#include "tessera/util/test_matchers.h"
#include "proto/common.pb.h"
#include "proto/hmac.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::proto::HashType;
using ::crypto::tessera::proto::HmacKeyFormat;
using ::crypto::tessera::proto::KeyTemplate;
using ::crypto::tessera::proto::OutputPrefixType;
using ::crypto::tessera::test::IsOk;
using ::testing::Eq;
using ::testing::Ref;

TEST(MacKeyTemplatesTest, HmacSha256HalfSizeTag) {
  const KeyTemplate& key_template = MacKeyTemplates::HmacSha256HalfSizeTag();
  EXPECT_THAT(key_template.type_url(),
              Eq("type.googleapis.com/crypto.tessera.proto.HmacKey"));
  EXPECT_THAT(key_template.output_prefix_type(), Eq(OutputPrefixType::TINK));
  HmacKeyFormat key_format;
  ASSERT_TRUE(key_format.ParseFromString(key_template.value()));
  EXPECT_THAT(key_format.key_size(), Eq(32));
  EXPECT_THAT(key_format.params().tag_size(), Eq(16));
  EXPECT_THAT(key_format.params().hash(), Eq(HashType::SHA256));
  EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), IsOk());

  EXPECT_THAT(MacKeyTemplates::HmacSha256HalfSizeTag(), Ref(key_template));
}

TEST(MacKeyTemplatesTest, HmacSha256) {
  const KeyTemplate& key_template = MacKeyTemplates::HmacSha256();
  EXPECT_THAT(key_template.type_url(), Eq(HmacKeyManager().get_key_type()));
  EXPECT_THAT(key_template.output_prefix_type(), Eq(OutputPrefixType::TINK));
  HmacKeyFormat key_format;
  ASSERT_TRUE(key_format.ParseFromString(key_template.value()));
  EXPECT_THAT(key_format.key_size(), Eq(32));
  EXPECT_THAT(key_format.params().tag_size(), Eq(32));
  EXPECT_THAT(key_format.params().hash(), Eq(HashType::SHA256));
  EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), IsOk());
}

TEST(MacKeyTemplatesTest, HmacSha512) {
  const KeyTemplate& key_template = MacKeyTemplates::HmacSha512();
  EXPECT_THAT(key_template.type_url(), Eq(HmacKeyManager().get_key_type()));
  EXPECT_THAT(key_template.output_prefix_type(), Eq(OutputPrefixType::TINK));
  HmacKeyFormat key_format;
  ASSERT_TRUE(key_format.ParseFromString(key_template.value()));
  EXPECT_THAT(key_format.key_size(), Eq(64));
  EXPECT_THAT(key_format.params().tag_size(), Eq(64));
  EXPECT_THAT(key_format.params().hash(), Eq(HashType::SHA512));
  EXPECT_THAT(HmacKeyManager().ValidateKeyFormat(key_format), IsOk());
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
