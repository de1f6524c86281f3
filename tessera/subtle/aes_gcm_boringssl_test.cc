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

#include "tessera/subtle/aes_gcm_boringssl.h"

#include <memory>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tessera/aead.h"
#include "tessera/subtle/random.h"
#include "tessera/util/secret_data.h"
#include "tessera/util/test_matchers.h"
#include "tessera/util/test_util.h"

namespace crypto {
namespace tessera {
namespace subtle {
namespace {

using ::crypto::tessera::test::HexDecodeOrDie;
using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::IsOkAndHolds;
using ::crypto::tessera::test::StatusIs;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::SizeIs;

constexpr absl::string_view kKey128Hex = "000102030405060708090a0b0c0d0e0f";
constexpr absl::string_view kMessage = "Some data to encrypt.";
constexpr absl::string_view kAssociatedData = "Some associated data.";

class AesGcmBoringSslTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<std::unique_ptr<Aead>> aead = AesGcmBoringSsl::New(
        util::SecretDataFromStringView(HexDecodeOrDie(kKey128Hex)));
    ASSERT_THAT(aead, IsOk());
    aead_ = *std::move(aead);
  }

  std::unique_ptr<Aead> aead_;
};

TEST_F(AesGcmBoringSslTest, EncryptDecrypt) {
  absl::StatusOr<std::string> ciphertext =
      aead_->Encrypt(kMessage, kAssociatedData);
  ASSERT_THAT(ciphertext, IsOk());
  EXPECT_THAT(*ciphertext,
              SizeIs(kMessage.size() + AesGcmBoringSsl::kIvSizeInBytes +
                     AesGcmBoringSsl::kTagSizeInBytes));
  EXPECT_THAT(aead_->Decrypt(*ciphertext, kAssociatedData),
              IsOkAndHolds(Eq(kMessage)));
}

TEST_F(AesGcmBoringSslTest, EncryptDecryptEmptyInputs) {
  absl::StatusOr<std::string> ciphertext = aead_->Encrypt("", "");
  ASSERT_THAT(ciphertext, IsOk());
  EXPECT_THAT(*ciphertext, SizeIs(AesGcmBoringSsl::kIvSizeInBytes +
                                  AesGcmBoringSsl::kTagSizeInBytes));
  EXPECT_THAT(aead_->Decrypt(*ciphertext, ""), IsOkAndHolds(Eq("")));
  EXPECT_THAT(aead_->Decrypt(*ciphertext, absl::string_view()),
              IsOkAndHolds(Eq("")));
}

TEST_F(AesGcmBoringSslTest, CiphertextsAreRandomized) {
  absl::StatusOr<std::string> first = aead_->Encrypt(kMessage, "");
  absl::StatusOr<std::string> second = aead_->Encrypt(kMessage, "");
  ASSERT_THAT(first, IsOk());
  ASSERT_THAT(second, IsOk());
  EXPECT_THAT(*first, Not(Eq(*second)));
}

TEST_F(AesGcmBoringSslTest, ModifiedCiphertextFails) {
  absl::StatusOr<std::string> ciphertext =
      aead_->Encrypt(kMessage, kAssociatedData);
  ASSERT_THAT(ciphertext, IsOk());
  for (size_t i = 0; i < ciphertext->size() * 8; i++) {
    std::string modified = *ciphertext;
    modified[i / 8] ^= 1 << (i % 8);
    EXPECT_THAT(aead_->Decrypt(modified, kAssociatedData), Not(IsOk()))
        << "bit " << i;
  }
  for (size_t length = 0; length < ciphertext->size(); length++) {
    EXPECT_THAT(aead_->Decrypt(ciphertext->substr(0, length), kAssociatedData),
                Not(IsOk()))
        << "length " << length;
  }
  EXPECT_THAT(
      aead_->Decrypt(absl::StrCat(*ciphertext, "x"), kAssociatedData),
      Not(IsOk()));
}

TEST_F(AesGcmBoringSslTest, WrongAssociatedDataFails) {
  absl::StatusOr<std::string> ciphertext =
      aead_->Encrypt(kMessage, kAssociatedData);
  ASSERT_THAT(ciphertext, IsOk());
  EXPECT_THAT(aead_->Decrypt(*ciphertext, "other associated data"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Authentication failed")));
}

TEST_F(AesGcmBoringSslTest, TooShortCiphertext) {
  EXPECT_THAT(aead_->Decrypt(std::string(27, 'x'), ""),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Ciphertext too short")));
}

// NIST SP 800-38D test case 2, laid out as iv || ciphertext || tag.
TEST(AesGcmBoringSslTestVectorTest, DecryptsKnownCiphertext) {
  absl::StatusOr<std::unique_ptr<Aead>> aead =
      AesGcmBoringSsl::New(SecretData(16, 0));
  ASSERT_THAT(aead, IsOk());
  std::string ciphertext = HexDecodeOrDie(
      "000000000000000000000000"
      "0388dace60b6a392f328c2b971b2fe78"
      "ab6e47d42cec13bdf53a67b21257bddf");
  EXPECT_THAT((*aead)->Decrypt(ciphertext, ""),
              IsOkAndHolds(Eq(std::string(16, '\0'))));
}

TEST(AesGcmBoringSslNewTest, AcceptsOnly128And256BitKeys) {
  for (int key_size = 0; key_size < 64; key_size++) {
    absl::StatusOr<std::unique_ptr<Aead>> aead =
        AesGcmBoringSsl::New(Random::GetRandomKeyBytes(key_size));
    if (key_size == 16 || key_size == 32) {
      EXPECT_THAT(aead, IsOk()) << "key_size " << key_size;
    } else {
      EXPECT_THAT(aead, StatusIs(absl::StatusCode::kInvalidArgument))
          << "key_size " << key_size;
    }
  }
}

TEST(AesGcmBoringSslNewTest, DifferentKeysDoNotDecrypt) {
  absl::StatusOr<std::unique_ptr<Aead>> aead1 =
      AesGcmBoringSsl::New(Random::GetRandomKeyBytes(32));
  absl::StatusOr<std::unique_ptr<Aead>> aead2 =
      AesGcmBoringSsl::New(Random::GetRandomKeyBytes(32));
  ASSERT_THAT(aead1, IsOk());
  ASSERT_THAT(aead2, IsOk());
  absl::StatusOr<std::string> ciphertext = (*aead1)->Encrypt(kMessage, "");
  ASSERT_THAT(ciphertext, IsOk());
  EXPECT_THAT((*aead2)->Decrypt(*ciphertext, ""), Not(IsOk()));
}

}  // namespace
}  // namespace subtle
}  // namespace tessera
}  // namespace crypto
