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

#include "tessera/signature/ed25519_sign_key_manager.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/public_key_sign.h"
#include "tessera/public_key_verify.h"
#include "tessera/signature/ed25519_verify_key_manager.h"
#include "tessera/subtle/ed25519_boringssl.h"
#include "tessera/util/test_matchers.h"
#include "proto/ed25519.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::proto::Ed25519KeyFormat;
using ::crypto::tessera::proto::Ed25519PrivateKey;
using ::crypto::tessera::proto::Ed25519PublicKey;
using ::crypto::tessera::proto::KeyData;
using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::StatusIs;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Ne;
using ::testing::Not;
using ::testing::SizeIs;

TEST(Ed25519SignKeyManagerTest, Basic) {
  EXPECT_THAT(Ed25519SignKeyManager().get_version(), Eq(0));
  EXPECT_THAT(Ed25519SignKeyManager().key_material_type(),
              Eq(KeyData::ASYMMETRIC_PRIVATE));
  EXPECT_THAT(Ed25519SignKeyManager().get_key_type(),
              Eq("type.googleapis.com/crypto.tessera.proto.Ed25519PrivateKey"));
}

TEST(Ed25519SignKeyManagerTest, ValidateKeyFormat) {
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKeyFormat(Ed25519KeyFormat()),
              IsOk());
}

TEST(Ed25519SignKeyManagerTest, ValidateKeyFormatWrongVersion) {
  Ed25519KeyFormat key_format;
  key_format.set_version(1);
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKeyFormat(key_format),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(Ed25519SignKeyManagerTest, CreateKey) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());
  EXPECT_THAT(key->version(), Eq(0));
  EXPECT_THAT(key->key_value(), SizeIs(32));
  EXPECT_THAT(key->public_key().version(), Eq(0));
  EXPECT_THAT(key->public_key().key_value(), SizeIs(32));
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKey(*key), IsOk());
}

TEST(Ed25519SignKeyManagerTest, CreateKeysAreDifferent) {
  absl::StatusOr<Ed25519PrivateKey> key1 =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  absl::StatusOr<Ed25519PrivateKey> key2 =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key1, IsOk());
  ASSERT_THAT(key2, IsOk());
  EXPECT_THAT(key1->key_value(), Ne(key2->key_value()));
  EXPECT_THAT(key1->public_key().key_value(),
              Ne(key2->public_key().key_value()));
}

TEST(Ed25519SignKeyManagerTest, ValidateKeyWrongVersion) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());
  key->set_version(1);
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKey(*key), Not(IsOk()));
}

TEST(Ed25519SignKeyManagerTest, ValidateKeyWrongLength) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());
  key->set_key_value(std::string(31, 'a'));
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKey(*key),
              StatusIs(absl::StatusCode::kInvalidArgument));
  key->set_key_value(std::string(64, 'a'));
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKey(*key),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(Ed25519SignKeyManagerTest, ValidateKeyInvalidPublicKey) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());
  key->mutable_public_key()->set_key_value(std::string(33, 'a'));
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKey(*key),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(Ed25519SignKeyManagerTest, ValidateKeyMismatchedPublicKey) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());
  absl::StatusOr<Ed25519PrivateKey> other_key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(other_key, IsOk());
  *key->mutable_public_key() = other_key->public_key();
  EXPECT_THAT(Ed25519SignKeyManager().ValidateKey(*key),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("does not match")));
}

TEST(Ed25519SignKeyManagerTest, GetPublicKey) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());
  absl::StatusOr<Ed25519PublicKey> public_key =
      Ed25519SignKeyManager().GetPublicKey(*key);
  ASSERT_THAT(public_key, IsOk());
  EXPECT_THAT(public_key->version(), Eq(key->public_key().version()));
  EXPECT_THAT(public_key->key_value(), Eq(key->public_key().key_value()));
  EXPECT_THAT(Ed25519VerifyKeyManager().ValidateKey(*public_key), IsOk());
}

TEST(Ed25519SignKeyManagerTest, Create) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());

  absl::StatusOr<std::unique_ptr<PublicKeySign>> signer =
      Ed25519SignKeyManager().GetPrimitive(*key);
  ASSERT_THAT(signer, IsOk());

  absl::StatusOr<std::unique_ptr<PublicKeyVerify>> direct_verifier =
      subtle::Ed25519VerifyBoringSsl::New(key->public_key().key_value());
  ASSERT_THAT(direct_verifier, IsOk());

  std::string message = "Some message";
  absl::StatusOr<std::string> signature = (*signer)->Sign(message);
  ASSERT_THAT(signature, IsOk());
  EXPECT_THAT(*signature, SizeIs(64));
  EXPECT_THAT((*direct_verifier)->Verify(*signature, message), IsOk());
}

TEST(Ed25519SignKeyManagerTest, CreateDifferentKey) {
  absl::StatusOr<Ed25519PrivateKey> key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(key, IsOk());
  absl::StatusOr<Ed25519PrivateKey> other_key =
      Ed25519SignKeyManager().CreateKey(Ed25519KeyFormat());
  ASSERT_THAT(other_key, IsOk());

  absl::StatusOr<std::unique_ptr<PublicKeySign>> signer =
      Ed25519SignKeyManager().GetPrimitive(*key);
  ASSERT_THAT(signer, IsOk());

  absl::StatusOr<std::unique_ptr<PublicKeyVerify>> direct_verifier =
      subtle::Ed25519VerifyBoringSsl::New(
          other_key->public_key().key_value());
  ASSERT_THAT(direct_verifier, IsOk());

  std::string message = "Some message";
  absl::StatusOr<std::string> signature = (*signer)->Sign(message);
  ASSERT_THAT(signature, IsOk());
  EXPECT_THAT((*direct_verifier)->Verify(*signature, message), Not(IsOk()));
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
