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

#include "tessera/signature/signature_config.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/keyset_handle.h"
#include "tessera/public_key_sign.h"
#include "tessera/public_key_verify.h"
#include "tessera/registry.h"
#include "tessera/signature/ed25519_sign_key_manager.h"
#include "tessera/signature/ed25519_verify_key_manager.h"
#include "tessera/signature/signature_key_templates.h"
#include "tessera/util/test_matchers.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::StatusIs;

class SignatureConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { Registry::Reset(); }
  void TearDown() override { Registry::Reset(); }
};

TEST_F(SignatureConfigTest, Basic) {
  EXPECT_THAT(Registry::get_key_manager<PublicKeySign>(
                  Ed25519SignKeyManager().get_key_type())
                  .status(),
              StatusIs(absl::StatusCode::kNotFound));
  ASSERT_THAT(SignatureConfig::Register(), IsOk());
  EXPECT_THAT(Registry::get_key_manager<PublicKeySign>(
                  Ed25519SignKeyManager().get_key_type())
                  .status(),
              IsOk());
  EXPECT_THAT(Registry::get_key_manager<PublicKeyVerify>(
                  Ed25519VerifyKeyManager().get_key_type())
                  .status(),
              IsOk());
}

TEST_F(SignatureConfigTest, RegisterTwice) {
  ASSERT_THAT(SignatureConfig::Register(), IsOk());
  EXPECT_THAT(SignatureConfig::Register(), IsOk());
}

// Tests that the wrappers have been properly registered and we can wrap
// primitives.
TEST_F(SignatureConfigTest, WrappersRegistered) {
  ASSERT_THAT(SignatureConfig::Register(), IsOk());
  absl::StatusOr<std::unique_ptr<KeysetHandle>> private_handle =
      KeysetHandle::GenerateNew(SignatureKeyTemplates::Ed25519());
  ASSERT_THAT(private_handle, IsOk());
  absl::StatusOr<std::unique_ptr<KeysetHandle>> public_handle =
      (*private_handle)->GetPublicKeysetHandle();
  ASSERT_THAT(public_handle, IsOk());

  absl::StatusOr<std::unique_ptr<PublicKeySign>> signer =
      (*private_handle)->GetPrimitive<PublicKeySign>();
  ASSERT_THAT(signer, IsOk());
  absl::StatusOr<std::unique_ptr<PublicKeyVerify>> verifier =
      (*public_handle)->GetPrimitive<PublicKeyVerify>();
  ASSERT_THAT(verifier, IsOk());

  absl::StatusOr<std::string> signature = (*signer)->Sign("message");
  ASSERT_THAT(signature, IsOk());
  EXPECT_THAT((*verifier)->Verify(*signature, "message"), IsOk());
  EXPECT_THAT((*verifier)->Verify(*signature, "other message"),
              StatusIs(absl::StatusCode::kUnauthenticated));
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
