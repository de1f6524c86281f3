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

#include "tessera/signature/public_key_sign_wrapper.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tessera/internal/monitoring.h"
#include "tessera/internal/monitoring_client_mocks.h"
#include "tessera/internal/registry_impl.h"
#include "tessera/primitive_set.h"
#include "tessera/public_key_sign.h"
#include "tessera/registry.h"
#include "tessera/util/test_matchers.h"
#include "tessera/util/test_util.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::proto::KeysetInfo;
using ::crypto::tessera::proto::KeyStatusType;
using ::crypto::tessera::proto::OutputPrefixType;
using ::crypto::tessera::test::DummyPublicKeySign;
using ::crypto::tessera::test::HexDecodeOrDie;
using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::IsOkAndHolds;
using ::crypto::tessera::test::StatusIs;
using ::testing::ByMove;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::Return;

KeysetInfo::KeyInfo MakeKeyInfo(uint32_t key_id,
                                OutputPrefixType output_prefix_type) {
  KeysetInfo::KeyInfo key_info;
  key_info.set_output_prefix_type(output_prefix_type);
  key_info.set_key_id(key_id);
  key_info.set_status(KeyStatusType::ENABLED);
  key_info.set_type_url("some_signature_key_type");
  return key_info;
}

std::unique_ptr<PrimitiveSet<PublicKeySign>> ToUnique(
    absl::StatusOr<PrimitiveSet<PublicKeySign>> primitive_set) {
  EXPECT_THAT(primitive_set, IsOk());
  return absl::make_unique<PrimitiveSet<PublicKeySign>>(
      *std::move(primitive_set));
}

std::string DummySignature(absl::string_view name, absl::string_view data) {
  return DummyPublicKeySign(name).Sign(data).value();
}

class PublicKeySignWrapperTest : public ::testing::Test {
 protected:
  void SetUp() override { Registry::Reset(); }
  void TearDown() override { Registry::Reset(); }
};

TEST_F(PublicKeySignWrapperTest, WrapNullptr) {
  EXPECT_THAT(PublicKeySignWrapper().Wrap(nullptr),
              StatusIs(absl::StatusCode::kInternal));
}

TEST_F(PublicKeySignWrapperTest, WrapEmpty) {
  EXPECT_THAT(PublicKeySignWrapper().Wrap(
                  ToUnique(PrimitiveSet<PublicKeySign>::Builder().Build())),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(PublicKeySignWrapperTest, SignsWithPrimaryAndPrefix) {
  std::unique_ptr<PrimitiveSet<PublicKeySign>> sign_set = ToUnique(
      PrimitiveSet<PublicKeySign>::Builder()
          .AddPrimitive(absl::make_unique<DummyPublicKeySign>("sign0"),
                        MakeKeyInfo(1, OutputPrefixType::TINK))
          .AddPrimaryPrimitive(absl::make_unique<DummyPublicKeySign>("sign1"),
                               MakeKeyInfo(42, OutputPrefixType::TINK))
          .Build());
  absl::StatusOr<std::unique_ptr<PublicKeySign>> sign =
      PublicKeySignWrapper().Wrap(std::move(sign_set));
  ASSERT_THAT(sign, IsOk());
  EXPECT_THAT((*sign)->Sign("data"),
              IsOkAndHolds(Eq(absl::StrCat(HexDecodeOrDie("010000002a"),
                                           DummySignature("sign1", "data")))));
}

TEST_F(PublicKeySignWrapperTest, RawPrimaryHasNoPrefix) {
  std::unique_ptr<PrimitiveSet<PublicKeySign>> sign_set = ToUnique(
      PrimitiveSet<PublicKeySign>::Builder()
          .AddPrimaryPrimitive(absl::make_unique<DummyPublicKeySign>("sign0"),
                               MakeKeyInfo(42, OutputPrefixType::RAW))
          .Build());
  absl::StatusOr<std::unique_ptr<PublicKeySign>> sign =
      PublicKeySignWrapper().Wrap(std::move(sign_set));
  ASSERT_THAT(sign, IsOk());
  EXPECT_THAT((*sign)->Sign("data"),
              IsOkAndHolds(Eq(DummySignature("sign0", "data"))));
}

TEST_F(PublicKeySignWrapperTest, LegacyPrimarySignsDataWithSuffix) {
  std::unique_ptr<PrimitiveSet<PublicKeySign>> sign_set = ToUnique(
      PrimitiveSet<PublicKeySign>::Builder()
          .AddPrimaryPrimitive(absl::make_unique<DummyPublicKeySign>("sign0"),
                               MakeKeyInfo(42, OutputPrefixType::LEGACY))
          .Build());
  absl::StatusOr<std::unique_ptr<PublicKeySign>> sign =
      PublicKeySignWrapper().Wrap(std::move(sign_set));
  ASSERT_THAT(sign, IsOk());
  std::string data_with_suffix = absl::StrCat("data", std::string(1, '\0'));
  EXPECT_THAT((*sign)->Sign("data"),
              IsOkAndHolds(Eq(absl::StrCat(
                  HexDecodeOrDie("000000002a"),
                  DummySignature("sign0", data_with_suffix)))));
}

class AlwaysFailingPublicKeySign : public PublicKeySign {
 public:
  absl::StatusOr<std::string> Sign(absl::string_view data) const override {
    return absl::Status(absl::StatusCode::kInternal, "AlwaysFailingSign");
  }
};

class PublicKeySignWrapperWithMonitoringTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Registry::Reset();
    auto monitoring_client_factory =
        absl::make_unique<internal::MockMonitoringClientFactory>();
    auto monitoring_client =
        absl::make_unique<NiceMock<internal::MockMonitoringClient>>();
    monitoring_client_ = monitoring_client.get();
    EXPECT_CALL(*monitoring_client_factory,
                New(internal::IsContextFor("public_key_sign", "sign")))
        .WillOnce(
            Return(ByMove(absl::StatusOr<
                          std::unique_ptr<internal::MonitoringClient>>(
                std::move(monitoring_client)))));
    ASSERT_THAT(internal::RegistryImpl::GlobalInstance()
                    .RegisterMonitoringClientFactory(
                        std::move(monitoring_client_factory)),
                IsOk());
  }

  ~PublicKeySignWrapperWithMonitoringTest() override { Registry::Reset(); }

  NiceMock<internal::MockMonitoringClient>* monitoring_client_;
};

TEST_F(PublicKeySignWrapperWithMonitoringTest, SuccessIsLogged) {
  std::unique_ptr<PrimitiveSet<PublicKeySign>> sign_set = ToUnique(
      PrimitiveSet<PublicKeySign>::Builder()
          .AddPrimaryPrimitive(absl::make_unique<DummyPublicKeySign>("sign0"),
                               MakeKeyInfo(42, OutputPrefixType::TINK))
          .Build());
  absl::StatusOr<std::unique_ptr<PublicKeySign>> sign =
      PublicKeySignWrapper().Wrap(std::move(sign_set));
  ASSERT_THAT(sign, IsOk());
  std::string data = "some data to sign";
  EXPECT_CALL(*monitoring_client_, Log(42, data.size()));
  EXPECT_THAT((*sign)->Sign(data), IsOk());
}

TEST_F(PublicKeySignWrapperWithMonitoringTest, FailureIsLogged) {
  std::unique_ptr<PrimitiveSet<PublicKeySign>> sign_set = ToUnique(
      PrimitiveSet<PublicKeySign>::Builder()
          .AddPrimaryPrimitive(absl::make_unique<AlwaysFailingPublicKeySign>(),
                               MakeKeyInfo(42, OutputPrefixType::TINK))
          .Build());
  absl::StatusOr<std::unique_ptr<PublicKeySign>> sign =
      PublicKeySignWrapper().Wrap(std::move(sign_set));
  ASSERT_THAT(sign, IsOk());
  EXPECT_CALL(*monitoring_client_, LogFailure());
  EXPECT_THAT((*sign)->Sign("data"), StatusIs(absl::StatusCode::kInternal));
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
