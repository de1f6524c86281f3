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

#include "tessera/mac/mac_wrapper.h"

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
#include "tessera/crypto_format.h"
#include "tessera/internal/monitoring.h"
#include "tessera/internal/monitoring_client_mocks.h"
#include "tessera/internal/registry_impl.h"
#include "tessera/mac.h"
#include "tessera/primitive_set.h"
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
using ::crypto::tessera::test::DummyMac;
using ::crypto::tessera::test::HexDecodeOrDie;
using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::IsOkAndHolds;
using ::crypto::tessera::test::StatusIs;
using ::testing::ByMove;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;

KeysetInfo::KeyInfo MakeKeyInfo(uint32_t key_id,
                                OutputPrefixType output_prefix_type) {
  KeysetInfo::KeyInfo key_info;
  key_info.set_output_prefix_type(output_prefix_type);
  key_info.set_key_id(key_id);
  key_info.set_status(KeyStatusType::ENABLED);
  key_info.set_type_url("some_mac_key_type");
  return key_info;
}

std::unique_ptr<PrimitiveSet<Mac>> ToUnique(
    absl::StatusOr<PrimitiveSet<Mac>> primitive_set) {
  EXPECT_THAT(primitive_set, IsOk());
  return absl::make_unique<PrimitiveSet<Mac>>(*std::move(primitive_set));
}

class MacWrapperTest : public ::testing::Test {
 protected:
  void SetUp() override { Registry::Reset(); }
  void TearDown() override { Registry::Reset(); }
};

TEST_F(MacWrapperTest, WrapNullptr) {
  EXPECT_THAT(MacWrapper().Wrap(nullptr),
              StatusIs(absl::StatusCode::kInternal, HasSubstr("non-NULL")));
}

TEST_F(MacWrapperTest, WrapEmpty) {
  EXPECT_THAT(
      MacWrapper().Wrap(ToUnique(PrimitiveSet<Mac>::Builder().Build())),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("no primary")));
}

TEST_F(MacWrapperTest, Basic) {
  std::unique_ptr<PrimitiveSet<Mac>> mac_set =
      ToUnique(PrimitiveSet<Mac>::Builder()
                   .AddPrimitive(absl::make_unique<DummyMac>("mac0"),
                                 MakeKeyInfo(1234543, OutputPrefixType::TINK))
                   .AddPrimitive(absl::make_unique<DummyMac>("mac1"),
                                 MakeKeyInfo(726329, OutputPrefixType::LEGACY))
                   .AddPrimaryPrimitive(absl::make_unique<DummyMac>("mac2"),
                                        MakeKeyInfo(7213743,
                                                    OutputPrefixType::TINK))
                   .Build());
  absl::StatusOr<std::unique_ptr<Mac>> mac =
      MacWrapper().Wrap(std::move(mac_set));
  ASSERT_THAT(mac, IsOk());

  std::string data = "some_data_for_mac";
  absl::StatusOr<std::string> mac_value = (*mac)->ComputeMac(data);
  ASSERT_THAT(mac_value, IsOk());
  EXPECT_THAT(*mac_value,
              Eq(absl::StrCat(HexDecodeOrDie("01006e12af"),
                              DummyMac("mac2").ComputeMac(data).value())));
  EXPECT_THAT((*mac)->VerifyMac(*mac_value, data), IsOk());
  EXPECT_THAT((*mac)->VerifyMac(*mac_value, "some bad data"),
              StatusIs(absl::StatusCode::kUnauthenticated,
                       HasSubstr("verification failed")));
  EXPECT_THAT((*mac)->VerifyMac("some bad mac value", data),
              StatusIs(absl::StatusCode::kUnauthenticated));
}

TEST_F(MacWrapperTest, LegacyKeysMacTheDataWithSuffix) {
  std::unique_ptr<PrimitiveSet<Mac>> mac_set =
      ToUnique(PrimitiveSet<Mac>::Builder()
                   .AddPrimaryPrimitive(absl::make_unique<DummyMac>("mac0"),
                                        MakeKeyInfo(42,
                                                    OutputPrefixType::LEGACY))
                   .Build());
  absl::StatusOr<std::unique_ptr<Mac>> mac =
      MacWrapper().Wrap(std::move(mac_set));
  ASSERT_THAT(mac, IsOk());

  std::string data = "some data";
  absl::StatusOr<std::string> mac_value = (*mac)->ComputeMac(data);
  ASSERT_THAT(mac_value, IsOk());
  std::string data_with_suffix = absl::StrCat(data, std::string(1, '\0'));
  EXPECT_THAT(
      *mac_value,
      Eq(absl::StrCat(HexDecodeOrDie("000000002a"),
                      DummyMac("mac0").ComputeMac(data_with_suffix).value())));
  EXPECT_THAT((*mac)->VerifyMac(*mac_value, data), IsOk());

  // A MAC over the data without the suffix does not verify.
  std::string without_suffix =
      absl::StrCat(HexDecodeOrDie("000000002a"),
                   DummyMac("mac0").ComputeMac(data).value());
  EXPECT_THAT((*mac)->VerifyMac(without_suffix, data),
              StatusIs(absl::StatusCode::kUnauthenticated));
}

TEST_F(MacWrapperTest, CrunchyKeysDoNotAppendSuffix) {
  std::unique_ptr<PrimitiveSet<Mac>> mac_set =
      ToUnique(PrimitiveSet<Mac>::Builder()
                   .AddPrimaryPrimitive(absl::make_unique<DummyMac>("mac0"),
                                        MakeKeyInfo(42,
                                                    OutputPrefixType::CRUNCHY))
                   .Build());
  absl::StatusOr<std::unique_ptr<Mac>> mac =
      MacWrapper().Wrap(std::move(mac_set));
  ASSERT_THAT(mac, IsOk());
  EXPECT_THAT((*mac)->ComputeMac("data"),
              IsOkAndHolds(Eq(absl::StrCat(
                  HexDecodeOrDie("000000002a"),
                  DummyMac("mac0").ComputeMac("data").value()))));
}

TEST_F(MacWrapperTest, RawKeysAreTriedLast) {
  std::unique_ptr<PrimitiveSet<Mac>> mac_set =
      ToUnique(PrimitiveSet<Mac>::Builder()
                   .AddPrimaryPrimitive(absl::make_unique<DummyMac>("mac0"),
                                        MakeKeyInfo(42, OutputPrefixType::TINK))
                   .AddPrimitive(absl::make_unique<DummyMac>("mac1"),
                                 MakeKeyInfo(43, OutputPrefixType::RAW))
                   .AddPrimitive(absl::make_unique<DummyMac>("mac2"),
                                 MakeKeyInfo(44, OutputPrefixType::RAW))
                   .Build());
  absl::StatusOr<std::unique_ptr<Mac>> mac =
      MacWrapper().Wrap(std::move(mac_set));
  ASSERT_THAT(mac, IsOk());
  std::string data = "data";
  EXPECT_THAT((*mac)->VerifyMac(DummyMac("mac2").ComputeMac(data).value(),
                                data),
              IsOk());
  EXPECT_THAT((*mac)->VerifyMac(DummyMac("mac3").ComputeMac(data).value(),
                                data),
              StatusIs(absl::StatusCode::kUnauthenticated));
}

// Tests for the monitoring behavior.
class MacWrapperWithMonitoringTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Registry::Reset();
    auto monitoring_client_factory =
        absl::make_unique<internal::MockMonitoringClientFactory>();
    auto compute_monitoring_client =
        absl::make_unique<NiceMock<internal::MockMonitoringClient>>();
    compute_monitoring_client_ = compute_monitoring_client.get();
    auto verify_monitoring_client =
        absl::make_unique<NiceMock<internal::MockMonitoringClient>>();
    verify_monitoring_client_ = verify_monitoring_client.get();

    EXPECT_CALL(*monitoring_client_factory,
                New(internal::IsContextFor("mac", "compute")))
        .WillOnce(
            Return(ByMove(absl::StatusOr<
                          std::unique_ptr<internal::MonitoringClient>>(
                std::move(compute_monitoring_client)))));
    EXPECT_CALL(*monitoring_client_factory,
                New(internal::IsContextFor("mac", "verify")))
        .WillOnce(
            Return(ByMove(absl::StatusOr<
                          std::unique_ptr<internal::MonitoringClient>>(
                std::move(verify_monitoring_client)))));

    ASSERT_THAT(internal::RegistryImpl::GlobalInstance()
                    .RegisterMonitoringClientFactory(
                        std::move(monitoring_client_factory)),
                IsOk());
  }

  ~MacWrapperWithMonitoringTest() override { Registry::Reset(); }

  NiceMock<internal::MockMonitoringClient>* compute_monitoring_client_;
  NiceMock<internal::MockMonitoringClient>* verify_monitoring_client_;
};

TEST_F(MacWrapperWithMonitoringTest, ComputeAndVerifyAreLogged) {
  std::unique_ptr<PrimitiveSet<Mac>> mac_set =
      ToUnique(PrimitiveSet<Mac>::Builder()
                   .AddPrimaryPrimitive(absl::make_unique<DummyMac>("mac0"),
                                        MakeKeyInfo(42, OutputPrefixType::TINK))
                   .Build());
  absl::StatusOr<std::unique_ptr<Mac>> mac =
      MacWrapper().Wrap(std::move(mac_set));
  ASSERT_THAT(mac, IsOk());

  std::string data = "some data";
  EXPECT_CALL(*compute_monitoring_client_, Log(42, data.size()));
  absl::StatusOr<std::string> mac_value = (*mac)->ComputeMac(data);
  ASSERT_THAT(mac_value, IsOk());

  EXPECT_CALL(*verify_monitoring_client_, Log(42, data.size()));
  EXPECT_THAT((*mac)->VerifyMac(*mac_value, data), IsOk());

  EXPECT_CALL(*verify_monitoring_client_, LogFailure());
  EXPECT_THAT((*mac)->VerifyMac(*mac_value, "other data"), Not(IsOk()));
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
