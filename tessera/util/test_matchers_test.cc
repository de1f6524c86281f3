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

#include "tessera/util/test_matchers.h"

#include <cstdint>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace crypto {
namespace tessera {
namespace test {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Not;

TEST(TestMatchersTest, StatusOrHoldingKeyId) {
  absl::StatusOr<uint32_t> key_id = 42u;
  EXPECT_THAT(key_id, IsOk());
  EXPECT_THAT(key_id, IsOkAndHolds(Eq(42u)));
  EXPECT_THAT(key_id, Not(IsOkAndHolds(Eq(43u))));
  EXPECT_THAT(key_id, StatusIs(absl::StatusCode::kOk));
  EXPECT_THAT(key_id, Not(StatusIs(absl::StatusCode::kNotFound)));
}

TEST(TestMatchersTest, StatusOrHoldingError) {
  absl::StatusOr<std::string> plaintext =
      absl::Status(absl::StatusCode::kUnauthenticated, "decryption failed");
  EXPECT_THAT(plaintext, Not(IsOk()));
  EXPECT_THAT(plaintext, Not(IsOkAndHolds(Eq(""))));
  EXPECT_THAT(plaintext, StatusIs(absl::StatusCode::kUnauthenticated));
  EXPECT_THAT(plaintext, Not(StatusIs(absl::StatusCode::kOk)));
}

TEST(TestMatchersTest, PlainStatus) {
  EXPECT_THAT(absl::OkStatus(), IsOk());
  EXPECT_THAT(absl::OkStatus(), StatusIs(absl::StatusCode::kOk));

  absl::Status primary_disabled(absl::StatusCode::kFailedPrecondition,
                                "cannot disable the primary key");
  EXPECT_THAT(primary_disabled, Not(IsOk()));
  EXPECT_THAT(primary_disabled,
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(primary_disabled,
              Not(StatusIs(absl::StatusCode::kInvalidArgument)));
}

TEST(TestMatchersTest, StatusIsMatchesMessage) {
  absl::Status status(absl::StatusCode::kNotFound, "no key 42");
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kNotFound, HasSubstr("42")));
  EXPECT_THAT(status,
              Not(StatusIs(absl::StatusCode::kNotFound, HasSubstr("43"))));
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kNotFound,
                               std::string("no key 42")));
}

}  // namespace
}  // namespace test
}  // namespace tessera
}  // namespace crypto
