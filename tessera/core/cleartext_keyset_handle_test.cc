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

#include "tessera/cleartext_keyset_handle.h"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "tessera/keyset_handle.h"
#include "tessera/util/test_matchers.h"
#include "tessera/util/test_util.h"
#include "proto/aes_gcm.pb.h"
#include "proto/tessera.pb.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::proto::AesGcmKey;
using ::crypto::tessera::proto::KeyData;
using ::crypto::tessera::proto::Keyset;
using ::crypto::tessera::proto::KeyStatusType;
using ::crypto::tessera::test::AddLegacyKey;
using ::crypto::tessera::test::AddRawKey;
using ::crypto::tessera::test::AddTinkKey;
using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::StatusIs;
using ::testing::Eq;

TEST(CleartextKeysetHandleTest, GetKeysetHandle) {
  Keyset keyset;
  AesGcmKey key;
  AddTinkKey("some key type", 42, key, KeyStatusType::ENABLED,
             KeyData::SYMMETRIC, &keyset);
  AddRawKey("some other key type", 711, key, KeyStatusType::ENABLED,
            KeyData::SYMMETRIC, &keyset);
  AddLegacyKey("some other key type", 7213743, key, KeyStatusType::DISABLED,
               KeyData::SYMMETRIC, &keyset);
  keyset.set_primary_key_id(42);

  absl::StatusOr<std::unique_ptr<KeysetHandle>> handle =
      CleartextKeysetHandle::GetKeysetHandle(keyset);
  ASSERT_THAT(handle, IsOk());
  EXPECT_THAT(CleartextKeysetHandle::GetKeyset(**handle).SerializeAsString(),
              Eq(keyset.SerializeAsString()));
  EXPECT_THAT((*handle)->size(), Eq(3));
}

TEST(CleartextKeysetHandleTest, GetKeysetHandleRejectsInvalidKeyset) {
  EXPECT_THAT(CleartextKeysetHandle::GetKeysetHandle(Keyset()).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));

  Keyset keyset;
  AddTinkKey("some key type", 42, AesGcmKey(), KeyStatusType::DISABLED,
             KeyData::SYMMETRIC, &keyset);
  keyset.set_primary_key_id(42);
  EXPECT_THAT(CleartextKeysetHandle::GetKeysetHandle(keyset).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
