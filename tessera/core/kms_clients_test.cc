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

#include "tessera/kms_clients.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "tessera/aead.h"
#include "tessera/kms_client.h"
#include "tessera/util/test_matchers.h"
#include "tessera/util/test_util.h"

namespace crypto {
namespace tessera {
namespace {

using ::crypto::tessera::test::DummyAead;
using ::crypto::tessera::test::IsOk;
using ::crypto::tessera::test::StatusIs;
using ::testing::Eq;

// A KmsClient that supports all key URIs starting with a given prefix.
class DummyKmsClient : public KmsClient {
 public:
  explicit DummyKmsClient(absl::string_view uri_prefix)
      : uri_prefix_(uri_prefix) {}

  bool DoesSupport(absl::string_view key_uri) const override {
    return absl::StartsWith(key_uri, uri_prefix_);
  }

  absl::StatusOr<std::unique_ptr<Aead>> GetAead(
      absl::string_view key_uri) const override {
    if (!DoesSupport(key_uri)) {
      return absl::Status(absl::StatusCode::kInvalidArgument,
                          "key_uri not supported");
    }
    return {absl::make_unique<DummyAead>(uri_prefix_)};
  }

  const std::string& uri_prefix() const { return uri_prefix_; }

 private:
  std::string uri_prefix_;
};

TEST(KmsClientsTest, Basic) {
  ASSERT_THAT(KmsClients::Add(absl::make_unique<DummyKmsClient>("prefix1")),
              IsOk());
  ASSERT_THAT(KmsClients::Add(absl::make_unique<DummyKmsClient>("prefix2")),
              IsOk());

  absl::StatusOr<const KmsClient*> client1 =
      KmsClients::Get("prefix1:some_key");
  ASSERT_THAT(client1, IsOk());
  EXPECT_THAT(static_cast<const DummyKmsClient*>(*client1)->uri_prefix(),
              Eq("prefix1"));

  absl::StatusOr<const KmsClient*> client2 =
      KmsClients::Get("prefix2:other_key");
  ASSERT_THAT(client2, IsOk());
  EXPECT_THAT(static_cast<const DummyKmsClient*>(*client2)->uri_prefix(),
              Eq("prefix2"));
}

TEST(KmsClientsTest, FirstMatchingClientWins) {
  ASSERT_THAT(KmsClients::Add(absl::make_unique<DummyKmsClient>("first")),
              IsOk());
  ASSERT_THAT(
      KmsClients::Add(absl::make_unique<DummyKmsClient>("first:second")),
      IsOk());
  absl::StatusOr<const KmsClient*> client =
      KmsClients::Get("first:second:key");
  ASSERT_THAT(client, IsOk());
  EXPECT_THAT(static_cast<const DummyKmsClient*>(*client)->uri_prefix(),
              Eq("first"));
}

TEST(KmsClientsTest, NoMatchingClient) {
  EXPECT_THAT(KmsClients::Get("unknown-kms://some_key").status(),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(KmsClientsTest, EmptyKeyUri) {
  EXPECT_THAT(KmsClients::Get("").status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(KmsClientsTest, AddNull) {
  EXPECT_THAT(KmsClients::Add(nullptr),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace tessera
}  // namespace crypto
