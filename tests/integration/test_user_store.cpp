// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "store/duckdb_user_store.h"
#include "store/sqlite_user_store.h"
#include "store/user_store.h"
#include "test_util.h"

namespace fs = std::filesystem;

using oauthlink::store::BackendType;
using oauthlink::store::BackendTypeFromString;
using oauthlink::store::BackendTypeToString;
using oauthlink::store::DuckDBUserStore;
using oauthlink::store::OpenUserStore;
using oauthlink::store::OpenUserStoreOrDegrade;
using oauthlink::store::SqliteConnection;
using oauthlink::store::SqliteUserStore;
using oauthlink::store::StoreOptions;
using oauthlink::store::UserRecord;
using oauthlink::store::UserStore;

namespace {

UserRecord Alice(int64_t connected_at) {
  return UserRecord{.id = "123",
                    .username = "alice",
                    .discriminator = "0",
                    .avatar_hash = "a_1234",
                    .connected_at = connected_at};
}

void RemoveDatabase(const fs::path& path) {
  std::error_code ec;
  for (const char* suffix : {"", "-wal", "-shm", ".wal"}) {
    fs::remove(path.string() + suffix, ec);
  }
}

}  // namespace

// ============================================================================
// Behaviour shared by every real backend
// ============================================================================

class UserStoreBackendTest : public ::testing::TestWithParam<BackendType> {
 protected:
  void SetUp() override {
    db_path_ = fs::temp_directory_path() /
               ("oauthlink_store_test_" + BackendTypeToString(GetParam()) + ".db");
    RemoveDatabase(db_path_);

    StoreOptions options{.backend = GetParam(), .database_filename = db_path_, .pool_size = 2};
    ASSERT_ARROW_OK_AND_ASSIGN(store_, OpenUserStore(options));
  }

  void TearDown() override {
    store_.reset();
    RemoveDatabase(db_path_);
  }

  fs::path db_path_;
  std::shared_ptr<UserStore> store_;
};

TEST_P(UserStoreBackendTest, ReportsBackendAndPings) {
  EXPECT_EQ(store_->backend(), GetParam());
  ASSERT_ARROW_OK(store_->Ping());
}

TEST_P(UserStoreBackendTest, UpsertInsertsFreshRecord) {
  ASSERT_ARROW_OK(store_->Upsert(Alice(1700000000)));

  std::optional<UserRecord> row;
  ASSERT_ARROW_OK_AND_ASSIGN(row, store_->Lookup("123"));
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->id, "123");
  EXPECT_EQ(row->username, "alice");
  EXPECT_EQ(row->discriminator, "0");
  EXPECT_EQ(row->avatar_hash, "a_1234");
  EXPECT_EQ(row->connected_at, 1700000000);
  EXPECT_FALSE(row->processed);
  EXPECT_TRUE(row->pulled_resources.empty());
}

TEST_P(UserStoreBackendTest, UpsertReplacesExistingRecord) {
  ASSERT_ARROW_OK(store_->Upsert(Alice(1700000000)));

  auto relinked = Alice(1700009999);
  relinked.username = "alice_renamed";
  relinked.avatar_hash.reset();
  relinked.processed = true;  // ignored by the store
  relinked.pulled_resources = {"ignored"};
  ASSERT_ARROW_OK(store_->Upsert(relinked));

  std::optional<UserRecord> row;
  ASSERT_ARROW_OK_AND_ASSIGN(row, store_->Lookup("123"));
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->username, "alice_renamed");
  EXPECT_FALSE(row->avatar_hash.has_value());
  EXPECT_EQ(row->connected_at, 1700009999);
  EXPECT_FALSE(row->processed);
  EXPECT_TRUE(row->pulled_resources.empty());
}

TEST_P(UserStoreBackendTest, LookupOfUnknownIdIsEmpty) {
  std::optional<UserRecord> row;
  ASSERT_ARROW_OK_AND_ASSIGN(row, store_->Lookup("does-not-exist"));
  EXPECT_FALSE(row.has_value());
}

INSTANTIATE_TEST_SUITE_P(Backends, UserStoreBackendTest,
                         ::testing::Values(BackendType::sqlite, BackendType::duckdb),
                         [](const ::testing::TestParamInfo<BackendType>& info) {
                           return BackendTypeToString(info.param);
                         });

// ============================================================================
// SQLite: the polling consumer shares the file
// ============================================================================

TEST(SqliteUserStoreTest, RelinkResetsConsumerState) {
  auto db_path = fs::temp_directory_path() / "oauthlink_consumer_test.db";
  RemoveDatabase(db_path);

  std::shared_ptr<UserStore> store;
  ASSERT_ARROW_OK_AND_ASSIGN(
      store, OpenUserStore({.backend = BackendType::sqlite, .database_filename = db_path}));
  ASSERT_ARROW_OK(store->Upsert(Alice(1700000000)));

  // The consumer marks the user processed on its own connection
  {
    std::unique_ptr<SqliteConnection> consumer;
    ASSERT_ARROW_OK_AND_ASSIGN(consumer, SqliteConnection::Open(db_path.string()));
    ASSERT_ARROW_OK(consumer->Exec(
        R"(UPDATE oauth_users SET processed = 1, pulled_resources = '["guilds","roles"]')"));
  }

  std::optional<UserRecord> row;
  ASSERT_ARROW_OK_AND_ASSIGN(row, store->Lookup("123"));
  ASSERT_TRUE(row.has_value());
  EXPECT_TRUE(row->processed);
  EXPECT_EQ(row->pulled_resources, (std::vector<std::string>{"guilds", "roles"}));

  ASSERT_ARROW_OK(store->Upsert(Alice(1700000500)));
  ASSERT_ARROW_OK_AND_ASSIGN(row, store->Lookup("123"));
  ASSERT_TRUE(row.has_value());
  EXPECT_FALSE(row->processed);
  EXPECT_TRUE(row->pulled_resources.empty());
  EXPECT_EQ(row->connected_at, 1700000500);

  store.reset();
  RemoveDatabase(db_path);
}

TEST(SqliteUserStoreTest, ConcurrentUpsertsAcrossPooledConnections) {
  auto db_path = fs::temp_directory_path() / "oauthlink_concurrency_test.db";
  RemoveDatabase(db_path);

  std::shared_ptr<UserStore> store;
  ASSERT_ARROW_OK_AND_ASSIGN(store, OpenUserStore({.backend = BackendType::sqlite,
                                                    .database_filename = db_path,
                                                    .pool_size = 3}));

  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10; ++i) {
        UserRecord record{.id = std::to_string(t * 100 + i),
                          .username = "user" + std::to_string(i),
                          .connected_at = 1700000000 + i};
        if (!store->Upsert(record).ok()) ++failures;
      }
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_EQ(failures.load(), 0);

  std::optional<UserRecord> row;
  ASSERT_ARROW_OK_AND_ASSIGN(row, store->Lookup("309"));
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->username, "user9");

  store.reset();
  RemoveDatabase(db_path);
}

TEST(SqliteUserStoreTest, InMemoryDatabaseWorks) {
  std::shared_ptr<UserStore> store;
  ASSERT_ARROW_OK_AND_ASSIGN(
      store, OpenUserStore({.backend = BackendType::sqlite,
                            .database_filename = ":memory:",
                            .pool_size = 4}));
  ASSERT_ARROW_OK(store->Upsert(Alice(1)));

  std::optional<UserRecord> row;
  ASSERT_ARROW_OK_AND_ASSIGN(row, store->Lookup("123"));
  EXPECT_TRUE(row.has_value());
}

// ============================================================================
// Degraded and unconfigured stores
// ============================================================================

TEST(UserStoreOpenTest, NoneBackendIsUnavailable) {
  std::shared_ptr<UserStore> store;
  ASSERT_ARROW_OK_AND_ASSIGN(store, OpenUserStore({.backend = BackendType::none}));

  EXPECT_EQ(store->backend(), BackendType::none);
  EXPECT_TRUE(store->Ping().IsIOError());
  auto status = store->Upsert(Alice(1));
  EXPECT_TRUE(status.IsIOError());
  EXPECT_NE(status.message().find("unavailable"), std::string::npos);
}

TEST(UserStoreOpenTest, UnopenableDatabaseDegrades) {
  StoreOptions options{.backend = BackendType::sqlite,
                       .database_filename = "/nonexistent-dir/oauthlink/users.db"};
  EXPECT_FALSE(OpenUserStore(options).ok());

  auto store = OpenUserStoreOrDegrade(options);
  ASSERT_NE(store, nullptr);
  EXPECT_EQ(store->backend(), BackendType::none);
  EXPECT_TRUE(store->Upsert(Alice(1)).IsIOError());
}

TEST(UserStoreOpenTest, RejectsEmptyPool) {
  auto result = OpenUserStore({.backend = BackendType::sqlite,
                               .database_filename = ":memory:",
                               .pool_size = 0});
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.status().IsInvalid());
}

TEST(UserStoreOpenTest, BackendFactoriesRejectEmptyPool) {
  StoreOptions options{.backend = BackendType::duckdb,
                       .database_filename = ":memory:",
                       .pool_size = 0};
  auto duckdb_store = DuckDBUserStore::Open(options);
  ASSERT_FALSE(duckdb_store.ok());
  EXPECT_TRUE(duckdb_store.status().IsInvalid());

  options.backend = BackendType::sqlite;
  options.pool_size = -2;
  auto sqlite_store = SqliteUserStore::Open(options);
  ASSERT_FALSE(sqlite_store.ok());
  EXPECT_TRUE(sqlite_store.status().IsInvalid());
}

TEST(BackendTypeTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(BackendTypeFromString("SQLite").ValueOrDie(), BackendType::sqlite);
  EXPECT_EQ(BackendTypeFromString("duckdb").ValueOrDie(), BackendType::duckdb);
  EXPECT_EQ(BackendTypeFromString("none").ValueOrDie(), BackendType::none);
  EXPECT_TRUE(BackendTypeFromString("mysql").status().IsInvalid());
}
