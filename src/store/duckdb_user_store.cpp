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

#include "duckdb_user_store.h"

#include <duckdb.hpp>

#include <vector>

#include <nlohmann/json.hpp>

#include "oauthlink_logging.h"

namespace oauthlink::store {
namespace {

constexpr const char* kSchemaSql = R"(
CREATE TABLE IF NOT EXISTS oauth_users (
  id VARCHAR PRIMARY KEY,
  username VARCHAR NOT NULL,
  discriminator VARCHAR,
  avatar VARCHAR,
  connected_at BIGINT NOT NULL,
  processed BOOLEAN NOT NULL DEFAULT false,
  pulled_resources VARCHAR NOT NULL DEFAULT '[]'
))";

constexpr const char* kUpsertSql =
    "INSERT INTO oauth_users (id, username, discriminator, avatar, connected_at, processed, "
    "pulled_resources) VALUES ($1, $2, $3, $4, $5, false, '[]') "
    "ON CONFLICT (id) DO UPDATE SET username = excluded.username, "
    "discriminator = excluded.discriminator, avatar = excluded.avatar, "
    "connected_at = excluded.connected_at, processed = false, pulled_resources = '[]'";

constexpr const char* kLookupSql =
    "SELECT id, username, discriminator, avatar, connected_at, processed, pulled_resources "
    "FROM oauth_users WHERE id = $1";

duckdb::Value OptionalValue(const std::optional<std::string>& value) {
  return value ? duckdb::Value(*value) : duckdb::Value();
}

std::optional<std::string> OptionalString(const duckdb::Value& value) {
  if (value.IsNull()) return std::nullopt;
  return value.ToString();
}

}  // namespace

DuckDBUserStore::DuckDBUserStore(std::shared_ptr<duckdb::DuckDB> db,
                                 std::unique_ptr<ConnectionPool<duckdb::Connection>> pool,
                                 std::chrono::milliseconds acquire_timeout)
    : db_instance_(std::move(db)),
      pool_(std::move(pool)),
      acquire_timeout_(acquire_timeout) {}

DuckDBUserStore::~DuckDBUserStore() = default;

arrow::Result<std::shared_ptr<DuckDBUserStore>> DuckDBUserStore::Open(
    const StoreOptions& options) {
  const std::string path = options.database_filename.string();
  if (options.pool_size < 1) {
    return arrow::Status::Invalid("DuckDB store pool size must be at least 1, got ",
                                  options.pool_size);
  }

  try {
    duckdb::DBConfig config;
    auto db = std::make_shared<duckdb::DuckDB>(path.empty() ? nullptr : path.c_str(),
                                               &config);

    std::vector<std::unique_ptr<duckdb::Connection>> connections;
    for (int i = 0; i < options.pool_size; ++i) {
      connections.push_back(std::make_unique<duckdb::Connection>(*db));
    }

    auto result = connections.front()->Query(kSchemaSql);
    if (result->HasError()) {
      return arrow::Status::IOError("Failed to initialize DuckDB user store schema: ",
                                    result->GetError());
    }

    OAUTHLINK_LOGKV(INFO, "Opened DuckDB user store", {"kind", "store"},
                    {"backend", "duckdb"}, {"database", path.empty() ? ":memory:" : path},
                    {"pool_size", static_cast<int64_t>(options.pool_size)},
                    {"duckdb_version", std::string(duckdb::DuckDB::LibraryVersion())});

    return std::shared_ptr<DuckDBUserStore>(new DuckDBUserStore(
        std::move(db),
        std::make_unique<ConnectionPool<duckdb::Connection>>(std::move(connections)),
        options.acquire_timeout));
  } catch (const std::exception& ex) {
    return arrow::Status::IOError("Unable to open DuckDB database '", path, "': ", ex.what());
  }
}

arrow::Status DuckDBUserStore::Upsert(const UserRecord& record) {
  ARROW_ASSIGN_OR_RAISE(auto conn, pool_->Acquire(acquire_timeout_));
  try {
    auto stmt = conn->Prepare(kUpsertSql);
    if (stmt->HasError()) {
      return arrow::Status::IOError("DuckDB prepare failed: ", stmt->GetError());
    }
    auto result = stmt->Execute(duckdb::Value(record.id), duckdb::Value(record.username),
                                OptionalValue(record.discriminator),
                                OptionalValue(record.avatar_hash),
                                duckdb::Value::BIGINT(record.connected_at));
    if (result->HasError()) {
      return arrow::Status::IOError("DuckDB upsert of user ", record.id,
                                    " failed: ", result->GetError());
    }
    return arrow::Status::OK();
  } catch (const std::exception& ex) {
    return arrow::Status::IOError("DuckDB upsert of user ", record.id, " failed: ",
                                  ex.what());
  }
}

arrow::Status DuckDBUserStore::Ping() {
  ARROW_ASSIGN_OR_RAISE(auto conn, pool_->Acquire(acquire_timeout_));
  try {
    auto result = conn->Query("SELECT 1");
    if (result->HasError()) {
      return arrow::Status::IOError("DuckDB ping failed: ", result->GetError());
    }
    return arrow::Status::OK();
  } catch (const std::exception& ex) {
    return arrow::Status::IOError("DuckDB ping failed: ", ex.what());
  }
}

arrow::Result<std::optional<UserRecord>> DuckDBUserStore::Lookup(const std::string& id) {
  ARROW_ASSIGN_OR_RAISE(auto conn, pool_->Acquire(acquire_timeout_));
  try {
    auto stmt = conn->Prepare(kLookupSql);
    if (stmt->HasError()) {
      return arrow::Status::IOError("DuckDB prepare failed: ", stmt->GetError());
    }
    auto result = stmt->Execute(duckdb::Value(id));
    if (result->HasError()) {
      return arrow::Status::IOError("DuckDB lookup of user ", id,
                                    " failed: ", result->GetError());
    }

    auto chunk = result->Fetch();
    if (!chunk || chunk->size() == 0) {
      return std::nullopt;
    }

    UserRecord record;
    record.id = chunk->GetValue(0, 0).ToString();
    record.username = chunk->GetValue(1, 0).ToString();
    record.discriminator = OptionalString(chunk->GetValue(2, 0));
    record.avatar_hash = OptionalString(chunk->GetValue(3, 0));
    record.connected_at = chunk->GetValue(4, 0).GetValue<int64_t>();
    record.processed = chunk->GetValue(5, 0).GetValue<bool>();

    auto resources = nlohmann::json::parse(chunk->GetValue(6, 0).ToString(), nullptr,
                                           /*allow_exceptions=*/false);
    if (resources.is_array()) {
      for (const auto& item : resources) {
        record.pulled_resources.push_back(item.is_string() ? item.get<std::string>()
                                                           : item.dump());
      }
    }
    return record;
  } catch (const std::exception& ex) {
    return arrow::Status::IOError("DuckDB lookup of user ", id, " failed: ", ex.what());
  }
}

}  // namespace oauthlink::store
