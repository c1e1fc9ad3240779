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

#include "sqlite_user_store.h"

#include <sqlite3.h>

#include <vector>

#include <nlohmann/json.hpp>

#include "oauthlink_logging.h"

namespace oauthlink::store {
namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kCreateTableSql = R"(
CREATE TABLE IF NOT EXISTS oauth_users (
  id TEXT PRIMARY KEY,
  username TEXT NOT NULL,
  discriminator TEXT,
  avatar TEXT,
  connected_at INTEGER NOT NULL,
  processed INTEGER NOT NULL DEFAULT 0,
  pulled_resources TEXT NOT NULL DEFAULT '[]'
))";

constexpr const char* kUpsertSql = R"(
INSERT INTO oauth_users (id, username, discriminator, avatar, connected_at, processed,
                         pulled_resources)
VALUES (?1, ?2, ?3, ?4, ?5, 0, '[]')
ON CONFLICT(id) DO UPDATE SET
  username = excluded.username,
  discriminator = excluded.discriminator,
  avatar = excluded.avatar,
  connected_at = excluded.connected_at,
  processed = 0,
  pulled_resources = '[]')";

constexpr const char* kLookupSql = R"(
SELECT id, username, discriminator, avatar, connected_at, processed, pulled_resources
FROM oauth_users WHERE id = ?1)";

// Finalizes the statement on scope exit.
struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

arrow::Result<StatementPtr> Prepare(SqliteConnection& conn, const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(conn.db(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return arrow::Status::IOError("SQLite prepare failed: ", conn.ErrorMessage());
  }
  return StatementPtr(stmt);
}

arrow::Status BindText(SqliteConnection& conn, sqlite3_stmt* stmt, int index,
                       const std::optional<std::string>& value) {
  int rc = value ? sqlite3_bind_text(stmt, index, value->c_str(),
                                     static_cast<int>(value->size()), SQLITE_TRANSIENT)
                 : sqlite3_bind_null(stmt, index);
  if (rc != SQLITE_OK) {
    return arrow::Status::IOError("SQLite bind of parameter ", index,
                                  " failed: ", conn.ErrorMessage());
  }
  return arrow::Status::OK();
}

std::optional<std::string> ColumnText(sqlite3_stmt* stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

std::vector<std::string> ParseResourceList(const std::string& text) {
  std::vector<std::string> out;
  auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (!parsed.is_array()) return out;
  for (const auto& item : parsed) {
    out.push_back(item.is_string() ? item.get<std::string>() : item.dump());
  }
  return out;
}

}  // namespace

arrow::Result<std::unique_ptr<SqliteConnection>> SqliteConnection::Open(
    const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    return arrow::Status::IOError("Unable to open SQLite database '", path, "': ", msg);
  }

  std::unique_ptr<SqliteConnection> conn(new SqliteConnection(db));
  sqlite3_busy_timeout(db, kBusyTimeoutMs);
  ARROW_RETURN_NOT_OK(conn->Exec("PRAGMA journal_mode=WAL"));
  return conn;
}

SqliteConnection::~SqliteConnection() { sqlite3_close(db_); }

arrow::Status SqliteConnection::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : ErrorMessage();
    sqlite3_free(err);
    return arrow::Status::IOError("SQLite statement failed: ", msg);
  }
  return arrow::Status::OK();
}

std::string SqliteConnection::ErrorMessage() const { return sqlite3_errmsg(db_); }

arrow::Result<std::shared_ptr<SqliteUserStore>> SqliteUserStore::Open(
    const StoreOptions& options) {
  const std::string path = options.database_filename.string();
  if (path.empty()) {
    return arrow::Status::Invalid("SQLite store requires a database filename");
  }

  if (options.pool_size < 1) {
    return arrow::Status::Invalid("SQLite store pool size must be at least 1, got ",
                                  options.pool_size);
  }

  // Every connection to ":memory:" is a separate database.
  int pool_size = options.pool_size;
  if (path == ":memory:" && pool_size != 1) {
    OAUTHLINK_LOG(WARNING) << "In-memory SQLite store: reducing pool size from "
                           << pool_size << " to 1";
    pool_size = 1;
  }

  std::vector<std::unique_ptr<SqliteConnection>> connections;
  for (int i = 0; i < pool_size; ++i) {
    ARROW_ASSIGN_OR_RAISE(auto conn, SqliteConnection::Open(path));
    if (i == 0) {
      ARROW_RETURN_NOT_OK(conn->Exec(kCreateTableSql));
    }
    connections.push_back(std::move(conn));
  }

  OAUTHLINK_LOGKV(INFO, "Opened SQLite user store", {"kind", "store"},
                  {"backend", "sqlite"}, {"database", path},
                  {"pool_size", static_cast<int64_t>(pool_size)});

  return std::shared_ptr<SqliteUserStore>(new SqliteUserStore(
      std::make_unique<ConnectionPool<SqliteConnection>>(std::move(connections)),
      options.acquire_timeout));
}

arrow::Status SqliteUserStore::Upsert(const UserRecord& record) {
  ARROW_ASSIGN_OR_RAISE(auto conn, pool_->Acquire(acquire_timeout_));
  ARROW_ASSIGN_OR_RAISE(auto stmt, Prepare(*conn, kUpsertSql));

  ARROW_RETURN_NOT_OK(BindText(*conn, stmt.get(), 1, record.id));
  ARROW_RETURN_NOT_OK(BindText(*conn, stmt.get(), 2, record.username));
  ARROW_RETURN_NOT_OK(BindText(*conn, stmt.get(), 3, record.discriminator));
  ARROW_RETURN_NOT_OK(BindText(*conn, stmt.get(), 4, record.avatar_hash));
  if (sqlite3_bind_int64(stmt.get(), 5, record.connected_at) != SQLITE_OK) {
    return arrow::Status::IOError("SQLite bind of connected_at failed: ",
                                  conn->ErrorMessage());
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return arrow::Status::IOError("SQLite upsert of user ", record.id,
                                  " failed: ", conn->ErrorMessage());
  }
  return arrow::Status::OK();
}

arrow::Status SqliteUserStore::Ping() {
  ARROW_ASSIGN_OR_RAISE(auto conn, pool_->Acquire(acquire_timeout_));
  return conn->Exec("SELECT 1");
}

arrow::Result<std::optional<UserRecord>> SqliteUserStore::Lookup(const std::string& id) {
  ARROW_ASSIGN_OR_RAISE(auto conn, pool_->Acquire(acquire_timeout_));
  ARROW_ASSIGN_OR_RAISE(auto stmt, Prepare(*conn, kLookupSql));
  ARROW_RETURN_NOT_OK(BindText(*conn, stmt.get(), 1, id));

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    return arrow::Status::IOError("SQLite lookup of user ", id,
                                  " failed: ", conn->ErrorMessage());
  }

  UserRecord record;
  record.id = ColumnText(stmt.get(), 0).value_or("");
  record.username = ColumnText(stmt.get(), 1).value_or("");
  record.discriminator = ColumnText(stmt.get(), 2);
  record.avatar_hash = ColumnText(stmt.get(), 3);
  record.connected_at = sqlite3_column_int64(stmt.get(), 4);
  record.processed = sqlite3_column_int(stmt.get(), 5) != 0;
  record.pulled_resources = ParseResourceList(ColumnText(stmt.get(), 6).value_or("[]"));
  return record;
}

}  // namespace oauthlink::store
