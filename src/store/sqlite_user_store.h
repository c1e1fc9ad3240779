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

#pragma once

#include <memory>
#include <string>

#include <arrow/result.h>
#include <arrow/status.h>

#include "connection_pool.h"
#include "user_store.h"

struct sqlite3;

namespace oauthlink::store {

/// Owns one sqlite3 handle; closed on destruction.
class SqliteConnection {
 public:
  static arrow::Result<std::unique_ptr<SqliteConnection>> Open(const std::string& path);

  ~SqliteConnection();

  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  /// Run statements without result rows.
  arrow::Status Exec(const std::string& sql);

  sqlite3* db() { return db_; }

  /// Last error message reported by this handle.
  std::string ErrorMessage() const;

 private:
  explicit SqliteConnection(sqlite3* db) : db_(db) {}

  sqlite3* db_;
};

/// User store on a SQLite file in WAL mode, so the polling consumer can read while
/// request threads write.
class SqliteUserStore : public UserStore {
 public:
  static arrow::Result<std::shared_ptr<SqliteUserStore>> Open(const StoreOptions& options);

  arrow::Status Upsert(const UserRecord& record) override;
  arrow::Status Ping() override;
  arrow::Result<std::optional<UserRecord>> Lookup(const std::string& id) override;
  BackendType backend() const override { return BackendType::sqlite; }

 private:
  SqliteUserStore(std::unique_ptr<ConnectionPool<SqliteConnection>> pool,
                  std::chrono::milliseconds acquire_timeout)
      : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

  std::unique_ptr<ConnectionPool<SqliteConnection>> pool_;
  std::chrono::milliseconds acquire_timeout_;
};

}  // namespace oauthlink::store
