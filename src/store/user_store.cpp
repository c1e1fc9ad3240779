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

#include "user_store.h"

#include "duckdb_user_store.h"
#include "oauthlink_logging.h"
#include "sqlite_user_store.h"

namespace oauthlink::store {

std::string BackendTypeToString(BackendType backend) {
  switch (backend) {
    case BackendType::none:
      return "none";
    case BackendType::sqlite:
      return "sqlite";
    case BackendType::duckdb:
      return "duckdb";
  }
  return "unknown";
}

arrow::Result<BackendType> BackendTypeFromString(const std::string& name) {
  auto v = ToLower(name);
  if (v == "sqlite") return BackendType::sqlite;
  if (v == "duckdb") return BackendType::duckdb;
  if (v == "none") return BackendType::none;
  return arrow::Status::Invalid("Unknown store backend '", name,
                                "' (expected one of: sqlite, duckdb, none)");
}

arrow::Status UnavailableUserStore::Unavailable() const {
  return arrow::Status::IOError("User store unavailable: ", reason_);
}

arrow::Status UnavailableUserStore::Upsert(const UserRecord&) { return Unavailable(); }

arrow::Status UnavailableUserStore::Ping() { return Unavailable(); }

arrow::Result<std::optional<UserRecord>> UnavailableUserStore::Lookup(const std::string&) {
  return Unavailable();
}

arrow::Result<std::shared_ptr<UserStore>> OpenUserStore(const StoreOptions& options) {
  if (options.pool_size < 1) {
    return arrow::Status::Invalid("Store pool size must be at least 1, got ",
                                  options.pool_size);
  }

  switch (options.backend) {
    case BackendType::sqlite: {
      ARROW_ASSIGN_OR_RAISE(auto store, SqliteUserStore::Open(options));
      return store;
    }
    case BackendType::duckdb: {
      ARROW_ASSIGN_OR_RAISE(auto store, DuckDBUserStore::Open(options));
      return store;
    }
    case BackendType::none:
      return std::make_shared<UnavailableUserStore>();
  }
  return arrow::Status::Invalid("Unsupported store backend");
}

std::shared_ptr<UserStore> OpenUserStoreOrDegrade(const StoreOptions& options) {
  auto result = OpenUserStore(options);
  if (result.ok()) {
    return *result;
  }

  OAUTHLINK_LOGKV(ERROR, "Failed to open user store, running without database",
                  {"kind", "store"}, {"backend", BackendTypeToString(options.backend)},
                  {"database", options.database_filename.string()},
                  {"error", result.status().ToString()});
  return std::make_shared<UnavailableUserStore>(result.status().message());
}

}  // namespace oauthlink::store
