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

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace oauthlink::store {

/// User store on an embedded DuckDB database. One DuckDB instance is shared by a
/// pool of connections.
class DuckDBUserStore : public UserStore {
 public:
  static arrow::Result<std::shared_ptr<DuckDBUserStore>> Open(const StoreOptions& options);

  ~DuckDBUserStore() override;

  arrow::Status Upsert(const UserRecord& record) override;
  arrow::Status Ping() override;
  arrow::Result<std::optional<UserRecord>> Lookup(const std::string& id) override;
  BackendType backend() const override { return BackendType::duckdb; }

 private:
  DuckDBUserStore(std::shared_ptr<duckdb::DuckDB> db,
                  std::unique_ptr<ConnectionPool<duckdb::Connection>> pool,
                  std::chrono::milliseconds acquire_timeout);

  // Declared first so connections are destroyed before the instance.
  std::shared_ptr<duckdb::DuckDB> db_instance_;
  std::unique_ptr<ConnectionPool<duckdb::Connection>> pool_;
  std::chrono::milliseconds acquire_timeout_;
};

}  // namespace oauthlink::store
