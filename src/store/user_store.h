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

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <arrow/result.h>
#include <arrow/status.h>

#include "user_record.h"

namespace oauthlink::store {

enum class BackendType { none, sqlite, duckdb };

std::string BackendTypeToString(BackendType backend);

arrow::Result<BackendType> BackendTypeFromString(const std::string& name);

struct StoreOptions {
  BackendType backend = BackendType::sqlite;
  std::filesystem::path database_filename;
  int pool_size = 4;
  std::chrono::milliseconds acquire_timeout{5000};
};

/// Keyed collection of linked users, shared with an external polling consumer.
///
/// Implementations must be safe to call from concurrent request threads.
class UserStore {
 public:
  virtual ~UserStore() = default;

  /// Insert or fully replace the row for `record.id`.
  /// `processed` is written as false and `pulled_resources` as an empty list no
  /// matter what the record carries.
  virtual arrow::Status Upsert(const UserRecord& record) = 0;

  /// Cheap connectivity probe.
  virtual arrow::Status Ping() = 0;

  /// Read a row back. Used by maintenance tooling and tests; the callback flow
  /// never reads.
  virtual arrow::Result<std::optional<UserRecord>> Lookup(const std::string& id) = 0;

  virtual BackendType backend() const = 0;
};

/// Store used when no backend is configured or the configured one failed to open.
class UnavailableUserStore : public UserStore {
 public:
  explicit UnavailableUserStore(std::string reason = "no store configured")
      : reason_(std::move(reason)) {}

  arrow::Status Upsert(const UserRecord& record) override;
  arrow::Status Ping() override;
  arrow::Result<std::optional<UserRecord>> Lookup(const std::string& id) override;
  BackendType backend() const override { return BackendType::none; }

 private:
  arrow::Status Unavailable() const;

  std::string reason_;
};

/// Open the configured backend and create its schema.
arrow::Result<std::shared_ptr<UserStore>> OpenUserStore(const StoreOptions& options);

/// Open the configured backend, falling back to UnavailableUserStore (with an
/// ERROR log line) when it cannot be opened.
std::shared_ptr<UserStore> OpenUserStoreOrDegrade(const StoreOptions& options);

}  // namespace oauthlink::store
