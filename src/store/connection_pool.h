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
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <arrow/result.h>
#include <arrow/status.h>

namespace oauthlink::store {

/// Fixed-size pool of database connections opened once at startup.
/// Request threads lease a connection for the duration of one statement and the
/// lease hands it back on destruction.
template <typename Conn>
class ConnectionPool {
 public:
  class Lease {
   public:
    Lease(ConnectionPool* pool, std::unique_ptr<Conn> conn)
        : pool_(pool), conn_(std::move(conn)) {}
    ~Lease() {
      if (pool_ && conn_) pool_->Release(std::move(conn_));
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)), conn_(std::move(other.conn_)) {}
    Lease& operator=(Lease&&) = delete;

    Conn& operator*() { return *conn_; }
    Conn* operator->() { return conn_.get(); }

   private:
    ConnectionPool* pool_;
    std::unique_ptr<Conn> conn_;
  };

  explicit ConnectionPool(std::vector<std::unique_ptr<Conn>> connections)
      : idle_(std::move(connections)), size_(idle_.size()) {}

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /// Wait up to `timeout` for an idle connection.
  arrow::Result<Lease> Acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!idle_cv_.wait_for(lock, timeout, [this] { return !idle_.empty(); })) {
      return arrow::Status::IOError("Timed out after ", timeout.count(),
                                    "ms waiting for a store connection (pool size ",
                                    size_, ")");
    }
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lease(this, std::move(conn));
  }

  size_t size() const { return size_; }

 private:
  void Release(std::unique_ptr<Conn> conn) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      idle_.push_back(std::move(conn));
    }
    idle_cv_.notify_one();
  }

  std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::vector<std::unique_ptr<Conn>> idle_;
  size_t size_;
};

}  // namespace oauthlink::store
