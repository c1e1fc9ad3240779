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

#include "detail/health_monitor.h"

#include "oauthlink_logging.h"

namespace oauthlink {

HealthMonitor::HealthMonitor(HealthCheckFn health_check_fn,
                             std::chrono::milliseconds poll_interval)
    : health_check_fn_(std::move(health_check_fn)), poll_interval_(poll_interval) {
  Record(health_check_fn_());
  health_check_thread_ = std::thread(&HealthMonitor::HealthCheckLoop, this);
}

HealthMonitor::~HealthMonitor() { Shutdown(); }

void HealthMonitor::Record(const arrow::Status& status) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool healthy = status.ok();
  if (healthy != cached_.healthy || cached_.version == 0) {
    if (healthy) {
      OAUTHLINK_LOGKV(INFO, "Store health changed", {"kind", "health"},
                      {"store", "connected"});
    } else {
      OAUTHLINK_LOGKV(WARNING, "Store health changed", {"kind", "health"},
                      {"store", "disconnected"}, {"error", status.ToString()});
    }
    cached_.healthy = healthy;
    ++cached_.version;
  }
  cached_.detail = healthy ? "" : status.message();
}

void HealthMonitor::HealthCheckLoop() {
  while (!shutdown_.load()) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      wake_cv_.wait_for(lock, poll_interval_, [this] { return shutdown_.load(); });
    }

    if (shutdown_.load()) {
      break;
    }

    Record(health_check_fn_());
  }
}

HealthSnapshot HealthMonitor::Snapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  return cached_;
}

void HealthMonitor::Shutdown() {
  bool expected = false;
  if (!shutdown_.compare_exchange_strong(expected, true)) {
    return;
  }

  wake_cv_.notify_all();

  if (health_check_thread_.joinable()) {
    health_check_thread_.join();
  }
}

}  // namespace oauthlink
