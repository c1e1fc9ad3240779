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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <arrow/status.h>

namespace oauthlink {

/// Probe run by the monitor; OK means healthy.
using HealthCheckFn = std::function<arrow::Status()>;

struct HealthSnapshot {
  bool healthy = false;
  std::string detail;  // Last probe error, empty when healthy
  uint64_t version = 0;  // Incremented on each status change
};

/// Polls a health probe on a background thread so request handlers read a cached
/// answer instead of touching the store on every /health hit.
class HealthMonitor {
 public:
  static constexpr int kDefaultPollIntervalMs = 5000;

  /// Runs the first probe synchronously before starting the poller.
  explicit HealthMonitor(HealthCheckFn health_check_fn,
                         std::chrono::milliseconds poll_interval =
                             std::chrono::milliseconds(kDefaultPollIntervalMs));

  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  HealthSnapshot Snapshot();

  bool IsHealthy() { return Snapshot().healthy; }

  /// Stop the poller. Safe to call more than once.
  void Shutdown();

 private:
  void HealthCheckLoop();
  void Record(const arrow::Status& status);

  HealthCheckFn health_check_fn_;
  std::chrono::milliseconds poll_interval_;

  std::mutex mutex_;
  std::condition_variable wake_cv_;
  HealthSnapshot cached_;

  std::thread health_check_thread_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace oauthlink
