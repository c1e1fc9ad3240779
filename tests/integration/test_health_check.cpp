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
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "detail/health_monitor.h"

using oauthlink::HealthMonitor;

namespace {

// Polls `pred` until it holds or two seconds pass.
template <typename Pred>
bool Eventually(Pred pred) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

}  // namespace

TEST(HealthMonitorTest, FirstProbeIsSynchronous) {
  HealthMonitor healthy([] { return arrow::Status::OK(); }, std::chrono::seconds(60));
  EXPECT_TRUE(healthy.IsHealthy());

  HealthMonitor unhealthy([] { return arrow::Status::IOError("User store unavailable"); },
                          std::chrono::seconds(60));
  auto snapshot = unhealthy.Snapshot();
  EXPECT_FALSE(snapshot.healthy);
  EXPECT_EQ(snapshot.detail, "User store unavailable");
  EXPECT_EQ(snapshot.version, 1u);
}

TEST(HealthMonitorTest, TracksStatusChanges) {
  std::atomic<bool> store_up{true};
  std::atomic<int> probes{0};
  HealthMonitor monitor(
      [&] {
        ++probes;
        return store_up.load() ? arrow::Status::OK()
                               : arrow::Status::IOError("database is locked");
      },
      std::chrono::milliseconds(20));

  ASSERT_TRUE(monitor.IsHealthy());

  store_up = false;
  EXPECT_TRUE(Eventually([&] { return !monitor.IsHealthy(); }));
  EXPECT_EQ(monitor.Snapshot().detail, "database is locked");

  store_up = true;
  EXPECT_TRUE(Eventually([&] { return monitor.IsHealthy(); }));
  EXPECT_EQ(monitor.Snapshot().version, 3u);
  EXPECT_GE(probes.load(), 3);
}

TEST(HealthMonitorTest, ShutdownStopsPollingAndIsIdempotent) {
  std::atomic<int> probes{0};
  HealthMonitor monitor(
      [&] {
        ++probes;
        return arrow::Status::OK();
      },
      std::chrono::milliseconds(10));

  monitor.Shutdown();
  int after_shutdown = probes.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(probes.load(), after_shutdown);
  monitor.Shutdown();
}
