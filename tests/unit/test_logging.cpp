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

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "oauthlink_logging.h"
#include "test_util.h"

namespace fs = std::filesystem;

using arrow::util::ArrowLogLevel;
using oauthlink::LogConfig;
using oauthlink::LogFormat;

namespace {

std::vector<std::string> ReadLines(const fs::path& path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

}  // namespace

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    log_path_ = fs::temp_directory_path() /
                ("oauthlink_logging_test_" + std::to_string(::getpid()) + ".log");
    std::error_code ec;
    fs::remove(log_path_, ec);
  }

  void TearDown() override {
    // Back to stderr before the file goes away
    oauthlink::InitLogging(LogConfig{});
    std::error_code ec;
    fs::remove(log_path_, ec);
  }

  void UseFile(LogFormat format, ArrowLogLevel level) {
    LogConfig cfg;
    cfg.format = format;
    cfg.level = level;
    cfg.file_path = log_path_.string();
    cfg.component = "oauthlink-test";
    oauthlink::InitLogging(cfg);
  }

  fs::path log_path_;
};

TEST_F(LoggingTest, JsonLinesCarryFieldsAtTopLevel) {
  UseFile(LogFormat::kJson, ArrowLogLevel::ARROW_DEBUG);

  OAUTHLINK_LOGKV(INFO, "callback finished", {"code", std::string("NO_CODE")},
                  {"status", int64_t{200}}, {"persisted", false}, {"msg", std::string("x")});

  auto lines = ReadLines(log_path_);
  ASSERT_EQ(lines.size(), 1u);
  auto j = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(j["msg"], "callback finished");
  EXPECT_EQ(j["lvl"], "INFO");
  EXPECT_EQ(j["component"], "oauthlink-test");
  EXPECT_EQ(j["code"], "NO_CODE");
  EXPECT_EQ(j["status"], 200);
  EXPECT_EQ(j["persisted"], false);
  EXPECT_EQ(j["field_msg"], "x");
  EXPECT_TRUE(j.contains("ts"));
}

TEST_F(LoggingTest, TextLinesAppendKeyValuePairs) {
  UseFile(LogFormat::kText, ArrowLogLevel::ARROW_DEBUG);

  OAUTHLINK_LOGKV(WARNING, "store unavailable", {"backend", std::string("sqlite")},
                  {"detail", std::string("disk full")});

  auto lines = ReadLines(log_path_);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find(" WARN "), std::string::npos);
  EXPECT_NE(lines[0].find("component=oauthlink-test"), std::string::npos);
  EXPECT_NE(lines[0].find("- store unavailable"), std::string::npos);
  EXPECT_NE(lines[0].find("backend=sqlite"), std::string::npos);
  EXPECT_NE(lines[0].find("detail=\"disk full\""), std::string::npos);
}

TEST_F(LoggingTest, EntriesBelowThresholdAreDropped) {
  UseFile(LogFormat::kJson, ArrowLogLevel::ARROW_WARNING);

  OAUTHLINK_LOGKV(INFO, "quiet");
  OAUTHLINK_LOGKV(ERROR, "loud");

  auto lines = ReadLines(log_path_);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(nlohmann::json::parse(lines[0])["msg"], "loud");
}

TEST_F(LoggingTest, InvalidUtf8FieldsAreReplacedNotThrown) {
  const std::string agent = "Mozilla/5.0 (X11) \xFF";

  UseFile(LogFormat::kText, ArrowLogLevel::ARROW_DEBUG);
  EXPECT_NO_THROW(OAUTHLINK_LOGKV(INFO, "access", {"user_agent", agent}));

  UseFile(LogFormat::kJson, ArrowLogLevel::ARROW_DEBUG);
  EXPECT_NO_THROW(OAUTHLINK_LOGKV(INFO, "denied by \xFF user", {"user_agent", agent}));

  auto lines = ReadLines(log_path_);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("user_agent=\"Mozilla/5.0 (X11) \xEF\xBF\xBD\""), std::string::npos);
  auto j = nlohmann::json::parse(lines[1]);
  EXPECT_EQ(j["user_agent"], "Mozilla/5.0 (X11) \xEF\xBF\xBD");
  EXPECT_EQ(j["msg"], "denied by \xEF\xBF\xBD user");
}

TEST_F(LoggingTest, InvalidUtf8OnWorkerThreadDoesNotTerminate) {
  UseFile(LogFormat::kText, ArrowLogLevel::ARROW_DEBUG);
  std::thread worker([] {
    OAUTHLINK_LOGKV(WARNING, "OAuth callback failed", {"message", std::string("a \xFF")});
  });
  worker.join();
  EXPECT_EQ(ReadLines(log_path_).size(), 1u);
}

TEST(ParseLogLevel, AcceptsKnownNames) {
  ArrowLogLevel level;
  ASSERT_ARROW_OK_AND_ASSIGN(level, oauthlink::ParseLogLevel("DEBUG"));
  EXPECT_EQ(level, ArrowLogLevel::ARROW_DEBUG);
  ASSERT_ARROW_OK_AND_ASSIGN(level, oauthlink::ParseLogLevel("warn"));
  EXPECT_EQ(level, ArrowLogLevel::ARROW_WARNING);
  ASSERT_ARROW_OK_AND_ASSIGN(level, oauthlink::ParseLogLevel("Error"));
  EXPECT_EQ(level, ArrowLogLevel::ARROW_ERROR);

  EXPECT_TRUE(oauthlink::ParseLogLevel("trace-ish").status().IsInvalid());
  EXPECT_TRUE(oauthlink::ParseLogLevel("").status().IsInvalid());
}

TEST(RedactForLogs, KeepsShortPrefix) {
  EXPECT_EQ(oauthlink::redact_for_logs("abcdefghij"), "abcdef...");
  EXPECT_EQ(oauthlink::redact_for_logs("abc"), "***");
}
