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

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "detail/service_config.h"
#include "oauthlink_library.h"
#include "test_util.h"

namespace fs = std::filesystem;

using oauthlink::ResolveServiceConfig;
using oauthlink::ServerOptions;
using oauthlink::ServiceConfig;

// Clears every variable the resolver reads and restores it afterwards.
class ServiceConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* name : kEnvNames) {
      if (const char* value = std::getenv(name)) saved_[name] = value;
      unsetenv(name);
    }
  }

  void TearDown() override {
    for (const char* name : kEnvNames) {
      auto it = saved_.find(name);
      if (it != saved_.end()) {
        setenv(name, it->second.c_str(), 1);
      } else {
        unsetenv(name);
      }
    }
  }

  static constexpr const char* kEnvNames[] = {
      "OAUTH_CLIENT_ID",         "OAUTH_CLIENT_SECRET",      "OAUTH_REDIRECT_URI",
      "OAUTH_SCOPE",             "OAUTH_AUTHORIZE_URL",      "OAUTH_TOKEN_URL",
      "OAUTH_PROFILE_URL",       "OAUTH_LEGACY_DISCRIMINATOR", "OAUTHLINK_STORE_BACKEND",
      "OAUTHLINK_STORE_DATABASE", "OAUTHLINK_HOSTNAME",      "PORT",
      "TRUSTED_PROXIES",         "PROXY_HEADER_HOST",        "PROXY_HEADER_PROTO",
      "OAUTHLINK_LOG_LEVEL",     "OAUTHLINK_LOG_FORMAT",     "OAUTHLINK_LOG_FILE",
      "OAUTHLINK_ACCESS_LOG"};

  std::map<std::string, std::string> saved_;
};

TEST_F(ServiceConfigTest, DevelopmentDefaults) {
  ServiceConfig cfg;
  ASSERT_ARROW_OK_AND_ASSIGN(cfg, ResolveServiceConfig(ServerOptions{}));

  EXPECT_EQ(cfg.http.hostname, "0.0.0.0");
  EXPECT_EQ(cfg.http.port, 8443);
  EXPECT_TRUE(cfg.http.access_log);
  EXPECT_EQ(cfg.http.proxy.trusted_proxies, "*");
  EXPECT_TRUE(cfg.dev_credentials);
  EXPECT_EQ(cfg.provider.client_id, "oauthlink-dev-client");
  EXPECT_EQ(cfg.provider.redirect_uri, "http://localhost:8443/callback");
  EXPECT_EQ(cfg.provider.scope, "identify");
  EXPECT_EQ(cfg.provider.token_url, "https://discord.com/api/oauth2/token");
  EXPECT_EQ(cfg.provider.exchange_timeout, std::chrono::seconds(30));
  EXPECT_EQ(cfg.provider.profile_timeout, std::chrono::seconds(15));
  EXPECT_TRUE(cfg.legacy_discriminator);
  EXPECT_EQ(cfg.store.backend, oauthlink::store::BackendType::sqlite);
  EXPECT_EQ(cfg.store.pool_size, 4);
  EXPECT_TRUE(cfg.store.database_filename.is_absolute());
  EXPECT_EQ(cfg.store.database_filename.filename(), "oauthlink_users.db");
}

TEST_F(ServiceConfigTest, EnvironmentOverridesDefaults) {
  setenv("OAUTH_CLIENT_ID", "env-client", 1);
  setenv("OAUTH_CLIENT_SECRET", "env-secret", 1);
  setenv("PORT", "9000", 1);
  setenv("OAUTH_LEGACY_DISCRIMINATOR", "off", 1);
  setenv("OAUTHLINK_STORE_BACKEND", "DuckDB", 1);
  setenv("OAUTHLINK_STORE_DATABASE", ":memory:", 1);

  ServiceConfig cfg;
  ASSERT_ARROW_OK_AND_ASSIGN(cfg, ResolveServiceConfig(ServerOptions{}));

  EXPECT_FALSE(cfg.dev_credentials);
  EXPECT_EQ(cfg.provider.client_id, "env-client");
  EXPECT_EQ(cfg.http.port, 9000);
  EXPECT_EQ(cfg.provider.redirect_uri, "http://localhost:9000/callback");
  EXPECT_FALSE(cfg.legacy_discriminator);
  EXPECT_EQ(cfg.store.backend, oauthlink::store::BackendType::duckdb);
  EXPECT_EQ(cfg.store.database_filename, fs::path(":memory:"));
}

TEST_F(ServiceConfigTest, CommandLineOverridesEnvironment) {
  setenv("OAUTH_CLIENT_ID", "env-client", 1);
  setenv("PORT", "9000", 1);

  ServerOptions options;
  options.client_id = "cli-client";
  options.port = 9100;
  options.redirect_uri = "https://link.example.com/callback";
  options.exchange_timeout_seconds = 5;

  ServiceConfig cfg;
  ASSERT_ARROW_OK_AND_ASSIGN(cfg, ResolveServiceConfig(options));

  EXPECT_EQ(cfg.provider.client_id, "cli-client");
  EXPECT_EQ(cfg.http.port, 9100);
  EXPECT_EQ(cfg.provider.redirect_uri, "https://link.example.com/callback");
  EXPECT_EQ(cfg.provider.exchange_timeout, std::chrono::seconds(5));
  // Secret still the placeholder
  EXPECT_TRUE(cfg.dev_credentials);
}

TEST_F(ServiceConfigTest, RejectsOutOfRangePort) {
  ServerOptions options;
  options.port = 70000;
  auto result = ResolveServiceConfig(options);
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.status().IsInvalid());
}

TEST_F(ServiceConfigTest, RejectsNonNumericPortEnv) {
  setenv("PORT", "eighty", 1);
  auto result = ResolveServiceConfig(ServerOptions{});
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.status().IsInvalid());
}

TEST_F(ServiceConfigTest, RejectsUnknownBackend) {
  ServerOptions options;
  options.store_backend = "postgres";
  auto result = ResolveServiceConfig(options);
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.status().IsInvalid());
}

TEST_F(ServiceConfigTest, RejectsBadSwitchValue) {
  ServerOptions options;
  options.access_log = "sometimes";
  EXPECT_TRUE(ResolveServiceConfig(options).status().IsInvalid());
}

TEST_F(ServiceConfigTest, LoggingOptions) {
  setenv("OAUTHLINK_LOG_LEVEL", "WARNING", 1);
  setenv("OAUTHLINK_LOG_FORMAT", "Json", 1);

  ServiceConfig cfg;
  ASSERT_ARROW_OK_AND_ASSIGN(cfg, ResolveServiceConfig(ServerOptions{}));
  EXPECT_EQ(cfg.logging.level, arrow::util::ArrowLogLevel::ARROW_WARNING);
  EXPECT_EQ(cfg.logging.format, oauthlink::LogFormat::kJson);
  EXPECT_FALSE(cfg.logging.file_path.has_value());

  ServerOptions options;
  options.log_level = "verbose";
  EXPECT_TRUE(ResolveServiceConfig(options).status().IsInvalid());

  options.log_level = "debug";
  options.log_format = "xml";
  EXPECT_TRUE(ResolveServiceConfig(options).status().IsInvalid());
}

TEST_F(ServiceConfigTest, TlsRequiresCertAndKey) {
  auto cert = fs::temp_directory_path() / "oauthlink_test_cert.pem";
  std::ofstream(cert) << "not really a certificate";

  ServerOptions cert_only;
  cert_only.tls_cert_path = cert;
  EXPECT_TRUE(ResolveServiceConfig(cert_only).status().IsInvalid());

  ServerOptions key_only;
  key_only.tls_key_path = cert;
  EXPECT_TRUE(ResolveServiceConfig(key_only).status().IsInvalid());

  ServerOptions missing_files;
  missing_files.tls_cert_path = "/nonexistent/oauthlink/cert.pem";
  missing_files.tls_key_path = "/nonexistent/oauthlink/key.pem";
  EXPECT_TRUE(ResolveServiceConfig(missing_files).status().IsInvalid());

  ServerOptions both;
  both.tls_cert_path = cert;
  both.tls_key_path = cert;
  EXPECT_TRUE(ResolveServiceConfig(both).ok());

  std::error_code ec;
  fs::remove(cert, ec);
}
