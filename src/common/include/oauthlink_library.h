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

#include <filesystem>
#include <string>

#include <arrow/result.h>

#include "version.h"

// Constants
const std::string OAUTHLINK_SERVER_VERSION = PROJECT_VERSION;
const std::string OAUTHLINK_SERVICE_NAME = "oauthlink";
const std::string DEFAULT_OAUTHLINK_HOSTNAME = "0.0.0.0";
const int DEFAULT_OAUTHLINK_PORT = 8443;
const std::string DEFAULT_DEV_CLIENT_ID = "oauthlink-dev-client";
const std::string DEFAULT_DEV_CLIENT_SECRET = "oauthlink-dev-secret";
const std::string DEFAULT_STORE_DATABASE = "oauthlink_users.db";
const int DEFAULT_STORE_POOL_SIZE = 4;
const int DEFAULT_EXCHANGE_TIMEOUT_SECONDS = 30;
const int DEFAULT_PROFILE_TIMEOUT_SECONDS = 15;

namespace oauthlink {

/// Raw option values as given on the command line. Empty strings and zero numbers
/// mean "not given": the environment variable is consulted next, then the
/// development default.
struct ServerOptions {
  std::string client_id;
  std::string client_secret;
  std::string redirect_uri;
  std::string scope;
  std::string authorize_url;
  std::string token_url;
  std::string profile_url;
  std::string legacy_discriminator;  // on|off
  int exchange_timeout_seconds = 0;
  int profile_timeout_seconds = 0;

  std::string store_backend;  // sqlite|duckdb|none
  std::string store_database;
  int store_pool_size = 0;

  std::string hostname;
  int port = 0;
  std::filesystem::path tls_cert_path;
  std::filesystem::path tls_key_path;

  std::string trusted_proxies;
  std::string proxy_header_host;
  std::string proxy_header_proto;

  std::string log_level;
  std::string log_format;
  std::string log_file;
  std::string access_log;  // on|off
};

struct ServiceConfig;

/// Apply the CLI > environment > default chain and validate the result.
arrow::Result<ServiceConfig> ResolveServiceConfig(const ServerOptions& options);

/**
 * @brief Run the OAuth link server until SIGINT or SIGTERM.
 *
 * Initializes logging, opens the user store (degrading to "no store" when it cannot
 * be opened), starts the health monitor and the HTTP server, then blocks.
 *
 * @return 0 on a clean shutdown, non-zero when configuration or startup fails.
 */
int RunOAuthLinkServer(const ServerOptions& options);

}  // namespace oauthlink
