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

#include <iostream>

#include <boost/program_options.hpp>

#include "oauthlink_library.h"

namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char** argv) {
  std::vector<std::string> tls_token_values;

  // Declare the supported options.
  po::options_description desc("Allowed options");
  // clang-format off
    desc.add_options()
            ("help", "produce this help message")
            ("version", "Print the version and exit")
            ("client-id", po::value<std::string>()->default_value(""),
             "OAuth client id registered with the provider.  If not set, we will use env var: 'OAUTH_CLIENT_ID'.  "
             "If that isn't set, a development placeholder is used (and a warning is logged).")
            ("client-secret", po::value<std::string>()->default_value(""),
             "OAuth client secret.  If not set, we will use env var: 'OAUTH_CLIENT_SECRET'.")
            ("redirect-uri", po::value<std::string>()->default_value(""),
             "Redirect URI registered with the provider.  If not set, we will use env var: 'OAUTH_REDIRECT_URI'.  "
             "If that isn't set, we will use: 'http://localhost:<port>/callback'.")
            ("scope", po::value<std::string>()->default_value(""),
             "OAuth scope to request.  If not set, we will use env var: 'OAUTH_SCOPE' or 'identify'.")
            ("authorize-url", po::value<std::string>()->default_value(""),
             "Provider authorization endpoint.  If not set, we will use env var: 'OAUTH_AUTHORIZE_URL'.")
            ("token-url", po::value<std::string>()->default_value(""),
             "Provider token endpoint.  If not set, we will use env var: 'OAUTH_TOKEN_URL'.")
            ("profile-url", po::value<std::string>()->default_value(""),
             "Provider user profile endpoint.  If not set, we will use env var: 'OAUTH_PROFILE_URL'.")
            ("legacy-discriminator", po::value<std::string>()->default_value(""),
             "Show 'username#discriminator' display names: on|off. If empty, uses env OAUTH_LEGACY_DISCRIMINATOR or defaults to on.")
            ("exchange-timeout", po::value<int>()->default_value(DEFAULT_EXCHANGE_TIMEOUT_SECONDS),
             "Timeout in seconds for the code-for-token exchange.")
            ("profile-timeout", po::value<int>()->default_value(DEFAULT_PROFILE_TIMEOUT_SECONDS),
             "Timeout in seconds for the user profile request.")
            ("store-backend,B", po::value<std::string>()->default_value(""),
             "User store backend: sqlite|duckdb|none. If empty, uses env OAUTHLINK_STORE_BACKEND or defaults to sqlite.")
            ("store-database,D", po::value<std::string>()->default_value(""),
             "User store database filename (absolute or relative to the current working directory).  "
             "If not set, we will use env var: 'OAUTHLINK_STORE_DATABASE'.  If that isn't set, we will use: 'oauthlink_users.db'.")
            ("store-pool-size", po::value<int>()->default_value(DEFAULT_STORE_POOL_SIZE),
             "Number of pooled user store connections.")
            ("hostname,H", po::value<std::string>()->default_value(""),
             "Specify the hostname to listen on.  If not set, we will use env var: 'OAUTHLINK_HOSTNAME'.  "
             "If that isn't set, we will use the default of: '0.0.0.0'.")
            ("port,R", po::value<int>()->default_value(0),
             "Specify the port to listen on.  If not set, we will use env var: 'PORT'.  "
             "If that isn't set, we will use the default of: 8443.")
            ("tls,T", po::value<std::vector<std::string>>(&tls_token_values)->multitoken()->default_value(
                     std::vector<std::string>{"", ""}, ""),
             "Specify the TLS certificate and key file paths.")
            ("trusted-proxies", po::value<std::string>()->default_value(""),
             "Comma separated peer addresses whose forwarding headers are honoured ('*' = any). "
             "If empty, uses env TRUSTED_PROXIES or defaults to '*'.")
            ("proxy-header-host", po::value<std::string>()->default_value(""),
             "Header carrying the original host. If empty, uses env PROXY_HEADER_HOST or defaults to X-Forwarded-Host.")
            ("proxy-header-proto", po::value<std::string>()->default_value(""),
             "Header carrying the original scheme. If empty, uses env PROXY_HEADER_PROTO or defaults to X-Forwarded-Proto.")
            // -------- Logging controls (raw strings; library normalizes) --------
            ("log-level",  po::value<std::string>()->default_value(""),
             "Log level: debug|info|warn|error|fatal. If empty, uses env OAUTHLINK_LOG_LEVEL or defaults to info.")
            ("log-format", po::value<std::string>()->default_value(""),
             "Log format: text|json. If empty, uses env OAUTHLINK_LOG_FORMAT or defaults to text.")
            ("access-log", po::value<std::string>()->default_value(""),
             "Per-request access logging: on|off. If empty, uses env OAUTHLINK_ACCESS_LOG or defaults to on.")
            ("log-file",   po::value<std::string>()->default_value(""),
             "Log file path; use '-' for stdout; empty => stderr. Can also use env OAUTHLINK_LOG_FILE.");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
    return 1;
  }

  if (vm.count("help")) {
    std::cout << desc << "\n";
    return 0;
  }

  if (vm.count("version")) {
    std::cout << "oauthlink server CLI: " << OAUTHLINK_SERVER_VERSION << "\n";
    return 0;
  }

  oauthlink::ServerOptions options;
  options.client_id = vm["client-id"].as<std::string>();
  options.client_secret = vm["client-secret"].as<std::string>();
  options.redirect_uri = vm["redirect-uri"].as<std::string>();
  options.scope = vm["scope"].as<std::string>();
  options.authorize_url = vm["authorize-url"].as<std::string>();
  options.token_url = vm["token-url"].as<std::string>();
  options.profile_url = vm["profile-url"].as<std::string>();
  options.legacy_discriminator = vm["legacy-discriminator"].as<std::string>();
  options.exchange_timeout_seconds = vm["exchange-timeout"].as<int>();
  options.profile_timeout_seconds = vm["profile-timeout"].as<int>();

  options.store_backend = vm["store-backend"].as<std::string>();
  options.store_database = vm["store-database"].as<std::string>();
  options.store_pool_size = vm["store-pool-size"].as<int>();

  options.hostname = vm["hostname"].as<std::string>();
  options.port = vm["port"].as<int>();

  if (vm.count("tls")) {
    std::vector<std::string> tls_tokens = tls_token_values;
    if (tls_tokens.size() != 2) {
      std::cerr << "--tls requires 2 entries - separated by a space!\n";
      return 1;
    }
    options.tls_cert_path = fs::path(tls_tokens[0]);
    options.tls_key_path = fs::path(tls_tokens[1]);
  }

  options.trusted_proxies = vm["trusted-proxies"].as<std::string>();
  options.proxy_header_host = vm["proxy-header-host"].as<std::string>();
  options.proxy_header_proto = vm["proxy-header-proto"].as<std::string>();

  options.log_level = vm["log-level"].as<std::string>();
  options.log_format = vm["log-format"].as<std::string>();
  options.access_log = vm["access-log"].as<std::string>();
  options.log_file = vm["log-file"].as<std::string>();

  return oauthlink::RunOAuthLinkServer(options);
}
