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

#include "oauthlink_library.h"

#include <charconv>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>

#include <pthread.h>

#include <arrow/util/config.h>

#include "detail/health_monitor.h"
#include "detail/service_config.h"
#include "oauth/callback_flow.h"
#include "oauth/page_renderer.h"

namespace fs = std::filesystem;

namespace oauthlink {
namespace {

std::string SafeGetEnvVarValue(const std::string& env_var_name) {
  auto env_var_value = std::getenv(env_var_name.c_str());
  if (env_var_value) {
    return std::string(env_var_value);
  } else {
    return "";
  }
}

std::string pick(const std::string& v, const char* env_name, const std::string& def) {
  if (!v.empty()) return v;
  auto env = SafeGetEnvVarValue(env_name);
  if (!env.empty()) return env;
  return def;
}

bool parse_bool(std::string s, bool& out) {
  s = ToLower(std::move(s));
  if (s == "1" || s == "true" || s == "on" || s == "yes") {
    out = true;
    return true;
  }
  if (s == "0" || s == "false" || s == "off" || s == "no") {
    out = false;
    return true;
  }
  return false;
}

arrow::Result<int> ParseInt(const std::string& what, const std::string& s) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return arrow::Status::Invalid("Invalid ", what, ": '", s, "' is not an integer");
  }
  return value;
}

arrow::Result<std::chrono::milliseconds> ResolveTimeout(const std::string& what,
                                                        int seconds, int def) {
  if (seconds < 0) {
    return arrow::Status::Invalid(what, " must be positive, got ", seconds);
  }
  return std::chrono::milliseconds(std::chrono::seconds(seconds == 0 ? def : seconds));
}

arrow::Result<LogConfig> ResolveLogConfig(const ServerOptions& options) {
  std::string lvl_s = pick(options.log_level, "OAUTHLINK_LOG_LEVEL", "info");
  std::string fmt_s = pick(options.log_format, "OAUTHLINK_LOG_FORMAT", "text");
  std::string file_s = pick(options.log_file, "OAUTHLINK_LOG_FILE", "");

  LogConfig log_config;
  ARROW_ASSIGN_OR_RAISE(log_config.level, ParseLogLevel(lvl_s));
  fmt_s = ToLower(fmt_s);
  if (fmt_s != "text" && fmt_s != "json") {
    return arrow::Status::Invalid("Unknown log format '", fmt_s, "' (expected text or json)");
  }
  log_config.format = fmt_s == "json" ? LogFormat::kJson : LogFormat::kText;
  log_config.component = OAUTHLINK_SERVICE_NAME;
  if (!file_s.empty()) log_config.file_path = file_s;  // "-" => stdout
  return log_config;
}

// Blocks the shutdown signals on the calling thread; threads started afterwards
// inherit the mask, so only sigwait() sees them.
sigset_t BlockShutdownSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  return signals;
}

}  // namespace

arrow::Result<ServiceConfig> ResolveServiceConfig(const ServerOptions& options) {
  ServiceConfig cfg;
  ARROW_ASSIGN_OR_RAISE(cfg.logging, ResolveLogConfig(options));

  // ---- listener ----
  cfg.http.hostname = pick(options.hostname, "OAUTHLINK_HOSTNAME", DEFAULT_OAUTHLINK_HOSTNAME);

  int port = options.port;
  if (port == 0) {
    auto env_port = SafeGetEnvVarValue("PORT");
    if (env_port.empty()) {
      port = DEFAULT_OAUTHLINK_PORT;
    } else {
      ARROW_ASSIGN_OR_RAISE(port, ParseInt("PORT", env_port));
    }
  }
  if (port < 1 || port > 65535) {
    return arrow::Status::Invalid("Port must be between 1 and 65535, got ", port);
  }
  cfg.http.port = port;

  if (!options.tls_key_path.empty() && options.tls_cert_path.empty()) {
    return arrow::Status::Invalid(
        "tls_cert_path was not specified (when tls_key_path WAS specified)");
  }
  if (!options.tls_cert_path.empty()) {
    cfg.http.tls_cert_path = fs::absolute(options.tls_cert_path);
    if (!fs::exists(cfg.http.tls_cert_path)) {
      return arrow::Status::Invalid("TLS certificate file does not exist: " +
                                    cfg.http.tls_cert_path.string());
    }
    if (options.tls_key_path.empty()) {
      return arrow::Status::Invalid(
          "tls_key_path was not specified (when tls_cert_path WAS specified)");
    }
    cfg.http.tls_key_path = fs::absolute(options.tls_key_path);
    if (!fs::exists(cfg.http.tls_key_path)) {
      return arrow::Status::Invalid("TLS key file does not exist: " +
                                    cfg.http.tls_key_path.string());
    }
  }

  cfg.http.proxy.trusted_proxies = pick(options.trusted_proxies, "TRUSTED_PROXIES", "*");
  cfg.http.proxy.host_header =
      pick(options.proxy_header_host, "PROXY_HEADER_HOST", "X-Forwarded-Host");
  cfg.http.proxy.proto_header =
      pick(options.proxy_header_proto, "PROXY_HEADER_PROTO", "X-Forwarded-Proto");

  std::string acc_s = pick(options.access_log, "OAUTHLINK_ACCESS_LOG", "on");
  if (!parse_bool(acc_s, cfg.http.access_log)) {
    return arrow::Status::Invalid("Unknown access-log value '", acc_s,
                                  "' (expected on or off)");
  }
  cfg.http.service_name = OAUTHLINK_SERVICE_NAME;

  // ---- provider ----
  auto& provider = cfg.provider;
  provider.client_id = pick(options.client_id, "OAUTH_CLIENT_ID", DEFAULT_DEV_CLIENT_ID);
  provider.client_secret =
      pick(options.client_secret, "OAUTH_CLIENT_SECRET", DEFAULT_DEV_CLIENT_SECRET);
  cfg.dev_credentials = provider.client_id == DEFAULT_DEV_CLIENT_ID ||
                        provider.client_secret == DEFAULT_DEV_CLIENT_SECRET;
  provider.redirect_uri =
      pick(options.redirect_uri, "OAUTH_REDIRECT_URI",
           "http://localhost:" + std::to_string(port) + "/callback");
  provider.scope = pick(options.scope, "OAUTH_SCOPE", provider.scope);
  provider.authorize_url =
      pick(options.authorize_url, "OAUTH_AUTHORIZE_URL", provider.authorize_url);
  provider.token_url = pick(options.token_url, "OAUTH_TOKEN_URL", provider.token_url);
  provider.profile_url = pick(options.profile_url, "OAUTH_PROFILE_URL", provider.profile_url);
  ARROW_ASSIGN_OR_RAISE(provider.exchange_timeout,
                        ResolveTimeout("Exchange timeout", options.exchange_timeout_seconds,
                                       DEFAULT_EXCHANGE_TIMEOUT_SECONDS));
  ARROW_ASSIGN_OR_RAISE(provider.profile_timeout,
                        ResolveTimeout("Profile timeout", options.profile_timeout_seconds,
                                       DEFAULT_PROFILE_TIMEOUT_SECONDS));

  std::string legacy_s =
      pick(options.legacy_discriminator, "OAUTH_LEGACY_DISCRIMINATOR", "on");
  if (!parse_bool(legacy_s, cfg.legacy_discriminator)) {
    return arrow::Status::Invalid("Unknown legacy-discriminator value '", legacy_s,
                                  "' (expected on or off)");
  }

  // ---- store ----
  ARROW_ASSIGN_OR_RAISE(
      cfg.store.backend,
      store::BackendTypeFromString(
          pick(options.store_backend, "OAUTHLINK_STORE_BACKEND", "sqlite")));
  cfg.store.database_filename =
      fs::path(pick(options.store_database, "OAUTHLINK_STORE_DATABASE", DEFAULT_STORE_DATABASE));
  if (cfg.store.database_filename.string().find(':') == std::string::npos) {
    // ":memory:" and "<scheme>:..." names are passed through untouched
    cfg.store.database_filename = fs::absolute(cfg.store.database_filename);
  }
  cfg.store.pool_size =
      options.store_pool_size == 0 ? DEFAULT_STORE_POOL_SIZE : options.store_pool_size;
  if (cfg.store.pool_size < 1) {
    return arrow::Status::Invalid("Store pool size must be at least 1, got ",
                                  cfg.store.pool_size);
  }

  return cfg;
}

int RunOAuthLinkServer(const ServerOptions& options) {
  const sigset_t shutdown_signals = BlockShutdownSignals();

  auto log_config = ResolveLogConfig(options);
  if (!log_config.ok()) {
    std::cerr << "Invalid logging configuration: " << log_config.status().ToString()
              << std::endl;
    return EXIT_FAILURE;
  }
  InitLogging(*log_config);

  auto now = std::chrono::system_clock::now();
  std::time_t currentTime = std::chrono::system_clock::to_time_t(now);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);

  OAUTHLINK_LOG(INFO) << "oauthlink server version: " << OAUTHLINK_SERVER_VERSION
                      << " (" << (1900 + localTime.tm_year) << ")"
                      << "\n Licensed under the Apache License, Version 2.0"
                      << "\n https://www.apache.org/licenses/LICENSE-2.0";
  OAUTHLINK_LOG(INFO) << "Apache Arrow version: " << ARROW_VERSION_STRING;

  auto cfg_result = ResolveServiceConfig(options);
  if (!cfg_result.ok()) {
    OAUTHLINK_LOG(ERROR) << "Invalid configuration: " << cfg_result.status().ToString();
    std::cerr << "Error: " << cfg_result.status().ToString() << std::endl;
    return EXIT_FAILURE;
  }
  auto cfg = std::move(cfg_result).ValueUnsafe();

  if (cfg.dev_credentials) {
    OAUTHLINK_LOGKV(WARNING,
                    "WARNING - Using development OAuth client credentials; set "
                    "OAUTH_CLIENT_ID and OAUTH_CLIENT_SECRET for real deployments",
                    {"kind", "config"}, {"client_id", cfg.provider.client_id});
  }
  OAUTHLINK_LOGKV(WARNING,
                  "WARNING - The OAuth state parameter is not generated or verified; "
                  "callbacks are not protected against CSRF",
                  {"kind", "config"}, {"csrf_protection", false});
  if (cfg.http.tls_cert_path.empty()) {
    OAUTHLINK_LOG(INFO) << "TLS is disabled for the oauthlink server; terminate TLS at "
                           "a reverse proxy for production use";
  }

  OAUTHLINK_LOGKV(INFO, "OAuth provider configured", {"kind", "config"},
                  {"authorize_url", cfg.provider.authorize_url},
                  {"token_url", cfg.provider.token_url},
                  {"profile_url", cfg.provider.profile_url},
                  {"redirect_uri", cfg.provider.redirect_uri},
                  {"legacy_discriminator", cfg.legacy_discriminator});

  auto user_store = store::OpenUserStoreOrDegrade(cfg.store);

  oauth::HttpProviderClient provider(cfg.provider);
  oauth::CallbackFlow flow(provider, *user_store, cfg.legacy_discriminator);
  oauth::PageRenderer renderer;
  HealthMonitor health([user_store] { return user_store->Ping(); });

  cfg.http.authorize_url = provider.AuthorizeUrl();
  cfg.http.store_backend = store::BackendTypeToString(user_store->backend());

  oauth::OAuthHttpServer server(cfg.http, flow, renderer, health);
  auto status = server.Start();
  if (!status.ok()) {
    OAUTHLINK_LOG(ERROR) << "Unable to start the oauthlink server: " << status.ToString();
    std::cerr << "Error: " << status.ToString() << std::endl;
    health.Shutdown();
    return EXIT_FAILURE;
  }

  OAUTHLINK_LOG(INFO) << "oauthlink server - started";

  int signal_number = 0;
  sigwait(&shutdown_signals, &signal_number);
  OAUTHLINK_LOG(INFO) << "Received signal " << signal_number << ", shutting down";

  server.Shutdown();
  health.Shutdown();
  return EXIT_SUCCESS;
}

}  // namespace oauthlink
