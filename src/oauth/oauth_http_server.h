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
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include <arrow/result.h>
#include <arrow/status.h>

#include "callback_flow.h"
#include "detail/health_monitor.h"
#include "detail/request_ctx.h"
#include "page_renderer.h"

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace oauthlink::oauth {

/// HTTP surface of the service.
///
/// Routes:
///   GET /           landing page with the connect link
///   GET /authorize  302 to the provider authorization URL
///   GET /callback   runs CallbackFlow, always answers 200 with an HTML page
///   GET /error      error page from `code` and `message` query parameters
///   GET /health     JSON status, 503 while the store is unreachable
///   GET /oauth-url  JSON with the authorization URL
///   GET /credits    credits page
/// Anything else gets a JSON 404 listing the routes.
class OAuthHttpServer {
 public:
  struct Config {
    std::string hostname = "0.0.0.0";
    int port = 0;  // 0 binds an ephemeral port, see port()
    std::filesystem::path tls_cert_path;
    std::filesystem::path tls_key_path;
    ProxyConfig proxy;
    bool access_log = true;
    std::string authorize_url;
    std::string store_backend;
    std::string service_name = "oauthlink";
  };

  OAuthHttpServer(Config config, CallbackFlow& flow, const PageRenderer& renderer,
                  HealthMonitor& health);
  ~OAuthHttpServer();

  /// Bind and start serving on a background thread. Returns error if unable to bind.
  arrow::Status Start();

  /// Stop the server and join its thread.
  void Shutdown();

  /// Bound port; valid after Start().
  int port() const { return bound_port_; }

 private:
  void HandleLanding(const httplib::Request& req, httplib::Response& res);
  void HandleAuthorize(const httplib::Request& req, httplib::Response& res);
  void HandleCallback(const httplib::Request& req, httplib::Response& res);
  void HandleError(const httplib::Request& req, httplib::Response& res);
  void HandleHealth(const httplib::Request& req, httplib::Response& res);
  void HandleOAuthUrl(const httplib::Request& req, httplib::Response& res);
  void HandleCredits(const httplib::Request& req, httplib::Response& res);
  void HandleNotFound(const httplib::Request& req, httplib::Response& res);

  /// Per-request headers; the static security headers are server defaults.
  void AddRequestHeaders(httplib::Response& res) const;

  void SendHtml(httplib::Response& res, const std::string& html) const;

  Config config_;
  CallbackFlow& flow_;
  const PageRenderer& renderer_;
  HealthMonitor& health_;

  std::unique_ptr<httplib::Server> server_;
  std::string listener_scheme_ = "http";
  int bound_port_ = 0;
  std::thread server_thread_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace oauthlink::oauth
