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

#include "oauth_http_server.h"

#include <chrono>
#include <exception>
#include <vector>

#include "httplib.h"

#include <nlohmann/json.hpp>

#include "access_log.h"
#include "oauthlink_library.h"
#include "oauthlink_logging.h"

namespace oauthlink::oauth {
namespace {

const std::vector<std::string> kAvailableRoutes = {
    "/", "/authorize", "/callback", "/error", "/health", "/oauth-url", "/credits"};

std::optional<std::string> Param(const httplib::Request& req, const char* key) {
  if (!req.has_param(key)) return std::nullopt;
  return req.get_param_value(key);
}

Viewport RequestViewport(const httplib::Request& req) {
  return ViewportFromUserAgent(req.get_header_value("User-Agent"));
}

// Paths and forwarded headers may carry invalid UTF-8.
void SendJson(httplib::Response& res, const nlohmann::json& body) {
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

int64_t EpochSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

OAuthHttpServer::OAuthHttpServer(Config config, CallbackFlow& flow,
                                 const PageRenderer& renderer, HealthMonitor& health)
    : config_(std::move(config)), flow_(flow), renderer_(renderer), health_(health) {}

OAuthHttpServer::~OAuthHttpServer() { Shutdown(); }

arrow::Status OAuthHttpServer::Start() {
  if (config_.authorize_url.empty()) {
    return arrow::Status::Invalid("OAuth authorize URL is required");
  }
  if (config_.port < 0 || config_.port > 65535) {
    return arrow::Status::Invalid("Invalid port number: ", config_.port);
  }

  if (!config_.tls_cert_path.empty() && !config_.tls_key_path.empty()) {
    auto ssl_server = std::make_unique<httplib::SSLServer>(
        config_.tls_cert_path.c_str(), config_.tls_key_path.c_str());
    if (!ssl_server->is_valid()) {
      return arrow::Status::Invalid("Unable to load TLS certificate '",
                                    config_.tls_cert_path.string(), "' / key '",
                                    config_.tls_key_path.string(), "'");
    }
    server_ = std::move(ssl_server);
    listener_scheme_ = "https";
  } else {
    server_ = std::make_unique<httplib::Server>();
    listener_scheme_ = "http";
  }

  server_->set_default_headers({
      {"X-Content-Type-Options", "nosniff"},
      {"X-Frame-Options", "SAMEORIGIN"},
      {"X-XSS-Protection", "1; mode=block"},
      {"Referrer-Policy", "strict-origin-when-cross-origin"},
      {"Permissions-Policy", "geolocation=(), microphone=(), camera=()"},
  });

  server_->set_pre_routing_handler(
      [this](const httplib::Request& req, httplib::Response&) {
        tl_request_ctx = ResolveRequestCtx(req, config_.proxy, listener_scheme_);
        return httplib::Server::HandlerResponse::Unhandled;
      });

  // Runs for every written response, error and exception replies included.
  server_->set_post_routing_handler(
      [this](const httplib::Request&, httplib::Response& res) { AddRequestHeaders(res); });

  server_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
    if (res.status != 404 || !res.body.empty()) {
      return httplib::Server::HandlerResponse::Unhandled;
    }
    HandleNotFound(req, res);
    return httplib::Server::HandlerResponse::Handled;
  });

  server_->set_exception_handler(
      [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
          std::rethrow_exception(ep);
        } catch (const std::exception& e) {
          what = e.what();
        } catch (...) {
          // Non-standard exception type; reported below as unknown.
        }
        OAUTHLINK_LOGKV(ERROR, "Unhandled exception in request handler", {"kind", "http"},
                        {"path", req.path}, {"request_id", tl_request_ctx.request_id},
                        {"error", what});
        res.status = 500;
        res.set_content(R"({"error":"Internal server error"})", "application/json");
      });

  if (config_.access_log) {
    server_->set_logger(LogAccess);
  }

  server_->Get("/", [this](const httplib::Request& req, httplib::Response& res) {
    HandleLanding(req, res);
  });
  server_->Get("/authorize", [this](const httplib::Request& req, httplib::Response& res) {
    HandleAuthorize(req, res);
  });
  server_->Get("/callback", [this](const httplib::Request& req, httplib::Response& res) {
    HandleCallback(req, res);
  });
  server_->Get("/error", [this](const httplib::Request& req, httplib::Response& res) {
    HandleError(req, res);
  });
  server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
    HandleHealth(req, res);
  });
  server_->Get("/oauth-url", [this](const httplib::Request& req, httplib::Response& res) {
    HandleOAuthUrl(req, res);
  });
  server_->Get("/credits", [this](const httplib::Request& req, httplib::Response& res) {
    HandleCredits(req, res);
  });

  if (config_.port == 0) {
    bound_port_ = server_->bind_to_any_port(config_.hostname);
    if (bound_port_ <= 0) {
      return arrow::Status::IOError("Unable to bind an ephemeral port on ",
                                    config_.hostname);
    }
  } else {
    if (!server_->bind_to_port(config_.hostname, config_.port)) {
      return arrow::Status::IOError("Unable to bind ", config_.hostname, ":",
                                    config_.port);
    }
    bound_port_ = config_.port;
  }

  server_thread_ = std::thread([this]() {
    if (!server_->listen_after_bind()) {
      if (!shutdown_) {
        OAUTHLINK_LOG(ERROR) << "OAuth HTTP server stopped listening on port "
                             << bound_port_;
      }
    }
  });

  OAUTHLINK_LOG(INFO) << "OAuth HTTP server listening on " << listener_scheme_ << "://"
                      << config_.hostname << ":" << bound_port_;
  return arrow::Status::OK();
}

void OAuthHttpServer::Shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }

  if (server_) {
    server_->stop();
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
    OAUTHLINK_LOG(INFO) << "OAuth HTTP server shutdown complete";
  }
}

void OAuthHttpServer::AddRequestHeaders(httplib::Response& res) const {
  const auto& ctx = tl_request_ctx;
  if (!ctx.request_id.empty()) {
    res.set_header("X-Request-Id", ctx.request_id);
  }
  if (ctx.scheme == "https") {
    res.set_header("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
  }
}

void OAuthHttpServer::SendHtml(httplib::Response& res, const std::string& html) const {
  res.status = 200;
  res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
  res.set_content(html, "text/html; charset=utf-8");
}

void OAuthHttpServer::HandleLanding(const httplib::Request& req, httplib::Response& res) {
  SendHtml(res, renderer_.RenderLanding(config_.authorize_url, RequestViewport(req),
                                        health_.IsHealthy()));
}

void OAuthHttpServer::HandleAuthorize(const httplib::Request&, httplib::Response& res) {
  res.set_redirect(config_.authorize_url, 302);
}

void OAuthHttpServer::HandleCallback(const httplib::Request& req, httplib::Response& res) {
  CallbackParams params{
      .code = Param(req, "code"),
      .error = Param(req, "error"),
      .error_description = Param(req, "error_description"),
  };

  OAUTHLINK_LOGKV(DEBUG, "OAuth callback received", {"kind", "oauth_callback"},
                  {"request_id", tl_request_ctx.request_id},
                  {"client_ip", tl_request_ctx.real_ip},
                  {"code", params.code ? redact_for_logs(*params.code) : std::string()});

  SendHtml(res, renderer_.Render(flow_.Run(params), RequestViewport(req)));
}

void OAuthHttpServer::HandleError(const httplib::Request& req, httplib::Response& res) {
  auto code = Param(req, "code").value_or("AUTH_FAILED");
  auto message = Param(req, "message").value_or("Authorization was denied or expired.");
  SendHtml(res, renderer_.RenderError(code, message, RequestViewport(req)));
}

void OAuthHttpServer::HandleHealth(const httplib::Request&, httplib::Response& res) {
  const auto snapshot = health_.Snapshot();
  const auto& ctx = tl_request_ctx;

  nlohmann::json body;
  body["status"] = snapshot.healthy ? "healthy" : "degraded";
  body["timestamp"] = EpochSeconds();
  body["service"] = config_.service_name;
  body["version"] = OAUTHLINK_SERVER_VERSION;
  body["store"] = snapshot.healthy ? "connected" : "disconnected";
  body["backend"] = config_.store_backend;
  body["client_ip"] = ctx.real_ip;
  body["scheme"] = ctx.scheme;
  body["request_id"] = ctx.request_id;

  res.status = snapshot.healthy ? 200 : 503;
  SendJson(res, body);
}

void OAuthHttpServer::HandleOAuthUrl(const httplib::Request&, httplib::Response& res) {
  nlohmann::json body;
  body["oauth_url"] = config_.authorize_url;
  SendJson(res, body);
}

void OAuthHttpServer::HandleCredits(const httplib::Request& req, httplib::Response& res) {
  SendHtml(res, renderer_.RenderCredits(RequestViewport(req)));
}

void OAuthHttpServer::HandleNotFound(const httplib::Request& req, httplib::Response& res) {
  nlohmann::json body;
  body["error"] = "Not found";
  body["path"] = req.path;
  body["available_routes"] = kAvailableRoutes;
  res.status = 404;
  SendJson(res, body);
}

}  // namespace oauthlink::oauth
