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

#include "provider_client.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <vector>
#include <iomanip>
#include <sstream>

#include "httplib.h"

#include <nlohmann/json.hpp>

#include "oauthlink_library.h"
#include "oauthlink_logging.h"
#include "store/connection_pool.h"

namespace oauthlink::oauth {
namespace {

constexpr size_t kMaxErrorBodyChars = 200;

struct SplitUrl {
  std::string base;  // scheme://host[:port]
  std::string path;
};

arrow::Result<SplitUrl> Split(const std::string& url) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return arrow::Status::Invalid("Invalid provider URL: ", url);
  }
  std::string rest = url.substr(scheme_end + 3);
  size_t path_start = rest.find('/');
  std::string host_port = (path_start == std::string::npos) ? rest : rest.substr(0, path_start);
  if (host_port.empty()) {
    return arrow::Status::Invalid("Provider URL has no host: ", url);
  }
  return SplitUrl{
      .base = url.substr(0, scheme_end + 3) + host_port,
      .path = (path_start == std::string::npos) ? "/" : rest.substr(path_start),
  };
}

using ClientPool = store::ConnectionPool<httplib::Client>;

// The per-operation timeouts stop a silent peer; max_timeout bounds the whole
// request, so a provider trickling bytes is cut off too.
void ApplyTimeout(httplib::Client& client, std::chrono::milliseconds timeout) {
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
  client.set_max_timeout(static_cast<time_t>(timeout.count()));
}

arrow::Status TimedOut(std::chrono::milliseconds timeout) {
  return ProviderErrorDetail::MakeStatus(
      ProviderErrorKind::kTimeout, 0,
      "no response within " + std::to_string(timeout.count()) + "ms");
}

// httplib reports an expired socket wait as a plain read/connect failure, so the
// elapsed time decides whether a transport error counts as a timeout.
arrow::Status TransportFailure(const httplib::Error error,
                               std::chrono::steady_clock::time_point started,
                               std::chrono::milliseconds timeout) {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (elapsed.count() * 10 >= timeout.count() * 9) {
    return TimedOut(timeout);
  }
  return ProviderErrorDetail::MakeStatus(ProviderErrorKind::kNetwork, 0,
                                         httplib::to_string(error));
}

std::optional<std::string> StringOrNumber(const nlohmann::json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_number_integer() || value.is_number_unsigned()) return value.dump();
  return std::nullopt;
}

std::string UserAgent() { return "oauthlink/" + OAUTHLINK_SERVER_VERSION; }

}  // namespace

std::string ProviderErrorKindToString(ProviderErrorKind kind) {
  switch (kind) {
    case ProviderErrorKind::kTimeout:
      return "timeout";
    case ProviderErrorKind::kRejected:
      return "rejected";
    case ProviderErrorKind::kNetwork:
      return "network";
  }
  return "unknown";
}

const char* ProviderErrorDetail::type_id() const {
  return "oauthlink::oauth::ProviderErrorDetail";
}

std::string ProviderErrorDetail::ToString() const {
  std::string s = "provider error: " + ProviderErrorKindToString(kind_);
  if (http_status_ != 0) s += " (HTTP " + std::to_string(http_status_) + ")";
  return s;
}

arrow::Status ProviderErrorDetail::MakeStatus(ProviderErrorKind kind, int http_status,
                                              const std::string& message) {
  auto code = kind == ProviderErrorKind::kRejected ? arrow::StatusCode::Invalid
                                                   : arrow::StatusCode::IOError;
  return arrow::Status(code, message,
                       std::make_shared<ProviderErrorDetail>(kind, http_status));
}

std::shared_ptr<ProviderErrorDetail> ProviderErrorDetail::UnwrapStatus(
    const arrow::Status& status) {
  auto detail = status.detail();
  if (!detail) return nullptr;
  return std::dynamic_pointer_cast<ProviderErrorDetail>(detail);
}

std::string UrlEncode(const std::string& value) {
  std::ostringstream out;
  out << std::hex << std::uppercase;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out << c;
    } else {
      out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return out.str();
}

std::string DescribeErrorBody(const std::string& body,
                              std::initializer_list<const char*> fields,
                              bool raw_when_unmatched) {
  auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_object()) {
    for (const char* field : fields) {
      auto it = parsed.find(field);
      if (it != parsed.end() && it->is_string()) return it->get<std::string>();
    }
    if (!raw_when_unmatched) return "Unknown error";
  }
  return body.size() > kMaxErrorBodyChars ? body.substr(0, kMaxErrorBodyChars) : body;
}

struct HttpProviderClient::Endpoint {
  arrow::Status url_status;  // Not OK when the configured URL could not be split
  std::string path;
  std::chrono::milliseconds timeout;
  std::unique_ptr<ClientPool> clients;

  /// Lease a client and arm it with what is left of the bound since `started`.
  arrow::Result<ClientPool::Lease> Checkout(std::chrono::steady_clock::time_point started) {
    auto lease = clients->Acquire(timeout);
    if (!lease.ok()) return TimedOut(timeout);

    auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - started);
    if (remaining.count() <= 0) return TimedOut(timeout);
    ApplyTimeout(**lease, remaining);
    return lease;
  }
};

std::unique_ptr<HttpProviderClient::Endpoint> HttpProviderClient::OpenEndpoint(
    const std::string& url, std::chrono::milliseconds timeout, int clients) {
  auto endpoint = std::make_unique<Endpoint>();
  endpoint->timeout = timeout;

  std::vector<std::unique_ptr<httplib::Client>> pool;
  auto target = Split(url);
  if (target.ok()) {
    endpoint->path = target->path;
    for (int i = 0; i < std::max(clients, 1); ++i) {
      auto client = std::make_unique<httplib::Client>(target->base);
      client->set_keep_alive(true);
      pool.push_back(std::move(client));
    }
  } else {
    endpoint->url_status = target.status();
  }
  endpoint->clients = std::make_unique<ClientPool>(std::move(pool));
  return endpoint;
}

HttpProviderClient::HttpProviderClient(ProviderConfig config)
    : config_(std::move(config)),
      token_endpoint_(OpenEndpoint(config_.token_url, config_.exchange_timeout,
                                   config_.clients_per_endpoint)),
      profile_endpoint_(OpenEndpoint(config_.profile_url, config_.profile_timeout,
                                     config_.clients_per_endpoint)) {}

HttpProviderClient::~HttpProviderClient() = default;

std::string HttpProviderClient::AuthorizeUrl() const {
  std::string url = config_.authorize_url;
  url += (url.find('?') == std::string::npos) ? "?" : "&";
  url += "client_id=" + UrlEncode(config_.client_id);
  url += "&redirect_uri=" + UrlEncode(config_.redirect_uri);
  url += "&response_type=code";
  url += "&scope=" + UrlEncode(config_.scope);
  return url;
}

arrow::Result<TokenResponse> HttpProviderClient::ExchangeCode(const std::string& code) {
  Endpoint& endpoint = *token_endpoint_;
  if (!endpoint.url_status.ok()) {
    return ProviderErrorDetail::MakeStatus(ProviderErrorKind::kNetwork, 0,
                                           endpoint.url_status.message());
  }

  httplib::Params params;
  params.emplace("client_id", config_.client_id);
  params.emplace("client_secret", config_.client_secret);
  params.emplace("grant_type", "authorization_code");
  params.emplace("code", code);
  params.emplace("redirect_uri", config_.redirect_uri);

  httplib::Headers headers = {{"Accept", "application/json"}, {"User-Agent", UserAgent()}};

  OAUTHLINK_LOG(DEBUG) << "Exchanging authorization code " << redact_for_logs(code)
                       << " at " << config_.token_url;

  auto started = std::chrono::steady_clock::now();
  ARROW_ASSIGN_OR_RAISE(auto client, endpoint.Checkout(started));
  auto result = client->Post(endpoint.path, headers, params);
  if (!result) {
    return TransportFailure(result.error(), started, endpoint.timeout);
  }

  if (result->status < 200 || result->status >= 300) {
    return ProviderErrorDetail::MakeStatus(
        ProviderErrorKind::kRejected, result->status,
        DescribeErrorBody(result->body, {"error_description", "error"}));
  }

  auto json = nlohmann::json::parse(result->body, nullptr, /*allow_exceptions=*/false);
  if (!json.is_object()) {
    return ProviderErrorDetail::MakeStatus(ProviderErrorKind::kRejected, result->status,
                                           "Invalid JSON response from provider");
  }

  TokenResponse token;
  if (auto it = json.find("access_token"); it != json.end() && it->is_string() &&
                                            !it->get<std::string>().empty()) {
    token.access_token = it->get<std::string>();
  }
  if (auto it = json.find("token_type"); it != json.end() && it->is_string()) {
    token.token_type = it->get<std::string>();
  }
  if (auto it = json.find("expires_in"); it != json.end() && it->is_number_integer()) {
    token.expires_in = it->get<int64_t>();
  }
  if (auto it = json.find("scope"); it != json.end() && it->is_string()) {
    token.scope = it->get<std::string>();
  }
  return token;
}

arrow::Result<UserProfile> HttpProviderClient::FetchProfile(const std::string& access_token) {
  Endpoint& endpoint = *profile_endpoint_;
  if (!endpoint.url_status.ok()) {
    return ProviderErrorDetail::MakeStatus(ProviderErrorKind::kNetwork, 0,
                                           endpoint.url_status.message());
  }

  httplib::Headers headers = {{"Authorization", "Bearer " + access_token},
                              {"Accept", "application/json"},
                              {"User-Agent", UserAgent()}};

  auto started = std::chrono::steady_clock::now();
  ARROW_ASSIGN_OR_RAISE(auto client, endpoint.Checkout(started));
  auto result = client->Get(endpoint.path, headers);
  if (!result) {
    return TransportFailure(result.error(), started, endpoint.timeout);
  }

  if (result->status < 200 || result->status >= 300) {
    return ProviderErrorDetail::MakeStatus(ProviderErrorKind::kRejected, result->status,
                                           DescribeErrorBody(result->body, {"message"},
                                                             /*raw_when_unmatched=*/true));
  }

  auto json = nlohmann::json::parse(result->body, nullptr, /*allow_exceptions=*/false);
  if (!json.is_object()) {
    return ProviderErrorDetail::MakeStatus(ProviderErrorKind::kRejected, result->status,
                                           "Invalid JSON from provider user API");
  }

  std::optional<std::string> id;
  if (auto it = json.find("id"); it != json.end()) id = StringOrNumber(*it);
  auto username = json.find("username");
  if (!id || username == json.end() || !username->is_string()) {
    return ProviderErrorDetail::MakeStatus(ProviderErrorKind::kRejected, result->status,
                                           "Profile response missing id or username");
  }

  UserProfile profile{.id = *id, .username = username->get<std::string>()};
  if (auto it = json.find("discriminator"); it != json.end()) {
    profile.discriminator = StringOrNumber(*it);
  }
  if (auto it = json.find("avatar"); it != json.end() && it->is_string()) {
    profile.avatar = it->get<std::string>();
  }
  return profile;
}

}  // namespace oauthlink::oauth
