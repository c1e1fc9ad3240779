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

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>

#include <arrow/result.h>
#include <arrow/status.h>

namespace oauthlink::oauth {

enum class ProviderErrorKind { kTimeout, kRejected, kNetwork };

std::string ProviderErrorKindToString(ProviderErrorKind kind);

/// Attached to every error status returned by ProviderClient.
class ProviderErrorDetail : public arrow::StatusDetail {
 public:
  ProviderErrorDetail(ProviderErrorKind kind, int http_status)
      : kind_(kind), http_status_(http_status) {}

  const char* type_id() const override;
  std::string ToString() const override;

  ProviderErrorKind kind() const { return kind_; }

  /// HTTP status of a rejected call; 0 for timeouts and transport failures.
  int http_status() const { return http_status_; }

  /// Build a status carrying this detail. `message` is the provider-facing detail
  /// text (error description, transport error) without any prefix.
  static arrow::Status MakeStatus(ProviderErrorKind kind, int http_status,
                                  const std::string& message);

  /// Try to extract a ProviderErrorDetail from a status.
  static std::shared_ptr<ProviderErrorDetail> UnwrapStatus(const arrow::Status& status);

 private:
  ProviderErrorKind kind_;
  int http_status_;
};

struct TokenResponse {
  std::optional<std::string> access_token;
  std::string token_type;
  std::optional<int64_t> expires_in;
  std::string scope;
};

struct UserProfile {
  std::string id;  // Decimal text when the provider sends a number
  std::string username;
  std::optional<std::string> discriminator;
  std::optional<std::string> avatar;
};

struct ProviderConfig {
  std::string client_id;
  std::string client_secret;
  std::string redirect_uri;
  std::string scope = "identify";
  std::string authorize_url = "https://discord.com/oauth2/authorize";
  std::string token_url = "https://discord.com/api/oauth2/token";
  std::string profile_url = "https://discord.com/api/v10/users/@me";
  std::chrono::milliseconds exchange_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds profile_timeout{std::chrono::seconds(15)};
  int clients_per_endpoint = 4;  // Keep-alive connections held per provider endpoint
};

/// Outbound calls to the identity provider.
class ProviderClient {
 public:
  virtual ~ProviderClient() = default;

  /// Trade an authorization code for a token. Presence of `access_token` in the
  /// response is left to the caller.
  virtual arrow::Result<TokenResponse> ExchangeCode(const std::string& code) = 0;

  virtual arrow::Result<UserProfile> FetchProfile(const std::string& access_token) = 0;
};

/// ProviderClient speaking HTTP(S) through cpp-httplib. One instance serves all
/// request threads; each endpoint keeps a small pool of keep-alive clients that
/// are leased per call.
class HttpProviderClient : public ProviderClient {
 public:
  explicit HttpProviderClient(ProviderConfig config);
  ~HttpProviderClient() override;

  HttpProviderClient(const HttpProviderClient&) = delete;
  HttpProviderClient& operator=(const HttpProviderClient&) = delete;

  arrow::Result<TokenResponse> ExchangeCode(const std::string& code) override;
  arrow::Result<UserProfile> FetchProfile(const std::string& access_token) override;

  /// The provider authorization URL the landing page and /authorize send users to.
  std::string AuthorizeUrl() const;

  const ProviderConfig& config() const { return config_; }

 private:
  struct Endpoint;

  static std::unique_ptr<Endpoint> OpenEndpoint(const std::string& url,
                                                std::chrono::milliseconds timeout,
                                                int clients);

  ProviderConfig config_;
  std::unique_ptr<Endpoint> token_endpoint_;
  std::unique_ptr<Endpoint> profile_endpoint_;
};

/// Percent-encode a query component (RFC 3986 unreserved characters pass through).
std::string UrlEncode(const std::string& value);

/// Human-readable detail from a provider error body. JSON objects yield the first
/// present string field of `fields`, else "Unknown error" (or the raw body when
/// `raw_when_unmatched`); anything else yields the raw body cut to 200 characters.
std::string DescribeErrorBody(const std::string& body,
                              std::initializer_list<const char*> fields,
                              bool raw_when_unmatched = false);

}  // namespace oauthlink::oauth
