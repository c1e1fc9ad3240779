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

#include "callback_flow.h"

#include <algorithm>
#include <cctype>
#include <chrono>

#include "oauthlink_logging.h"

namespace oauthlink::oauth {
namespace {

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

int64_t WallClockSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

struct StepMessages {
  const char* rejected;  // followed by " (STATUS): DETAIL"
  const char* timed_out;
  const char* network;  // followed by ": DETAIL"
};

constexpr StepMessages kExchangeMessages{
    .rejected = "Token exchange failed",
    .timed_out = "Token exchange timed out",
    .network = "Network error during token exchange",
};

constexpr StepMessages kProfileMessages{
    .rejected = "Failed to fetch user info",
    .timed_out = "User info request timed out",
    .network = "Network error fetching user info",
};

std::string DescribeProviderError(const arrow::Status& status, const StepMessages& msgs) {
  auto detail = ProviderErrorDetail::UnwrapStatus(status);
  if (!detail) {
    return std::string(msgs.network) + ": " + status.message();
  }
  switch (detail->kind()) {
    case ProviderErrorKind::kRejected:
      return std::string(msgs.rejected) + " (" + std::to_string(detail->http_status()) +
             "): " + status.message();
    case ProviderErrorKind::kTimeout:
      return msgs.timed_out;
    case ProviderErrorKind::kNetwork:
      break;
  }
  return std::string(msgs.network) + ": " + status.message();
}

std::string ErrorKind(const arrow::Status& status) {
  auto detail = ProviderErrorDetail::UnwrapStatus(status);
  return detail ? ProviderErrorKindToString(detail->kind()) : "network";
}

}  // namespace

std::string DisplayName(const std::string& username,
                        const std::optional<std::string>& discriminator,
                        bool legacy_discriminator) {
  if (legacy_discriminator && discriminator && !discriminator->empty() &&
      *discriminator != "0") {
    return username + "#" + *discriminator;
  }
  return username;
}

CallbackFlow::CallbackFlow(ProviderClient& provider, store::UserStore& store,
                           bool legacy_discriminator, Clock now_seconds)
    : provider_(provider),
      store_(store),
      legacy_discriminator_(legacy_discriminator),
      now_seconds_(now_seconds ? std::move(now_seconds) : Clock(WallClockSeconds)) {}

CallbackFailure CallbackFlow::Fail(std::string code, std::string message) const {
  OAUTHLINK_LOGKV(WARNING, "OAuth callback failed", {"kind", "oauth_callback"},
                  {"result", "failure"}, {"code", code}, {"message", message});
  return CallbackFailure{.code = std::move(code), .message = std::move(message)};
}

CallbackResult CallbackFlow::Run(const CallbackParams& params) {
  if (params.error && !params.error->empty()) {
    return Fail(Upper(*params.error),
                params.error_description.value_or("Authorization was denied."));
  }
  if (!params.code || params.code->empty()) {
    return Fail("NO_CODE", "No authorization code received.");
  }

  auto token = provider_.ExchangeCode(*params.code);
  if (!token.ok()) {
    OAUTHLINK_LOGKV(DEBUG, "Token exchange error", {"kind", "oauth_callback"},
                    {"error_kind", ErrorKind(token.status())},
                    {"error", token.status().ToString()});
    return Fail("TOKEN_ERROR", DescribeProviderError(token.status(), kExchangeMessages));
  }
  if (!token->access_token) {
    return Fail("NO_TOKEN", "No access token in response.");
  }

  auto profile = provider_.FetchProfile(*token->access_token);
  if (!profile.ok()) {
    OAUTHLINK_LOGKV(DEBUG, "Profile fetch error", {"kind", "oauth_callback"},
                    {"error_kind", ErrorKind(profile.status())},
                    {"error", profile.status().ToString()});
    return Fail("USER_ERROR", DescribeProviderError(profile.status(), kProfileMessages));
  }

  store::UserRecord record{
      .id = profile->id,
      .username = profile->username,
      .discriminator = profile->discriminator,
      .avatar_hash = profile->avatar,
      .connected_at = now_seconds_(),
  };

  auto status = store_.Upsert(record);
  if (!status.ok()) {
    OAUTHLINK_LOGKV(WARNING, "User linked but not persisted", {"kind", "oauth_callback"},
                    {"result", "store_unavailable"}, {"user_id", record.id},
                    {"error", status.ToString()});
  } else {
    OAUTHLINK_LOGKV(INFO, "User linked", {"kind", "oauth_callback"}, {"result", "success"},
                    {"user_id", record.id}, {"username", record.username});
  }

  return CallbackSuccess{
      .user_id = profile->id,
      .display_name =
          DisplayName(profile->username, profile->discriminator, legacy_discriminator_),
  };
}

}  // namespace oauthlink::oauth
