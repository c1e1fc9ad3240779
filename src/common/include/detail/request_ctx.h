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
#include <optional>
#include <string>

namespace httplib {
struct Request;
}  // namespace httplib

namespace oauthlink {

/// Which forwarding headers to believe, and from whom.
struct ProxyConfig {
  std::string trusted_proxies = "*";  // "*" or comma-separated peer addresses
  std::string host_header = "X-Forwarded-Host";
  std::string proto_header = "X-Forwarded-Proto";
};

struct RequestCtx {
  std::string peer;
  std::string real_ip;
  std::string scheme;
  std::string host;
  std::string request_id;
  std::chrono::steady_clock::time_point started;
};

// One scratchpad per HTTP worker thread, reset at the start of every request
inline thread_local RequestCtx tl_request_ctx;

/// True when `peer` may set forwarding headers.
bool IsTrustedProxy(const ProxyConfig& config, const std::string& peer);

/// Client address, scheme, host and request id as seen before any reverse proxy.
/// `listener_scheme` is "https" when the server terminates TLS itself.
RequestCtx ResolveRequestCtx(const httplib::Request& req, const ProxyConfig& config,
                             const std::string& listener_scheme);

}  // namespace oauthlink
