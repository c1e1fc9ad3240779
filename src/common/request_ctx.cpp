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

#include "detail/request_ctx.h"

#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "httplib.h"

#include <nlohmann/json.hpp>

namespace oauthlink {
namespace {

std::string HeaderOrEmpty(const httplib::Request& req, const std::string& name) {
  if (name.empty() || !req.has_header(name)) return "";
  return boost::algorithm::trim_copy(req.get_header_value(name));
}

std::string FirstListEntry(const std::string& value) {
  auto comma = value.find(',');
  return boost::algorithm::trim_copy(value.substr(0, comma));
}

std::string SchemeFromCfVisitor(const std::string& value) {
  auto json = nlohmann::json::parse(value, nullptr, /*allow_exceptions=*/false);
  if (!json.is_object()) return "";
  auto it = json.find("scheme");
  if (it == json.end() || !it->is_string()) return "";
  return boost::algorithm::to_lower_copy(it->get<std::string>());
}

std::string MakeRequestId() {
  return boost::uuids::to_string(boost::uuids::random_generator()());
}

}  // namespace

bool IsTrustedProxy(const ProxyConfig& config, const std::string& peer) {
  auto trusted = boost::algorithm::trim_copy(config.trusted_proxies);
  if (trusted == "*") return true;
  if (trusted.empty()) return false;

  std::vector<std::string> entries;
  boost::algorithm::split(entries, trusted, boost::algorithm::is_any_of(","));
  for (auto& entry : entries) {
    boost::algorithm::trim(entry);
    if (!entry.empty() && entry == peer) return true;
  }
  return false;
}

RequestCtx ResolveRequestCtx(const httplib::Request& req, const ProxyConfig& config,
                             const std::string& listener_scheme) {
  RequestCtx ctx;
  ctx.peer = req.remote_addr;
  ctx.started = std::chrono::steady_clock::now();

  const bool trusted = IsTrustedProxy(config, req.remote_addr);

  if (trusted) {
    ctx.real_ip = HeaderOrEmpty(req, "CF-Connecting-IP");
    if (ctx.real_ip.empty()) ctx.real_ip = HeaderOrEmpty(req, "X-Real-IP");
    if (ctx.real_ip.empty()) ctx.real_ip = FirstListEntry(HeaderOrEmpty(req, "X-Forwarded-For"));

    ctx.scheme = SchemeFromCfVisitor(HeaderOrEmpty(req, "CF-Visitor"));
    if (ctx.scheme.empty()) {
      ctx.scheme = boost::algorithm::to_lower_copy(
          FirstListEntry(HeaderOrEmpty(req, config.proto_header)));
    }

    ctx.host = FirstListEntry(HeaderOrEmpty(req, config.host_header));

    ctx.request_id = HeaderOrEmpty(req, "X-Amzn-Trace-Id");
    if (ctx.request_id.empty()) ctx.request_id = HeaderOrEmpty(req, "X-Request-Id");
  }

  if (ctx.real_ip.empty()) ctx.real_ip = req.remote_addr;
  if (ctx.scheme.empty()) ctx.scheme = listener_scheme;
  if (ctx.host.empty()) ctx.host = HeaderOrEmpty(req, "Host");
  if (ctx.request_id.empty()) ctx.request_id = MakeRequestId();
  return ctx;
}

}  // namespace oauthlink
