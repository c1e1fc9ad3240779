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

#include "access_log.h"

#include <chrono>
#include <string>

#include "httplib.h"

#include "detail/request_ctx.h"
#include "oauthlink_logging.h"

namespace oauthlink {
using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

void LogAccess(const httplib::Request& req, const httplib::Response& res) {
  const auto& ctx = tl_request_ctx;
  auto dur_ms = duration_cast<milliseconds>(steady_clock::now() - ctx.started).count();

  // Path only; the query string carries authorization codes.
  OAUTHLINK_LOGKV(INFO, "access", {"kind", "access"}, {"method", req.method},
                  {"path", req.path}, {"status", static_cast<int64_t>(res.status)},
                  {"client_ip", ctx.real_ip.empty() ? req.remote_addr : ctx.real_ip},
                  {"scheme", ctx.scheme}, {"request_id", ctx.request_id},
                  {"user_agent", req.get_header_value("User-Agent")},
                  {"duration_ms", static_cast<int64_t>(dur_ms)});
}

}  // namespace oauthlink
