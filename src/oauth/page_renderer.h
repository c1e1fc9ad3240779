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

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "callback_flow.h"

namespace oauthlink::oauth {

enum class Viewport { kDesktop, kMobile };

/// Mobile when the User-Agent names a handheld browser.
Viewport ViewportFromUserAgent(std::string_view user_agent);

std::string HtmlEscape(std::string_view text);

/// FNV-1a 32-bit hash of `code`, masked to 16 bits, as 4 uppercase hex digits.
/// Decoration only.
std::string ErrorHexCode(std::string_view code);

/// Local wall-clock time as "YYYY-MM-DD HH:MM:SS".
std::string CurrentTimestamp();

/// Replace %NAME% placeholders in one pass. Unknown placeholders are left as is and
/// substituted text is never rescanned.
std::string FillTemplate(std::string_view tmpl, const std::map<std::string, std::string>& values);

/// Turns results into HTML documents. Performs no I/O.
class PageRenderer {
 public:
  using TimestampFn = std::function<std::string()>;

  explicit PageRenderer(TimestampFn timestamp = {});

  std::string Render(const CallbackResult& result, Viewport viewport) const;

  std::string RenderError(const std::string& code, const std::string& message,
                          Viewport viewport) const;

  std::string RenderLanding(const std::string& authorize_url, Viewport viewport,
                            bool store_connected = true) const;

  std::string RenderCredits(Viewport viewport) const;

 private:
  std::string RenderSuccess(const CallbackSuccess& success, Viewport viewport) const;

  std::string Page(const std::string& title, const std::string& content,
                   const std::string& footer, const std::string& timestamp,
                   Viewport viewport) const;

  TimestampFn timestamp_;
};

}  // namespace oauthlink::oauth
