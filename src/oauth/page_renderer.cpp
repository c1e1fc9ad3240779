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

#include "page_renderer.h"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>

#include "html_templates.h"
#include "oauthlink_library.h"

namespace oauthlink::oauth {
namespace {

constexpr std::array<std::string_view, 9> kMobileKeywords = {
    "mobile", "android", "iphone", "ipad", "ipod", "webos", "blackberry", "opera mini",
    "opera mobi"};

constexpr uint32_t kFnvOffsetBasis = 2166136261u;
constexpr uint32_t kFnvPrime = 16777619u;

bool IsPlaceholderChar(char c) {
  return (c >= 'A' && c <= 'Z') || c == '_';
}

}  // namespace

Viewport ViewportFromUserAgent(std::string_view user_agent) {
  std::string ua(user_agent);
  for (auto& c : ua) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (auto keyword : kMobileKeywords) {
    if (ua.find(keyword) != std::string::npos) return Viewport::kMobile;
  }
  return Viewport::kDesktop;
}

std::string HtmlEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string ErrorHexCode(std::string_view code) {
  uint32_t hash = kFnvOffsetBasis;
  for (unsigned char c : code) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  char buf[5];
  std::snprintf(buf, sizeof(buf), "%04X", static_cast<unsigned>(hash & 0xFFFFu));
  return buf;
}

std::string CurrentTimestamp() {
  std::time_t t = std::time(nullptr);
  std::tm tm_local{};
  localtime_r(&t, &tm_local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_local);
  return buf;
}

std::string FillTemplate(std::string_view tmpl,
                         const std::map<std::string, std::string>& values) {
  std::string out;
  out.reserve(tmpl.size());

  size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] != '%') {
      out += tmpl[i++];
      continue;
    }
    size_t end = i + 1;
    while (end < tmpl.size() && IsPlaceholderChar(tmpl[end])) ++end;
    if (end < tmpl.size() && end > i + 1 && tmpl[end] == '%') {
      auto it = values.find(std::string(tmpl.substr(i + 1, end - i - 1)));
      if (it != values.end()) {
        out += it->second;
        i = end + 1;
        continue;
      }
    }
    out += tmpl[i++];
  }
  return out;
}

PageRenderer::PageRenderer(TimestampFn timestamp)
    : timestamp_(timestamp ? std::move(timestamp) : TimestampFn(CurrentTimestamp)) {}

std::string PageRenderer::Page(const std::string& title, const std::string& content,
                               const std::string& footer, const std::string& timestamp,
                               Viewport viewport) const {
  return FillTemplate(kPageShell,
                      {{"TITLE", HtmlEscape(title)},
                       {"STYLES", kPageStyles},
                       {"VIEWPORT", viewport == Viewport::kMobile ? "mobile" : "desktop"},
                       {"TIMESTAMP", HtmlEscape(timestamp)},
                       {"CONTENT", content},
                       {"FOOTER", footer}});
}

std::string PageRenderer::Render(const CallbackResult& result, Viewport viewport) const {
  if (const auto* success = std::get_if<CallbackSuccess>(&result)) {
    return RenderSuccess(*success, viewport);
  }
  const auto& failure = std::get<CallbackFailure>(result);
  return RenderError(failure.code, failure.message, viewport);
}

std::string PageRenderer::RenderSuccess(const CallbackSuccess& success,
                                        Viewport viewport) const {
  auto content = FillTemplate(kSuccessSequence,
                              {{"USER_ID", HtmlEscape(success.user_id)},
                               {"USERNAME", HtmlEscape(success.display_name)}});
  return Page("Authentication Successful", content, "", timestamp_(), viewport);
}

std::string PageRenderer::RenderError(const std::string& code, const std::string& message,
                                      Viewport viewport) const {
  const std::string timestamp = timestamp_();
  auto content = FillTemplate(kErrorSequence, {{"ERROR_CODE", HtmlEscape(code)},
                                               {"ERROR_HEX", ErrorHexCode(code)},
                                               {"ERROR_MESSAGE", HtmlEscape(message)},
                                               {"TIMESTAMP", HtmlEscape(timestamp)}});
  return Page("Authentication Failed", content, "", timestamp, viewport);
}

std::string PageRenderer::RenderLanding(const std::string& authorize_url, Viewport viewport,
                                        bool store_connected) const {
  const char* boot =
      viewport == Viewport::kMobile ? kBootSequenceMobile : kBootSequenceDesktop;
  auto content =
      FillTemplate(boot, {{"VERSION", HtmlEscape(OAUTHLINK_SERVER_VERSION)},
                          {"STORE_STATE", store_connected ? "CONNECTED" : "OFFLINE"}});
  auto footer = FillTemplate(kConnectFooter, {{"AUTHORIZE_URL", HtmlEscape(authorize_url)}});
  return Page("OAuth", content, footer, timestamp_(), viewport);
}

std::string PageRenderer::RenderCredits(Viewport viewport) const {
  auto content = FillTemplate(
      kCreditsSequence,
      {{"BANNER",
        viewport == Viewport::kMobile ? kCreditsBannerMobile : kCreditsBannerDesktop},
       {"VERSION", HtmlEscape(OAUTHLINK_SERVER_VERSION)}});
  return Page("Credits", content, kHomeFooter, timestamp_(), viewport);
}

}  // namespace oauthlink::oauth
