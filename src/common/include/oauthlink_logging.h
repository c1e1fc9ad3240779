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

#include <arrow/result.h>
#include <arrow/util/logger.h>  // Arrow v21+
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace oauthlink {

enum class LogFormat { kText, kJson };

struct LogConfig {
  LogFormat format = LogFormat::kText;
  arrow::util::ArrowLogLevel level = arrow::util::ArrowLogLevel::ARROW_INFO;
  std::optional<std::string> file_path{};  // "-" = stdout; unset = stderr
  std::optional<std::string> component{};  // e.g. "oauthlink"
  bool show_source = false;
};

using FieldValue = std::variant<std::string, int64_t, double, bool>;

struct Field {
  std::string key;
  FieldValue value;
};

using FieldList = std::vector<Field>;

/// Install the oauthlink logger as Arrow's default logger. May be called again to
/// reconfigure; the previous sink is closed.
void InitLogging(const LogConfig& cfg);

/// Structured entry point behind OAUTHLINK_LOGKV. Fields are rendered as key=value
/// pairs (text) or top-level members (JSON).
void LogWithFields(arrow::util::ArrowLogLevel level, const char* file, int line,
                   std::string_view msg, const FieldList& fields = {});

/// debug|info|warn|warning|error|fatal, case-insensitive.
arrow::Result<arrow::util::ArrowLogLevel> ParseLogLevel(const std::string& name);

inline std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Keep a short prefix of a credential-like value (codes, tokens) for log lines
inline std::string redact_for_logs(std::string_view value, size_t keep = 6) {
  if (value.size() <= keep) return std::string(value.size(), '*');
  return std::string(value.substr(0, keep)) + "...";
}

#define OAUTHLINK_LOG(SEV)                                                      \
  (::arrow::util::LogMessage(::arrow::util::ArrowLogLevel::ARROW_##SEV,         \
                             ::arrow::util::LoggerRegistry::GetDefaultLogger(), \
                             ::arrow::util::SourceLocation{__FILE__, __LINE__}) \
       .Stream())

#define OAUTHLINK_LOGKV(SEV, MSG, ...)                                            \
  ::oauthlink::LogWithFields(::arrow::util::ArrowLogLevel::ARROW_##SEV, __FILE__, \
                             __LINE__, MSG, ::oauthlink::FieldList{__VA_ARGS__})

}  // namespace oauthlink
