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

#include "oauthlink_logging.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

#include <unistd.h>

#include <nlohmann/json.hpp>

namespace oauthlink {
namespace {

using arrow::util::ArrowLogLevel;

// Fields of the OAUTHLINK_LOGKV call currently being logged on this thread.
// Arrow's LogDetails only carries a message, so the fields travel beside it.
thread_local const FieldList* tl_pending_fields = nullptr;

// Field and message text comes from requests; invalid UTF-8 becomes U+FFFD.
std::string DumpJson(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Publishes the fields for the duration of one Log() call.
class PendingFieldsScope {
 public:
  explicit PendingFieldsScope(const FieldList& fields) { tl_pending_fields = &fields; }
  ~PendingFieldsScope() { tl_pending_fields = nullptr; }

  PendingFieldsScope(const PendingFieldsScope&) = delete;
  PendingFieldsScope& operator=(const PendingFieldsScope&) = delete;
};

std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count() %
                      1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_utc);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03lldZ", date, static_cast<long long>(millis));
  return out;
}

const char* SeverityName(ArrowLogLevel level) {
  switch (level) {
    case ArrowLogLevel::ARROW_TRACE:
      return "TRACE";
    case ArrowLogLevel::ARROW_DEBUG:
      return "DEBUG";
    case ArrowLogLevel::ARROW_INFO:
      return "INFO";
    case ArrowLogLevel::ARROW_WARNING:
      return "WARN";
    case ArrowLogLevel::ARROW_ERROR:
      return "ERROR";
    case ArrowLogLevel::ARROW_FATAL:
      return "FATAL";
  }
  return "INFO";
}

std::string ThreadId() {
  std::ostringstream tid;
  tid << std::this_thread::get_id();
  return tid.str();
}

std::string TextValue(const FieldValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
          for (char c : v) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == '"') {
              return DumpJson(nlohmann::json(v));
            }
          }
          return v.empty() ? "\"\"" : v;
        } else if constexpr (std::is_same_v<V, bool>) {
          return v ? "true" : "false";
        } else {
          return DumpJson(nlohmann::json(v));
        }
      },
      value);
}

/// Writes formatted lines to stderr, stdout or an owned file.
class LogSink {
 public:
  void Open(const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.reset();
    out_ = &std::cerr;
    if (!path) return;
    if (*path == "-") {
      out_ = &std::cout;
      return;
    }
    auto file = std::make_unique<std::ofstream>(*path, std::ios::app);
    if (!*file) {
      std::cerr << "WARN Unable to open log file '" << *path << "', logging to stderr\n";
      return;
    }
    file_ = std::move(file);
    out_ = file_.get();
  }

  void WriteLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    (*out_) << line << '\n';
    out_->flush();
  }

 private:
  std::mutex mutex_;
  std::unique_ptr<std::ofstream> file_;
  std::ostream* out_ = &std::cerr;
};

class OAuthLinkLogger final : public arrow::util::Logger {
 public:
  explicit OAuthLinkLogger(LogConfig config) : config_(std::move(config)) {
    sink_.Open(config_.file_path);
  }

  bool is_enabled() const override { return true; }

  ArrowLogLevel severity_threshold() const override { return config_.level; }

  void Log(const arrow::util::LogDetails& details) override {
    const FieldList* fields = tl_pending_fields;
    std::string line;
    try {
      line = config_.format == LogFormat::kJson ? FormatJson(details, fields)
                                                : FormatText(details, fields);
    } catch (const std::exception& e) {
      // Callers include httplib worker threads with no handler above them.
      line = UtcTimestamp() + " ERROR - log formatting failed: " + e.what();
    }
    sink_.WriteLine(line);
  }

 private:
  std::string FormatText(const arrow::util::LogDetails& d, const FieldList* fields) const {
    std::ostringstream line;
    line << UtcTimestamp() << " " << SeverityName(d.severity) << " pid=" << getpid()
         << " tid=" << ThreadId();
    if (config_.component) line << " component=" << *config_.component;
    if (config_.show_source) {
      line << " src=" << d.source_location.file << ":" << d.source_location.line;
    }
    line << " - " << d.message;
    if (fields) {
      for (const auto& field : *fields) {
        line << " " << field.key << "=" << TextValue(field.value);
      }
    }
    return line.str();
  }

  std::string FormatJson(const arrow::util::LogDetails& d, const FieldList* fields) const {
    nlohmann::json j;
    j["ts"] = UtcTimestamp();
    j["lvl"] = SeverityName(d.severity);
    j["pid"] = getpid();
    j["tid"] = ThreadId();
    if (config_.component) j["component"] = *config_.component;
    if (config_.show_source) {
      j["file"] = d.source_location.file;
      j["line"] = d.source_location.line;
    }
    j["msg"] = std::string(d.message);
    if (fields) {
      for (const auto& field : *fields) {
        // Reserved keys keep their meaning
        const std::string key = j.contains(field.key) ? "field_" + field.key : field.key;
        std::visit([&](const auto& v) { j[key] = v; }, field.value);
      }
    }
    return DumpJson(j);
  }

  LogConfig config_;
  LogSink sink_;
};

}  // namespace

void InitLogging(const LogConfig& cfg) {
  arrow::util::LoggerRegistry::SetDefaultLogger(std::make_shared<OAuthLinkLogger>(cfg));
}

void LogWithFields(ArrowLogLevel level, const char* file, int line, std::string_view msg,
                   const FieldList& fields) {
  auto logger = arrow::util::LoggerRegistry::GetDefaultLogger();
  if (!logger || !logger->is_enabled() || level < logger->severity_threshold()) {
    return;
  }

  arrow::util::LogDetails details;
  details.severity = level;
  details.message = msg;
  details.source_location.file = file;
  details.source_location.line = static_cast<uint32_t>(line);

  PendingFieldsScope scope(fields);
  logger->Log(details);
}

arrow::Result<ArrowLogLevel> ParseLogLevel(const std::string& name) {
  const auto v = ToLower(name);
  if (v == "debug") return ArrowLogLevel::ARROW_DEBUG;
  if (v == "info") return ArrowLogLevel::ARROW_INFO;
  if (v == "warn" || v == "warning") return ArrowLogLevel::ARROW_WARNING;
  if (v == "error") return ArrowLogLevel::ARROW_ERROR;
  if (v == "fatal") return ArrowLogLevel::ARROW_FATAL;
  return arrow::Status::Invalid("Unknown log level '", name,
                                "' (expected debug, info, warn, error or fatal)");
}

}  // namespace oauthlink
