#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace hwbridge::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing log level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// Destination shared by every component logger of one process. Records from
// concurrent io/handler/worker threads are written whole, never interleaved.
class LogSink {
public:
  explicit LogSink(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(MinLevel());
  }

  void Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    (*out_) << line << '\n';
    out_->flush();
  }

private:
  mutable std::mutex mutex_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
};

// Cheap-to-copy handle that stamps every record with a component name.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : sink_(std::make_shared<LogSink>(min_level, out)) {}

  Logger(std::shared_ptr<LogSink> sink, std::string component)
      : sink_(std::move(sink)), component_(std::move(component)) {}

  Logger Child(std::string component) const {
    return Logger(sink_, std::move(component));
  }

  void SetMinLevel(LogLevel level) {
    sink_->SetMinLevel(level);
  }

  LogLevel MinLevel() const {
    return sink_->MinLevel();
  }

  const std::string& Component() const {
    return component_;
  }

  bool ShouldLog(LogLevel level) const {
    return sink_->ShouldLog(level);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) const {
    if (!ShouldLog(level)) {
      return;
    }

    std::ostringstream line;
    line << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
         << " level=" << ToString(level)
         << " component=" << Quote(component_)
         << " msg=" << Quote(message);

    for (const auto& field : fields) {
      line << ' ' << field.key << '=' << Quote(field.value);
    }

    sink_->Write(line.str());
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  std::shared_ptr<LogSink> sink_;
  std::string component_ = "main";
};

} // namespace hwbridge::core::logging
