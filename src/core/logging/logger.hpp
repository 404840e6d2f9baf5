#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace lfspack::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

// One `key=value` pair. Byte counts and object counts are passed as numbers
// and rendered without quotes so log lines stay grep-friendly.
struct LogField {
  LogField(std::string_view field_key, std::string_view field_value)
      : key(field_key), value(field_value) {}
  LogField(std::string_view field_key, const char* field_value)
      : key(field_key), value(field_value == nullptr ? "" : field_value) {}
  LogField(std::string_view field_key, std::uint64_t field_value)
      : key(field_key), value(std::to_string(field_value)) {}

  std::string_view key;
  std::string value;
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
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    error = "invalid --log-level '" + std::string(raw) + "' (expected " +
            ExpectedLogLevelList() + ")";
    return false;
  }
  return true;
}

// Appends `raw` in logfmt form: bare when it is a single token, otherwise
// double-quoted with `\"`, `\\` and control bytes escaped.
inline void AppendLogValue(std::string& line, std::string_view raw) {
  const bool needs_quotes =
      raw.empty() || std::any_of(raw.begin(), raw.end(), [](char c) {
        return c == ' ' || c == '"' || c == '=' || c == '\\' ||
               static_cast<unsigned char>(c) < 0x20U;
      });
  if (!needs_quotes) {
    line.append(raw);
    return;
  }

  constexpr char kHex[] = "0123456789abcdef";
  line.push_back('"');
  for (const char c : raw) {
    const auto byte = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\') {
      line.push_back('\\');
      line.push_back(c);
    } else if (c == '\n') {
      line += "\\n";
    } else if (c == '\t') {
      line += "\\t";
    } else if (byte < 0x20U) {
      line += "\\x";
      line.push_back(kHex[byte >> 4]);
      line.push_back(kHex[byte & 0x0FU]);
    } else {
      line.push_back(c);
    }
  }
  line.push_back('"');
}

// `2026-01-31T09:15:02.123Z`, or empty when the platform cannot convert.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  char buffer[32];
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc_time);
  std::string formatted(buffer, written);
  formatted.push_back('.');
  formatted.push_back(static_cast<char>('0' + millis_component / 100));
  formatted.push_back(static_cast<char>('0' + (millis_component / 10) % 10));
  formatted.push_back(static_cast<char>('0' + millis_component % 10));
  formatted.push_back('Z');
  return formatted;
}

// Line-oriented logfmt logger. Every line carries the subcommand that
// produced it (`op=pack`, `op=boot`, ...) so interleaved tool output stays
// attributable when both sides run inside one CI job.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  void SetOperation(std::string operation) {
    operation_ = std::move(operation);
  }

  const std::string& Operation() const {
    return operation_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  // Full line including the trailing newline.
  std::string FormatLine(std::chrono::system_clock::time_point ts, LogLevel level,
                         std::string_view message,
                         std::initializer_list<LogField> fields) const {
    std::string line = "ts_utc=" + FormatUtcTimestamp(ts) + " level=" + ToString(level) + " op=";
    AppendLogValue(line, operation_);
    line += " msg=";
    AppendLogValue(line, message);
    for (const auto& field : fields) {
      line.push_back(' ');
      line.append(field.key);
      line.push_back('=');
      AppendLogValue(line, field.value);
    }
    line.push_back('\n');
    return line;
  }

  void Log(LogLevel level, std::string_view message, std::initializer_list<LogField> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }
    (*out_) << FormatLine(std::chrono::system_clock::now(), level, message, fields);
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string operation_ = "-";
};

} // namespace lfspack::core::logging
