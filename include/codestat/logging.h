#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codestat {

enum class LogLevel { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

using LogFields = std::vector<std::pair<std::string, std::string>>;

// Message names emitted by the walker and the analyzers.
namespace events {
inline constexpr std::string_view kWalkStart = "walk.start";
inline constexpr std::string_view kWalkComplete = "walk.complete";
inline constexpr std::string_view kDirectoryUnreadable = "directory.unreadable";
inline constexpr std::string_view kFileUnreadable = "file.unreadable";
inline constexpr std::string_view kFileDecodedLatin1 = "file.decoded_latin1";
inline constexpr std::string_view kFileAnalyzed = "file.analyzed";
inline constexpr std::string_view kFileAnalysisFailed = "file.analysis_failed";
inline constexpr std::string_view kPythonParseFailed = "python.parse_failed";
inline constexpr std::string_view kPythonParseUnavailable =
    "python.parse_unavailable";
} // namespace events

struct LoggingConfig {
  LogLevel level = LogLevel::kWarn;
};

class Logger {
public:
  virtual ~Logger() = default;
  virtual void Log(LogLevel level, std::string_view message,
                   LogFields fields = {}) = 0;
  virtual LogLevel Level() const = 0;
  bool IsEnabled(LogLevel level) const {
    return static_cast<int>(level) <= static_cast<int>(Level());
  }
};

class NullLogger : public Logger {
public:
  void Log(LogLevel, std::string_view, LogFields) override {}
  LogLevel Level() const override { return LogLevel::kError; }
};

class StructuredLogger : public Logger {
public:
  StructuredLogger(std::ostream &stream, LoggingConfig config);
  void Log(LogLevel level, std::string_view message,
           LogFields fields) override;
  LogLevel Level() const override { return config_.level; }

private:
  std::ostream *stream_;
  LoggingConfig config_;
};

std::string LogLevelName(LogLevel level);

std::shared_ptr<Logger> EnsureLogger(std::shared_ptr<Logger> logger);
std::shared_ptr<Logger> MakeLogger(const LoggingConfig &config,
                                   std::ostream &stream);

} // namespace codestat
