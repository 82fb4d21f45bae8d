#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace rootsave::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug, info, warn/warning, error (any case). Throws
// std::runtime_error on anything else.
LogLevel ParseLogLevel(std::string_view value);

std::string FormatUtcTimestamp();

// Process-wide log sink. Without a file the logger only mirrors warnings and
// errors to stderr.
class Logger {
 public:
  static Logger& Instance();

  // Opens (appending) the log file. Throws std::runtime_error when the file
  // cannot be opened.
  void EnableFile(const std::string& path);
  void DisableFile();

  void Configure(LogLevel threshold, std::uintmax_t max_bytes, std::size_t max_files);
  void SetStderrMirror(bool enabled);

  void Log(LogLevel level, std::string_view tag, std::string_view message);

  LogLevel threshold() const;

 private:
  Logger() = default;
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
  bool stderr_mirror_{true};
};

void LogDebug(std::string_view tag, std::string_view message);
void LogInfo(std::string_view tag, std::string_view message);
void LogWarn(std::string_view tag, std::string_view message);
void LogError(std::string_view tag, std::string_view message);

}  // namespace rootsave::util
