#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace rootsave::util {

const char* LogLevelName(LogLevel level) {
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
  return "UNKNOWN";
}

LogLevel ParseLogLevel(std::string_view value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + std::string(value));
}

std::string FormatUtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

Logger& Logger::Instance() {
  static Logger logger;
  return logger;
}

void Logger::EnableFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_ = path;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(path, std::ios::app);
  if (!stream_) {
    path_.clear();
    throw std::runtime_error("failed to open log file: " + path);
  }
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  current_size_ = ec ? 0 : size;
  const std::string header = "---- rootsave log started " + FormatUtcTimestamp() + " ----\n";
  stream_ << header;
  stream_.flush();
  current_size_ += header.size();
}

void Logger::DisableFile() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_.clear();
  current_size_ = 0;
}

void Logger::Configure(LogLevel threshold, std::uintmax_t max_bytes, std::size_t max_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  threshold_ = threshold;
  max_bytes_ = max_bytes;
  max_files_ = max_files;
}

void Logger::SetStderrMirror(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  stderr_mirror_ = enabled;
}

LogLevel Logger::threshold() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return threshold_;
}

void Logger::Log(LogLevel level, std::string_view tag, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stderr_mirror_ && level >= LogLevel::kWarn) {
    std::cerr << "[" << tag << "] " << (level == LogLevel::kWarn ? "warn" : "error") << ": "
              << message << "\n";
  }
  if (!stream_.is_open() || level < threshold_) {
    return;
  }
  if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
    RotateLocked();
    if (!stream_.is_open()) {
      return;
    }
  }
  std::ostringstream line;
  line << "[" << FormatUtcTimestamp() << "] [" << LogLevelName(level) << "] [" << tag << "] "
       << message << '\n';
  const std::string text = line.str();
  stream_ << text;
  stream_.flush();
  current_size_ += text.size();
}

void Logger::RotateLocked() {
  if (path_.empty() || max_files_ == 0) {
    return;
  }
  stream_.close();
  // log.(n-1) -> log.n, ..., log -> log.1
  for (std::size_t i = max_files_; i > 0; --i) {
    const auto rotated = std::filesystem::path(path_).concat("." + std::to_string(i));
    const auto previous =
        (i == 1) ? std::filesystem::path(path_)
                 : std::filesystem::path(path_).concat("." + std::to_string(i - 1));
    std::error_code ec;
    if (std::filesystem::exists(previous, ec)) {
      std::filesystem::rename(previous, rotated, ec);
    }
  }
  stream_.open(path_, std::ios::trunc);
  current_size_ = 0;
}

void LogDebug(std::string_view tag, std::string_view message) {
  Logger::Instance().Log(LogLevel::kDebug, tag, message);
}

void LogInfo(std::string_view tag, std::string_view message) {
  Logger::Instance().Log(LogLevel::kInfo, tag, message);
}

void LogWarn(std::string_view tag, std::string_view message) {
  Logger::Instance().Log(LogLevel::kWarn, tag, message);
}

void LogError(std::string_view tag, std::string_view message) {
  Logger::Instance().Log(LogLevel::kError, tag, message);
}

}  // namespace rootsave::util
