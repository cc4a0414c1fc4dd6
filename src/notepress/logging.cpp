#include "notepress/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#include "notepress/text.hpp"

namespace {

using notepress::logging::LogLevel;

std::atomic<LogLevel> g_log_level{LogLevel::kInfo};
std::mutex g_log_mutex;
// Innermost document last. Each thread converts its own documents.
thread_local std::vector<std::string> g_documents;

std::string CurrentTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_snapshot{};
  localtime_r(&now_time, &tm_snapshot);
  std::ostringstream oss;
  oss << std::put_time(&tm_snapshot, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kDebug:
      return "DEBUG";
  }
  return "INFO";
}

}  // namespace

namespace notepress::logging {

LogLevel ParseLogLevel(std::string value) {
  value = text::ToLower(text::Trim(value));
  if (value == "error") {
    return LogLevel::kError;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  return LogLevel::kInfo;
}

void InitializeFromEnvironment() {
  if (const char* env = std::getenv("NOTEPRESS_LOG_LEVEL")) {
    SetLogLevel(ParseLogLevel(env));
  }
}

void SetLogLevel(LogLevel level) { g_log_level.store(level); }

LogLevel GetLogLevel() { return g_log_level.load(); }

bool IsDebugEnabled() { return GetLogLevel() == LogLevel::kDebug; }

void Log(LogLevel level, const std::string& message) {
  const auto current_level = g_log_level.load();
  if (static_cast<int>(level) > static_cast<int>(current_level)) {
    return;
  }

  const std::string timestamp = CurrentTimestamp();
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::ostream& stream =
      (level == LogLevel::kError || level == LogLevel::kWarn) ? std::cerr : std::cout;
  stream << timestamp << " [" << ToString(level) << "] " << WithDocumentContext(message)
         << std::endl;
}

std::string WithDocumentContext(const std::string& message) {
  if (g_documents.empty()) {
    return message;
  }
  return "(" + g_documents.back() + ") " + message;
}

void LogInfo(const std::string& message) { Log(LogLevel::kInfo, message); }

void LogWarn(const std::string& message) { Log(LogLevel::kWarn, message); }

void LogError(const std::string& message) { Log(LogLevel::kError, message); }

void LogDebug(const std::string& message) { Log(LogLevel::kDebug, message); }

DocumentScope::DocumentScope(std::string document) {
  g_documents.push_back(std::move(document));
}

DocumentScope::~DocumentScope() { g_documents.pop_back(); }

ScopedTimer::ScopedTimer(std::string label)
    : label_(std::move(label)), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
  if (IsDebugEnabled()) {
    LogDebug(label_ + " took " + std::to_string(ElapsedMilliseconds()) + " ms");
  }
}

long long ScopedTimer::ElapsedMilliseconds() const {
  const auto elapsed = std::chrono::steady_clock::now() - start_;
  return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

}  // namespace notepress::logging
