#pragma once

#include <chrono>
#include <string>

namespace notepress::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsDebugEnabled();
LogLevel ParseLogLevel(std::string value);

void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

// Prefixes |message| with "(<document>) " while a DocumentScope is active on
// this thread.
std::string WithDocumentContext(const std::string& message);

// Names the document being converted in every message logged on this thread
// until it goes out of scope. Scopes nest; the innermost one is shown.
class DocumentScope {
 public:
  explicit DocumentScope(std::string document);
  ~DocumentScope();

  DocumentScope(const DocumentScope&) = delete;
  DocumentScope& operator=(const DocumentScope&) = delete;
};

// Logs "<label> took N ms" at debug level when it goes out of scope.
class ScopedTimer {
 public:
  explicit ScopedTimer(std::string label);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  long long ElapsedMilliseconds() const;

 private:
  std::string label_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace notepress::logging
