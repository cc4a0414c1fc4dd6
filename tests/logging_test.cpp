#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "notepress/logging.hpp"

namespace {

namespace logging = notepress::logging;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Captures std::cout for the lifetime of the object.
class CapturedStdout {
 public:
  CapturedStdout() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CapturedStdout() { std::cout.rdbuf(previous_); }

  std::string str() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* previous_;
};

void TestParseLogLevel() {
  Assert(logging::ParseLogLevel(" DEBUG ") == logging::LogLevel::kDebug, "debug level");
  Assert(logging::ParseLogLevel("warning") == logging::LogLevel::kWarn, "warning alias");
  Assert(logging::ParseLogLevel("Error") == logging::LogLevel::kError, "error level");
  Assert(logging::ParseLogLevel("chatty") == logging::LogLevel::kInfo, "unknown is info");
}

void TestDocumentContext() {
  Assert(logging::WithDocumentContext("plain") == "plain", "no context outside a scope");
  {
    const logging::DocumentScope outer("a.md");
    Assert(logging::WithDocumentContext("msg") == "(a.md) msg", "document prefix");
    {
      const logging::DocumentScope inner("b.md");
      Assert(logging::WithDocumentContext("msg") == "(b.md) msg", "innermost document shown");
    }
    Assert(logging::WithDocumentContext("msg") == "(a.md) msg", "outer restored");
  }
  Assert(logging::WithDocumentContext("plain") == "plain", "context cleared");
}

void TestLogLineCarriesContext() {
  logging::SetLogLevel(logging::LogLevel::kInfo);
  std::string output;
  {
    CapturedStdout captured;
    const logging::DocumentScope scope("note.md");
    logging::LogInfo("converted");
    logging::LogDebug("hidden at info level");
    output = captured.str();
  }
  Assert(EndsWith(output, "[INFO] (note.md) converted\n"), "log line: " + output);
  Assert(output.find("hidden") == std::string::npos, "debug suppressed at info level");
}

}  // namespace

int main() {
  try {
    TestParseLogLevel();
    TestDocumentContext();
    TestLogLineCarriesContext();
  } catch (const std::exception& ex) {
    std::cerr << "logging_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
