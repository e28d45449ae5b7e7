#pragma once
#include <cstddef>
#include <string>

namespace CrashHandler {
struct Config {
  bool enableStackTrace = true;
  std::string crashLogPath = "crash.log";
};

// Installs handlers for fatal signals. The report is written to
// Config::crashLogPath and the process exits with status 1.
void init(const Config &config = Config());
std::string getStackTrace(std::size_t maxFrames = 62);
// Builds the report written on a crash
std::string formatReport(const std::string &header);
std::string getPlatformInfo();
} // namespace CrashHandler
