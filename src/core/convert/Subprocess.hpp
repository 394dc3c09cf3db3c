#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace certgen {

struct ProcessResult {
  bool        launched = false;
  std::string launchError;  // set when !launched
  bool        timedOut = false;
  int         exitCode = -1;
  int         termSignal = 0;
  std::string outputTail;   // last bytes of combined stdout/stderr
};

// Runs argv[0] (PATH lookup) in its own process group with stdin from
// /dev/null and stdout/stderr appended to `logFile`. The whole group is
// SIGKILLed once `timeout` elapses. `env` entries override the inherited
// environment.
ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout,
                          const std::filesystem::path& logFile,
                          const std::map<std::string, std::string>& env = {});

} // namespace certgen
