#pragma once
#include <string>
#include <vector>

namespace walltint::apply
{
  struct ProcessResult
  {
    bool started{false};
    int exitCode{-1}; // -1 when killed by a signal or not started
  };

  // Runs `exePath args...` with stdin closed and waits for it.
  ProcessResult runAndWait(const std::string &exePath, const std::vector<std::string> &args,
                           std::string *outError = nullptr);

} // namespace walltint::apply
