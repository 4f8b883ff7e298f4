#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace digiplayer::util {

struct ProcessResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string output;  // stdout and stderr interleaved

  bool Ok() const {
    return !timed_out && exit_code == 0;
  }

  // execvp failed: the binary is not installed on this image
  bool NotFound() const {
    return !timed_out && exit_code == 127;
  }
};

/*
  Runs OS tooling (nmcli, vcgencmd, reboot, ...).

  Abstract so platform adapters can be exercised without touching the
  host. Implementations must enforce the timeout: a hung child is killed.
*/
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  virtual ProcessResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
};

// fork/execvp with a pipe for output; SIGKILL on timeout. Throws
// ExecutionError when the child cannot be spawned.
class SystemProcessRunner final : public ProcessRunner {
 public:
  ProcessResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
};

std::string DescribeCommand(const std::vector<std::string>& argv);

} // namespace digiplayer::util
