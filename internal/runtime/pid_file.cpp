#include "pid_file.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "internal/storage/durable_file.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::runtime {

PidFile::PidFile(std::filesystem::path file) : file_(std::move(file)) {
  storage::WriteFileAtomically(file_, std::to_string(getpid()) + "\n");
}

PidFile::~PidFile() {
  std::error_code ec;
  std::filesystem::remove(file_, ec);
}

std::optional<pid_t> PidFile::ReadRunning(const std::filesystem::path& file) {
  std::optional<std::string> contents;
  try {
    contents = storage::ReadFileContents(file);
  } catch (const util::StorageError&) {
    return std::nullopt;
  }
  if (!contents || contents->empty()) {
    return std::nullopt;
  }

  pid_t pid = 0;
  for (const char c : *contents) {
    if (c == '\n') break;
    if (c < '0' || c > '9') return std::nullopt;
    pid = pid * 10 + (c - '0');
    if (pid > 4194304) return std::nullopt;
  }
  if (pid <= 0) {
    return std::nullopt;
  }

  // EPERM still proves the process exists
  if (kill(pid, 0) == 0 || errno == EPERM) {
    return pid;
  }
  return std::nullopt;
}

} // namespace digiplayer::runtime
