#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>

namespace digiplayer::runtime {

/*
  Advertises the running agent to digiplayerctl.

  Written on construction, removed on destruction. Throws StorageError
  when the file cannot be written.
*/
class PidFile {
 public:
  explicit PidFile(std::filesystem::path file);
  ~PidFile();

  PidFile(const PidFile&)            = delete;
  PidFile& operator=(const PidFile&) = delete;

  // Pid of a live agent, nullopt when the file is missing, malformed or stale.
  static std::optional<pid_t> ReadRunning(const std::filesystem::path& file);

 private:
  std::filesystem::path file_;
};

} // namespace digiplayer::runtime
