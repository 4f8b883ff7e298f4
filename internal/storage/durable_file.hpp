#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace digiplayer::storage {

/*
  Advisory flock(2) on "<file>.lock".

  The lock lives on a sidecar file so the atomic rename of the data file
  never swaps the locked inode underneath a waiting process. Released on
  every exit path by the destructor.
*/
class ScopedFileLock {
 public:
  enum class Mode { kShared, kExclusive };

  ScopedFileLock(const std::filesystem::path& file, Mode mode);
  ~ScopedFileLock();

  ScopedFileLock(const ScopedFileLock&)            = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

 private:
  int fd_ = -1;
};

// Returns nullopt when the file does not exist. Throws StorageError on I/O failure.
std::optional<std::string> ReadFileContents(const std::filesystem::path& file);

/*
  Crash-safe replace:
      write tmp → fsync → rename → fsync(dir)

  A reader never observes a torn file. Caller is expected to hold an
  exclusive ScopedFileLock. Throws StorageError.
*/
void WriteFileAtomically(const std::filesystem::path& file, std::string_view contents);

} // namespace digiplayer::storage
