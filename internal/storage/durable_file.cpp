#include "durable_file.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/util/errors.hpp"

namespace digiplayer::storage {

namespace {

std::string ErrnoMessage(const std::string& action, const std::filesystem::path& target) {
  return action + " " + target.string() + ": " + std::strerror(errno);
}

void EnsureParentDirectory(const std::filesystem::path& file) {
  const auto parent = file.parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw util::StorageError("create directory " + parent.string() + ": " + ec.message());
  }
}

void FsyncDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return;
  ::fsync(fd);
  ::close(fd);
}

} // namespace

ScopedFileLock::ScopedFileLock(const std::filesystem::path& file, Mode mode) {
  EnsureParentDirectory(file);

  const auto lock_path = file.string() + ".lock";
  fd_                  = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw util::StorageError(ErrnoMessage("open lock", lock_path));
  }

  const int operation = mode == Mode::kShared ? LOCK_SH : LOCK_EX;
  int       rc        = 0;
  do {
    rc = ::flock(fd_, operation);
  } while (rc != 0 && errno == EINTR);

  if (rc != 0) {
    const auto message = ErrnoMessage("flock", lock_path);
    ::close(fd_);
    fd_ = -1;
    throw util::StorageError(message);
  }
}

ScopedFileLock::~ScopedFileLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

std::optional<std::string> ReadFileContents(const std::filesystem::path& file) {
  const int fd = ::open(file.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) return std::nullopt;
    throw util::StorageError(ErrnoMessage("open", file));
  }

  std::string contents;
  char        buffer[4096];
  while (true) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      const auto message = ErrnoMessage("read", file);
      ::close(fd);
      throw util::StorageError(message);
    }
    contents.append(buffer, static_cast<size_t>(n));
  }

  ::close(fd);
  return contents;
}

void WriteFileAtomically(const std::filesystem::path& file, std::string_view contents) {
  EnsureParentDirectory(file);

  const auto tmp_path = file.string() + ".tmp";
  const int  fd       = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw util::StorageError(ErrnoMessage("open", tmp_path));
  }

  size_t written = 0;
  while (written < contents.size()) {
    const ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      const auto message = ErrnoMessage("write", tmp_path);
      ::close(fd);
      ::unlink(tmp_path.c_str());
      throw util::StorageError(message);
    }
    written += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    const auto message = ErrnoMessage("fsync", tmp_path);
    ::close(fd);
    ::unlink(tmp_path.c_str());
    throw util::StorageError(message);
  }
  ::close(fd);

  if (::rename(tmp_path.c_str(), file.c_str()) != 0) {
    const auto message = ErrnoMessage("rename", tmp_path);
    ::unlink(tmp_path.c_str());
    throw util::StorageError(message);
  }

  FsyncDirectory(file.parent_path());
}

} // namespace digiplayer::storage
