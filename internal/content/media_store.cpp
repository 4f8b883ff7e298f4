#include "media_store.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::content {

namespace fs = std::filesystem;

using observability::StringField;

MediaStore::MediaStore(fs::path root) : root_(std::move(root)) {
}

fs::path MediaStore::PathFor(const std::string& checksum) const {
  return root_ / checksum;
}

fs::path MediaStore::StagingPathFor(const std::string& checksum) const {
  return root_ / ".staging" / (checksum + ".part");
}

bool MediaStore::Contains(const std::string& checksum) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (verified_.count(checksum) > 0) {
      std::error_code ec;
      if (fs::is_regular_file(PathFor(checksum), ec)) {
        return true;
      }
      verified_.erase(checksum);
      return false;
    }
  }

  const auto path = PathFor(checksum);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return false;
  }

  try {
    if (util::Sha256FileHex(path) != checksum) {
      DIGIPLAYER_LOG_WARN("Cached media failed verification, discarding", {StringField("checksum", checksum)});
      fs::remove(path, ec);
      return false;
    }
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_WARN("Cached media unreadable", {StringField("checksum", checksum), StringField("error", e.what())});
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  verified_.insert(checksum);
  return true;
}

void MediaStore::Adopt(const fs::path& staged, const std::string& checksum) {
  std::error_code ec;

  std::string actual;
  try {
    actual = util::Sha256FileHex(staged);
  } catch (const util::StorageError&) {
    fs::remove(staged, ec);
    throw;
  }

  if (actual != checksum) {
    fs::remove(staged, ec);
    throw util::StorageError("checksum mismatch for " + checksum + ": got " + actual);
  }

  EnsureDirectories();
  fs::rename(staged, PathFor(checksum), ec);
  if (ec) {
    fs::remove(staged, ec);
    throw util::StorageError("cannot move " + staged.string() + " into media store: " + ec.message());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  verified_.insert(checksum);
}

std::size_t MediaStore::CollectGarbage(const std::set<std::string>& keep) {
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    return 0;
  }

  std::size_t removed = 0;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (it->is_directory(ec)) {
      continue;
    }
    if (keep.count(name) > 0) {
      continue;
    }

    std::error_code remove_ec;
    if (fs::remove(it->path(), remove_ec)) {
      ++removed;
      std::lock_guard<std::mutex> lock(mutex_);
      verified_.erase(name);
    } else if (remove_ec) {
      DIGIPLAYER_LOG_WARN("Could not remove stale media", {StringField("path", it->path().string()), StringField("error", remove_ec.message())});
    }
  }

  const auto staging = root_ / ".staging";
  if (fs::is_directory(staging, ec)) {
    for (fs::directory_iterator it(staging, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code remove_ec;
      if (fs::remove(it->path(), remove_ec)) {
        ++removed;
      }
    }
  }

  return removed;
}

void MediaStore::EnsureDirectories() const {
  std::error_code ec;
  fs::create_directories(root_ / ".staging", ec);
  if (ec) {
    throw util::StorageError("cannot create " + (root_ / ".staging").string() + ": " + ec.message());
  }
}

} // namespace digiplayer::content
