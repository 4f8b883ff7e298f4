#pragma once

#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace digiplayer::content {

/*
  Content-addressed media cache.

      <root>/<sha256>            verified items
      <root>/.staging/<sha256>   downloads in progress

  Items enter the cache only through Adopt(), which verifies the digest
  and renames into place, so a path under <root> is always complete.
*/
class MediaStore {
 public:
  explicit MediaStore(std::filesystem::path root);

  std::filesystem::path PathFor(const std::string& checksum) const;
  std::filesystem::path StagingPathFor(const std::string& checksum) const;

  // Present and matching its digest. Each file is hashed once per process.
  bool Contains(const std::string& checksum);

  // Verifies `staged` against `checksum` and moves it into the cache.
  // Throws StorageError on mismatch or I/O failure; the staged file is removed.
  void Adopt(const std::filesystem::path& staged, const std::string& checksum);

  // Removes every cached item not in `keep`, and all staging leftovers.
  // Returns the number of files removed.
  std::size_t CollectGarbage(const std::set<std::string>& keep);

  // Creates <root>/.staging. Throws StorageError.
  void EnsureDirectories() const;

 private:

  std::filesystem::path root_;

  std::mutex            mutex_;
  std::set<std::string> verified_;
};

} // namespace digiplayer::content
