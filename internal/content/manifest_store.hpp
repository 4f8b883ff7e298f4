#pragma once

#include <filesystem>
#include <optional>

#include "internal/model/content.hpp"

namespace digiplayer::content {

struct ContentManifest {
  std::optional<model::ContentAssignment> active;
  std::optional<model::ContentAssignment> target;  // being downloaded
  bool                                    publish_pending = false;
};

/*
  content.json: the active playlist pointer and the pending target, so a
  restart resumes an interrupted download instead of waiting for the next
  assignment.
*/
class ContentManifestStore {
 public:
  explicit ContentManifestStore(std::filesystem::path file);

  // Missing or corrupt documents yield an empty manifest.
  ContentManifest Load() const;

  // Throws StorageError.
  void Save(const ContentManifest& manifest);

 private:
  std::filesystem::path file_;
};

} // namespace digiplayer::content
