#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/content.hpp"

namespace digiplayer::util {
class ProcessRunner;
}

namespace digiplayer::content {

struct ResolvedItem {
  model::MediaItem      item;
  std::filesystem::path path;
};

/*
  Hand-off to the external renderer. Called only with fully verified
  playlists. Throws StorageError when the playlist cannot be written.
*/
class PlaybackSink {
 public:
  virtual ~PlaybackSink() = default;

  virtual void Publish(const std::string& playlist_version, const std::vector<ResolvedItem>& items) = 0;
};

/*
  Writes playlist.json atomically and, when configured, runs a reload
  command (through /bin/sh) so the kiosk picks it up.
*/
class PlaylistFileSink final : public PlaybackSink {
 public:
  PlaylistFileSink(std::filesystem::path playlist_file, std::string reload_command, std::shared_ptr<util::ProcessRunner> runner);

  void Publish(const std::string& playlist_version, const std::vector<ResolvedItem>& items) override;

 private:
  std::filesystem::path                playlist_file_;
  std::string                          reload_command_;
  std::shared_ptr<util::ProcessRunner> runner_;
};

} // namespace digiplayer::content
