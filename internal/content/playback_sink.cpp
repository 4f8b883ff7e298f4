#include "playback_sink.hpp"

#include "digiplayer/agent/v1/content.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/storage/json_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"

namespace digiplayer::content {

using observability::StringField;

PlaylistFileSink::PlaylistFileSink(std::filesystem::path playlist_file, std::string reload_command,
                                   std::shared_ptr<util::ProcessRunner> runner)
    : playlist_file_(std::move(playlist_file)), reload_command_(std::move(reload_command)), runner_(std::move(runner)) {
}

void PlaylistFileSink::Publish(const std::string& playlist_version, const std::vector<ResolvedItem>& items) {
  digiplayer::agent::v1::PublishedPlaylist playlist;
  playlist.set_playlist_version(playlist_version);
  for (const auto& resolved : items) {
    auto* out = playlist.add_items();
    out->set_media_ref(resolved.item.media_ref);
    out->set_path(resolved.path.string());
    out->set_duration_sec(resolved.item.duration_sec);
  }

  {
    storage::ScopedFileLock lock(playlist_file_, storage::ScopedFileLock::Mode::kExclusive);
    storage::SaveJsonDocument(playlist_file_, playlist);
  }
  DIGIPLAYER_LOG_INFO("Published playlist", {StringField("playlist_version", playlist_version),
                                             observability::IntField("items", static_cast<std::int64_t>(items.size()))});

  if (reload_command_.empty()) {
    return;
  }
  // the renderer also watches playlist.json, so a failed nudge is not fatal
  try {
    const auto result = runner_->Run({"/bin/sh", "-c", reload_command_}, std::chrono::seconds(30));
    if (!result.Ok()) {
      DIGIPLAYER_LOG_WARN("Reload command failed", {StringField("command", reload_command_), StringField("output", result.output)});
    }
  } catch (const util::ExecutionError& e) {
    DIGIPLAYER_LOG_WARN("Reload command not started", {StringField("command", reload_command_), StringField("error", e.what())});
  }
}

} // namespace digiplayer::content
