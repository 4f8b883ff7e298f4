#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "digiplayer/agent/v1/registration.pb.h"
#include "internal/util/time.hpp"

namespace digiplayer::state {

/*
  Owns state.json: the last-executed-command watermark and the
  last-seen-online timestamp.

  Every mutation is a read-modify-write of the on-disk document under an
  exclusive lock, so a concurrent digiplayerctl reset is never overwritten.
  When the disk is unavailable the change is kept in memory, the store is
  marked dirty and Flush() retries on later cycles.
*/
class AgentStateStore {
 public:
  explicit AgentStateStore(std::filesystem::path file);

  std::string              LastCommandId() const;
  std::optional<util::TimePoint> LastSeenOnline() const;

  // Each returns true when the change reached the disk.
  bool SetLastCommandId(const std::string& command_id);
  bool SetLastSeenOnline(util::TimePoint when);
  bool ClearWatermark();

  // Durable or nothing: on a failed write the in-memory view is left
  // untouched, so a caller can refuse a side effect that must not repeat.
  bool CommitLastCommandId(const std::string& command_id);

  // Rebuilds the in-memory view from disk. A dirty store flushes first and
  // keeps its view when the flush still fails.
  void Reload();

  bool Flush();

  bool Dirty() const;

 private:
  using Document = digiplayer::agent::v1::AgentStateDocument;

  bool Mutate(const std::function<void(Document&)>& mutate, bool keep_on_failure = true);
  bool WriteLocked();

  std::filesystem::path file_;

  mutable std::mutex mutex_;
  Document           document_;
  bool               dirty_ = false;
};

} // namespace digiplayer::state
