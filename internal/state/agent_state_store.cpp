#include "agent_state_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/storage/json_document.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::state {

using digiplayer::storage::DocumentState;
using digiplayer::storage::ScopedFileLock;

namespace {

bool ReadDocument(const std::filesystem::path& file, digiplayer::agent::v1::AgentStateDocument* document) {
  std::string error;
  const auto  state = storage::LoadJsonDocument(file, document, &error);
  if (state == DocumentState::kCorrupt) {
    DIGIPLAYER_LOG_WARN("Agent state document is corrupt, starting empty",
                        {observability::StringField("path", file.string()), observability::StringField("error", error)});
  }
  return state == DocumentState::kLoaded;
}

} // namespace

AgentStateStore::AgentStateStore(std::filesystem::path file) : file_(std::move(file)) {
  Reload();
}

std::string AgentStateStore::LastCommandId() const {
  std::lock_guard lock(mutex_);
  return document_.last_command_id();
}

std::optional<util::TimePoint> AgentStateStore::LastSeenOnline() const {
  std::lock_guard lock(mutex_);
  if (!document_.has_last_seen_online()) return std::nullopt;
  return util::FromProto(document_.last_seen_online());
}

bool AgentStateStore::SetLastCommandId(const std::string& command_id) {
  return Mutate([&](Document& document) { document.set_last_command_id(command_id); });
}

bool AgentStateStore::SetLastSeenOnline(util::TimePoint when) {
  return Mutate([&](Document& document) { *document.mutable_last_seen_online() = util::ToProto(when); });
}

bool AgentStateStore::ClearWatermark() {
  return Mutate([](Document& document) { document.clear_last_command_id(); });
}

bool AgentStateStore::CommitLastCommandId(const std::string& command_id) {
  return Mutate([&](Document& document) { document.set_last_command_id(command_id); }, false);
}

bool AgentStateStore::Mutate(const std::function<void(Document&)>& mutate, bool keep_on_failure) {
  std::lock_guard lock(mutex_);
  const Document previous = document_;
  mutate(document_);

  try {
    ScopedFileLock file_lock(file_, ScopedFileLock::Mode::kExclusive);

    if (!dirty_) {
      // merge onto what is on disk so out-of-process edits survive
      Document on_disk;
      if (ReadDocument(file_, &on_disk)) {
        mutate(on_disk);
        document_ = on_disk;
      }
    }

    storage::SaveJsonDocument(file_, document_);
    dirty_ = false;
    return true;
  } catch (const util::StorageError& e) {
    if (!keep_on_failure) {
      document_ = previous;
      DIGIPLAYER_LOG_ERROR("Agent state write failed",
                           {observability::StringField("path", file_.string()), observability::StringField("error", e.what())});
      return false;
    }
    dirty_ = true;
    DIGIPLAYER_LOG_WARN("Agent state kept in memory only",
                        {observability::StringField("path", file_.string()), observability::StringField("error", e.what())});
    return false;
  }
}

bool AgentStateStore::WriteLocked() {
  try {
    ScopedFileLock file_lock(file_, ScopedFileLock::Mode::kExclusive);
    storage::SaveJsonDocument(file_, document_);
    dirty_ = false;
    return true;
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_WARN("Agent state flush failed",
                        {observability::StringField("path", file_.string()), observability::StringField("error", e.what())});
    return false;
  }
}

bool AgentStateStore::Flush() {
  std::lock_guard lock(mutex_);
  if (!dirty_) return true;
  return WriteLocked();
}

void AgentStateStore::Reload() {
  std::lock_guard lock(mutex_);
  if (dirty_ && !WriteLocked()) {
    return;
  }

  try {
    ScopedFileLock file_lock(file_, ScopedFileLock::Mode::kShared);
    Document       on_disk;
    ReadDocument(file_, &on_disk);
    document_ = on_disk;
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_WARN("Agent state unreadable, keeping in-memory view",
                        {observability::StringField("path", file_.string()), observability::StringField("error", e.what())});
  }
}

bool AgentStateStore::Dirty() const {
  std::lock_guard lock(mutex_);
  return dirty_;
}

} // namespace digiplayer::state
