#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "digiplayer/agent/v1/registration.pb.h"
#include "internal/model/registration.hpp"

namespace digiplayer::identity {

struct RegistrationDefaults {
  std::string          server_url{"https://www.digireklaam.ee"};
  std::string          api_prefix{"/api/v1"};
  std::chrono::seconds heartbeat_interval{30};
};

inline constexpr std::chrono::seconds kMinHeartbeatInterval{5};
inline constexpr std::chrono::seconds kMaxHeartbeatInterval{3600};

bool IsValidServerUrl(const std::string& url);

/*
  Owns config.json, the durable registration document.

  Load() validates and normalizes: missing, mistyped or out-of-range
  fields fall back to defaults one by one, unknown fields are ignored, and
  a file that is not a JSON object or has a malformed device id is treated
  as absent. All access goes through a
  ScopedFileLock so the agent and digiplayerctl never observe torn writes.
*/
class RegistrationStore {
 public:
  using Document = digiplayer::agent::v1::RegistrationDocument;

  RegistrationStore(std::filesystem::path file, RegistrationDefaults defaults);

  // nullopt when the document is absent or corrupt. Throws StorageError if unreadable.
  std::optional<Document> Load() const;

  // Read-modify-write under one exclusive lock. Starts from a defaulted
  // document when none is usable. Throws StorageError.
  Document Update(const std::function<void(Document&)>& mutate);

  model::Registration ToRegistration(const Document& document) const;

  const std::filesystem::path& Path() const {
    return file_;
  }

 private:
  std::optional<Document> LoadUnlocked() const;
  Document                Normalize(Document document) const;
  Document                Fresh() const;

  std::filesystem::path file_;
  RegistrationDefaults  defaults_;
};

} // namespace digiplayer::identity
