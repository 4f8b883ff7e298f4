#include "registration_store.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/identity/device_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/storage/json_document.hpp"

namespace digiplayer::identity {

using digiplayer::storage::DocumentState;
using digiplayer::storage::ScopedFileLock;

namespace {

using Fields = google::protobuf::Map<std::string, google::protobuf::Value>;

const std::string* StringAt(const Fields& fields, const std::string& key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return nullptr;
  }
  return &it->second.string_value();
}

// Integral JSON numbers, or strings holding one (the int64 JSON mapping).
std::optional<std::int64_t> IntegerAt(const Fields& fields, const std::string& key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  double number = 0;
  if (it->second.kind_case() == google::protobuf::Value::kNumberValue) {
    number = it->second.number_value();
  } else if (it->second.kind_case() == google::protobuf::Value::kStringValue) {
    const auto& text = it->second.string_value();
    if (text.empty() || text.find_first_not_of("-0123456789") != std::string::npos) {
      return std::nullopt;
    }
    try {
      return std::stoll(text);
    } catch (const std::logic_error&) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }
  if (std::trunc(number) != number || std::fabs(number) > 9.0e15) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(number);
}

// Keeps the well-typed fields of a document the strict mapping rejected.
std::optional<RegistrationStore::Document> SalvageFields(const std::string& contents) {
  google::protobuf::Struct object;
  if (!google::protobuf::util::JsonStringToMessage(contents, &object).ok()) {
    return std::nullopt;
  }

  const auto&                 fields = object.fields();
  RegistrationStore::Document document;
  if (const auto* value = StringAt(fields, "server_url")) document.set_server_url(*value);
  if (const auto* value = StringAt(fields, "api_prefix")) document.set_api_prefix(*value);
  if (const auto* value = StringAt(fields, "device_id")) document.set_device_id(*value);
  if (const auto value = IntegerAt(fields, "player_id")) document.set_player_id(*value);
  if (const auto value = IntegerAt(fields, "heartbeat_interval")) {
    if (*value >= 0 && *value <= std::numeric_limits<std::uint32_t>::max()) {
      document.set_heartbeat_interval(static_cast<std::uint32_t>(*value));
    }
  }
  return document;
}

} // namespace

bool IsValidServerUrl(const std::string& url) {
  const bool https = url.rfind("https://", 0) == 0 && url.size() > 8;
  const bool http  = url.rfind("http://", 0) == 0 && url.size() > 7;
  return (https || http) && url.find_first_of(" \t\r\n") == std::string::npos;
}

RegistrationStore::RegistrationStore(std::filesystem::path file, RegistrationDefaults defaults)
    : file_(std::move(file)), defaults_(std::move(defaults)) {
}

RegistrationStore::Document RegistrationStore::Fresh() const {
  Document document;
  document.set_server_url(defaults_.server_url);
  document.set_api_prefix(defaults_.api_prefix);
  document.set_heartbeat_interval(static_cast<uint32_t>(defaults_.heartbeat_interval.count()));
  return document;
}

RegistrationStore::Document RegistrationStore::Normalize(Document document) const {
  while (!document.server_url().empty() && document.server_url().back() == '/') {
    document.mutable_server_url()->pop_back();
  }
  if (!IsValidServerUrl(document.server_url())) {
    document.set_server_url(defaults_.server_url);
  }

  if (document.api_prefix().empty() || document.api_prefix().front() != '/') {
    document.set_api_prefix(defaults_.api_prefix);
  }
  while (document.api_prefix().size() > 1 && document.api_prefix().back() == '/') {
    document.mutable_api_prefix()->pop_back();
  }

  const auto interval = std::chrono::seconds(document.heartbeat_interval());
  if (interval < kMinHeartbeatInterval || interval > kMaxHeartbeatInterval) {
    document.set_heartbeat_interval(static_cast<uint32_t>(defaults_.heartbeat_interval.count()));
  }

  if (document.has_player_id() && document.player_id() <= 0) {
    document.clear_player_id();
  }
  return document;
}

std::optional<RegistrationStore::Document> RegistrationStore::LoadUnlocked() const {
  Document    document;
  std::string error;

  switch (storage::LoadJsonDocument(file_, &document, &error)) {
    case DocumentState::kMissing:
      return std::nullopt;
    case DocumentState::kCorrupt: {
      const auto contents = storage::ReadFileContents(file_);
      auto       salvaged = contents ? SalvageFields(*contents) : std::nullopt;
      if (!salvaged) {
        DIGIPLAYER_LOG_WARN("Registration document is corrupt, treating as absent",
                            {observability::StringField("path", file_.string()), observability::StringField("error", error)});
        return std::nullopt;
      }
      DIGIPLAYER_LOG_WARN("Registration document has mistyped fields, keeping the rest",
                          {observability::StringField("path", file_.string()), observability::StringField("error", error)});
      document = std::move(*salvaged);
      break;
    }
    case DocumentState::kLoaded:
      break;
  }

  if (!document.device_id().empty() && !IsValidDeviceId(document.device_id())) {
    DIGIPLAYER_LOG_WARN("Registration document has malformed device id, treating as absent",
                        {observability::StringField("path", file_.string()), observability::StringField("device_id", document.device_id())});
    return std::nullopt;
  }

  return Normalize(std::move(document));
}

std::optional<RegistrationStore::Document> RegistrationStore::Load() const {
  ScopedFileLock lock(file_, ScopedFileLock::Mode::kShared);
  return LoadUnlocked();
}

RegistrationStore::Document RegistrationStore::Update(const std::function<void(Document&)>& mutate) {
  ScopedFileLock lock(file_, ScopedFileLock::Mode::kExclusive);

  auto document = LoadUnlocked().value_or(Fresh());
  mutate(document);
  document = Normalize(std::move(document));

  storage::SaveJsonDocument(file_, document);
  return document;
}

model::Registration RegistrationStore::ToRegistration(const Document& document) const {
  model::Registration registration;
  registration.device_id          = document.device_id();
  registration.server_url         = document.server_url();
  registration.api_prefix         = document.api_prefix();
  registration.heartbeat_interval = std::chrono::seconds(document.heartbeat_interval());
  if (document.has_player_id()) {
    registration.player_id = document.player_id();
  }
  return registration;
}

} // namespace digiplayer::identity
