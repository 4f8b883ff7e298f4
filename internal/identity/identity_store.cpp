#include "identity_store.hpp"

#include "internal/identity/device_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/agent_state_store.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::identity {

using observability::IntField;
using observability::StringField;

IdentityStore::IdentityStore(std::shared_ptr<RegistrationStore> registration, std::shared_ptr<state::AgentStateStore> state,
                             std::shared_ptr<FingerprintSource> fingerprint)
    : registration_(std::move(registration)), state_(std::move(state)), fingerprint_(std::move(fingerprint)) {
}

std::string IdentityStore::GetOrCreateDeviceId() {
  if (auto document = registration_->Load(); document && !document->device_id().empty()) {
    return document->device_id();
  }

  // re-checked under the exclusive lock: another process may have won the race
  const auto document = registration_->Update([this](RegistrationStore::Document& doc) {
    if (doc.device_id().empty()) {
      doc.set_device_id(DeriveDeviceId(fingerprint_->Read()));
      DIGIPLAYER_LOG_INFO("Generated device id", {StringField("device_id", doc.device_id())});
    }
  });
  return document.device_id();
}

model::Registration IdentityStore::Current() {
  auto document = registration_->Load();
  if (!document || document->device_id().empty()) {
    GetOrCreateDeviceId();
    document = registration_->Load();
  }
  if (!document) {
    throw util::StorageError("registration document unavailable after bootstrap: " + registration_->Path().string());
  }
  return registration_->ToRegistration(*document);
}

void IdentityStore::ResetRegistration() {
  registration_->Update([this](RegistrationStore::Document& doc) {
    if (doc.device_id().empty()) {
      doc.set_device_id(DeriveDeviceId(fingerprint_->Read()));
    }
    doc.clear_player_id();
  });

  if (!state_->ClearWatermark()) {
    throw util::StorageError("could not clear command watermark");
  }
  DIGIPLAYER_LOG_INFO("Registration reset");
}

std::string IdentityStore::ResetDeviceId() {
  const auto document = registration_->Update([this](RegistrationStore::Document& doc) {
    doc.set_device_id(DeriveDeviceId(fingerprint_->Read()));
    doc.clear_player_id();
  });

  if (!state_->ClearWatermark()) {
    throw util::StorageError("could not clear command watermark");
  }
  DIGIPLAYER_LOG_INFO("Device id reset", {StringField("device_id", document.device_id())});
  return document.device_id();
}

void IdentityStore::SetPlayerId(int64_t player_id) {
  if (player_id <= 0) {
    throw util::InvalidArgument("player id must be a positive integer");
  }

  GetOrCreateDeviceId();
  registration_->Update([player_id](RegistrationStore::Document& doc) { doc.set_player_id(player_id); });
  DIGIPLAYER_LOG_INFO("Player id set", {IntField("player_id", player_id)});
}

void IdentityStore::ClearPlayerId() {
  GetOrCreateDeviceId();
  registration_->Update([](RegistrationStore::Document& doc) { doc.clear_player_id(); });
  DIGIPLAYER_LOG_INFO("Player id cleared");
}

void IdentityStore::SetServerUrl(const std::string& server_url) {
  if (!IsValidServerUrl(server_url)) {
    throw util::InvalidArgument("server url must start with http:// or https://: " + server_url);
  }

  GetOrCreateDeviceId();
  registration_->Update([&server_url](RegistrationStore::Document& doc) { doc.set_server_url(server_url); });
  DIGIPLAYER_LOG_INFO("Server url set", {StringField("server_url", server_url)});
}

} // namespace digiplayer::identity
