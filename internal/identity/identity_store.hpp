#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/identity/hardware_fingerprint.hpp"
#include "internal/identity/registration_store.hpp"
#include "internal/model/registration.hpp"

namespace digiplayer::state {
class AgentStateStore;
}

namespace digiplayer::identity {

/*
  Device identity and registration handshake state.

  The device id is generated once from the hardware fingerprint and then
  only ever read back; operator actions below are the only writers.
*/
class IdentityStore {
 public:
  IdentityStore(std::shared_ptr<RegistrationStore> registration, std::shared_ptr<state::AgentStateStore> state,
                std::shared_ptr<FingerprintSource> fingerprint);

  // Persists before returning. Throws StorageError when the document cannot
  // be written; the agent cannot run without an id.
  std::string GetOrCreateDeviceId();

  // Current registration, bootstrapping the id if needed.
  model::Registration Current();

  // Clears player id and command watermark, keeps the device id.
  void ResetRegistration();

  // Re-derives the id from hardware and clears registration.
  std::string ResetDeviceId();

  // Throws InvalidArgument for non-positive ids.
  void SetPlayerId(int64_t player_id);
  void ClearPlayerId();

  // Throws InvalidArgument unless http:// or https://.
  void SetServerUrl(const std::string& server_url);

 private:
  std::shared_ptr<RegistrationStore>      registration_;
  std::shared_ptr<state::AgentStateStore> state_;
  std::shared_ptr<FingerprintSource>      fingerprint_;
};

} // namespace digiplayer::identity
