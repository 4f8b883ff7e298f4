#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace digiplayer::model {

/*
  In-memory view of the registration document.

  Rebuilt from disk at every start and every control-loop cycle; never the
  source of truth itself.
*/
struct Registration {
  std::string             device_id;
  std::optional<int64_t>  player_id;
  std::string             server_url;
  std::string             api_prefix;
  std::chrono::seconds    heartbeat_interval{30};

  bool Registered() const {
    return player_id.has_value();
  }

  // "https://host" + "/api/v1"
  std::string ApiUrl() const {
    return server_url + api_prefix;
  }
};

} // namespace digiplayer::model
