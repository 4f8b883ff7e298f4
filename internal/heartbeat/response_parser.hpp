#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/command.hpp"
#include "internal/model/content.hpp"

namespace digiplayer::heartbeat {

struct HeartbeatResponse {
  std::vector<model::Command>             commands;
  std::optional<model::ContentAssignment> content_assignment;
  std::optional<std::int64_t>             player_id;
  std::optional<bool>                     registered;  // lookup responses only
};

/*
  Strict mapping of the server's JSON onto closed types.

  Unknown fields are ignored. Commands with an unknown kind or without an
  id, and content assignments with a malformed item, are dropped with a
  warning. Ids may arrive as JSON strings or numbers.

  Throws TransportError when the body is not a JSON object.
*/
HeartbeatResponse ParseHeartbeatResponse(const std::string& body);

// "sha256:ABC..." -> "abc..."; nullopt unless 64 hex digits remain.
std::optional<std::string> NormalizeChecksum(const std::string& checksum);

} // namespace digiplayer::heartbeat
