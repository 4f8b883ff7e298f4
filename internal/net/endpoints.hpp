#pragma once

#include <string>

#include "internal/model/registration.hpp"

namespace digiplayer::net {

/*
  Control server URL layout, relative to {server_url}{api_prefix}.
*/

// POST /players/{player_id}/heartbeat. Requires a registered device.
std::string HeartbeatUrl(const model::Registration& registration);

// GET /players/lookup?unique_id={device_id}
std::string LookupUrl(const model::Registration& registration);

// GET /health
std::string HealthUrl(const model::Registration& registration);

// POST /players/{player_id}/screenshot. Requires a registered device.
std::string ScreenshotUrl(const model::Registration& registration);

// Absolute http(s) references are used as-is; anything else is resolved
// against the server root ("/media/a.mp4" or "media/a.mp4").
std::string ResolveMediaUrl(const model::Registration& registration, const std::string& media_ref);

} // namespace digiplayer::net
