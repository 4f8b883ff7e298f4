#include "endpoints.hpp"

#include "internal/net/http_transport.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::net {

namespace {

std::string PlayerUrl(const model::Registration& registration) {
  if (!registration.player_id.has_value()) {
    throw util::InvalidArgument("device " + registration.device_id + " has no player id");
  }
  return registration.ApiUrl() + "/players/" + std::to_string(*registration.player_id);
}

bool HasScheme(const std::string& ref) {
  return ref.rfind("http://", 0) == 0 || ref.rfind("https://", 0) == 0;
}

} // namespace

std::string HeartbeatUrl(const model::Registration& registration) {
  return PlayerUrl(registration) + "/heartbeat";
}

std::string LookupUrl(const model::Registration& registration) {
  return registration.ApiUrl() + "/players/lookup?unique_id=" + UrlEncode(registration.device_id);
}

std::string HealthUrl(const model::Registration& registration) {
  return registration.ApiUrl() + "/health";
}

std::string ScreenshotUrl(const model::Registration& registration) {
  return PlayerUrl(registration) + "/screenshot";
}

std::string ResolveMediaUrl(const model::Registration& registration, const std::string& media_ref) {
  if (HasScheme(media_ref)) {
    return media_ref;
  }
  if (!media_ref.empty() && media_ref.front() == '/') {
    return registration.server_url + media_ref;
  }
  return registration.server_url + "/" + media_ref;
}

} // namespace digiplayer::net
