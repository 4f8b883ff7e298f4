#include "heartbeat_client.hpp"

#include <algorithm>
#include <limits>

#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/heartbeat/system_info.hpp"
#include "internal/net/endpoints.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/json_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/version.hpp"

namespace digiplayer::heartbeat {

using observability::IntField;
using observability::StringField;

namespace {

util::TransportError StatusError(const std::string& what, long status) {
  return util::TransportError(what + " answered HTTP " + std::to_string(status), status);
}

} // namespace

HeartbeatClient::HeartbeatClient(std::shared_ptr<net::HttpTransport> transport, std::shared_ptr<SystemInfoProvider> system_info,
                                 HeartbeatOptions options)
    : transport_(std::move(transport)), system_info_(std::move(system_info)), options_(options) {
}

HeartbeatOutcome HeartbeatClient::Cycle(const model::Registration& registration, const HeartbeatContext& context,
                                        HeartbeatBackoff& backoff, connectivity::ConnectivityMonitor& monitor,
                                        util::TimePoint now) {
  HeartbeatOutcome outcome;
  try {
    outcome.response  = Send(registration, context, now);
    outcome.delivered = true;
    backoff.RecordSuccess();
    return outcome;
  } catch (const util::TransportError& e) {
    outcome.error = e.what();
  }

  backoff.RecordFailure();
  DIGIPLAYER_LOG_WARN("Heartbeat failed", {StringField("error", outcome.error),
                                           IntField("consecutive_failures", backoff.ConsecutiveFailures()),
                                           IntField("retry_in_sec", backoff.NextDelay().count())});

  if (backoff.ConsecutiveFailures() >= options_.failure_threshold) {
    const auto transition     = monitor.ReportHeartbeatDegraded();
    outcome.degraded_reported = true;
    if (transition.Changed()) {
      DIGIPLAYER_LOG_WARN("Server marked degraded after repeated heartbeat failures",
                          {IntField("consecutive_failures", backoff.ConsecutiveFailures())});
    }
  }
  return outcome;
}

HeartbeatResponse HeartbeatClient::Send(const model::Registration& registration, const HeartbeatContext& context,
                                        util::TimePoint now) {
  if (!registration.Registered()) {
    return Lookup(registration);
  }

  const auto request = BuildRequest(registration, context, now);
  const auto url     = net::HeartbeatUrl(registration);

  std::string body;
  try {
    body = storage::ToJson(request);
  } catch (const util::StorageError& e) {
    throw util::TransportError(e.what());
  }

  const auto http = transport_->PostJson(url, body, options_.request_timeout);
  if (http.status == 404) {
    DIGIPLAYER_LOG_ERROR("Player not found on server, check registration", {IntField("player_id", *registration.player_id)});
  }
  if (!http.Ok()) {
    throw StatusError("heartbeat", http.status);
  }

  auto response = ParseHeartbeatResponse(http.body);
  reported_content_ = context.current_content;

  DIGIPLAYER_LOG_DEBUG("Heartbeat ok", {IntField("commands", static_cast<std::int64_t>(response.commands.size())),
                                        StringField("assignment", response.content_assignment ? response.content_assignment->playlist_version : "")});
  return response;
}

HeartbeatResponse HeartbeatClient::Lookup(const model::Registration& registration) {
  const auto http = transport_->Get(net::LookupUrl(registration), options_.request_timeout);

  if (http.status == 404) {
    HeartbeatResponse response;
    response.registered = false;
    return response;
  }
  if (!http.Ok()) {
    throw StatusError("registration lookup", http.status);
  }

  auto response = ParseHeartbeatResponse(http.body);
  if (!response.registered.value_or(false)) {
    response.player_id.reset();
  }
  return response;
}

digiplayer::agent::v1::HeartbeatRequest HeartbeatClient::BuildRequest(const model::Registration& registration,
                                                                      const HeartbeatContext& context, util::TimePoint now) {
  const auto info = system_info_->Collect();

  digiplayer::agent::v1::HeartbeatRequest request;
  request.set_unique_id(registration.device_id);
  if (registration.player_id && *registration.player_id <= std::numeric_limits<std::uint32_t>::max()) {
    request.set_player_id(static_cast<std::uint32_t>(*registration.player_id));
  }
  request.set_status("online");
  request.set_ip_address(info.ip_address());
  request.set_mac_address(info.mac_address());
  request.set_screen_resolution(info.screen_resolution());
  request.set_storage_used(static_cast<double>(info.storage_used()));
  request.set_storage_total(static_cast<double>(info.storage_total()));
  request.set_uptime_seconds(static_cast<std::uint32_t>(std::min<std::uint64_t>(info.uptime_seconds(), UINT32_MAX)));
  request.set_agent_version(std::string(util::kAgentVersion));
  request.set_timestamp(util::FormatRfc3339(now));
  request.set_last_command_id(context.last_command_id);
  if (context.command_error) {
    request.set_command_error(*context.command_error);
  }
  if (context.current_content && context.current_content != reported_content_) {
    request.set_current_content(*context.current_content);
  }
  return request;
}

void HeartbeatClient::ResetContentReport() {
  reported_content_.reset();
}

} // namespace digiplayer::heartbeat
