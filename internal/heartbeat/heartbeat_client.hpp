#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "digiplayer/agent/v1/heartbeat.pb.h"
#include "internal/heartbeat/backoff.hpp"
#include "internal/heartbeat/response_parser.hpp"
#include "internal/model/registration.hpp"
#include "internal/util/time.hpp"

namespace digiplayer::net {
class HttpTransport;
}

namespace digiplayer::connectivity {
class ConnectivityMonitor;
}

namespace digiplayer::heartbeat {

class SystemInfoProvider;

// What the agent knows about itself at send time.
struct HeartbeatContext {
  std::string                last_command_id;
  std::optional<std::string> command_error;
  std::optional<std::string> current_content;  // active playlist version
};

struct HeartbeatOutcome {
  bool              delivered = false;
  HeartbeatResponse response;
  std::string       error;
  bool              degraded_reported = false;
};

struct HeartbeatOptions {
  std::chrono::milliseconds request_timeout{10000};
  std::uint32_t             failure_threshold = 3;
};

/*
  One request, one timeout, one retry policy.

  Registered devices POST the heartbeat record; unregistered devices ask
  the lookup endpoint whether an operator has bound them to a player yet.
  The response is the only inbound channel for commands and content.

  Backoff and the degradation signal are owned by the caller's state and
  updated here: success resets the backoff, every failure grows it, and
  reaching failure_threshold consecutive failures marks the server
  degraded on the connectivity monitor.
*/
class HeartbeatClient {
 public:
  HeartbeatClient(std::shared_ptr<net::HttpTransport> transport, std::shared_ptr<SystemInfoProvider> system_info,
                  HeartbeatOptions options);

  HeartbeatOutcome Cycle(const model::Registration& registration, const HeartbeatContext& context, HeartbeatBackoff& backoff,
                         connectivity::ConnectivityMonitor& monitor, util::TimePoint now);

  // Throws TransportError on network failure or a non-2xx answer.
  HeartbeatResponse Send(const model::Registration& registration, const HeartbeatContext& context, util::TimePoint now);

  digiplayer::agent::v1::HeartbeatRequest BuildRequest(const model::Registration& registration, const HeartbeatContext& context,
                                                       util::TimePoint now);

  // Forgets the last reported content so the next heartbeat repeats it.
  void ResetContentReport();

 private:
  HeartbeatResponse Lookup(const model::Registration& registration);

  std::shared_ptr<net::HttpTransport> transport_;
  std::shared_ptr<SystemInfoProvider> system_info_;
  HeartbeatOptions                    options_;

  std::optional<std::string> reported_content_;
};

} // namespace digiplayer::heartbeat
