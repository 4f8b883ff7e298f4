#pragma once

#include <filesystem>
#include <memory>

#include "config/config.pb.h"

namespace digiplayer::identity {
class IdentityStore;
}
namespace digiplayer::state {
class AgentStateStore;
}
namespace digiplayer::net {
class HttpTransport;
}
namespace digiplayer::heartbeat {
class HeartbeatClient;
}
namespace digiplayer::provisioning {
class CaptivePortalServer;
}
namespace digiplayer::runtime {
class Agent;
}

namespace digiplayer::factory {

using digiplayer::runtime::config::RuntimeConfig;

/*
  The two documents shared by the agent and digiplayerctl.
*/
struct LocalStores {
  std::shared_ptr<identity::IdentityStore> identity;
  std::shared_ptr<state::AgentStateStore>  state;
};

/*
  Application

  Owns every long-lived component of the agent process.
*/
struct Application {
  LocalStores                                        stores;
  std::shared_ptr<runtime::Agent>                    agent;
  std::shared_ptr<provisioning::CaptivePortalServer> portal;  // null when fallback is disabled
};

std::filesystem::path StatusFile(const RuntimeConfig& config);

LocalStores BuildLocalStores(const RuntimeConfig& config);

std::shared_ptr<net::HttpTransport> BuildTransport(const RuntimeConfig& config);

std::shared_ptr<heartbeat::HeartbeatClient> BuildHeartbeatClient(const RuntimeConfig& config,
                                                                 std::shared_ptr<net::HttpTransport> transport);

/*
  Build

  Composition root: the only place that knows the concrete Linux
  backends (curl, nmcli/hostapd, vcgencmd, playlist file).
*/
Application Build(const RuntimeConfig& config);

} // namespace digiplayer::factory
