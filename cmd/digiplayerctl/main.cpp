#include <signal.h>
#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "digiplayer/agent/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/heartbeat/heartbeat_client.hpp"
#include "internal/identity/identity_store.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/runtime/pid_file.hpp"
#include "internal/state/agent_state_store.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/storage/json_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using digiplayer::runtime::config::RuntimeConfig;

namespace {

constexpr int kExitOk            = 0;
constexpr int kExitInvalid       = 1;
constexpr int kExitTransport     = 2;
constexpr int kExitNotConfigured = 3;
constexpr int kExitStorage       = 4;

constexpr const char* kDefaultConfig = "/etc/digiplayer/agent.yaml";

void Usage() {
  std::cout << "Usage:\n"
            << "  digiplayerctl [--config <agent.yaml>] show-id\n"
            << "  digiplayerctl [--config <agent.yaml>] status\n"
            << "  digiplayerctl [--config <agent.yaml>] heartbeat\n"
            << "  digiplayerctl [--config <agent.yaml>] set-player-id <id>\n"
            << "  digiplayerctl [--config <agent.yaml>] clear-player-id\n"
            << "  digiplayerctl [--config <agent.yaml>] set-server <url>\n"
            << "  digiplayerctl [--config <agent.yaml>] reset-registration\n"
            << "  digiplayerctl [--config <agent.yaml>] reset-identity\n";
}

std::optional<int64_t> ParsePlayerId(const std::string& value) {
  if (value.empty() || value.size() > 18) {
    return std::nullopt;
  }
  int64_t id = 0;
  for (char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    id = id * 10 + (c - '0');
  }
  return id;
}

// Nudges a running agent so it re-reads the registration now.
void NotifyAgent(const RuntimeConfig& config) {
  const auto pid = digiplayer::runtime::PidFile::ReadRunning(config.paths().pid_file());
  if (pid && ::kill(*pid, SIGUSR1) != 0) {
    std::cerr << "warning: could not signal agent pid " << *pid << "\n";
  }
}

int ShowStatus(const RuntimeConfig& config, const digiplayer::factory::LocalStores& stores) {
  digiplayer::agent::v1::AgentStatus status;
  const auto                         file  = digiplayer::factory::StatusFile(config);
  auto                               state = digiplayer::storage::DocumentState::kMissing;
  if (std::filesystem::exists(file)) {
    digiplayer::storage::ScopedFileLock lock(file, digiplayer::storage::ScopedFileLock::Mode::kShared);
    state = digiplayer::storage::LoadJsonDocument(file, &status);
  }

  const auto pid = digiplayer::runtime::PidFile::ReadRunning(config.paths().pid_file());
  std::cout << "agent: " << (pid ? "running (pid " + std::to_string(*pid) + ")" : std::string("not running")) << "\n";

  if (state != digiplayer::storage::DocumentState::kLoaded) {
    // no report from the agent yet, fall back to the registration document
    const auto registration = stores.identity->Current();
    status.set_device_id(registration.device_id);
    if (registration.player_id) {
      status.set_player_id(*registration.player_id);
    }
    status.set_server_url(registration.server_url);
    status.set_last_command_id(stores.state->LastCommandId());
  }

  std::cout << digiplayer::storage::ToJson(status, true) << "\n";
  return kExitOk;
}

int Heartbeat(const RuntimeConfig& config, const digiplayer::factory::LocalStores& stores) {
  const auto pid = digiplayer::runtime::PidFile::ReadRunning(config.paths().pid_file());
  if (pid && ::kill(*pid, SIGUSR1) == 0) {
    std::cout << "heartbeat requested from agent pid " << *pid << "\n";
    return kExitOk;
  }

  const auto registration = stores.identity->Current();
  if (!registration.Registered()) {
    std::cerr << "device " << registration.device_id << " is not registered with " << registration.server_url << "\n";
    return kExitNotConfigured;
  }

  // commands in the answer stay unacknowledged and are re-delivered to the agent
  auto client = digiplayer::factory::BuildHeartbeatClient(config, digiplayer::factory::BuildTransport(config));

  digiplayer::heartbeat::HeartbeatContext context;
  context.last_command_id = stores.state->LastCommandId();

  const auto now = digiplayer::util::Now();
  try {
    client->Send(registration, context, now);
  } catch (const digiplayer::util::TransportError& e) {
    std::cerr << "heartbeat failed: " << e.what() << "\n";
    return kExitTransport;
  }
  stores.state->SetLastSeenOnline(now);

  std::cout << "heartbeat delivered for player " << *registration.player_id << "\n";
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    Usage();
    return kExitInvalid;
  }

  RuntimeConfig config;
  try {
    if (!config_path.empty()) {
      config = digiplayer::config::ConfigLoader::LoadFromYaml(config_path);
    } else if (std::filesystem::exists(kDefaultConfig)) {
      config = digiplayer::config::ConfigLoader::LoadFromYaml(kDefaultConfig);
    } else {
      config = digiplayer::config::ConfigLoader::Defaults();
    }
  } catch (const digiplayer::util::ConfigError& e) {
    std::cerr << e.what() << "\n";
    return kExitInvalid;
  }

  const std::string& cmd = args[0];

  try {
    auto stores = digiplayer::factory::BuildLocalStores(config);

    if (cmd == "show-id" && args.size() == 1) {
      std::cout << stores.identity->GetOrCreateDeviceId() << "\n";
      return kExitOk;
    }

    if (cmd == "status" && args.size() == 1) {
      return ShowStatus(config, stores);
    }

    if (cmd == "heartbeat" && args.size() == 1) {
      return Heartbeat(config, stores);
    }

    if (cmd == "set-player-id" && args.size() == 2) {
      const auto id = ParsePlayerId(args[1]);
      if (!id) {
        std::cerr << "invalid player id: " << args[1] << "\n";
        return kExitInvalid;
      }
      stores.identity->SetPlayerId(*id);
      NotifyAgent(config);
      std::cout << "player id set to " << *id << "\n";
      return kExitOk;
    }

    if (cmd == "clear-player-id" && args.size() == 1) {
      stores.identity->ClearPlayerId();
      NotifyAgent(config);
      std::cout << "player id cleared\n";
      return kExitOk;
    }

    if (cmd == "set-server" && args.size() == 2) {
      stores.identity->SetServerUrl(args[1]);
      NotifyAgent(config);
      std::cout << "server set to " << args[1] << "\n";
      return kExitOk;
    }

    if (cmd == "reset-registration" && args.size() == 1) {
      stores.identity->ResetRegistration();
      NotifyAgent(config);
      std::cout << "registration reset\n";
      return kExitOk;
    }

    if (cmd == "reset-identity" && args.size() == 1) {
      const auto device_id = stores.identity->ResetDeviceId();
      NotifyAgent(config);
      std::cout << device_id << "\n";
      return kExitOk;
    }
  } catch (const digiplayer::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    return kExitInvalid;
  } catch (const digiplayer::util::StorageError& e) {
    std::cerr << "storage failure: " << e.what() << "\n";
    return kExitStorage;
  }

  Usage();
  return kExitInvalid;
}
