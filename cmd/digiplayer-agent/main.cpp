#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/provisioning/captive_portal.hpp"
#include "internal/runtime/agent.hpp"
#include "internal/runtime/pid_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/version.hpp"

using digiplayer::factory::Build;
using digiplayer::observability::StringField;
using digiplayer::runtime::PidFile;

static volatile std::sig_atomic_t g_running         = 1;
static volatile std::sig_atomic_t g_force_heartbeat = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleHeartbeatSignal(int) {
  g_force_heartbeat = 1;
}

int main(int argc, char** argv) {
  std::string config_path = "/etc/digiplayer/agent.yaml";
  bool        verbose     = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      std::cerr << "Usage: digiplayer-agent [--config <agent.yaml>] [-v]" << std::endl;
      return 1;
    }
  }

  digiplayer::runtime::config::RuntimeConfig config;
  try {
    config = digiplayer::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const digiplayer::util::ConfigError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  if (verbose) {
    config.mutable_logging()->set_level("debug");
  }

  digiplayer::observability::InitializeLogging(config);

  try {
    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    PidFile pid_file(config.paths().pid_file());

    // no device id means nothing to report; this is the one fatal error
    app.agent->Bootstrap();

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGUSR1, HandleHeartbeatSignal);

    if (app.portal) {
      app.portal->Start();
    }

    std::thread loop([&app] { app.agent->Run(); });
    DIGIPLAYER_LOG_INFO("DigiPlayer agent started", {StringField("version", digiplayer::util::kAgentVersion),
                                                     StringField("config", config_path)});

    while (g_running) {
      if (g_force_heartbeat) {
        g_force_heartbeat = 0;
        app.agent->ForceHeartbeat();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    DIGIPLAYER_LOG_INFO("Shutting down DigiPlayer agent");

    app.agent->Stop();
    loop.join();
    if (app.portal) {
      app.portal->Stop();
    }
    digiplayer::observability::ShutdownLogging();
  } catch (const digiplayer::util::StorageError& e) {
    DIGIPLAYER_LOG_ERROR("Local state unavailable", {StringField("error", e.what())});
    digiplayer::observability::ShutdownLogging();
    return 4;
  } catch (const std::exception& e) {
    DIGIPLAYER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    digiplayer::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
