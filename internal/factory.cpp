#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/command/command_executor.hpp"
#include "internal/command/device_platform.hpp"
#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/connectivity/probes.hpp"
#include "internal/content/content_reconciler.hpp"
#include "internal/content/manifest_store.hpp"
#include "internal/content/media_fetcher.hpp"
#include "internal/content/media_store.hpp"
#include "internal/content/playback_sink.hpp"
#include "internal/heartbeat/heartbeat_client.hpp"
#include "internal/heartbeat/system_info.hpp"
#include "internal/identity/hardware_fingerprint.hpp"
#include "internal/identity/identity_store.hpp"
#include "internal/identity/registration_store.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/provisioning/access_point.hpp"
#include "internal/provisioning/captive_portal.hpp"
#include "internal/provisioning/provisioner.hpp"
#include "internal/provisioning/wifi_configurator.hpp"
#include "internal/runtime/agent.hpp"
#include "internal/state/agent_state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"
#include "internal/util/version.hpp"

namespace digiplayer::factory {

namespace {

std::filesystem::path StateDir(const RuntimeConfig& config) {
  return std::filesystem::path(config.paths().state_dir());
}

identity::RegistrationDefaults BuildRegistrationDefaults(const RuntimeConfig& config) {
  identity::RegistrationDefaults defaults;
  defaults.server_url         = config.server().server_url();
  defaults.api_prefix         = config.server().api_prefix();
  defaults.heartbeat_interval = std::chrono::seconds(config.server().heartbeat_interval_sec());
  return defaults;
}

std::shared_ptr<provisioning::AccessPointController> BuildAccessPoint(const RuntimeConfig& config,
                                                                      std::shared_ptr<util::ProcessRunner> runner) {
  const auto&                      ap = config.access_point();
  provisioning::AccessPointOptions options;
  options.interface    = ap.interface();
  options.passphrase   = ap.passphrase();
  options.hostapd_conf = ap.hostapd_conf();

  if (ap.ap_backend() == "nmcli") {
    return std::make_shared<provisioning::NmcliAccessPoint>(std::move(runner), options);
  }
  if (ap.ap_backend() == "hostapd") {
    return std::make_shared<provisioning::HostapdAccessPoint>(std::move(runner), options);
  }
  throw util::ConfigError("unknown access_point.ap_backend: " + ap.ap_backend());
}

std::shared_ptr<provisioning::WifiConfigurator> BuildWifi(const RuntimeConfig& config, std::shared_ptr<util::ProcessRunner> runner) {
  const auto&              ap = config.access_point();
  provisioning::WifiOptions options;
  options.interface           = ap.interface();
  options.wpa_supplicant_conf = ap.wpa_supplicant_conf();
  options.apply_timeout       = std::chrono::seconds(ap.apply_timeout_sec());

  if (ap.network_backend() == "nmcli") {
    return std::make_shared<provisioning::NmcliWifiConfigurator>(std::move(runner), options);
  }
  if (ap.network_backend() == "wpa_supplicant") {
    return std::make_shared<provisioning::WpaSupplicantConfigurator>(std::move(runner), options);
  }
  throw util::ConfigError("unknown access_point.network_backend: " + ap.network_backend());
}

} // namespace

std::filesystem::path StatusFile(const RuntimeConfig& config) {
  return StateDir(config) / "status.json";
}

LocalStores BuildLocalStores(const RuntimeConfig& config) {
  LocalStores stores;
  auto registration = std::make_shared<identity::RegistrationStore>(config.paths().registration_file(), BuildRegistrationDefaults(config));
  stores.state      = std::make_shared<state::AgentStateStore>(StateDir(config) / "state.json");
  stores.identity   = std::make_shared<identity::IdentityStore>(std::move(registration), stores.state,
                                                                std::make_shared<identity::SysfsFingerprintSource>());
  return stores;
}

std::shared_ptr<net::HttpTransport> BuildTransport(const RuntimeConfig& config) {
  net::CurlTransportOptions options;
  options.ca_bundle  = config.server().ca_bundle();
  options.user_agent = "DigiPlayer/" + std::string(util::kAgentVersion);
  return std::make_shared<net::CurlHttpTransport>(options);
}

std::shared_ptr<heartbeat::HeartbeatClient> BuildHeartbeatClient(const RuntimeConfig& config,
                                                                 std::shared_ptr<net::HttpTransport> transport) {
  auto runner      = std::make_shared<util::SystemProcessRunner>();
  auto system_info = std::make_shared<heartbeat::LinuxSystemInfoProvider>(runner, StateDir(config));

  heartbeat::HeartbeatOptions options;
  options.request_timeout   = std::chrono::milliseconds(config.server().request_timeout_ms());
  options.failure_threshold = config.heartbeat().failure_threshold();
  return std::make_shared<heartbeat::HeartbeatClient>(std::move(transport), std::move(system_info), options);
}

/*
    Build full agent dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;
  app.stores = BuildLocalStores(config);

  auto runner    = std::make_shared<util::SystemProcessRunner>();
  auto transport = BuildTransport(config);

  // ------------------------------------------------------------------
  // Connectivity
  // ------------------------------------------------------------------
  const auto& conn    = config.connectivity();
  auto        monitor = std::make_shared<connectivity::ConnectivityMonitor>(conn.fallback_grace_probes());
  auto        network_probe =
      std::make_shared<connectivity::RouteTcpNetworkProbe>(conn.route_table_path(), conn.probe_host(),
                                                           static_cast<std::uint16_t>(conn.probe_port()),
                                                           std::chrono::milliseconds(conn.probe_timeout_ms()));
  auto server_probe = std::make_shared<connectivity::HttpServerProbe>(transport, std::chrono::milliseconds(conn.probe_timeout_ms()));

  // ------------------------------------------------------------------
  // Provisioning fallback
  // ------------------------------------------------------------------
  std::shared_ptr<provisioning::Provisioner> provisioner;
  if (config.access_point().enabled()) {
    provisioner = std::make_shared<provisioning::Provisioner>(BuildAccessPoint(config, runner), BuildWifi(config, runner),
                                                              config.access_point().ssid_prefix(), [monitor] {
                                                                monitor->ClearFallback();
                                                                monitor->RequestReprobe();
                                                              });
  }

  // ------------------------------------------------------------------
  // Heartbeat, commands, content
  // ------------------------------------------------------------------
  auto heartbeat_client = BuildHeartbeatClient(config, transport);

  command::ExecutorOptions executor_options;
  executor_options.screenshot_path = config.paths().screenshot_path();
  auto executor = std::make_shared<command::CommandExecutor>(app.stores.state, std::make_shared<command::LinuxDevicePlatform>(runner),
                                                             transport, executor_options);

  const auto& content = config.content();
  auto        media   = std::make_shared<content::MediaStore>(config.paths().media_dir());
  auto fetcher = std::make_shared<content::HttpMediaFetcher>(transport, std::chrono::milliseconds(content.download_timeout_ms()));
  auto sink    = std::make_shared<content::PlaylistFileSink>(StateDir(config) / "playlist.json", content.reload_command(), runner);
  auto manifest = std::make_shared<content::ContentManifestStore>(StateDir(config) / "content.json");

  content::ReconcilerOptions reconciler_options;
  reconciler_options.download_concurrency = content.download_concurrency();
  auto reconciler = std::make_shared<content::ContentReconciler>(media, fetcher, sink, manifest, reconciler_options);

  // ------------------------------------------------------------------
  // Agent
  // ------------------------------------------------------------------
  runtime::AgentComponents components;
  components.identity      = app.stores.identity;
  components.state_store   = app.stores.state;
  components.monitor       = monitor;
  components.network_probe = network_probe;
  components.server_probe  = server_probe;
  components.provisioner   = provisioner;
  components.heartbeat     = heartbeat_client;
  components.executor      = executor;
  components.reconciler    = reconciler;

  runtime::AgentOptions agent_options;
  agent_options.probe_interval         = std::chrono::seconds(conn.probe_interval_sec());
  agent_options.max_backoff_multiplier = config.heartbeat().max_backoff_multiplier();
  agent_options.status_file            = StatusFile(config);

  app.agent = std::make_shared<runtime::Agent>(std::move(components), agent_options);

  if (provisioner) {
    std::weak_ptr<runtime::Agent> agent = app.agent;
    auto router = std::make_shared<provisioning::PortalRouter>(provisioner, [agent] {
      if (auto locked = agent.lock()) {
        return locked->Status();
      }
      return digiplayer::agent::v1::AgentStatus();
    });
    app.portal = std::make_shared<provisioning::CaptivePortalServer>(config.access_point().portal_address(),
                                                                     static_cast<std::uint16_t>(config.access_point().portal_port()),
                                                                     std::move(router));
  }

  return app;
}

} // namespace digiplayer::factory
