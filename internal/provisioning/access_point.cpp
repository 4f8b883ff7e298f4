#include "access_point.hpp"

#include <sstream>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"

namespace digiplayer::provisioning {

namespace {

constexpr char kConnectionName[] = "digiplayer-ap";

void RunChecked(util::ProcessRunner& runner, const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  const auto result = runner.Run(argv, timeout);
  if (!result.Ok()) {
    const std::string cause = result.timed_out ? "timed out" : "exit " + std::to_string(result.exit_code) + ": " + result.output;
    throw util::ExecutionError("access_point", util::DescribeCommand(argv) + " " + cause);
  }
}

} // namespace

// ------------------------------------------------------------

NmcliAccessPoint::NmcliAccessPoint(std::shared_ptr<util::ProcessRunner> runner, AccessPointOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
}

void NmcliAccessPoint::Start(const std::string& ssid) {
  // a stale profile from a previous run would make "add" fail
  if (runner_->Run({"nmcli", "connection", "delete", kConnectionName}, options_.command_timeout).Ok()) {
    DIGIPLAYER_LOG_DEBUG("Removed stale access point profile");
  }

  std::vector<std::string> add = {"nmcli",     "connection", "add",
                                  "type",      "wifi",       "ifname",
                                  options_.interface,        "con-name",
                                  kConnectionName,           "autoconnect",
                                  "no",        "ssid",       ssid,
                                  "802-11-wireless.mode",    "ap",
                                  "802-11-wireless.band",    "bg",
                                  "ipv4.method",             "shared"};
  if (!options_.passphrase.empty()) {
    add.insert(add.end(), {"wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.psk", options_.passphrase});
  }

  RunChecked(*runner_, add, options_.command_timeout);
  RunChecked(*runner_, {"nmcli", "connection", "up", kConnectionName}, options_.command_timeout);
  running_ = true;

  DIGIPLAYER_LOG_INFO("Access point started", {observability::StringField("ssid", ssid), observability::StringField("backend", "nmcli")});
}

void NmcliAccessPoint::Stop() {
  if (!running_) {
    return;
  }
  RunChecked(*runner_, {"nmcli", "connection", "down", kConnectionName}, options_.command_timeout);
  running_ = false;
  DIGIPLAYER_LOG_INFO("Access point stopped", {observability::StringField("backend", "nmcli")});
}

bool NmcliAccessPoint::Running() const {
  return running_;
}

// ------------------------------------------------------------

HostapdAccessPoint::HostapdAccessPoint(std::shared_ptr<util::ProcessRunner> runner, AccessPointOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
}

void HostapdAccessPoint::Start(const std::string& ssid) {
  try {
    storage::ScopedFileLock lock(options_.hostapd_conf, storage::ScopedFileLock::Mode::kExclusive);
    storage::WriteFileAtomically(options_.hostapd_conf, RenderHostapdConfig(options_.interface, ssid, options_.passphrase));
  } catch (const util::StorageError& e) {
    throw util::ExecutionError("access_point", e.what());
  }

  RunChecked(*runner_, {"systemctl", "restart", "hostapd"}, options_.command_timeout);
  RunChecked(*runner_, {"systemctl", "restart", "dnsmasq"}, options_.command_timeout);
  running_ = true;

  DIGIPLAYER_LOG_INFO("Access point started", {observability::StringField("ssid", ssid), observability::StringField("backend", "hostapd")});
}

void HostapdAccessPoint::Stop() {
  if (!running_) {
    return;
  }
  RunChecked(*runner_, {"systemctl", "stop", "dnsmasq"}, options_.command_timeout);
  RunChecked(*runner_, {"systemctl", "stop", "hostapd"}, options_.command_timeout);
  running_ = false;
  DIGIPLAYER_LOG_INFO("Access point stopped", {observability::StringField("backend", "hostapd")});
}

bool HostapdAccessPoint::Running() const {
  return running_;
}

std::string RenderHostapdConfig(const std::string& interface, const std::string& ssid, const std::string& passphrase) {
  std::ostringstream out;
  out << "interface=" << interface << "\n"
      << "driver=nl80211\n"
      << "ssid=" << ssid << "\n"
      << "hw_mode=g\n"
      << "channel=6\n"
      << "wmm_enabled=0\n"
      << "auth_algs=1\n"
      << "ignore_broadcast_ssid=0\n";
  if (!passphrase.empty()) {
    out << "wpa=2\n"
        << "wpa_key_mgmt=WPA-PSK\n"
        << "rsn_pairwise=CCMP\n"
        << "wpa_passphrase=" << passphrase << "\n";
  }
  return out.str();
}

} // namespace digiplayer::provisioning
