#include "wifi_configurator.hpp"

#include <algorithm>
#include <sstream>
#include <string_view>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"

namespace digiplayer::provisioning {

using observability::StringField;

namespace {

constexpr std::size_t kMaxSsidBytes      = 32;
constexpr std::size_t kMinPassphraseSize = 8;
constexpr std::size_t kMaxPassphraseSize = 63;

bool HasForbiddenCharacter(const std::string& value) {
  return std::any_of(value.begin(), value.end(), [](char c) {
    const auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7F || c == '"' || c == '\'';
  });
}

void AddUnique(std::vector<std::string>& networks, std::string ssid) {
  if (ssid.empty() || std::find(networks.begin(), networks.end(), ssid) != networks.end()) {
    return;
  }
  networks.push_back(std::move(ssid));
}

} // namespace

std::optional<std::string> ValidateCredentials(const WifiCredentials& credentials) {
  if (credentials.ssid.empty()) {
    return "ssid is required";
  }
  if (credentials.ssid.size() > kMaxSsidBytes) {
    return "ssid longer than 32 bytes";
  }
  if (!credentials.passphrase.empty() &&
      (credentials.passphrase.size() < kMinPassphraseSize || credentials.passphrase.size() > kMaxPassphraseSize)) {
    return "passphrase must be 8 to 63 characters";
  }
  if (HasForbiddenCharacter(credentials.ssid) || HasForbiddenCharacter(credentials.passphrase)) {
    return "quotes and control characters are not allowed";
  }
  return std::nullopt;
}

// ------------------------------------------------------------

NmcliWifiConfigurator::NmcliWifiConfigurator(std::shared_ptr<util::ProcessRunner> runner, WifiOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
}

void NmcliWifiConfigurator::Apply(const WifiCredentials& credentials) {
  std::vector<std::string> argv = {"nmcli", "--wait", std::to_string(options_.apply_timeout.count() / 1000), "device",
                                   "wifi",  "connect", credentials.ssid};
  if (!credentials.passphrase.empty()) {
    argv.insert(argv.end(), {"password", credentials.passphrase});
  }
  argv.insert(argv.end(), {"ifname", options_.interface});

  // nmcli enforces --wait itself; the extra margin only catches a hung binary
  const auto result = runner_->Run(argv, options_.apply_timeout + std::chrono::seconds(5));
  if (!result.Ok()) {
    throw util::ExecutionError("wifi_connect", result.timed_out ? "timed out" : result.output);
  }

  DIGIPLAYER_LOG_INFO("Joined wireless network", {StringField("ssid", credentials.ssid), StringField("backend", "nmcli")});
}

std::vector<std::string> NmcliWifiConfigurator::Scan() {
  const auto result = runner_->Run({"nmcli", "-t", "-f", "SSID", "device", "wifi", "list", "ifname", options_.interface, "--rescan", "yes"},
                                   options_.scan_timeout);
  if (!result.Ok()) {
    DIGIPLAYER_LOG_WARN("Wireless scan failed", {StringField("output", result.output)});
    return {};
  }
  return ParseNmcliScan(result.output);
}

// ------------------------------------------------------------

WpaSupplicantConfigurator::WpaSupplicantConfigurator(std::shared_ptr<util::ProcessRunner> runner, WifiOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
}

void WpaSupplicantConfigurator::Apply(const WifiCredentials& credentials) {
  try {
    storage::ScopedFileLock lock(options_.wpa_supplicant_conf, storage::ScopedFileLock::Mode::kExclusive);
    std::string contents = storage::ReadFileContents(options_.wpa_supplicant_conf).value_or("");
    if (!contents.empty() && contents.back() != '\n') {
      contents.push_back('\n');
    }
    contents += RenderWpaNetworkBlock(credentials);
    storage::WriteFileAtomically(options_.wpa_supplicant_conf, contents);
  } catch (const util::StorageError& e) {
    throw util::ExecutionError("wifi_connect", e.what());
  }

  const auto reconfigure = runner_->Run({"wpa_cli", "-i", options_.interface, "reconfigure"}, std::chrono::seconds(10));
  if (!reconfigure.Ok()) {
    throw util::ExecutionError("wifi_connect", "wpa_cli reconfigure failed: " + reconfigure.output);
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.apply_timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (Associated()) {
      DIGIPLAYER_LOG_INFO("Joined wireless network", {StringField("ssid", credentials.ssid), StringField("backend", "wpa_supplicant")});
      return;
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  throw util::ExecutionError("wifi_connect", "no association with " + credentials.ssid + " before timeout");
}

bool WpaSupplicantConfigurator::Associated() {
  const auto status = runner_->Run({"wpa_cli", "-i", options_.interface, "status"}, std::chrono::seconds(5));
  return status.Ok() && status.output.find("wpa_state=COMPLETED") != std::string::npos;
}

std::vector<std::string> WpaSupplicantConfigurator::Scan() {
  const auto result = runner_->Run({"iwlist", options_.interface, "scan"}, options_.scan_timeout);
  if (!result.Ok()) {
    DIGIPLAYER_LOG_WARN("Wireless scan failed", {StringField("output", result.output)});
    return {};
  }
  return ParseIwlistScan(result.output);
}

// ------------------------------------------------------------

std::string RenderWpaNetworkBlock(const WifiCredentials& credentials) {
  std::ostringstream out;
  out << "\nnetwork={\n"
      << "    ssid=\"" << credentials.ssid << "\"\n";
  if (credentials.passphrase.empty()) {
    out << "    key_mgmt=NONE\n";
  } else {
    out << "    psk=\"" << credentials.passphrase << "\"\n"
        << "    key_mgmt=WPA-PSK\n";
  }
  out << "}\n";
  return out.str();
}

std::vector<std::string> ParseNmcliScan(const std::string& output) {
  std::vector<std::string> networks;
  std::istringstream       in(output);
  std::string              line;
  while (std::getline(in, line)) {
    std::string ssid;
    for (std::size_t i = 0; i < line.size(); ++i) {
      if (line[i] == '\\' && i + 1 < line.size()) {
        ssid.push_back(line[++i]);
      } else {
        ssid.push_back(line[i]);
      }
    }
    AddUnique(networks, std::move(ssid));
  }
  return networks;
}

std::vector<std::string> ParseIwlistScan(const std::string& output) {
  static constexpr std::string_view kMarker = "ESSID:\"";

  std::vector<std::string> networks;
  std::istringstream       in(output);
  std::string              line;
  while (std::getline(in, line)) {
    const auto start = line.find(kMarker);
    if (start == std::string::npos) {
      continue;
    }
    const auto begin = start + kMarker.size();
    const auto end   = line.rfind('"');
    if (end == std::string::npos || end < begin) {
      continue;
    }
    AddUnique(networks, line.substr(begin, end - begin));
  }
  return networks;
}

} // namespace digiplayer::provisioning
