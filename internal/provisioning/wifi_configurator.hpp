#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace digiplayer::util {
class ProcessRunner;
}

namespace digiplayer::provisioning {

struct WifiCredentials {
  std::string ssid;
  std::string passphrase;  // empty: open network
};

// Reason the credentials are rejected, nullopt when acceptable.
//   ssid:       1..32 bytes
//   passphrase: empty or 8..63 characters
//   neither may contain control characters or quotes
std::optional<std::string> ValidateCredentials(const WifiCredentials& credentials);

/*
  Writes credentials into the OS network configuration and joins the
  network. Apply throws ExecutionError when the network cannot be joined
  within the timeout.
*/
class WifiConfigurator {
 public:
  virtual ~WifiConfigurator() = default;

  virtual void                     Apply(const WifiCredentials& credentials) = 0;
  virtual std::vector<std::string> Scan()                                    = 0;
};

struct WifiOptions {
  std::string               interface{"wlan0"};
  std::filesystem::path     wpa_supplicant_conf{"/etc/wpa_supplicant/wpa_supplicant.conf"};
  std::chrono::milliseconds apply_timeout{std::chrono::seconds(45)};
  std::chrono::milliseconds scan_timeout{std::chrono::seconds(30)};
};

class NmcliWifiConfigurator final : public WifiConfigurator {
 public:
  NmcliWifiConfigurator(std::shared_ptr<util::ProcessRunner> runner, WifiOptions options);

  void                     Apply(const WifiCredentials& credentials) override;
  std::vector<std::string> Scan() override;

 private:
  std::shared_ptr<util::ProcessRunner> runner_;
  WifiOptions                          options_;
};

/*
  Appends a network block to wpa_supplicant.conf, asks wpa_supplicant to
  reload it and waits for the association to complete.
*/
class WpaSupplicantConfigurator final : public WifiConfigurator {
 public:
  WpaSupplicantConfigurator(std::shared_ptr<util::ProcessRunner> runner, WifiOptions options);

  void                     Apply(const WifiCredentials& credentials) override;
  std::vector<std::string> Scan() override;

 private:
  bool Associated();

  std::shared_ptr<util::ProcessRunner> runner_;
  WifiOptions                          options_;
};

std::string RenderWpaNetworkBlock(const WifiCredentials& credentials);

// `nmcli -t -f SSID device wifi list` output, with "\:" unescaped.
std::vector<std::string> ParseNmcliScan(const std::string& output);

// `iwlist <iface> scan` output.
std::vector<std::string> ParseIwlistScan(const std::string& output);

} // namespace digiplayer::provisioning
