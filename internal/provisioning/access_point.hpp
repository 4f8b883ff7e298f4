#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace digiplayer::util {
class ProcessRunner;
}

namespace digiplayer::provisioning {

/*
  Local wireless access point used while the unit has no network.

  Start/Stop throw ExecutionError when the OS tooling fails. Stop on an
  access point that is not running is a no-op.
*/
class AccessPointController {
 public:
  virtual ~AccessPointController() = default;

  virtual void Start(const std::string& ssid) = 0;
  virtual void Stop()                         = 0;
  virtual bool Running() const                = 0;
};

struct AccessPointOptions {
  std::string               interface{"wlan0"};
  std::string               passphrase;  // empty: open network
  std::filesystem::path     hostapd_conf{"/etc/hostapd/hostapd.conf"};
  std::chrono::milliseconds command_timeout{std::chrono::seconds(30)};
};

// NetworkManager shared-mode hotspot connection ("digiplayer-ap").
class NmcliAccessPoint final : public AccessPointController {
 public:
  NmcliAccessPoint(std::shared_ptr<util::ProcessRunner> runner, AccessPointOptions options);

  void Start(const std::string& ssid) override;
  void Stop() override;
  bool Running() const override;

 private:
  std::shared_ptr<util::ProcessRunner> runner_;
  AccessPointOptions                   options_;
  bool                                 running_ = false;
};

// hostapd + dnsmasq system services; hostapd.conf is rewritten on Start.
class HostapdAccessPoint final : public AccessPointController {
 public:
  HostapdAccessPoint(std::shared_ptr<util::ProcessRunner> runner, AccessPointOptions options);

  void Start(const std::string& ssid) override;
  void Stop() override;
  bool Running() const override;

 private:
  std::shared_ptr<util::ProcessRunner> runner_;
  AccessPointOptions                   options_;
  bool                                 running_ = false;
};

std::string RenderHostapdConfig(const std::string& interface, const std::string& ssid, const std::string& passphrase);

} // namespace digiplayer::provisioning
