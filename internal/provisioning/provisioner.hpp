#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/provisioning/access_point.hpp"
#include "internal/provisioning/wifi_configurator.hpp"

namespace digiplayer::provisioning {

enum class SubmitStatus {
  kAccepted,
  kBusy,
  kInvalid,
};

constexpr std::string_view ToString(SubmitStatus status) {
  switch (status) {
    case SubmitStatus::kAccepted:
      return "accepted";
    case SubmitStatus::kBusy:
      return "busy";
    case SubmitStatus::kInvalid:
      return "invalid";
  }
  return "invalid";
}

struct SubmitResult {
  SubmitStatus status = SubmitStatus::kInvalid;
  std::string  message;
};

struct ProvisionerSnapshot {
  bool                     active   = false;
  bool                     applying = false;
  std::string              ssid;
  std::string              last_error;
  std::vector<std::string> networks;
};

/*
  Access-point fallback.

  Credential application is single-slot: a submission while another is
  being applied is rejected with kBusy, never queued. Applying runs on a
  worker thread:

      stop AP -> write network config -> joined?  yes: on_joined()
                                                   no:  start AP again

  The access point is always re-armed after a failed attempt.
*/
class Provisioner {
 public:
  Provisioner(std::shared_ptr<AccessPointController> access_point, std::shared_ptr<WifiConfigurator> wifi,
              std::string ssid_prefix, std::function<void()> on_joined);
  ~Provisioner();

  Provisioner(const Provisioner&)            = delete;
  Provisioner& operator=(const Provisioner&) = delete;

  // Scans nearby networks for the form, then starts the access point.
  // Throws ExecutionError when the access point cannot be started.
  void Activate(const std::string& device_id);

  // Throws ExecutionError when the access point cannot be stopped.
  void Deactivate();

  // Rejects with kInvalid unless the fallback is active.
  SubmitResult SubmitCredentials(const WifiCredentials& credentials);

  // Blocks until no submission is being applied.
  void WaitIdle();

  bool                     Active() const;
  bool                     Applying() const;
  std::vector<std::string> Networks() const;
  ProvisionerSnapshot      Snapshot() const;

 private:
  void ApplyWorker(WifiCredentials credentials);
  void StartAccessPointLocked();

  std::shared_ptr<AccessPointController> access_point_;
  std::shared_ptr<WifiConfigurator>      wifi_;
  std::string                            ssid_prefix_;
  std::function<void()>                  on_joined_;

  // serializes access point and network tooling
  std::mutex tooling_mutex_;

  mutable std::mutex       mutex_;
  std::condition_variable  idle_cv_;
  bool                     armed_    = false;
  bool                     applying_ = false;
  std::string              ssid_;
  std::string              last_error_;
  std::vector<std::string> networks_;
  std::thread              worker_;
};

} // namespace digiplayer::provisioning
