#include "provisioner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::provisioning {

using observability::StringField;

Provisioner::Provisioner(std::shared_ptr<AccessPointController> access_point, std::shared_ptr<WifiConfigurator> wifi,
                         std::string ssid_prefix, std::function<void()> on_joined)
    : access_point_(std::move(access_point)),
      wifi_(std::move(wifi)),
      ssid_prefix_(std::move(ssid_prefix)),
      on_joined_(std::move(on_joined)) {
}

Provisioner::~Provisioner() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

void Provisioner::Activate(const std::string& device_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    armed_ = true;
    ssid_  = ssid_prefix_ + device_id;
    if (applying_) {
      // the worker re-arms on failure
      return;
    }
  }

  std::lock_guard<std::mutex> tooling(tooling_mutex_);

  // scanning is not possible once the radio is in AP mode
  auto networks = wifi_->Scan();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    networks_ = std::move(networks);
  }

  StartAccessPointLocked();
}

void Provisioner::Deactivate() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    armed_ = false;
  }

  std::lock_guard<std::mutex> tooling(tooling_mutex_);
  access_point_->Stop();
}

SubmitResult Provisioner::SubmitCredentials(const WifiCredentials& credentials) {
  if (auto reason = ValidateCredentials(credentials)) {
    DIGIPLAYER_LOG_WARN("Rejected wireless credentials", {StringField("reason", *reason)});
    return {SubmitStatus::kInvalid, *reason};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // the portal also answers on the LAN; an online device keeps its network
  if (!armed_) {
    DIGIPLAYER_LOG_WARN("Credential submission while fallback is inactive", {StringField("ssid", credentials.ssid)});
    return {SubmitStatus::kInvalid, "access point fallback is not active"};
  }
  if (applying_) {
    DIGIPLAYER_LOG_WARN("Credential submission while another is applied", {StringField("ssid", credentials.ssid)});
    return {SubmitStatus::kBusy, "another network configuration is being applied"};
  }

  applying_ = true;
  // the previous worker has already cleared applying_, so this join is immediate
  if (worker_.joinable()) {
    worker_.join();
  }
  worker_ = std::thread(&Provisioner::ApplyWorker, this, credentials);

  DIGIPLAYER_LOG_INFO("Applying wireless credentials", {StringField("ssid", credentials.ssid)});
  return {SubmitStatus::kAccepted, "connecting to " + credentials.ssid};
}

void Provisioner::ApplyWorker(WifiCredentials credentials) {
  bool        joined = false;
  std::string error;

  {
    std::lock_guard<std::mutex> tooling(tooling_mutex_);

    try {
      access_point_->Stop();
    } catch (const util::ExecutionError& e) {
      DIGIPLAYER_LOG_WARN("Access point did not stop cleanly", {StringField("error", e.what())});
    }

    try {
      wifi_->Apply(credentials);
      joined = true;
    } catch (const util::ExecutionError& e) {
      error = e.what();
      DIGIPLAYER_LOG_ERROR("Could not join wireless network", {StringField("ssid", credentials.ssid), StringField("error", error)});
    }

    if (!joined) {
      try {
        StartAccessPointLocked();
      } catch (const util::ExecutionError& e) {
        DIGIPLAYER_LOG_ERROR("Could not re-arm access point", {StringField("error", e.what())});
        error += "; " + std::string(e.what());
      }
    }
  }

  if (joined) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      armed_ = false;
    }
    if (on_joined_) {
      on_joined_();
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = error;
    applying_   = false;
  }
  idle_cv_.notify_all();
}

// Caller holds tooling_mutex_.
void Provisioner::StartAccessPointLocked() {
  std::string ssid;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!armed_) {
      return;
    }
    ssid = ssid_;
  }
  access_point_->Start(ssid);
}

void Provisioner::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return !applying_; });
}

bool Provisioner::Active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return armed_;
}

bool Provisioner::Applying() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return applying_;
}

std::vector<std::string> Provisioner::Networks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return networks_;
}

ProvisionerSnapshot Provisioner::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {armed_, applying_, ssid_, last_error_, networks_};
}

} // namespace digiplayer::provisioning
