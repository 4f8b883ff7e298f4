#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/command/device_platform.hpp"
#include "internal/connectivity/probes.hpp"
#include "internal/content/media_fetcher.hpp"
#include "internal/content/playback_sink.hpp"
#include "internal/heartbeat/system_info.hpp"
#include "internal/identity/hardware_fingerprint.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/provisioning/access_point.hpp"
#include "internal/provisioning/wifi_configurator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"

namespace digiplayer::testing {

struct RecordedRequest {
  std::string method;
  std::string url;
  std::string body;
};

/*
  Scripted HttpTransport. With no handler every call fails like an
  unreachable host.
*/
class FakeTransport final : public net::HttpTransport {
 public:
  using Handler = std::function<net::HttpResponse(const RecordedRequest&)>;

  net::HttpResponse Get(const std::string& url, std::chrono::milliseconds) override {
    return Dispatch({"GET", url, ""});
  }

  net::HttpResponse PostJson(const std::string& url, const std::string& body, std::chrono::milliseconds) override {
    return Dispatch({"POST", url, body});
  }

  net::HttpResponse PostFile(const std::string& url, const net::MultipartFile& file, std::chrono::milliseconds) override {
    return Dispatch({"UPLOAD", url, file.field + ":" + file.path.string()});
  }

  net::HttpResponse Download(const std::string& url, const std::filesystem::path& destination, std::chrono::milliseconds) override {
    auto response = Dispatch({"DOWNLOAD", url, ""});
    if (response.Ok()) {
      std::filesystem::create_directories(destination.parent_path());
      std::ofstream out(destination, std::ios::binary);
      out << response.body;
    }
    response.body.clear();
    return response;
  }

  void SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
  }

  std::vector<RecordedRequest> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::size_t Count(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 count = 0;
    for (const auto& request : requests_) {
      if (request.method == method) ++count;
    }
    return count;
  }

 private:
  net::HttpResponse Dispatch(const RecordedRequest& request) {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      handler = handler_;
    }
    if (!handler) {
      throw util::TransportError("connection refused: " + request.url);
    }
    return handler(request);
  }

  mutable std::mutex           mutex_;
  Handler                      handler_;
  std::vector<RecordedRequest> requests_;
};

class FixedSystemInfo final : public heartbeat::SystemInfoProvider {
 public:
  digiplayer::agent::v1::SystemInfo Collect() override {
    digiplayer::agent::v1::SystemInfo info;
    info.set_ip_address("192.168.1.50");
    info.set_mac_address("b8:27:eb:12:34:56");
    info.set_screen_resolution("1920x1080");
    info.set_storage_used(1000);
    info.set_storage_total(32000);
    info.set_uptime_seconds(3600);
    info.set_hostname("signage-01");
    return info;
  }
};

class FakePlatform final : public command::DevicePlatform {
 public:
  void Reboot() override {
    if (fail_reboot) throw util::ExecutionError("reboot", "systemctl refused");
    ++reboots;
  }

  command::DisplayPower QueryDisplayPower() override {
    return display;
  }

  void SetDisplayPower(bool on) override {
    if (fail_display) throw util::ExecutionError(on ? "screen_on" : "screen_off", "vcgencmd failed");
    ++display_changes;
    display = on ? command::DisplayPower::kOn : command::DisplayPower::kOff;
  }

  void CaptureScreenshot(const std::filesystem::path& destination) override {
    if (fail_screenshot) throw util::ExecutionError("screenshot", "no display");
    std::filesystem::create_directories(destination.parent_path());
    std::ofstream out(destination, std::ios::binary);
    out << "\x89PNG";
    ++screenshots;
  }

  command::DisplayPower display         = command::DisplayPower::kOn;
  int                   reboots         = 0;
  int                   display_changes = 0;
  int                   screenshots     = 0;
  bool                  fail_reboot     = false;
  bool                  fail_display    = false;
  bool                  fail_screenshot = false;
};

/*
  Serves media bodies by URL; unknown URLs fail. Safe to call from the
  download workers.
*/
class FakeFetcher final : public content::MediaFetcher {
 public:
  void Fetch(const std::string& url, const std::filesystem::path& destination) override {
    std::string body;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_[url];
      const auto it = bodies_.find(url);
      if (it == bodies_.end()) {
        throw util::TransportError("download answered HTTP 404", 404);
      }
      body = it->second;
    }
    std::filesystem::create_directories(destination.parent_path());
    std::ofstream out(destination, std::ios::binary);
    out << body;
  }

  void Serve(const std::string& url, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    bodies_[url] = body;
  }

  void Withdraw(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    bodies_.erase(url);
  }

  int Calls(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = calls_.find(url);
    return it == calls_.end() ? 0 : it->second;
  }

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> bodies_;
  std::map<std::string, int>         calls_;
};

class RecordingSink final : public content::PlaybackSink {
 public:
  void Publish(const std::string& playlist_version, const std::vector<content::ResolvedItem>& items) override {
    if (fail) throw util::StorageError("playlist.json not writable");
    versions.push_back(playlist_version);
    last_items = items;
  }

  std::vector<std::string>            versions;
  std::vector<content::ResolvedItem>  last_items;
  bool                                fail = false;
};

class FakeNetworkProbe final : public connectivity::NetworkProbe {
 public:
  bool Reachable() override {
    ++probes;
    if (broken) throw std::runtime_error("netlink socket unavailable");
    return reachable;
  }

  bool reachable = true;
  bool broken    = false;
  int  probes    = 0;
};

class FakeServerProbe final : public connectivity::ServerProbe {
 public:
  bool Reachable(const model::Registration&) override {
    ++probes;
    return reachable;
  }

  bool reachable = true;
  int  probes    = 0;
};

class FakeAccessPoint final : public provisioning::AccessPointController {
 public:
  void Start(const std::string& ssid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_start) throw util::ExecutionError("access_point", "nmcli failed");
    running_ = true;
    ssid_    = ssid;
    ++starts_;
  }

  void Stop() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) ++stops_;
    running_ = false;
  }

  bool Running() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  int Starts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return starts_;
  }

  int Stops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stops_;
  }

  std::string Ssid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ssid_;
  }

  bool fail_start = false;

 private:
  mutable std::mutex mutex_;
  bool               running_ = false;
  std::string        ssid_;
  int                starts_ = 0;
  int                stops_  = 0;
};

/*
  Apply() blocks while the gate is held so tests can observe the
  applying state.
*/
class FakeWifi final : public provisioning::WifiConfigurator {
 public:
  void Apply(const provisioning::WifiCredentials& credentials) override {
    std::unique_lock<std::mutex> lock(mutex_);
    applied_.push_back(credentials.ssid);
    cv_.wait(lock, [this] { return !held_; });
    if (fail_) throw util::ExecutionError("wifi", "association timed out");
  }

  std::vector<std::string> Scan() override {
    return {"Office", "Guest"};
  }

  void Hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = true;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      held_ = false;
    }
    cv_.notify_all();
  }

  void FailNext(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }

  std::vector<std::string> Applied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return applied_;
  }

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  bool                     held_ = false;
  bool                     fail_ = false;
  std::vector<std::string> applied_;
};

/*
  Records argv and answers by program name.
*/
class FakeProcessRunner final : public util::ProcessRunner {
 public:
  using Handler = std::function<util::ProcessResult(const std::vector<std::string>&)>;

  util::ProcessResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    calls.push_back(argv);
    if (handler) return handler(argv);
    util::ProcessResult ok;
    ok.exit_code = 0;
    return ok;
  }

  std::vector<std::vector<std::string>> calls;
  Handler                               handler;

 private:
  std::mutex mutex_;
};

class FixedFingerprint final : public identity::FingerprintSource {
 public:
  identity::HardwareFingerprint Read() const override {
    return {"00000000abcdef01", "b827eb123456"};
  }
};

inline std::filesystem::path FreshDir(const std::string& suite, const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / suite / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline net::HttpResponse Respond(long status, std::string body = "") {
  net::HttpResponse response;
  response.status = status;
  response.body   = std::move(body);
  return response;
}

} // namespace digiplayer::testing
