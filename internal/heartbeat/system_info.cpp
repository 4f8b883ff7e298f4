#include "system_info.hpp"

#include <sys/statvfs.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <algorithm>
#include <fstream>
#include <regex>

#include "internal/identity/hardware_fingerprint.hpp"
#include "internal/util/subprocess.hpp"

namespace digiplayer::heartbeat {

namespace {

constexpr auto kToolTimeout = std::chrono::seconds(5);

std::uint64_t UptimeSeconds() {
  std::ifstream in("/proc/uptime");
  double        seconds = 0;
  if (in >> seconds && seconds > 0) {
    return static_cast<std::uint64_t>(seconds);
  }
  return 0;
}

std::string Hostname() {
  char buffer[256] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return {};
  }
  return buffer;
}

} // namespace

LinuxSystemInfoProvider::LinuxSystemInfoProvider(std::shared_ptr<util::ProcessRunner> runner, std::filesystem::path storage_root,
                                                 std::filesystem::path net_root)
    : runner_(std::move(runner)), storage_root_(std::move(storage_root)), net_root_(std::move(net_root)) {
}

digiplayer::agent::v1::SystemInfo LinuxSystemInfoProvider::Collect() {
  digiplayer::agent::v1::SystemInfo info;
  info.set_ip_address(LocalIpAddress());

  const auto fingerprint = identity::SysfsFingerprintSource("/proc/cpuinfo", net_root_).Read();
  info.set_mac_address(FormatMacAddress(fingerprint.mac_address));

  info.set_screen_resolution(ScreenResolution());

  struct statvfs fs {};
  if (statvfs(storage_root_.c_str(), &fs) == 0) {
    const std::uint64_t total = static_cast<std::uint64_t>(fs.f_frsize) * fs.f_blocks;
    const std::uint64_t avail = static_cast<std::uint64_t>(fs.f_frsize) * fs.f_bavail;
    info.set_storage_total(total);
    info.set_storage_used(total - std::min(total, avail));
  }

  info.set_uptime_seconds(UptimeSeconds());
  info.set_hostname(Hostname());
  return info;
}

std::string LinuxSystemInfoProvider::ScreenResolution() {
  const auto fbset = runner_->Run({"fbset", "-s"}, kToolTimeout);
  if (fbset.Ok()) {
    if (auto resolution = ParseResolution(fbset.output); !resolution.empty()) {
      return resolution;
    }
  }

  const auto xrandr = runner_->Run({"env", "DISPLAY=:0", "xrandr", "--current"}, kToolTimeout);
  if (xrandr.Ok()) {
    if (auto resolution = ParseResolution(xrandr.output); !resolution.empty()) {
      return resolution;
    }
  }
  return "unknown";
}

std::string LocalIpAddress() {
  namespace asio = boost::asio;

  // connect() on UDP only selects a route; nothing is sent
  asio::io_context          io;
  asio::ip::udp::socket     socket(io);
  boost::system::error_code ec;
  socket.open(asio::ip::udp::v4(), ec);
  if (!ec) {
    socket.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("8.8.8.8"), 80), ec);
  }
  if (ec) {
    return "0.0.0.0";
  }

  const auto local = socket.local_endpoint(ec);
  return ec ? "0.0.0.0" : local.address().to_string();
}

std::string ParseResolution(const std::string& output) {
  static const std::regex kFbset(R"(geometry (\d+) (\d+))");
  static const std::regex kXrandr(R"(current (\d+) x (\d+))");

  std::smatch match;
  if (std::regex_search(output, match, kFbset) || std::regex_search(output, match, kXrandr)) {
    return match[1].str() + "x" + match[2].str();
  }
  return {};
}

std::string FormatMacAddress(const std::string& compact) {
  std::string out;
  for (std::size_t i = 0; i < compact.size(); ++i) {
    if (i > 0 && i % 2 == 0) {
      out.push_back(':');
    }
    out.push_back(compact[i]);
  }
  return out;
}

} // namespace digiplayer::heartbeat
