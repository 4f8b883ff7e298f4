#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "digiplayer/agent/v1/heartbeat.pb.h"

namespace digiplayer::util {
class ProcessRunner;
}

namespace digiplayer::heartbeat {

class SystemInfoProvider {
 public:
  virtual ~SystemInfoProvider() = default;

  // Best effort: fields that cannot be determined keep neutral values.
  virtual digiplayer::agent::v1::SystemInfo Collect() = 0;
};

class LinuxSystemInfoProvider final : public SystemInfoProvider {
 public:
  LinuxSystemInfoProvider(std::shared_ptr<util::ProcessRunner> runner, std::filesystem::path storage_root,
                          std::filesystem::path net_root = "/sys/class/net");

  digiplayer::agent::v1::SystemInfo Collect() override;

 private:
  std::string ScreenResolution();

  std::shared_ptr<util::ProcessRunner> runner_;
  std::filesystem::path                storage_root_;
  std::filesystem::path                net_root_;
};

// Local address of the interface carrying the default route ("0.0.0.0" if none).
std::string LocalIpAddress();

// "geometry 1920 1080 ..." (fbset -s) or "current 1920 x 1080" (xrandr) -> "1920x1080".
std::string ParseResolution(const std::string& output);

// "aabbccddeeff" -> "aa:bb:cc:dd:ee:ff"
std::string FormatMacAddress(const std::string& compact);

} // namespace digiplayer::heartbeat
