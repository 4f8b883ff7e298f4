#include "device_platform.hpp"

#include <string>
#include <system_error>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/subprocess.hpp"

namespace digiplayer::command {

namespace {

std::string Describe(const std::vector<std::string>& argv, const util::ProcessResult& result) {
  if (result.timed_out) {
    return util::DescribeCommand(argv) + " timed out";
  }
  return util::DescribeCommand(argv) + " exited " + std::to_string(result.exit_code) + ": " + result.output;
}

} // namespace

LinuxDevicePlatform::LinuxDevicePlatform(std::shared_ptr<util::ProcessRunner> runner, std::chrono::milliseconds timeout)
    : runner_(std::move(runner)), timeout_(timeout) {
}

void LinuxDevicePlatform::Reboot() {
  const std::vector<std::string> argv = {"systemctl", "reboot"};
  auto                           result = runner_->Run(argv, timeout_);
  if (result.NotFound()) {
    result = runner_->Run({"reboot"}, timeout_);
  }
  if (!result.Ok()) {
    throw util::ExecutionError("reboot", Describe(argv, result));
  }
}

DisplayPower LinuxDevicePlatform::QueryDisplayPower() {
  const auto result = runner_->Run({"vcgencmd", "display_power"}, timeout_);
  if (!result.Ok()) {
    return DisplayPower::kUnknown;
  }
  if (result.output.find("display_power=1") != std::string::npos) {
    return DisplayPower::kOn;
  }
  if (result.output.find("display_power=0") != std::string::npos) {
    return DisplayPower::kOff;
  }
  return DisplayPower::kUnknown;
}

void LinuxDevicePlatform::SetDisplayPower(bool on) {
  const char*                    kind    = on ? "screen_on" : "screen_off";
  const std::vector<std::string> primary = {"vcgencmd", "display_power", on ? "1" : "0"};

  const auto result = runner_->Run(primary, timeout_);
  if (result.Ok()) {
    return;
  }

  const std::vector<std::string> fallback = {"tvservice", on ? "-p" : "-o"};
  const auto                     second   = runner_->Run(fallback, timeout_);
  if (!second.Ok()) {
    throw util::ExecutionError(kind, Describe(primary, result) + "; " + Describe(fallback, second));
  }
}

void LinuxDevicePlatform::CaptureScreenshot(const std::filesystem::path& destination) {
  std::error_code ec;
  std::filesystem::create_directories(destination.parent_path(), ec);

  const std::vector<std::string> primary = {"raspi2png", "-p", destination.string()};
  const auto                     result  = runner_->Run(primary, timeout_);
  if (result.Ok()) {
    return;
  }

  const std::vector<std::string> fallback = {"env", "DISPLAY=:0", "scrot", "-o", destination.string()};
  const auto                     second   = runner_->Run(fallback, timeout_);
  if (!second.Ok()) {
    throw util::ExecutionError("screenshot", Describe(primary, result) + "; " + Describe(fallback, second));
  }
}

} // namespace digiplayer::command
