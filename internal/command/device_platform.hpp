#pragma once

#include <chrono>
#include <filesystem>
#include <memory>

namespace digiplayer::util {
class ProcessRunner;
}

namespace digiplayer::command {

enum class DisplayPower {
  kOn,
  kOff,
  kUnknown,
};

/*
  OS side effects of remote commands. Every method throws ExecutionError
  when the OS refuses.
*/
class DevicePlatform {
 public:
  virtual ~DevicePlatform() = default;

  // Returns once the restart has been requested.
  virtual void Reboot() = 0;

  virtual DisplayPower QueryDisplayPower()        = 0;
  virtual void         SetDisplayPower(bool on)   = 0;

  virtual void CaptureScreenshot(const std::filesystem::path& destination) = 0;
};

/*
  Raspberry Pi tooling with generic fallbacks:
    display     vcgencmd display_power, else tvservice
    screenshot  raspi2png, else scrot on DISPLAY=:0
*/
class LinuxDevicePlatform final : public DevicePlatform {
 public:
  explicit LinuxDevicePlatform(std::shared_ptr<util::ProcessRunner> runner,
                               std::chrono::milliseconds timeout = std::chrono::seconds(20));

  void         Reboot() override;
  DisplayPower QueryDisplayPower() override;
  void         SetDisplayPower(bool on) override;
  void         CaptureScreenshot(const std::filesystem::path& destination) override;

 private:
  std::shared_ptr<util::ProcessRunner> runner_;
  std::chrono::milliseconds            timeout_;
};

} // namespace digiplayer::command
