#pragma once

#include <filesystem>
#include <string>

namespace digiplayer::identity {

/*
  Stable hardware characteristics of the unit.

  Re-flashing the same board reproduces the same fingerprint, and
  therefore the same device id.
*/
struct HardwareFingerprint {
  std::string cpu_serial;
  std::string mac_address;  // lower-case hex, no separators

  std::string Canonical() const {
    return cpu_serial + "-" + mac_address;
  }
};

class FingerprintSource {
 public:
  virtual ~FingerprintSource() = default;

  virtual HardwareFingerprint Read() const = 0;
};

/*
  Reads /proc/cpuinfo ("Serial" line) and /sys/class/net/<iface>/address.

  Interfaces are tried in a fixed preference order, then any non-loopback
  interface in name order. Roots are injectable for tests.
*/
class SysfsFingerprintSource final : public FingerprintSource {
 public:
  explicit SysfsFingerprintSource(std::filesystem::path cpuinfo = "/proc/cpuinfo", std::filesystem::path net_root = "/sys/class/net");

  HardwareFingerprint Read() const override;

 private:
  std::string ReadCpuSerial() const;
  std::string ReadMacAddress() const;

  std::filesystem::path cpuinfo_;
  std::filesystem::path net_root_;
};

} // namespace digiplayer::identity
