#include "hardware_fingerprint.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <system_error>
#include <vector>

namespace digiplayer::identity {

namespace {

constexpr char kFallbackSerial[] = "0000000000000000";
constexpr char kFallbackMac[]    = "000000000000";

constexpr std::array<const char*, 4> kPreferredInterfaces = {"eth0", "wlan0", "en0", "enp0s3"};

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::string NormalizeMac(const std::string& raw) {
  std::string mac;
  for (char c : Trim(raw)) {
    if (c == ':') continue;
    mac.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return mac;
}

bool IsUsableMac(const std::string& mac) {
  return mac.size() == 12 && mac != kFallbackMac;
}

std::string ReadInterfaceMac(const std::filesystem::path& net_root, const std::string& iface) {
  std::ifstream in(net_root / iface / "address");
  if (!in) return {};
  std::string line;
  std::getline(in, line);
  return NormalizeMac(line);
}

} // namespace

SysfsFingerprintSource::SysfsFingerprintSource(std::filesystem::path cpuinfo, std::filesystem::path net_root)
    : cpuinfo_(std::move(cpuinfo)), net_root_(std::move(net_root)) {
}

HardwareFingerprint SysfsFingerprintSource::Read() const {
  HardwareFingerprint fingerprint;
  fingerprint.cpu_serial  = ReadCpuSerial();
  fingerprint.mac_address = ReadMacAddress();
  return fingerprint;
}

std::string SysfsFingerprintSource::ReadCpuSerial() const {
  std::ifstream in(cpuinfo_);
  std::string   line;
  while (std::getline(in, line)) {
    if (line.rfind("Serial", 0) != 0) continue;
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    auto serial = Trim(line.substr(colon + 1));
    if (!serial.empty()) return serial;
  }
  return kFallbackSerial;
}

std::string SysfsFingerprintSource::ReadMacAddress() const {
  for (const char* iface : kPreferredInterfaces) {
    auto mac = ReadInterfaceMac(net_root_, iface);
    if (IsUsableMac(mac)) return mac;
  }

  std::vector<std::string> interfaces;
  std::error_code          ec;
  for (const auto& entry : std::filesystem::directory_iterator(net_root_, ec)) {
    const auto name = entry.path().filename().string();
    if (name != "lo") interfaces.push_back(name);
  }
  std::sort(interfaces.begin(), interfaces.end());

  for (const auto& iface : interfaces) {
    auto mac = ReadInterfaceMac(net_root_, iface);
    if (IsUsableMac(mac)) return mac;
  }
  return kFallbackMac;
}

} // namespace digiplayer::identity
