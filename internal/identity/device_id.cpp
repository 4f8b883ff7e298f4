#include "device_id.hpp"

#include <cctype>

#include "internal/util/digest.hpp"

namespace digiplayer::identity {

std::string DeriveDeviceId(const HardwareFingerprint& fingerprint) {
  const auto digest = util::Md5Hex(fingerprint.Canonical());

  std::string id(kDeviceIdPrefix);
  for (std::size_t i = 0; i < kDeviceIdHexDigits; ++i) {
    id.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(digest[i]))));
  }
  return id;
}

bool IsValidDeviceId(std::string_view device_id) {
  if (device_id.substr(0, kDeviceIdPrefix.size()) != kDeviceIdPrefix) return false;

  const auto hex = device_id.substr(kDeviceIdPrefix.size());
  if (hex.empty() || hex.size() > 32) return false;

  for (char c : hex) {
    const bool digit = c >= '0' && c <= '9';
    const bool upper = c >= 'A' && c <= 'F';
    if (!digit && !upper) return false;
  }
  return true;
}

} // namespace digiplayer::identity
