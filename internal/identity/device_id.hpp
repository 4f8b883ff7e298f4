#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "hardware_fingerprint.hpp"

namespace digiplayer::identity {

inline constexpr std::string_view kDeviceIdPrefix    = "DIG";
inline constexpr std::size_t      kDeviceIdHexDigits = 11;

// "DIG" + first 11 hex digits of MD5(fingerprint), upper-case.
std::string DeriveDeviceId(const HardwareFingerprint& fingerprint);

// Accepts ids from older units too: prefix + 1..32 upper-case hex digits.
bool IsValidDeviceId(std::string_view device_id);

} // namespace digiplayer::identity
