#pragma once

#include <string_view>

// Set by the build from the CMake project version.
#ifndef DIGIPLAYER_VERSION
#define DIGIPLAYER_VERSION "0.0.0-dev"
#endif

namespace digiplayer::util {

inline constexpr std::string_view kAgentVersion = DIGIPLAYER_VERSION;

} // namespace digiplayer::util
