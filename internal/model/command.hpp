#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace digiplayer::model {

enum class CommandKind : std::uint8_t {
  kReboot,
  kRefresh,
  kScreenOn,
  kScreenOff,
  kScreenshot,
};

struct Command {
  std::string                command_id;
  CommandKind                kind = CommandKind::kRefresh;
  std::optional<std::string> issued_at;
};

constexpr std::string_view ToString(CommandKind kind) {
  switch (kind) {
    case CommandKind::kReboot:
      return "reboot";
    case CommandKind::kRefresh:
      return "refresh";
    case CommandKind::kScreenOn:
      return "screen_on";
    case CommandKind::kScreenOff:
      return "screen_off";
    case CommandKind::kScreenshot:
      return "screenshot";
  }
  return "unknown";
}

// Closed set: anything else is rejected by the parser.
inline std::optional<CommandKind> ParseCommandKind(std::string_view name) {
  if (name == "reboot") return CommandKind::kReboot;
  if (name == "refresh") return CommandKind::kRefresh;
  if (name == "screen_on") return CommandKind::kScreenOn;
  if (name == "screen_off") return CommandKind::kScreenOff;
  if (name == "screenshot") return CommandKind::kScreenshot;
  return std::nullopt;
}

} // namespace digiplayer::model
