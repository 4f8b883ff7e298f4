#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/command.hpp"
#include "internal/model/registration.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::state {
class AgentStateStore;
}

namespace digiplayer::net {
class HttpTransport;
}

namespace digiplayer::command {

class DevicePlatform;

enum class ExecutionStatus {
  kExecuted,
  kSkipped,
  kFailed,
};

constexpr std::string_view ToString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::kExecuted:
      return "executed";
    case ExecutionStatus::kSkipped:
      return "skipped";
    case ExecutionStatus::kFailed:
      return "failed";
  }
  return "failed";
}

struct ExecutionResult {
  ExecutionStatus                     status = ExecutionStatus::kSkipped;
  std::optional<util::ExecutionError> error;
  bool                                retry_pending = false;  // a re-delivery will run it again
};

struct ExecutorOptions {
  std::filesystem::path     screenshot_path{"/tmp/digiplayer-screenshot.png"};
  std::chrono::milliseconds upload_timeout{30000};
  std::uint32_t             max_attempts = 2;
};

/*
  At-most-once execution of server commands.

  A command runs only when its id is newer than the persisted watermark.
  The watermark advances after a successful side effect, or before it for
  reboot, which is refused when the watermark cannot be made durable.

  A failed command keeps the watermark so the next heartbeat re-delivering
  it retries; after max_attempts failures the watermark advances anyway.
*/
class CommandExecutor {
 public:
  CommandExecutor(std::shared_ptr<state::AgentStateStore> state, std::shared_ptr<DevicePlatform> platform,
                  std::shared_ptr<net::HttpTransport> transport, ExecutorOptions options);

  // Invoked by `refresh`; the control loop turns it into a forced heartbeat
  // and reconciliation.
  void OnRefresh(std::function<void()> handler);

  ExecutionResult Apply(const model::Command& command, const model::Registration& registration);

  // Commands that failed and still await re-delivery.
  std::size_t TrackedFailures() const;

 private:
  void Execute(const model::Command& command, const model::Registration& registration);
  void SetDisplay(bool on);
  void UploadScreenshot(const model::Registration& registration);

  ExecutionResult RecordFailure(const model::Command& command, util::ExecutionError error);
  void            AdvanceWatermark(const std::string& command_id);
  void            ForgetAttemptsUpTo(const std::string& watermark);

  std::shared_ptr<state::AgentStateStore> state_;
  std::shared_ptr<DevicePlatform>         platform_;
  std::shared_ptr<net::HttpTransport>     transport_;
  ExecutorOptions                         options_;
  std::function<void()>                   on_refresh_;

  // command id -> failed attempts, in this process
  std::map<std::string, std::uint32_t> attempts_;
};

} // namespace digiplayer::command
