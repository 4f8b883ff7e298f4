#include "command_executor.hpp"

#include "internal/command/command_order.hpp"
#include "internal/command/device_platform.hpp"
#include "internal/net/endpoints.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/agent_state_store.hpp"

namespace digiplayer::command {

using observability::IntField;
using observability::StringField;

CommandExecutor::CommandExecutor(std::shared_ptr<state::AgentStateStore> state, std::shared_ptr<DevicePlatform> platform,
                                 std::shared_ptr<net::HttpTransport> transport, ExecutorOptions options)
    : state_(std::move(state)), platform_(std::move(platform)), transport_(std::move(transport)), options_(std::move(options)) {
}

void CommandExecutor::OnRefresh(std::function<void()> handler) {
  on_refresh_ = std::move(handler);
}

ExecutionResult CommandExecutor::Apply(const model::Command& command, const model::Registration& registration) {
  const std::string watermark = state_->LastCommandId();
  if (!IsNewer(command.command_id, watermark)) {
    DIGIPLAYER_LOG_DEBUG("Skipping command at or below watermark",
                         {StringField("command_id", command.command_id), StringField("watermark", watermark)});
    return {ExecutionStatus::kSkipped, std::nullopt, false};
  }

  const std::string kind(model::ToString(command.kind));
  DIGIPLAYER_LOG_INFO("Executing command", {StringField("command_id", command.command_id), StringField("kind", kind)});

  if (command.kind == model::CommandKind::kReboot) {
    // durable first: a restart must never find the same reboot pending
    if (!state_->CommitLastCommandId(command.command_id)) {
      return RecordFailure(command, util::ExecutionError(kind, "watermark could not be persisted, reboot refused"));
    }
    ForgetAttemptsUpTo(command.command_id);
    try {
      platform_->Reboot();
    } catch (const util::ExecutionError& e) {
      DIGIPLAYER_LOG_ERROR("Reboot failed", {StringField("command_id", command.command_id), StringField("error", e.what())});
      return {ExecutionStatus::kFailed, e, false};
    }
    return {ExecutionStatus::kExecuted, std::nullopt, false};
  }

  try {
    Execute(command, registration);
  } catch (const util::ExecutionError& e) {
    return RecordFailure(command, e);
  }

  AdvanceWatermark(command.command_id);
  return {ExecutionStatus::kExecuted, std::nullopt, false};
}

void CommandExecutor::Execute(const model::Command& command, const model::Registration& registration) {
  switch (command.kind) {
    case model::CommandKind::kRefresh:
      if (on_refresh_) {
        on_refresh_();
      }
      return;
    case model::CommandKind::kScreenOn:
      SetDisplay(true);
      return;
    case model::CommandKind::kScreenOff:
      SetDisplay(false);
      return;
    case model::CommandKind::kScreenshot:
      platform_->CaptureScreenshot(options_.screenshot_path);
      UploadScreenshot(registration);
      return;
    case model::CommandKind::kReboot:
      return;
  }
}

void CommandExecutor::SetDisplay(bool on) {
  const auto target  = on ? DisplayPower::kOn : DisplayPower::kOff;
  const auto current = platform_->QueryDisplayPower();
  if (current == target) {
    DIGIPLAYER_LOG_INFO("Display already in requested state", {StringField("state", on ? "on" : "off")});
    return;
  }
  platform_->SetDisplayPower(on);
}

void CommandExecutor::UploadScreenshot(const model::Registration& registration) {
  if (!registration.Registered()) {
    throw util::ExecutionError("screenshot", "device has no player id to upload for");
  }

  net::HttpResponse response;
  try {
    response = transport_->PostFile(net::ScreenshotUrl(registration), {"file", options_.screenshot_path, "image/png"},
                                    options_.upload_timeout);
  } catch (const util::TransportError& e) {
    throw util::ExecutionError("screenshot", std::string("upload failed: ") + e.what());
  }
  if (!response.Ok()) {
    throw util::ExecutionError("screenshot", "upload answered HTTP " + std::to_string(response.status));
  }
}

ExecutionResult CommandExecutor::RecordFailure(const model::Command& command, util::ExecutionError error) {
  const auto attempts = ++attempts_[command.command_id];

  if (attempts < options_.max_attempts) {
    DIGIPLAYER_LOG_WARN("Command failed, retrying on next delivery",
                        {StringField("command_id", command.command_id), StringField("error", error.what()), IntField("attempt", attempts)});
    return {ExecutionStatus::kFailed, std::move(error), true};
  }

  DIGIPLAYER_LOG_ERROR("Command failed, giving up",
                       {StringField("command_id", command.command_id), StringField("error", error.what()), IntField("attempt", attempts)});
  AdvanceWatermark(command.command_id);
  return {ExecutionStatus::kFailed, std::move(error), false};
}

void CommandExecutor::AdvanceWatermark(const std::string& command_id) {
  ForgetAttemptsUpTo(command_id);
  if (!state_->SetLastCommandId(command_id)) {
    DIGIPLAYER_LOG_WARN("Watermark held in memory until storage recovers", {StringField("command_id", command_id)});
  }
}

// Commands at or below the watermark are never delivered again.
void CommandExecutor::ForgetAttemptsUpTo(const std::string& watermark) {
  for (auto it = attempts_.begin(); it != attempts_.end();) {
    if (IsNewer(it->first, watermark)) {
      ++it;
    } else {
      it = attempts_.erase(it);
    }
  }
}

std::size_t CommandExecutor::TrackedFailures() const {
  return attempts_.size();
}

} // namespace digiplayer::command
