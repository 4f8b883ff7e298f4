#include "internal/command/command_executor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/command/command_order.hpp"
#include "internal/command/device_platform.hpp"
#include "internal/state/agent_state_store.hpp"
#include "internal/util/subprocess.hpp"
#include "test_fakes.hpp"

namespace {

using digiplayer::command::CommandExecutor;
using digiplayer::command::CompareCommandIds;
using digiplayer::command::DisplayPower;
using digiplayer::command::ExecutionStatus;
using digiplayer::command::ExecutorOptions;
using digiplayer::command::IsNewer;
using digiplayer::model::Command;
using digiplayer::model::CommandKind;
using digiplayer::state::AgentStateStore;
using digiplayer::testing::FakePlatform;
using digiplayer::testing::FakeProcessRunner;
using digiplayer::testing::FakeTransport;
using digiplayer::testing::RecordedRequest;
using digiplayer::testing::Respond;

Command MakeCommand(const std::string& id, CommandKind kind) {
  Command command;
  command.command_id = id;
  command.kind       = kind;
  return command;
}

digiplayer::model::Registration MakeRegistration() {
  digiplayer::model::Registration registration;
  registration.device_id  = "DIGF17219CD1B2";
  registration.player_id  = 12;
  registration.server_url = "https://cms.example.com";
  registration.api_prefix = "/api/v1";
  return registration;
}

struct Fixture {
  explicit Fixture(const std::string& test_name)
      : dir(digiplayer::testing::FreshDir("digiplayer_command_tests", test_name)),
        state(std::make_shared<AgentStateStore>(dir / "state.json")),
        platform(std::make_shared<FakePlatform>()),
        transport(std::make_shared<FakeTransport>()) {
    ExecutorOptions options;
    options.screenshot_path = dir / "shot.png";
    executor                = std::make_unique<CommandExecutor>(state, platform, transport, options);
  }

  std::filesystem::path            dir;
  std::shared_ptr<AgentStateStore> state;
  std::shared_ptr<FakePlatform>    platform;
  std::shared_ptr<FakeTransport>   transport;
  std::unique_ptr<CommandExecutor> executor;
};

void TestNaturalOrdering() {
  assert(CompareCommandIds("9", "10") < 0);
  assert(CompareCommandIds("c2", "c10") < 0);
  assert(CompareCommandIds("007", "7") == 0);
  assert(CompareCommandIds("b", "a") > 0);
  assert(CompareCommandIds("cmd-1", "cmd-1") == 0);
  assert(CompareCommandIds("cmd-1", "cmd-1a") < 0);

  assert(IsNewer("1", ""));
  assert(!IsNewer("", ""));
  assert(IsNewer("11", "9"));
  assert(!IsNewer("9", "11"));
  assert(!IsNewer("11", "11"));
}

void TestDuplicateScreenOffRunsOnce() {
  Fixture fixture("screen_off_twice");
  const auto command = MakeCommand("5", CommandKind::kScreenOff);

  const auto first = fixture.executor->Apply(command, MakeRegistration());
  assert(first.status == ExecutionStatus::kExecuted);
  assert(fixture.platform->display == DisplayPower::kOff);
  assert(fixture.state->LastCommandId() == "5");

  const auto second = fixture.executor->Apply(command, MakeRegistration());
  assert(second.status == ExecutionStatus::kSkipped);
  assert(fixture.platform->display_changes == 1);
}

void TestReplayAfterRestartIsSkipped() {
  const auto dir = digiplayer::testing::FreshDir("digiplayer_command_tests", "restart");
  auto       platform = std::make_shared<FakePlatform>();
  {
    auto            state = std::make_shared<AgentStateStore>(dir / "state.json");
    CommandExecutor executor(state, platform, std::make_shared<FakeTransport>(), ExecutorOptions{});
    assert(executor.Apply(MakeCommand("21", CommandKind::kScreenOff), MakeRegistration()).status == ExecutionStatus::kExecuted);
  }

  // a fresh process sees the same command re-delivered
  auto            state = std::make_shared<AgentStateStore>(dir / "state.json");
  CommandExecutor executor(state, platform, std::make_shared<FakeTransport>(), ExecutorOptions{});
  assert(executor.Apply(MakeCommand("21", CommandKind::kScreenOff), MakeRegistration()).status == ExecutionStatus::kSkipped);
  assert(executor.Apply(MakeCommand("3", CommandKind::kScreenOn), MakeRegistration()).status == ExecutionStatus::kSkipped);
  assert(platform->display_changes == 1);
}

void TestScreenCommandIsNoOpWhenAlreadyInState() {
  Fixture fixture("already_on");
  fixture.platform->display = DisplayPower::kOn;

  const auto result = fixture.executor->Apply(MakeCommand("1", CommandKind::kScreenOn), MakeRegistration());
  assert(result.status == ExecutionStatus::kExecuted);
  assert(fixture.platform->display_changes == 0);
  assert(fixture.state->LastCommandId() == "1");
}

void TestRebootPersistsWatermarkFirst() {
  Fixture fixture("reboot");

  const auto result = fixture.executor->Apply(MakeCommand("8", CommandKind::kReboot), MakeRegistration());
  assert(result.status == ExecutionStatus::kExecuted);
  assert(fixture.platform->reboots == 1);

  AgentStateStore reopened(fixture.dir / "state.json");
  assert(reopened.LastCommandId() == "8");
  assert(fixture.executor->Apply(MakeCommand("8", CommandKind::kReboot), MakeRegistration()).status == ExecutionStatus::kSkipped);
  assert(fixture.platform->reboots == 1);
}

void TestRebootRefusedWhenWatermarkCannotBePersisted() {
  const auto dir     = digiplayer::testing::FreshDir("digiplayer_command_tests", "reboot_refused");
  const auto blocker = dir / "blocked";
  {
    std::ofstream out(blocker);
    out << "x";
  }
  auto            state    = std::make_shared<AgentStateStore>(blocker / "state.json");
  auto            platform = std::make_shared<FakePlatform>();
  CommandExecutor executor(state, platform, std::make_shared<FakeTransport>(), ExecutorOptions{});

  const auto result = executor.Apply(MakeCommand("8", CommandKind::kReboot), MakeRegistration());
  assert(result.status == ExecutionStatus::kFailed);
  assert(result.retry_pending);
  assert(platform->reboots == 0);
  assert(state->LastCommandId().empty());
}

void TestFailedCommandIsRetriedOnceThenGivenUp() {
  Fixture fixture("retry");
  fixture.platform->fail_display = true;
  fixture.platform->display      = DisplayPower::kOn;
  const auto command             = MakeCommand("30", CommandKind::kScreenOff);

  const auto first = fixture.executor->Apply(command, MakeRegistration());
  assert(first.status == ExecutionStatus::kFailed);
  assert(first.retry_pending);
  assert(first.error && first.error->Kind() == "screen_off");
  assert(fixture.state->LastCommandId().empty());

  const auto second = fixture.executor->Apply(command, MakeRegistration());
  assert(second.status == ExecutionStatus::kFailed);
  assert(!second.retry_pending);
  assert(fixture.state->LastCommandId() == "30");

  assert(fixture.executor->Apply(command, MakeRegistration()).status == ExecutionStatus::kSkipped);
}

void TestNewerCommandRetiresPendingRetry() {
  Fixture fixture("superseded");
  fixture.platform->fail_display = true;
  fixture.platform->display      = DisplayPower::kOn;

  assert(fixture.executor->Apply(MakeCommand("40", CommandKind::kScreenOff), MakeRegistration()).retry_pending);
  assert(fixture.executor->TrackedFailures() == 1);

  fixture.platform->fail_display = false;
  assert(fixture.executor->Apply(MakeCommand("41", CommandKind::kRefresh), MakeRegistration()).status == ExecutionStatus::kExecuted);
  assert(fixture.state->LastCommandId() == "41");
  assert(fixture.executor->TrackedFailures() == 0);

  assert(fixture.executor->Apply(MakeCommand("40", CommandKind::kScreenOff), MakeRegistration()).status == ExecutionStatus::kSkipped);
  assert(fixture.platform->display == DisplayPower::kOn);
}

void TestRetrySucceedsOnRedelivery() {
  Fixture fixture("retry_ok");
  fixture.platform->fail_display = true;
  const auto command             = MakeCommand("31", CommandKind::kScreenOff);

  assert(fixture.executor->Apply(command, MakeRegistration()).retry_pending);
  fixture.platform->fail_display = false;
  assert(fixture.executor->Apply(command, MakeRegistration()).status == ExecutionStatus::kExecuted);
  assert(fixture.platform->display == DisplayPower::kOff);
}

void TestRefreshInvokesHandler() {
  Fixture fixture("refresh");
  int     refreshes = 0;
  fixture.executor->OnRefresh([&refreshes] { ++refreshes; });

  assert(fixture.executor->Apply(MakeCommand("2", CommandKind::kRefresh), MakeRegistration()).status == ExecutionStatus::kExecuted);
  assert(refreshes == 1);
}

void TestScreenshotIsUploaded() {
  Fixture fixture("screenshot");
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(201); });

  const auto result = fixture.executor->Apply(MakeCommand("40", CommandKind::kScreenshot), MakeRegistration());
  assert(result.status == ExecutionStatus::kExecuted);
  assert(fixture.platform->screenshots == 1);

  const auto requests = fixture.transport->Requests();
  assert(requests.size() == 1);
  assert(requests[0].method == "UPLOAD");
  assert(requests[0].url == "https://cms.example.com/api/v1/players/12/screenshot");
  assert(requests[0].body.rfind("file:", 0) == 0);
}

void TestScreenshotUploadFailureIsExecutionError() {
  Fixture fixture("screenshot_fail");
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(413); });

  const auto result = fixture.executor->Apply(MakeCommand("41", CommandKind::kScreenshot), MakeRegistration());
  assert(result.status == ExecutionStatus::kFailed);
  assert(result.error->Cause().find("413") != std::string::npos);
}

void TestLinuxPlatformFallsBackToTvservice() {
  auto runner     = std::make_shared<FakeProcessRunner>();
  runner->handler = [](const std::vector<std::string>& argv) {
    digiplayer::util::ProcessResult result;
    result.exit_code = argv[0] == "vcgencmd" ? 127 : 0;
    return result;
  };

  digiplayer::command::LinuxDevicePlatform platform(runner);
  assert(platform.QueryDisplayPower() == DisplayPower::kUnknown);
  platform.SetDisplayPower(false);

  assert(runner->calls.size() == 3);
  assert(runner->calls[2] == (std::vector<std::string>{"tvservice", "-o"}));
}

void TestLinuxPlatformParsesDisplayPower() {
  auto runner     = std::make_shared<FakeProcessRunner>();
  runner->handler = [](const std::vector<std::string>&) {
    digiplayer::util::ProcessResult result;
    result.exit_code = 0;
    result.output    = "display_power=0\n";
    return result;
  };

  digiplayer::command::LinuxDevicePlatform platform(runner);
  assert(platform.QueryDisplayPower() == DisplayPower::kOff);
}

void TestLinuxPlatformRebootFailureThrows() {
  auto runner     = std::make_shared<FakeProcessRunner>();
  runner->handler = [](const std::vector<std::string>&) {
    digiplayer::util::ProcessResult result;
    result.exit_code = 1;
    result.output    = "Access denied";
    return result;
  };

  digiplayer::command::LinuxDevicePlatform platform(runner);
  bool                                     threw = false;
  try {
    platform.Reboot();
  } catch (const digiplayer::util::ExecutionError& e) {
    threw = e.Kind() == "reboot";
  }
  assert(threw);
}

void TestSpawnFailureIsExecutionError() {
  digiplayer::util::SystemProcessRunner runner;
  bool                                  threw = false;
  try {
    runner.Run({}, std::chrono::seconds(1));
  } catch (const digiplayer::util::ExecutionError& e) {
    threw = true;
    assert(e.Kind() == "spawn");
  }
  assert(threw);

  const auto missing = runner.Run({"/nonexistent/digiplayer-tool"}, std::chrono::seconds(5));
  assert(missing.NotFound());
}

} // namespace

int main() {
  TestNaturalOrdering();
  TestDuplicateScreenOffRunsOnce();
  TestReplayAfterRestartIsSkipped();
  TestScreenCommandIsNoOpWhenAlreadyInState();
  TestRebootPersistsWatermarkFirst();
  TestRebootRefusedWhenWatermarkCannotBePersisted();
  TestFailedCommandIsRetriedOnceThenGivenUp();
  TestNewerCommandRetiresPendingRetry();
  TestRetrySucceedsOnRedelivery();
  TestRefreshInvokesHandler();
  TestScreenshotIsUploaded();
  TestScreenshotUploadFailureIsExecutionError();
  TestLinuxPlatformFallsBackToTvservice();
  TestLinuxPlatformParsesDisplayPower();
  TestLinuxPlatformRebootFailureThrows();
  TestSpawnFailureIsExecutionError();

  std::cout << "digiplayer_unit_command_executor: pass\n";
  return 0;
}
