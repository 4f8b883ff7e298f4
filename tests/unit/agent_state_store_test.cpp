#include "internal/state/agent_state_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "internal/util/time.hpp"

namespace {

using digiplayer::state::AgentStateStore;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "digiplayer_agent_state_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestWatermarkSurvivesRestart() {
  const auto dir = FreshDir("restart");
  {
    AgentStateStore store(dir / "state.json");
    assert(store.LastCommandId().empty());
    assert(store.SetLastCommandId("cmd-41"));
  }

  AgentStateStore reopened(dir / "state.json");
  assert(reopened.LastCommandId() == "cmd-41");
}

void TestDocumentUsesSnakeCaseKeys() {
  const auto dir = FreshDir("field_names");
  {
    AgentStateStore store(dir / "state.json");
    assert(store.SetLastCommandId("cmd-7"));
    assert(store.SetLastSeenOnline(digiplayer::util::Now()));
  }

  std::ifstream in(dir / "state.json");
  const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(contents.find("\"last_command_id\": \"cmd-7\"") != std::string::npos);
  assert(contents.find("\"last_seen_online\"") != std::string::npos);
  assert(contents.find("lastCommandId") == std::string::npos);
}

void TestLastSeenOnlineRoundTripsToTheSecond() {
  const auto dir = FreshDir("last_seen");
  const auto now = std::chrono::time_point_cast<std::chrono::seconds>(digiplayer::util::Now());
  {
    AgentStateStore store(dir / "state.json");
    assert(!store.LastSeenOnline());
    assert(store.SetLastSeenOnline(now));
  }

  AgentStateStore reopened(dir / "state.json");
  assert(reopened.LastSeenOnline());
  assert(*reopened.LastSeenOnline() == now);
}

void TestMutationMergesOutOfProcessEdits() {
  const auto      dir = FreshDir("merge");
  AgentStateStore agent(dir / "state.json");
  AgentStateStore ctl(dir / "state.json");

  assert(agent.SetLastCommandId("cmd-5"));
  ctl.Reload();
  assert(ctl.ClearWatermark());

  // the agent's next unrelated write must not resurrect the watermark
  assert(agent.SetLastSeenOnline(digiplayer::util::Now()));
  assert(agent.LastCommandId().empty());
}

void TestReloadPicksUpExternalReset() {
  const auto      dir = FreshDir("reload");
  AgentStateStore store(dir / "state.json");
  assert(store.SetLastCommandId("cmd-9"));

  std::filesystem::remove(dir / "state.json");
  store.Reload();
  assert(store.LastCommandId().empty());
}

void TestCorruptDocumentStartsEmpty() {
  const auto dir = FreshDir("corrupt");
  {
    std::ofstream out(dir / "state.json");
    out << "{{{";
  }

  AgentStateStore store(dir / "state.json");
  assert(store.LastCommandId().empty());
  assert(store.SetLastCommandId("cmd-1"));
  assert(store.LastCommandId() == "cmd-1");
}

void TestUnwritableDiskKeepsChangeInMemoryUntilFlush() {
  const auto dir     = FreshDir("dirty");
  const auto blocker = dir / "blocked";
  {
    std::ofstream out(blocker);
    out << "a file where the state directory should be";
  }

  AgentStateStore store(blocker / "state.json");
  assert(!store.SetLastCommandId("cmd-3"));
  assert(store.Dirty());
  assert(store.LastCommandId() == "cmd-3");

  // a dirty store keeps its view when the flush still fails
  store.Reload();
  assert(store.LastCommandId() == "cmd-3");

  std::filesystem::remove(blocker);
  assert(store.Flush());
  assert(!store.Dirty());

  AgentStateStore reopened(blocker / "state.json");
  assert(reopened.LastCommandId() == "cmd-3");
}

void TestCommitIsDurableOrNothing() {
  const auto dir     = FreshDir("commit");
  const auto blocker = dir / "blocked";
  {
    std::ofstream out(blocker);
    out << "x";
  }

  AgentStateStore store(blocker / "state.json");
  assert(!store.CommitLastCommandId("cmd-reboot"));
  assert(store.LastCommandId().empty());
  assert(!store.Dirty());

  std::filesystem::remove(blocker);
  assert(store.CommitLastCommandId("cmd-reboot"));
  assert(store.LastCommandId() == "cmd-reboot");
}

} // namespace

int main() {
  TestWatermarkSurvivesRestart();
  TestDocumentUsesSnakeCaseKeys();
  TestLastSeenOnlineRoundTripsToTheSecond();
  TestMutationMergesOutOfProcessEdits();
  TestReloadPicksUpExternalReset();
  TestCorruptDocumentStartsEmpty();
  TestUnwritableDiskKeepsChangeInMemoryUntilFlush();
  TestCommitIsDurableOrNothing();

  std::cout << "digiplayer_unit_agent_state_store: pass\n";
  return 0;
}
