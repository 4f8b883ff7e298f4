#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "digiplayer_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(paths:
  state_dir: "C:\\digiplayer\\\"quoted\"\\state"
server:
  server_url: "https://signage.example.com"
)");

  auto config = digiplayer::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.paths().state_dir() == "C:\\digiplayer\\\"quoted\"\\state");
  assert(config.server().server_url() == "https://signage.example.com");
}

void TestQuotedNumericScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(access_point:
  passphrase: "12345678"
  ssid_prefix: "0042-"
)");

  auto config = digiplayer::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.access_point().passphrase() == "12345678");
  assert(config.access_point().ssid_prefix() == "0042-");
}

void TestDefaultsFillUnsetFields() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(paths:
  state_dir: /tmp/digiplayer-state
connectivity:
  fallback_grace_probes: 5
access_point:
  enabled: false
)");

  auto config = digiplayer::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.paths().state_dir() == "/tmp/digiplayer-state");
  assert(config.paths().media_dir() == "/tmp/digiplayer-state/media");
  assert(config.connectivity().fallback_grace_probes() == 5);
  assert(config.connectivity().probe_interval_sec() == 10);
  assert(config.server().server_url() == "https://www.digireklaam.ee");
  assert(config.server().api_prefix() == "/api/v1");
  assert(config.server().heartbeat_interval_sec() == 30);
  assert(config.heartbeat().failure_threshold() == 3);
  assert(!config.access_point().enabled());
  assert(config.content().download_concurrency() == 3);
}

void TestEmptyFileIsAllDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = digiplayer::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.access_point().enabled());
  assert(config.access_point().ap_backend() == "nmcli");
  assert(config.logging().level() == "info");
  assert(config.logging().max_file_size_mb() == 5);
  assert(config.logging().max_files() == 3);
  assert(config.logging().file().empty());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  server_url: "https://signage.example.com"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)digiplayer::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const digiplayer::util::ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigError() {
  bool threw = false;
  try {
    (void)digiplayer::config::ConfigLoader::LoadFromYaml("/nonexistent/digiplayer/agent.yaml");
  } catch (const digiplayer::util::ConfigError&) {
    threw = true;
  }

  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumericScalarsStayStrings();
  TestDefaultsFillUnsetFields();
  TestEmptyFileIsAllDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigError();

  std::cout << "digiplayer_unit_config_loader: pass\n";
  return 0;
}
