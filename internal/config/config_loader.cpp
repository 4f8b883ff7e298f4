#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace digiplayer::config {

using digiplayer::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("12345678" passphrases, "0.0.0.0")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
  if (logging->max_file_size_mb() == 0) logging->set_max_file_size_mb(5);
  if (logging->max_files() == 0) logging->set_max_files(3);

  auto* paths = config->mutable_paths();
  if (paths->state_dir().empty()) paths->set_state_dir("/var/lib/digiplayer");
  if (paths->media_dir().empty()) paths->set_media_dir(paths->state_dir() + "/media");
  if (paths->screenshot_path().empty()) paths->set_screenshot_path("/tmp/digiplayer-screenshot.png");
  if (paths->pid_file().empty()) paths->set_pid_file(paths->state_dir() + "/agent.pid");
  if (paths->registration_file().empty()) paths->set_registration_file("/etc/digiplayer/config.json");

  auto* server = config->mutable_server();
  if (server->server_url().empty()) server->set_server_url("https://www.digireklaam.ee");
  if (server->api_prefix().empty()) server->set_api_prefix("/api/v1");
  if (server->heartbeat_interval_sec() == 0) server->set_heartbeat_interval_sec(30);
  if (server->request_timeout_ms() == 0) server->set_request_timeout_ms(10000);

  auto* connectivity = config->mutable_connectivity();
  if (connectivity->probe_interval_sec() == 0) connectivity->set_probe_interval_sec(10);
  if (connectivity->fallback_grace_probes() == 0) connectivity->set_fallback_grace_probes(3);
  if (connectivity->probe_host().empty()) connectivity->set_probe_host("1.1.1.1");
  if (connectivity->probe_port() == 0) connectivity->set_probe_port(53);
  if (connectivity->probe_timeout_ms() == 0) connectivity->set_probe_timeout_ms(3000);
  if (connectivity->route_table_path().empty()) connectivity->set_route_table_path("/proc/net/route");

  auto* heartbeat = config->mutable_heartbeat();
  if (heartbeat->max_backoff_multiplier() == 0) heartbeat->set_max_backoff_multiplier(10);
  if (heartbeat->failure_threshold() == 0) heartbeat->set_failure_threshold(3);

  auto* ap = config->mutable_access_point();
  if (!ap->has_enabled()) ap->set_enabled(true);
  if (ap->interface().empty()) ap->set_interface("wlan0");
  if (ap->ssid_prefix().empty()) ap->set_ssid_prefix("DigiPlayer-");
  if (ap->ap_backend().empty()) ap->set_ap_backend("nmcli");
  if (ap->network_backend().empty()) ap->set_network_backend("nmcli");
  if (ap->wpa_supplicant_conf().empty()) ap->set_wpa_supplicant_conf("/etc/wpa_supplicant/wpa_supplicant.conf");
  if (ap->hostapd_conf().empty()) ap->set_hostapd_conf("/etc/hostapd/hostapd.conf");
  if (ap->portal_address().empty()) ap->set_portal_address("0.0.0.0");
  if (ap->portal_port() == 0) ap->set_portal_port(8080);
  if (ap->apply_timeout_sec() == 0) ap->set_apply_timeout_sec(45);

  auto* content = config->mutable_content();
  if (content->download_concurrency() == 0) content->set_download_concurrency(3);
  if (content->download_timeout_ms() == 0) content->set_download_timeout_ms(120000);
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty file is a valid "all defaults" configuration
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace digiplayer::config
