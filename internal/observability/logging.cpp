#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace digiplayer::observability {
namespace {

constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
// journald stamps every line itself
constexpr char kJournalPattern[] = "[%l] %v";

std::string ResolveLevel(const digiplayer::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("DIGIPLAYER_LOG_LEVEL")) {
    return level;
  }
  if (!config.logging().level().empty()) {
    return config.logging().level();
  }
  return "info";
}

std::string ResolvePattern(const digiplayer::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("DIGIPLAYER_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }
  return std::getenv("JOURNAL_STREAM") ? kJournalPattern : kDefaultPattern;
}

// Values with blanks, quotes or '=' are quoted so lines stay key=value parseable.
void AppendValue(std::ostringstream& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    out << value;
    return;
  }
  out << '"';
  for (const char c : value) {
    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const digiplayer::runtime::config::RuntimeConfig& config, std::string_view logger_name) {
  const std::string name(logger_name);
  spdlog::drop(name);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  // the SD card must not fill up with logs
  const auto& logging = config.logging();
  std::string file_error;
  if (!logging.file().empty()) {
    const std::size_t max_bytes = static_cast<std::size_t>(logging.max_file_size_mb()) * 1024 * 1024;
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file(), max_bytes, logging.max_files()));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (!file_error.empty()) {
    LogWarn("Log file unavailable, logging to stderr only", {StringField("file", logging.file()), StringField("error", file_error)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  const auto serialized_fields = SerializeFields(fields);
  if (serialized_fields.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized_fields);
}

} // namespace digiplayer::observability
