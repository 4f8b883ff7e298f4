#include "response_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::heartbeat {

using google::protobuf::Struct;
using google::protobuf::Value;
using observability::StringField;

namespace {

const Value* Field(const Struct& object, const char* key) {
  const auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

// Whole numbers print without a fraction so "42" and 42 name the same id.
std::optional<std::string> ScalarString(const Value* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->kind_case() == Value::kStringValue) {
    return value->string_value();
  }
  if (value->kind_case() == Value::kNumberValue) {
    const double number = value->number_value();
    if (std::floor(number) == number && std::fabs(number) < 9.0e15) {
      return std::to_string(static_cast<std::int64_t>(number));
    }
    return std::to_string(number);
  }
  return std::nullopt;
}

std::optional<std::int64_t> PositiveInteger(const Value* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->kind_case() == Value::kNumberValue) {
    const double number = value->number_value();
    if (number >= 1 && number < 9.0e15 && std::floor(number) == number) {
      return static_cast<std::int64_t>(number);
    }
    return std::nullopt;
  }
  if (value->kind_case() == Value::kStringValue) {
    const auto& text = value->string_value();
    if (text.empty() || text.size() > 15) {
      return std::nullopt;
    }
    for (const char c : text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        return std::nullopt;
      }
    }
    const auto parsed = std::stoll(text);
    return parsed > 0 ? std::optional<std::int64_t>(parsed) : std::nullopt;
  }
  return std::nullopt;
}

std::optional<model::Command> ParseCommand(const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    DIGIPLAYER_LOG_WARN("Dropping command that is not an object");
    return std::nullopt;
  }
  const auto& object = value.struct_value();

  const auto id = ScalarString(Field(object, "id"));
  if (!id || id->empty()) {
    DIGIPLAYER_LOG_WARN("Dropping command without id");
    return std::nullopt;
  }

  auto kind_name = ScalarString(Field(object, "kind"));
  if (!kind_name) {
    kind_name = ScalarString(Field(object, "command_type"));
  }
  const auto kind = kind_name ? model::ParseCommandKind(*kind_name) : std::nullopt;
  if (!kind) {
    DIGIPLAYER_LOG_WARN("Dropping command with unknown kind", {StringField("command_id", *id), StringField("kind", kind_name.value_or(""))});
    return std::nullopt;
  }

  model::Command command;
  command.command_id = *id;
  command.kind       = *kind;
  command.issued_at  = ScalarString(Field(object, "issued_at"));
  return command;
}

std::optional<model::MediaItem> ParseMediaItem(const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    return std::nullopt;
  }
  const auto& object = value.struct_value();

  auto media_ref = ScalarString(Field(object, "media_ref"));
  if (!media_ref) {
    media_ref = ScalarString(Field(object, "url"));
  }
  if (!media_ref || media_ref->empty()) {
    return std::nullopt;
  }

  const auto checksum = NormalizeChecksum(ScalarString(Field(object, "checksum")).value_or(""));
  if (!checksum) {
    return std::nullopt;
  }

  const Value* duration = Field(object, "duration");
  if (duration == nullptr) {
    duration = Field(object, "duration_sec");
  }
  std::uint32_t duration_sec = 0;
  if (duration != nullptr) {
    if (duration->kind_case() != Value::kNumberValue || duration->number_value() < 0 || duration->number_value() > 86400.0 * 365) {
      return std::nullopt;
    }
    duration_sec = static_cast<std::uint32_t>(duration->number_value());
  }

  return model::MediaItem{*media_ref, duration_sec, *checksum};
}

std::optional<model::ContentAssignment> ParseAssignment(const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    DIGIPLAYER_LOG_WARN("Dropping content assignment that is not an object");
    return std::nullopt;
  }
  const auto& object = value.struct_value();

  const auto version = ScalarString(Field(object, "playlist_version"));
  if (!version || version->empty()) {
    DIGIPLAYER_LOG_WARN("Dropping content assignment without playlist_version");
    return std::nullopt;
  }

  model::ContentAssignment assignment;
  assignment.playlist_version = *version;

  const Value* items = Field(object, "items");
  if (items == nullptr) {
    return assignment;
  }
  if (items->kind_case() != Value::kListValue) {
    DIGIPLAYER_LOG_WARN("Dropping content assignment with malformed items", {StringField("playlist_version", *version)});
    return std::nullopt;
  }

  for (const auto& entry : items->list_value().values()) {
    auto item = ParseMediaItem(entry);
    if (!item) {
      DIGIPLAYER_LOG_WARN("Dropping content assignment with malformed item", {StringField("playlist_version", *version)});
      return std::nullopt;
    }
    assignment.items.push_back(std::move(*item));
  }
  return assignment;
}

} // namespace

std::optional<std::string> NormalizeChecksum(const std::string& checksum) {
  std::string digest = checksum;
  if (digest.rfind("sha256:", 0) == 0) {
    digest = digest.substr(7);
  }
  if (digest.size() != 64) {
    return std::nullopt;
  }
  for (auto& c : digest) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return digest;
}

HeartbeatResponse ParseHeartbeatResponse(const std::string& body) {
  HeartbeatResponse response;
  if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
    return response;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Struct root;
  const auto status = google::protobuf::util::JsonStringToMessage(body, &root, options);
  if (!status.ok()) {
    throw util::TransportError("malformed heartbeat response: " + std::string(status.message()));
  }

  if (const Value* pending = Field(root, "pending_command")) {
    if (auto command = ParseCommand(*pending)) {
      response.commands.push_back(std::move(*command));
    }
  }

  if (const Value* commands = Field(root, "commands")) {
    if (commands->kind_case() == Value::kListValue) {
      for (const auto& entry : commands->list_value().values()) {
        if (auto command = ParseCommand(entry)) {
          response.commands.push_back(std::move(*command));
        }
      }
    } else {
      DIGIPLAYER_LOG_WARN("Ignoring malformed commands field");
    }
  }

  if (const Value* assignment = Field(root, "content_assignment")) {
    response.content_assignment = ParseAssignment(*assignment);
  }

  response.player_id = PositiveInteger(Field(root, "player_id"));

  if (const Value* registered = Field(root, "registered")) {
    if (registered->kind_case() == Value::kBoolValue) {
      response.registered = registered->bool_value();
    }
  }

  return response;
}

} // namespace digiplayer::heartbeat
