#include "json_document.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/storage/durable_file.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::storage {

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.add_whitespace             = pretty;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::StorageError("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::ConfigError("Invalid " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

DocumentState LoadJsonDocument(const std::filesystem::path& file, google::protobuf::Message* message, std::string* error) {
  const auto contents = ReadFileContents(file);
  if (!contents) {
    return DocumentState::kMissing;
  }

  message->Clear();
  try {
    FromJson(*contents, message);
  } catch (const util::ConfigError& e) {
    message->Clear();
    if (error) *error = e.what();
    return DocumentState::kCorrupt;
  }
  return DocumentState::kLoaded;
}

void SaveJsonDocument(const std::filesystem::path& file, const google::protobuf::Message& message) {
  WriteFileAtomically(file, ToJson(message, true) + "\n");
}

} // namespace digiplayer::storage
