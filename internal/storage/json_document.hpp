#pragma once

#include <filesystem>
#include <string>

#include <google/protobuf/message.h>

namespace digiplayer::storage {

enum class DocumentState {
  kLoaded,
  kMissing,
  kCorrupt,
};

/*
  Protobuf messages persisted in their JSON mapping.

  Parsing is forward compatible: unknown fields are ignored. A document that
  fails to parse is reported as kCorrupt and the caller decides whether that
  means "absent". Neither function takes the file lock; callers hold a
  ScopedFileLock around read-modify-write sequences.
*/
DocumentState LoadJsonDocument(const std::filesystem::path& file, google::protobuf::Message* message, std::string* error = nullptr);

void SaveJsonDocument(const std::filesystem::path& file, const google::protobuf::Message& message);

std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Throws ConfigError when the payload is not valid JSON for the message.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace digiplayer::storage
