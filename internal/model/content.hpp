#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "digiplayer/agent/v1/content.pb.h"

namespace digiplayer::model {

struct MediaItem {
  std::string   media_ref;
  std::uint32_t duration_sec = 0;
  std::string   checksum;  // lower-case sha256 hex

  bool operator==(const MediaItem& other) const {
    return media_ref == other.media_ref && duration_sec == other.duration_sec && checksum == other.checksum;
  }
};

struct ContentAssignment {
  std::string            playlist_version;
  std::vector<MediaItem> items;

  bool operator==(const ContentAssignment& other) const {
    return playlist_version == other.playlist_version && items == other.items;
  }
  bool operator!=(const ContentAssignment& other) const {
    return !(*this == other);
  }
};

inline digiplayer::agent::v1::ContentAssignment ToProto(const ContentAssignment& assignment) {
  digiplayer::agent::v1::ContentAssignment proto;
  proto.set_playlist_version(assignment.playlist_version);
  for (const auto& item : assignment.items) {
    auto* out = proto.add_items();
    out->set_media_ref(item.media_ref);
    out->set_duration_sec(item.duration_sec);
    out->set_checksum(item.checksum);
  }
  return proto;
}

inline ContentAssignment FromProto(const digiplayer::agent::v1::ContentAssignment& proto) {
  ContentAssignment assignment;
  assignment.playlist_version = proto.playlist_version();
  for (const auto& item : proto.items()) {
    assignment.items.push_back({item.media_ref(), item.duration_sec(), item.checksum()});
  }
  return assignment;
}

} // namespace digiplayer::model
