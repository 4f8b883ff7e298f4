#include "manifest_store.hpp"

#include "digiplayer/agent/v1/content.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/storage/durable_file.hpp"
#include "internal/storage/json_document.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::content {

ContentManifestStore::ContentManifestStore(std::filesystem::path file) : file_(std::move(file)) {
}

ContentManifest ContentManifestStore::Load() const {
  digiplayer::agent::v1::ContentManifest document;
  std::string                            error;

  try {
    storage::ScopedFileLock lock(file_, storage::ScopedFileLock::Mode::kShared);
    if (storage::LoadJsonDocument(file_, &document, &error) == storage::DocumentState::kCorrupt) {
      DIGIPLAYER_LOG_WARN("Content manifest is corrupt, ignoring", {observability::StringField("error", error)});
      return {};
    }
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_WARN("Content manifest unreadable", {observability::StringField("error", e.what())});
    return {};
  }

  ContentManifest manifest;
  if (document.has_active()) manifest.active = model::FromProto(document.active());
  if (document.has_target()) manifest.target = model::FromProto(document.target());
  manifest.publish_pending = manifest.active && document.publish_pending();
  return manifest;
}

void ContentManifestStore::Save(const ContentManifest& manifest) {
  digiplayer::agent::v1::ContentManifest document;
  if (manifest.active) {
    *document.mutable_active() = model::ToProto(*manifest.active);
  }
  if (manifest.target) {
    *document.mutable_target() = model::ToProto(*manifest.target);
  }
  document.set_publish_pending(manifest.publish_pending);

  storage::ScopedFileLock lock(file_, storage::ScopedFileLock::Mode::kExclusive);
  storage::SaveJsonDocument(file_, document);
}

} // namespace digiplayer::content
