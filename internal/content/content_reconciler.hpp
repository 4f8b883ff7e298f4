#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/content/manifest_store.hpp"
#include "internal/model/content.hpp"
#include "internal/model/registration.hpp"

namespace digiplayer::content {

class MediaStore;
class MediaFetcher;
class PlaybackSink;

struct ReconcileReport {
  std::optional<std::string> active_version;
  std::optional<std::string> target_version;
  std::size_t                fetched = 0;
  std::size_t                missing = 0;  // still missing after this pass
  bool                       swapped = false;
  bool                       published = false;
};

struct ReconcilerOptions {
  std::uint32_t download_concurrency = 3;
};

/*
  Keeps the rendered playlist equal to the newest assignment that is
  fully present and verified.

      assignment -> target -> fetch missing (bounded, concurrent)
                          -> barrier
                          -> all verified? swap, persist, publish, GC

  A partially fetched target never reaches the renderer. Missing items are
  retried on the next pass. Stale media is collected only once the new
  playlist has been published; a failed publish stays pending in
  content.json and is retried every pass.
*/
class ContentReconciler {
 public:
  ContentReconciler(std::shared_ptr<MediaStore> store, std::shared_ptr<MediaFetcher> fetcher, std::shared_ptr<PlaybackSink> sink,
                    std::shared_ptr<ContentManifestStore> manifest_store, ReconcilerOptions options);

  // Loads content.json so an interrupted download resumes.
  void Restore();

  // `force` republishes the active playlist even when nothing changed.
  ReconcileReport Reconcile(const std::optional<model::ContentAssignment>& assignment, const model::Registration& registration,
                            bool force);

  std::optional<std::string> ActiveVersion() const;
  std::optional<std::string> TargetVersion() const;
  bool                       HasPendingTarget() const {
    return manifest_.target.has_value();
  }
  // The active playlist is swapped in but its publish failed.
  bool PublishPending() const {
    return manifest_.publish_pending;
  }

 private:
  void        AcceptAssignment(const model::ContentAssignment& assignment);
  std::size_t FetchMissing(const model::ContentAssignment& target, const model::Registration& registration);
  std::size_t CountMissing(const model::ContentAssignment& target);
  bool        Publish(const model::ContentAssignment& assignment);
  void        SaveManifest();

  std::shared_ptr<MediaStore>           store_;
  std::shared_ptr<MediaFetcher>         fetcher_;
  std::shared_ptr<PlaybackSink>         sink_;
  std::shared_ptr<ContentManifestStore> manifest_store_;
  ReconcilerOptions                     options_;

  ContentManifest manifest_;
};

} // namespace digiplayer::content
