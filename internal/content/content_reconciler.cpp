#include "content_reconciler.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <set>
#include <thread>
#include <vector>

#include "internal/content/download_queue.hpp"
#include "internal/content/media_fetcher.hpp"
#include "internal/content/media_store.hpp"
#include "internal/content/playback_sink.hpp"
#include "internal/net/endpoints.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::content {

using observability::IntField;
using observability::StringField;

namespace {

std::set<std::string> Checksums(const model::ContentAssignment& assignment) {
  std::set<std::string> checksums;
  for (const auto& item : assignment.items) {
    checksums.insert(item.checksum);
  }
  return checksums;
}

} // namespace

ContentReconciler::ContentReconciler(std::shared_ptr<MediaStore> store, std::shared_ptr<MediaFetcher> fetcher,
                                     std::shared_ptr<PlaybackSink> sink, std::shared_ptr<ContentManifestStore> manifest_store,
                                     ReconcilerOptions options)
    : store_(std::move(store)),
      fetcher_(std::move(fetcher)),
      sink_(std::move(sink)),
      manifest_store_(std::move(manifest_store)),
      options_(options) {
}

void ContentReconciler::Restore() {
  manifest_ = manifest_store_->Load();
  DIGIPLAYER_LOG_INFO("Content manifest restored", {StringField("active", ActiveVersion().value_or("")),
                                                    StringField("target", TargetVersion().value_or(""))});
}

ReconcileReport ContentReconciler::Reconcile(const std::optional<model::ContentAssignment>& assignment,
                                             const model::Registration& registration, bool force) {
  if (assignment) {
    AcceptAssignment(*assignment);
  }

  ReconcileReport report;

  if (manifest_.target) {
    const auto target = *manifest_.target;
    report.fetched    = FetchMissing(target, registration);
    report.missing    = CountMissing(target);

    if (report.missing == 0) {
      manifest_.active = target;
      manifest_.target.reset();
      manifest_.publish_pending = true;
      SaveManifest();
      report.swapped = true;

      DIGIPLAYER_LOG_INFO("Playlist swapped", {StringField("playlist_version", target.playlist_version),
                                               IntField("items", static_cast<std::int64_t>(target.items.size()))});
    } else {
      DIGIPLAYER_LOG_WARN("Playlist incomplete, keeping active playlist",
                          {StringField("target", target.playlist_version), IntField("missing", static_cast<std::int64_t>(report.missing))});
    }
  }

  if (manifest_.active && (manifest_.publish_pending || force)) {
    const bool collect = manifest_.publish_pending;
    report.published   = Publish(*manifest_.active);

    // stale media only goes once the renderer has moved on
    if (report.published && collect) {
      manifest_.publish_pending = false;
      SaveManifest();
      const auto removed = store_->CollectGarbage(Checksums(*manifest_.active));
      if (removed > 0) {
        DIGIPLAYER_LOG_INFO("Collected stale media", {IntField("removed", static_cast<std::int64_t>(removed))});
      }
    }
  }

  report.active_version = ActiveVersion();
  report.target_version = TargetVersion();
  return report;
}

void ContentReconciler::AcceptAssignment(const model::ContentAssignment& assignment) {
  if (manifest_.active && assignment == *manifest_.active) {
    if (manifest_.target) {
      DIGIPLAYER_LOG_INFO("Assignment reverted to active playlist, dropping target",
                          {StringField("target", manifest_.target->playlist_version)});
      manifest_.target.reset();
      SaveManifest();
    }
    return;
  }

  if (manifest_.target && assignment == *manifest_.target) {
    return;
  }

  DIGIPLAYER_LOG_INFO("New content assignment", {StringField("playlist_version", assignment.playlist_version),
                                                 IntField("items", static_cast<std::int64_t>(assignment.items.size()))});
  manifest_.target = assignment;
  SaveManifest();
}

std::size_t ContentReconciler::FetchMissing(const model::ContentAssignment& target, const model::Registration& registration) {
  DownloadQueue         queue;
  std::set<std::string> queued;
  std::size_t           pending = 0;

  for (const auto& item : target.items) {
    if (queued.count(item.checksum) > 0 || store_->Contains(item.checksum)) {
      continue;
    }
    queued.insert(item.checksum);
    queue.Enqueue({item, net::ResolveMediaUrl(registration, item.media_ref)});
    ++pending;
  }
  queue.Close();

  if (pending == 0) {
    return 0;
  }

  std::atomic<std::size_t> fetched{0};
  const auto               workers = std::min<std::size_t>(std::max<std::uint32_t>(options_.download_concurrency, 1), pending);

  auto work = [&] {
    while (auto task = queue.Dequeue()) {
      const auto staging = store_->StagingPathFor(task->item.checksum);
      try {
        store_->EnsureDirectories();
        fetcher_->Fetch(task->url, staging);
        store_->Adopt(staging, task->item.checksum);
        ++fetched;
      } catch (const util::TransportError& e) {
        DIGIPLAYER_LOG_WARN("Media download failed", {StringField("media_ref", task->item.media_ref), StringField("error", e.what())});
      } catch (const util::StorageError& e) {
        DIGIPLAYER_LOG_WARN("Media verification failed", {StringField("media_ref", task->item.media_ref), StringField("error", e.what())});
      } catch (const std::exception& e) {
        // the item stays missing and is retried next pass
        DIGIPLAYER_LOG_ERROR("Media fetch aborted", {StringField("media_ref", task->item.media_ref), StringField("error", e.what())});
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(work);
  }
  // barrier: the swap decision needs every outcome
  for (auto& thread : threads) {
    thread.join();
  }

  return fetched.load();
}

std::size_t ContentReconciler::CountMissing(const model::ContentAssignment& target) {
  std::size_t missing = 0;
  for (const auto& checksum : Checksums(target)) {
    if (!store_->Contains(checksum)) {
      ++missing;
    }
  }
  return missing;
}

bool ContentReconciler::Publish(const model::ContentAssignment& assignment) {
  std::vector<ResolvedItem> items;
  items.reserve(assignment.items.size());
  for (const auto& item : assignment.items) {
    items.push_back({item, store_->PathFor(item.checksum)});
  }

  try {
    sink_->Publish(assignment.playlist_version, items);
    return true;
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_ERROR("Playlist publish failed", {StringField("playlist_version", assignment.playlist_version),
                                                     StringField("error", e.what())});
    return false;
  }
}

void ContentReconciler::SaveManifest() {
  try {
    manifest_store_->Save(manifest_);
  } catch (const util::StorageError& e) {
    DIGIPLAYER_LOG_WARN("Content manifest kept in memory only", {StringField("error", e.what())});
  }
}

std::optional<std::string> ContentReconciler::ActiveVersion() const {
  if (!manifest_.active) return std::nullopt;
  return manifest_.active->playlist_version;
}

std::optional<std::string> ContentReconciler::TargetVersion() const {
  if (!manifest_.target) return std::nullopt;
  return manifest_.target->playlist_version;
}

} // namespace digiplayer::content
