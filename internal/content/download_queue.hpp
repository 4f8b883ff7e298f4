#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

#include "internal/model/content.hpp"

namespace digiplayer::content {

struct DownloadTask {
  model::MediaItem item;
  std::string      url;
};

/*
  Thread-safe blocking queue for download workers.

  Close() lets workers drain what is queued; Dequeue() then returns
  nullopt and the worker exits.
*/
class DownloadQueue {
 public:
  void Enqueue(DownloadTask task);

  // blocking wait
  std::optional<DownloadTask> Dequeue();

  void Close();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<DownloadTask> queue_;
  bool                     closed_ = false;
};

} // namespace digiplayer::content
