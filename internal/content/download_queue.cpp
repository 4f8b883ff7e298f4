#include "download_queue.hpp"

namespace digiplayer::content {

void DownloadQueue::Enqueue(DownloadTask task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<DownloadTask> DownloadQueue::Dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) {
    return std::nullopt;
  }

  auto task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void DownloadQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

} // namespace digiplayer::content
