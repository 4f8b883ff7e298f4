#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace digiplayer::net {
class HttpTransport;
}

namespace digiplayer::content {

class MediaFetcher {
 public:
  virtual ~MediaFetcher() = default;

  // Writes the body to `destination`. Throws TransportError (network or
  // non-2xx) or StorageError (local write).
  virtual void Fetch(const std::string& url, const std::filesystem::path& destination) = 0;
};

class HttpMediaFetcher final : public MediaFetcher {
 public:
  HttpMediaFetcher(std::shared_ptr<net::HttpTransport> transport, std::chrono::milliseconds timeout);

  void Fetch(const std::string& url, const std::filesystem::path& destination) override;

 private:
  std::shared_ptr<net::HttpTransport> transport_;
  std::chrono::milliseconds           timeout_;
};

} // namespace digiplayer::content
