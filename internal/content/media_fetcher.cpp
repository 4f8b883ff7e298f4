#include "media_fetcher.hpp"

#include "internal/net/http_transport.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::content {

HttpMediaFetcher::HttpMediaFetcher(std::shared_ptr<net::HttpTransport> transport, std::chrono::milliseconds timeout)
    : transport_(std::move(transport)), timeout_(timeout) {
}

void HttpMediaFetcher::Fetch(const std::string& url, const std::filesystem::path& destination) {
  const auto response = transport_->Download(url, destination, timeout_);
  if (!response.Ok()) {
    throw util::TransportError(url + " answered HTTP " + std::to_string(response.status), response.status);
  }
}

} // namespace digiplayer::content
