#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace digiplayer::net {

struct HttpResponse {
  long        status = 0;
  std::string body;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

struct MultipartFile {
  std::string           field;
  std::filesystem::path path;
  std::string           content_type;
};

/*
  Outbound HTTP(S) used by the heartbeat, probes, uploads and downloads.

  Every call carries its own timeout. Network-level failures (DNS, connect,
  TLS, timeout) throw TransportError; any HTTP answer, including non-2xx,
  is returned to the caller.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Get(const std::string& url, std::chrono::milliseconds timeout) = 0;

  virtual HttpResponse PostJson(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) = 0;

  virtual HttpResponse PostFile(const std::string& url, const MultipartFile& file, std::chrono::milliseconds timeout) = 0;

  // Streams the body to `destination`. The file is removed unless the
  // response is 2xx; `body` of the result is always empty.
  virtual HttpResponse Download(const std::string& url, const std::filesystem::path& destination,
                                std::chrono::milliseconds timeout) = 0;
};

struct CurlTransportOptions {
  std::string ca_bundle;  // empty: system default
  std::string user_agent;
  std::chrono::milliseconds connect_timeout{5000};
};

class CurlHttpTransport final : public HttpTransport {
 public:
  explicit CurlHttpTransport(CurlTransportOptions options);

  HttpResponse Get(const std::string& url, std::chrono::milliseconds timeout) override;
  HttpResponse PostJson(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) override;
  HttpResponse PostFile(const std::string& url, const MultipartFile& file, std::chrono::milliseconds timeout) override;
  HttpResponse Download(const std::string& url, const std::filesystem::path& destination,
                        std::chrono::milliseconds timeout) override;

 private:
  CurlTransportOptions options_;
};

// "a b&c" -> "a%20b%26c"
std::string UrlEncode(const std::string& value);

} // namespace digiplayer::net
