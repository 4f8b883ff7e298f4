#include "http_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <mutex>
#include <system_error>

#include "internal/util/errors.hpp"

namespace digiplayer::net {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using MimeHandle = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

struct FileCloser {
  void operator()(std::FILE* file) const {
    if (file != nullptr) std::fclose(file);
  }
};

void GlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t AppendToString(char* data, size_t size, size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

size_t WriteToFile(char* data, size_t size, size_t count, void* user) {
  return std::fwrite(data, size, count, static_cast<std::FILE*>(user)) * size;
}

CurlHandle NewHandle(const std::string& url, std::chrono::milliseconds timeout, const CurlTransportOptions& options) {
  GlobalInit();

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw util::TransportError("curl_easy_init failed");
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(std::min(timeout, options.connect_timeout).count()));
  if (!options.ca_bundle.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_CAINFO, options.ca_bundle.c_str());
  }
  if (!options.user_agent.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
  }
  return curl;
}

long Perform(CURL* curl, const std::string& url) {
  const CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    throw util::TransportError(url + ": " + curl_easy_strerror(rc));
  }

  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  return status;
}

} // namespace

CurlHttpTransport::CurlHttpTransport(CurlTransportOptions options) : options_(std::move(options)) {
}

HttpResponse CurlHttpTransport::Get(const std::string& url, std::chrono::milliseconds timeout) {
  auto curl = NewHandle(url, timeout, options_);

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  HeaderList headers(curl_slist_append(nullptr, "Accept: application/json"), &curl_slist_free_all);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

  response.status = Perform(curl.get(), url);
  return response;
}

HttpResponse CurlHttpTransport::PostJson(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) {
  auto curl = NewHandle(url, timeout, options_);

  HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);
  headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  response.status = Perform(curl.get(), url);
  return response;
}

HttpResponse CurlHttpTransport::PostFile(const std::string& url, const MultipartFile& file, std::chrono::milliseconds timeout) {
  auto curl = NewHandle(url, timeout, options_);

  MimeHandle mime(curl_mime_init(curl.get()), &curl_mime_free);
  curl_mimepart* part = curl_mime_addpart(mime.get());
  curl_mime_name(part, file.field.c_str());
  if (curl_mime_filedata(part, file.path.c_str()) != CURLE_OK) {
    throw util::TransportError("cannot attach " + file.path.string());
  }
  if (!file.content_type.empty()) {
    curl_mime_type(part, file.content_type.c_str());
  }

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &AppendToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  response.status = Perform(curl.get(), url);
  return response;
}

HttpResponse CurlHttpTransport::Download(const std::string& url, const std::filesystem::path& destination,
                                         std::chrono::milliseconds timeout) {
  auto curl = NewHandle(url, timeout, options_);

  HttpResponse response;
  {
    std::unique_ptr<std::FILE, FileCloser> out(std::fopen(destination.c_str(), "wb"));
    if (!out) {
      throw util::StorageError("cannot open " + destination.string() + " for writing");
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteToFile);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, out.get());
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 0L);

    try {
      response.status = Perform(curl.get(), url);
    } catch (const util::TransportError&) {
      out.reset();
      std::error_code ec;
      std::filesystem::remove(destination, ec);
      throw;
    }

    if (std::fflush(out.get()) != 0) {
      out.reset();
      std::error_code ec;
      std::filesystem::remove(destination, ec);
      throw util::StorageError("write failed for " + destination.string());
    }
  }

  if (!response.Ok()) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
  }
  return response;
}

std::string UrlEncode(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(value.size());
  for (const unsigned char c : value) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                            c == '_' || c == '.' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

} // namespace digiplayer::net
