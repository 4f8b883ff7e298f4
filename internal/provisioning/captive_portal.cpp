#include "captive_portal.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/provisioning/provisioner.hpp"
#include "internal/storage/json_document.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::provisioning {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

using observability::StringField;

namespace {

constexpr auto kSessionTimeout = std::chrono::seconds(15);

unsigned HttpStatusFor(SubmitStatus status) {
  switch (status) {
    case SubmitStatus::kAccepted:
      return 202;
    case SubmitStatus::kBusy:
      return 409;
    case SubmitStatus::kInvalid:
      return 400;
  }
  return 400;
}

PortalResponse JsonResponse(unsigned status, const google::protobuf::Message& message) {
  return {status, "application/json", storage::ToJson(message)};
}

PortalResponse SubmitResponse(const SubmitResult& result) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["status"].set_string_value(std::string(ToString(result.status)));
  (*body.mutable_fields())["message"].set_string_value(result.message);
  return JsonResponse(HttpStatusFor(result.status), body);
}

PortalResponse NotFound() {
  return {404, "text/plain", "not found\n"};
}

std::string StructString(const google::protobuf::Struct& body, const std::string& key) {
  const auto it = body.fields().find(key);
  if (it == body.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

// Path without the query string.
std::string PathOf(const std::string& target) {
  return target.substr(0, target.find('?'));
}

/*
  One request, one response, then the connection is closed.
*/
class PortalSession : public std::enable_shared_from_this<PortalSession> {
 public:
  PortalSession(tcp::socket&& socket, std::shared_ptr<PortalRouter> router)
      : stream_(std::move(socket)), router_(std::move(router)) {
  }

  void Run() {
    asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&PortalSession::Read, shared_from_this()));
  }

 private:
  void Read() {
    stream_.expires_after(kSessionTimeout);
    http::async_read(stream_, buffer_, request_, beast::bind_front_handler(&PortalSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec != http::error::end_of_stream) {
        DIGIPLAYER_LOG_DEBUG("Portal read failed", {StringField("error", ec.message())});
      }
      Close();
      return;
    }

    const std::string content_type(request_[http::field::content_type]);
    const auto        routed = router_->Handle(std::string(request_.method_string()), std::string(request_.target()),
                                               content_type, request_.body());

    response_.version(request_.version());
    response_.result(routed.status);
    response_.set(http::field::server, "digiplayer-agent");
    response_.set(http::field::content_type, routed.content_type);
    response_.set(http::field::cache_control, "no-store");
    response_.keep_alive(false);
    response_.body() = routed.body;
    response_.prepare_payload();

    http::async_write(stream_, response_, beast::bind_front_handler(&PortalSession::OnWrite, shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      DIGIPLAYER_LOG_DEBUG("Portal write failed", {StringField("error", ec.message())});
    }
    Close();
  }

  void Close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream                 stream_;
  beast::flat_buffer                buffer_;
  http::request<http::string_body>  request_;
  http::response<http::string_body> response_;
  std::shared_ptr<PortalRouter>     router_;
};

} // namespace

// ------------------------------------------------------------

PortalRouter::PortalRouter(std::shared_ptr<Provisioner> provisioner, StatusProvider status)
    : provisioner_(std::move(provisioner)), status_(std::move(status)) {
}

PortalResponse PortalRouter::Handle(const std::string& method, const std::string& target, const std::string& content_type,
                                    const std::string& body) const {
  const std::string path = PathOf(target);

  if (method == "GET") {
    if (path == "/" || path == "/wifi") return Index();
    if (path == "/api/status") return Status();
    if (path == "/api/wifi/scan") return Scan();
    return NotFound();
  }

  if (method == "POST") {
    if (path == "/api/wifi/connect") {
      if (content_type.rfind("application/x-www-form-urlencoded", 0) == 0) return ConnectForm(body);
      return ConnectJson(body);
    }
    if (path == "/connect") return ConnectForm(body);
    return NotFound();
  }

  return {405, "text/plain", "method not allowed\n"};
}

PortalResponse PortalRouter::Index() const {
  const auto status   = status_();
  const auto networks = provisioner_->Networks();

  std::ostringstream html;
  html << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
       << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">"
       << "<title>DigiPlayer setup</title></head><body>\n"
       << "<h1>DigiPlayer</h1>\n"
       << "<p>Device ID: <strong>" << HtmlEscape(status.device_id()) << "</strong></p>\n"
       << "<p>Connectivity: " << HtmlEscape(status.connectivity()) << "</p>\n"
       << "<form method=\"post\" action=\"/connect\">\n"
       << "<label>Network <input name=\"ssid\" list=\"networks\" maxlength=\"32\" required></label>\n"
       << "<datalist id=\"networks\">\n";
  for (const auto& ssid : networks) {
    html << "<option value=\"" << HtmlEscape(ssid) << "\">\n";
  }
  html << "</datalist>\n"
       << "<label>Password <input name=\"password\" type=\"password\" maxlength=\"63\"></label>\n"
       << "<button type=\"submit\">Connect</button>\n"
       << "</form>\n</body></html>\n";

  return {200, "text/html; charset=utf-8", html.str()};
}

PortalResponse PortalRouter::Status() const {
  return JsonResponse(200, status_());
}

PortalResponse PortalRouter::Scan() const {
  google::protobuf::Struct body;
  auto*                    list = (*body.mutable_fields())["networks"].mutable_list_value();
  for (const auto& ssid : provisioner_->Networks()) {
    list->add_values()->set_string_value(ssid);
  }
  return JsonResponse(200, body);
}

PortalResponse PortalRouter::ConnectJson(const std::string& body) const {
  google::protobuf::Struct request;
  if (!google::protobuf::util::JsonStringToMessage(body, &request).ok()) {
    return SubmitResponse({SubmitStatus::kInvalid, "body must be a JSON object"});
  }

  WifiCredentials credentials;
  credentials.ssid       = StructString(request, "ssid");
  credentials.passphrase = StructString(request, "password");
  if (credentials.passphrase.empty()) {
    credentials.passphrase = StructString(request, "passphrase");
  }
  return SubmitResponse(provisioner_->SubmitCredentials(credentials));
}

PortalResponse PortalRouter::ConnectForm(const std::string& body) const {
  WifiCredentials credentials;

  std::istringstream in(body);
  std::string        pair;
  while (std::getline(in, pair, '&')) {
    const auto eq    = pair.find('=');
    const auto key   = FormDecode(pair.substr(0, eq));
    const auto value = eq == std::string::npos ? std::string() : FormDecode(pair.substr(eq + 1));
    if (key == "ssid") {
      credentials.ssid = value;
    } else if (key == "password" || key == "passphrase") {
      credentials.passphrase = value;
    }
  }

  const auto result = provisioner_->SubmitCredentials(credentials);

  std::ostringstream html;
  html << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>DigiPlayer setup</title></head><body>\n"
       << "<h1>" << ToString(result.status) << "</h1>\n"
       << "<p>" << HtmlEscape(result.message) << "</p>\n"
       << "<p><a href=\"/\">Back</a></p>\n</body></html>\n";
  return {HttpStatusFor(result.status), "text/html; charset=utf-8", html.str()};
}

// ------------------------------------------------------------

CaptivePortalServer::CaptivePortalServer(std::string address, std::uint16_t port, std::shared_ptr<PortalRouter> router)
    : address_(std::move(address)), port_(port), router_(std::move(router)), acceptor_(io_) {
}

CaptivePortalServer::~CaptivePortalServer() {
  Stop();
}

void CaptivePortalServer::Start() {
  if (running_.load()) {
    return;
  }

  beast::error_code ec;
  const auto        address = asio::ip::make_address(address_, ec);
  if (ec) {
    throw util::ConfigError("invalid portal address " + address_ + ": " + ec.message());
  }

  const tcp::endpoint endpoint(address, port_);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(asio::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();

  running_.store(true);
  Accept();
  thread_ = std::thread([this] { io_.run(); });

  DIGIPLAYER_LOG_INFO("Captive portal listening", {StringField("address", address_), observability::IntField("port", port_)});
}

void CaptivePortalServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  io_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }

  beast::error_code ec;
  acceptor_.close(ec);
}

std::uint16_t CaptivePortalServer::Port() const {
  return port_;
}

void CaptivePortalServer::Accept() {
  acceptor_.async_accept(asio::make_strand(io_), [this](beast::error_code ec, tcp::socket socket) {
    if (!running_.load()) {
      return;
    }
    if (ec) {
      DIGIPLAYER_LOG_WARN("Portal accept failed", {StringField("error", ec.message())});
    } else {
      std::make_shared<PortalSession>(std::move(socket), router_)->Run();
    }
    Accept();
  });
}

// ------------------------------------------------------------

std::string FormDecode(const std::string& value) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
  };

  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() && hex(value[i + 1]) >= 0 && hex(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>((hex(value[i + 1]) << 4) | hex(value[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string HtmlEscape(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

} // namespace digiplayer::provisioning
