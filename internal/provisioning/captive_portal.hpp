#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "digiplayer/agent/v1/status.pb.h"

namespace digiplayer::provisioning {

class Provisioner;

struct PortalResponse {
  unsigned    status = 200;
  std::string content_type{"application/json"};
  std::string body;
};

/*
  Request dispatch for the captive configuration endpoint.

    GET  /                 network selection form
    GET  /api/status       agent status (JSON)
    GET  /api/wifi/scan    {"networks": [...]}
    POST /api/wifi/connect {"ssid": ..., "password": ...}
    POST /connect          form-urlencoded ssid + password

  Submissions answer 202 accepted, 409 busy or 400 invalid.
*/
class PortalRouter {
 public:
  using StatusProvider = std::function<digiplayer::agent::v1::AgentStatus()>;

  PortalRouter(std::shared_ptr<Provisioner> provisioner, StatusProvider status);

  PortalResponse Handle(const std::string& method, const std::string& target, const std::string& content_type,
                        const std::string& body) const;

 private:
  PortalResponse Index() const;
  PortalResponse Status() const;
  PortalResponse Scan() const;
  PortalResponse ConnectJson(const std::string& body) const;
  PortalResponse ConnectForm(const std::string& body) const;

  std::shared_ptr<Provisioner> provisioner_;
  StatusProvider               status_;
};

/*
  HTTP/1.1 listener (Boost.Beast) on its own io_context thread, one
  request per connection. Runs for the whole agent lifetime so an
  operator can reach it over the access point or the LAN.
*/
class CaptivePortalServer {
 public:
  CaptivePortalServer(std::string address, std::uint16_t port, std::shared_ptr<PortalRouter> router);
  ~CaptivePortalServer();

  CaptivePortalServer(const CaptivePortalServer&)            = delete;
  CaptivePortalServer& operator=(const CaptivePortalServer&) = delete;

  // Throws ConfigError for a malformed address, boost::system::system_error
  // when it cannot be bound.
  void Start();
  void Stop();

  // Bound port; differs from the configured one when that was 0.
  std::uint16_t Port() const;

 private:
  void Accept();

  std::string                   address_;
  std::uint16_t                 port_;
  std::shared_ptr<PortalRouter> router_;

  boost::asio::io_context        io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::thread                    thread_;
  std::atomic<bool>              running_{false};
};

// application/x-www-form-urlencoded value decoding ('+' is a space).
std::string FormDecode(const std::string& value);

std::string HtmlEscape(const std::string& value);

} // namespace digiplayer::provisioning
