#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "internal/model/registration.hpp"

namespace digiplayer::net {
class HttpTransport;
}

namespace digiplayer::connectivity {

class NetworkProbe {
 public:
  virtual ~NetworkProbe() = default;

  virtual bool Reachable() = 0;
};

class ServerProbe {
 public:
  virtual ~ServerProbe() = default;

  virtual bool Reachable(const model::Registration& registration) = 0;
};

// True when the kernel routing table has a default (0.0.0.0/0) route that is up.
bool HasDefaultRoute(const std::filesystem::path& route_table);

/*
  Local network: a default route plus a TCP connect to a well-known host
  (DNS port by default). Name lookup and connect share the timeout.
*/
class RouteTcpNetworkProbe final : public NetworkProbe {
 public:
  RouteTcpNetworkProbe(std::filesystem::path route_table, std::string host, std::uint16_t port,
                       std::chrono::milliseconds timeout);

  bool Reachable() override;

 private:
  std::filesystem::path     route_table_;
  std::string               host_;
  std::uint16_t             port_;
  std::chrono::milliseconds timeout_;
  boost::asio::io_context   io_;
};

/*
  Control server: GET /health answering 200. When that fails the lookup
  endpoint is tried, where 200 and 404 both prove the server is answering.
*/
class HttpServerProbe final : public ServerProbe {
 public:
  HttpServerProbe(std::shared_ptr<net::HttpTransport> transport, std::chrono::milliseconds timeout);

  bool Reachable(const model::Registration& registration) override;

 private:
  std::shared_ptr<net::HttpTransport> transport_;
  std::chrono::milliseconds           timeout_;
};

} // namespace digiplayer::connectivity
