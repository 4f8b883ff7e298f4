#include "probes.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "internal/net/endpoints.hpp"
#include "internal/net/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace digiplayer::connectivity {

namespace {

constexpr unsigned long kRouteFlagUp = 0x0001;

namespace asio = boost::asio;
using asio::ip::tcp;

// Outlives the probe call: a lookup still running at the deadline completes
// against its own attempt on a later run.
struct ConnectAttempt {
  explicit ConnectAttempt(asio::io_context& io) : resolver(io), socket(io) {
  }

  tcp::resolver             resolver;
  tcp::socket               socket;
  boost::system::error_code result    = asio::error::would_block;
  bool                      abandoned = false;
};

// Resolve and connect share one deadline.
bool TcpConnect(asio::io_context& io, const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
  auto attempt = std::make_shared<ConnectAttempt>(io);

  attempt->resolver.async_resolve(
      host, std::to_string(port), tcp::resolver::numeric_service,
      [attempt](const boost::system::error_code& error, const tcp::resolver::results_type& endpoints) {
        if (attempt->abandoned) {
          return;
        }
        if (error) {
          attempt->result = error;
          return;
        }
        asio::async_connect(attempt->socket, endpoints,
                            [attempt](const boost::system::error_code& connect_error, const tcp::endpoint&) {
                              if (!attempt->abandoned) attempt->result = connect_error;
                            });
      });

  io.restart();
  io.run_for(timeout);

  const bool connected = attempt->result != asio::error::would_block && !attempt->result;
  if (attempt->result == asio::error::would_block) {
    DIGIPLAYER_LOG_DEBUG("Reachability check timed out", {observability::StringField("host", host)});
  }

  attempt->abandoned = true;
  boost::system::error_code ignored;
  attempt->resolver.cancel();
  attempt->socket.close(ignored);
  return connected;
}

} // namespace

bool HasDefaultRoute(const std::filesystem::path& route_table) {
  std::ifstream in(route_table);
  if (!in) {
    return false;
  }

  std::string line;
  std::getline(in, line);  // header

  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string        iface;
    std::string        destination;
    std::string        gateway;
    std::string        flags;
    if (!(fields >> iface >> destination >> gateway >> flags)) {
      continue;
    }
    if (destination != "00000000") {
      continue;
    }
    if (std::strtoul(flags.c_str(), nullptr, 16) & kRouteFlagUp) {
      return true;
    }
  }
  return false;
}

RouteTcpNetworkProbe::RouteTcpNetworkProbe(std::filesystem::path route_table, std::string host, std::uint16_t port,
                                           std::chrono::milliseconds timeout)
    : route_table_(std::move(route_table)), host_(std::move(host)), port_(port), timeout_(timeout) {
}

bool RouteTcpNetworkProbe::Reachable() {
  if (!HasDefaultRoute(route_table_)) {
    DIGIPLAYER_LOG_DEBUG("No default route");
    return false;
  }
  return TcpConnect(io_, host_, port_, timeout_);
}

HttpServerProbe::HttpServerProbe(std::shared_ptr<net::HttpTransport> transport, std::chrono::milliseconds timeout)
    : transport_(std::move(transport)), timeout_(timeout) {
}

bool HttpServerProbe::Reachable(const model::Registration& registration) {
  try {
    if (transport_->Get(net::HealthUrl(registration), timeout_).status == 200) {
      return true;
    }
  } catch (const util::TransportError& e) {
    DIGIPLAYER_LOG_DEBUG("Health probe failed", {observability::StringField("error", e.what())});
  }

  try {
    const auto status = transport_->Get(net::LookupUrl(registration), timeout_).status;
    return status == 200 || status == 404;
  } catch (const util::TransportError& e) {
    DIGIPLAYER_LOG_DEBUG("Lookup probe failed", {observability::StringField("error", e.what())});
  }
  return false;
}

} // namespace digiplayer::connectivity
