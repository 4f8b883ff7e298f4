#include "internal/heartbeat/heartbeat_client.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/heartbeat/backoff.hpp"
#include "internal/net/endpoints.hpp"
#include "test_fakes.hpp"

namespace {

using digiplayer::connectivity::ConnectivityMonitor;
using digiplayer::connectivity::ConnectivityState;
using digiplayer::heartbeat::HeartbeatBackoff;
using digiplayer::heartbeat::HeartbeatClient;
using digiplayer::heartbeat::HeartbeatContext;
using digiplayer::heartbeat::HeartbeatOptions;
using digiplayer::testing::FakeTransport;
using digiplayer::testing::FixedSystemInfo;
using digiplayer::testing::RecordedRequest;
using digiplayer::testing::Respond;

digiplayer::model::Registration MakeRegistration(std::optional<int64_t> player_id) {
  digiplayer::model::Registration registration;
  registration.device_id  = "DIGF17219CD1B2";
  registration.player_id  = player_id;
  registration.server_url = "https://cms.example.com";
  registration.api_prefix = "/api/v1";
  return registration;
}

google::protobuf::Struct ParseBody(const std::string& body) {
  google::protobuf::Struct object;
  const auto               status = google::protobuf::util::JsonStringToMessage(body, &object);
  assert(status.ok());
  return object;
}

struct Fixture {
  Fixture() : transport(std::make_shared<FakeTransport>()), client(transport, std::make_shared<FixedSystemInfo>(), HeartbeatOptions{}) {
  }

  std::shared_ptr<FakeTransport> transport;
  HeartbeatClient                client;
  HeartbeatBackoff               backoff{std::chrono::seconds(30), 10};
  ConnectivityMonitor            monitor{3};
};

void TestUrls() {
  const auto registration = MakeRegistration(12);
  assert(digiplayer::net::HeartbeatUrl(registration) == "https://cms.example.com/api/v1/players/12/heartbeat");
  assert(digiplayer::net::LookupUrl(registration) == "https://cms.example.com/api/v1/players/lookup?unique_id=DIGF17219CD1B2");
  assert(digiplayer::net::ResolveMediaUrl(registration, "/media/a.mp4") == "https://cms.example.com/media/a.mp4");
  assert(digiplayer::net::ResolveMediaUrl(registration, "https://cdn.example.com/b.png") == "https://cdn.example.com/b.png");
}

void TestHeartbeatBodyCarriesNumbersAndIdentity() {
  Fixture fixture;
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(200, "{}"); });

  HeartbeatContext context;
  context.last_command_id = "cmd-4";
  context.command_error   = std::string("cmd-4 screen_off: vcgencmd failed");

  fixture.client.Send(MakeRegistration(12), context, digiplayer::util::Now());

  const auto requests = fixture.transport->Requests();
  assert(requests.size() == 1);
  assert(requests[0].method == "POST");
  assert(requests[0].url == "https://cms.example.com/api/v1/players/12/heartbeat");

  const auto  body   = ParseBody(requests[0].body);
  const auto& fields = body.fields();
  assert(fields.at("unique_id").string_value() == "DIGF17219CD1B2");
  assert(fields.at("player_id").number_value() == 12);
  assert(fields.at("status").string_value() == "online");
  assert(fields.at("storage_total").number_value() == 32000);
  assert(fields.at("uptime_seconds").number_value() == 3600);
  assert(fields.at("last_command_id").string_value() == "cmd-4");
  assert(fields.at("command_error").string_value() == "cmd-4 screen_off: vcgencmd failed");
  assert(fields.count("current_content") == 0);
}

void TestCurrentContentIsReportedOnlyWhenChanged() {
  Fixture fixture;
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(200); });

  HeartbeatContext context;
  context.current_content = std::string("v3");

  const auto registration = MakeRegistration(12);
  fixture.client.Send(registration, context, digiplayer::util::Now());
  fixture.client.Send(registration, context, digiplayer::util::Now());
  fixture.client.ResetContentReport();
  fixture.client.Send(registration, context, digiplayer::util::Now());

  const auto requests = fixture.transport->Requests();
  assert(requests.size() == 3);
  assert(ParseBody(requests[0].body).fields().count("current_content") == 1);
  assert(ParseBody(requests[1].body).fields().count("current_content") == 0);
  assert(ParseBody(requests[2].body).fields().at("current_content").string_value() == "v3");
}

void TestUnregisteredDeviceUsesLookup() {
  Fixture fixture;
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(404, R"({"detail": "not found"})"); });

  const auto outcome = fixture.client.Cycle(MakeRegistration(std::nullopt), HeartbeatContext{}, fixture.backoff, fixture.monitor,
                                            digiplayer::util::Now());
  assert(outcome.delivered);
  assert(outcome.response.registered == false);
  assert(!outcome.response.player_id);
  assert(fixture.transport->Count("GET") == 1);
  assert(fixture.transport->Count("POST") == 0);
  assert(!fixture.backoff.BackingOff());
}

void TestLookupAdoptsPlayerIdOnlyWhenRegistered() {
  Fixture fixture;
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(200, R"({"registered": true, "player_id": 77})"); });

  auto response = fixture.client.Send(MakeRegistration(std::nullopt), HeartbeatContext{}, digiplayer::util::Now());
  assert(response.player_id == 77);

  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(200, R"({"registered": false, "player_id": 77})"); });
  response = fixture.client.Send(MakeRegistration(std::nullopt), HeartbeatContext{}, digiplayer::util::Now());
  assert(!response.player_id);
}

void TestServerErrorCountsAsFailure() {
  Fixture fixture;
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(500, "oops"); });

  const auto outcome =
      fixture.client.Cycle(MakeRegistration(12), HeartbeatContext{}, fixture.backoff, fixture.monitor, digiplayer::util::Now());
  assert(!outcome.delivered);
  assert(outcome.error.find("500") != std::string::npos);
  assert(fixture.backoff.ConsecutiveFailures() == 1);
  assert(!outcome.degraded_reported);

  bool threw = false;
  try {
    fixture.client.Send(MakeRegistration(12), HeartbeatContext{}, digiplayer::util::Now());
  } catch (const digiplayer::util::TransportError& e) {
    threw = true;
    assert(e.HttpStatus() == 500L);
  }
  assert(threw);
}

void TestThreeTimeoutsDegradeServer() {
  Fixture fixture;
  fixture.monitor.Observe({true, true});
  assert(fixture.monitor.State() == ConnectivityState::kServerOnline);

  // no handler: every call fails like a timeout
  const auto registration = MakeRegistration(12);
  auto first  = fixture.client.Cycle(registration, HeartbeatContext{}, fixture.backoff, fixture.monitor, digiplayer::util::Now());
  auto second = fixture.client.Cycle(registration, HeartbeatContext{}, fixture.backoff, fixture.monitor, digiplayer::util::Now());
  assert(!first.degraded_reported && !second.degraded_reported);
  assert(fixture.monitor.State() == ConnectivityState::kServerOnline);
  assert(fixture.backoff.NextDelay() == std::chrono::seconds(120));

  auto third = fixture.client.Cycle(registration, HeartbeatContext{}, fixture.backoff, fixture.monitor, digiplayer::util::Now());
  assert(third.degraded_reported);
  assert(fixture.monitor.State() == ConnectivityState::kNetworkNoServer);
  assert(fixture.backoff.NextDelay() == std::chrono::seconds(240));

  // recovery resets the backoff
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(200); });
  auto recovered = fixture.client.Cycle(registration, HeartbeatContext{}, fixture.backoff, fixture.monitor, digiplayer::util::Now());
  assert(recovered.delivered);
  assert(fixture.backoff.NextDelay() == std::chrono::seconds(30));
}

void TestResponseCommandsAreReturned() {
  Fixture fixture;
  fixture.transport->SetHandler(
      [](const RecordedRequest&) { return Respond(200, R"({"pending_command": {"id": "c-9", "kind": "refresh"}})"); });

  const auto outcome =
      fixture.client.Cycle(MakeRegistration(12), HeartbeatContext{}, fixture.backoff, fixture.monitor, digiplayer::util::Now());
  assert(outcome.delivered);
  assert(outcome.response.commands.size() == 1);
  assert(outcome.response.commands[0].command_id == "c-9");
}

void TestMalformedResponseIsFailure() {
  Fixture fixture;
  fixture.transport->SetHandler([](const RecordedRequest&) { return Respond(200, "<html>captive login</html>"); });

  const auto outcome =
      fixture.client.Cycle(MakeRegistration(12), HeartbeatContext{}, fixture.backoff, fixture.monitor, digiplayer::util::Now());
  assert(!outcome.delivered);
  assert(fixture.backoff.ConsecutiveFailures() == 1);
}

} // namespace

int main() {
  TestUrls();
  TestHeartbeatBodyCarriesNumbersAndIdentity();
  TestCurrentContentIsReportedOnlyWhenChanged();
  TestUnregisteredDeviceUsesLookup();
  TestLookupAdoptsPlayerIdOnlyWhenRegistered();
  TestServerErrorCountsAsFailure();
  TestThreeTimeoutsDegradeServer();
  TestResponseCommandsAreReturned();
  TestMalformedResponseIsFailure();

  std::cout << "digiplayer_unit_heartbeat_client: pass\n";
  return 0;
}
