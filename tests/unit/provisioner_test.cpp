#include "internal/provisioning/provisioner.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/provisioning/captive_portal.hpp"
#include "internal/storage/durable_file.hpp"
#include "test_fakes.hpp"

namespace {

using digiplayer::agent::v1::AgentStatus;
using digiplayer::provisioning::FormDecode;
using digiplayer::provisioning::HtmlEscape;
using digiplayer::provisioning::PortalRouter;
using digiplayer::provisioning::Provisioner;
using digiplayer::provisioning::SubmitStatus;
using digiplayer::provisioning::WifiCredentials;
using digiplayer::testing::FakeAccessPoint;
using digiplayer::testing::FakeProcessRunner;
using digiplayer::testing::FakeWifi;

constexpr char kDeviceId[] = "DIGF17219CD1B2";

struct Fixture {
  Fixture() {
    access_point = std::make_shared<FakeAccessPoint>();
    wifi         = std::make_shared<FakeWifi>();
    provisioner  = std::make_shared<Provisioner>(access_point, wifi, "DigiPlayer-", [this] { joined.fetch_add(1); });
    router       = std::make_shared<PortalRouter>(provisioner, [] {
      AgentStatus status;
      status.set_device_id(kDeviceId);
      status.set_connectivity("NO_NETWORK");
      return status;
    });
  }

  std::shared_ptr<FakeAccessPoint> access_point;
  std::shared_ptr<FakeWifi>        wifi;
  std::shared_ptr<Provisioner>     provisioner;
  std::shared_ptr<PortalRouter>    router;
  std::atomic<int>                 joined{0};
};

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestActivateScansThenStartsAccessPoint() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);

  assert(f.access_point->Running());
  assert(f.access_point->Ssid() == std::string("DigiPlayer-") + kDeviceId);
  assert(f.provisioner->Active());

  const auto networks = f.provisioner->Networks();
  assert(networks.size() == 2);
  assert(networks[0] == "Office");

  const auto snapshot = f.provisioner->Snapshot();
  assert(snapshot.active);
  assert(!snapshot.applying);
  assert(snapshot.ssid == std::string("DigiPlayer-") + kDeviceId);
}

void TestDeactivateStopsAccessPoint() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);
  f.provisioner->Deactivate();
  assert(!f.access_point->Running());
  assert(!f.provisioner->Active());
  assert(f.access_point->Stops() == 1);
}

void TestActivateFailurePropagates() {
  Fixture f;
  f.access_point->fail_start = true;

  bool threw = false;
  try {
    f.provisioner->Activate(kDeviceId);
  } catch (const digiplayer::util::ExecutionError&) {
    threw = true;
  }
  assert(threw);
  assert(!f.access_point->Running());
}

void TestInvalidCredentialsAreRejected() {
  Fixture f;
  assert(f.provisioner->SubmitCredentials({"", "password1"}).status == SubmitStatus::kInvalid);
  assert(f.provisioner->SubmitCredentials({std::string(33, 'a'), "password1"}).status == SubmitStatus::kInvalid);
  assert(f.provisioner->SubmitCredentials({"Office", "short"}).status == SubmitStatus::kInvalid);
  assert(f.provisioner->SubmitCredentials({"Office", std::string(64, 'p')}).status == SubmitStatus::kInvalid);
  assert(f.provisioner->SubmitCredentials({"Off\"ice", "password1"}).status == SubmitStatus::kInvalid);
  assert(f.provisioner->SubmitCredentials({"Office", "pass\nword1"}).status == SubmitStatus::kInvalid);
  assert(f.wifi->Applied().empty());

  // open networks carry no passphrase
  assert(!digiplayer::provisioning::ValidateCredentials({"Cafe", ""}).has_value());
  assert(!digiplayer::provisioning::ValidateCredentials({std::string(32, 'a'), std::string(63, 'p')}).has_value());
}

void TestSubmissionWhileInactiveIsRejected() {
  Fixture f;
  const auto before = f.provisioner->SubmitCredentials({"Office", "password1"});
  assert(before.status == SubmitStatus::kInvalid);
  assert(!f.provisioner->Applying());

  const auto routed =
      f.router->Handle("POST", "/api/wifi/connect", "application/json", R"({"ssid":"Office","password":"password1"})");
  assert(routed.status == 400);

  f.provisioner->Activate(kDeviceId);
  f.provisioner->Deactivate();
  assert(f.provisioner->SubmitCredentials({"Office", "password1"}).status == SubmitStatus::kInvalid);

  f.provisioner->WaitIdle();
  assert(f.wifi->Applied().empty());
  assert(f.joined.load() == 0);
}

void TestSecondSubmissionWhileApplyingIsBusy() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);
  f.wifi->Hold();

  const auto first = f.provisioner->SubmitCredentials({"Office", "password1"});
  assert(first.status == SubmitStatus::kAccepted);
  assert(first.message == "connecting to Office");
  assert(f.provisioner->Applying());

  const auto second = f.provisioner->SubmitCredentials({"Guest", "password2"});
  assert(second.status == SubmitStatus::kBusy);

  f.wifi->Release();
  f.provisioner->WaitIdle();
  assert(!f.provisioner->Applying());

  const auto applied = f.wifi->Applied();
  assert(applied.size() == 1);
  assert(applied[0] == "Office");
}

void TestFailedApplyRearmsAccessPoint() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);
  f.wifi->FailNext(true);

  assert(f.provisioner->SubmitCredentials({"Office", "password1"}).status == SubmitStatus::kAccepted);
  f.provisioner->WaitIdle();

  assert(f.access_point->Starts() == 2);
  assert(f.access_point->Stops() == 1);
  assert(f.access_point->Running());
  assert(f.provisioner->Active());
  assert(f.joined.load() == 0);
  assert(Contains(f.provisioner->Snapshot().last_error, "association timed out"));

  // the slot is free again
  f.wifi->FailNext(false);
  assert(f.provisioner->SubmitCredentials({"Office", "password1"}).status == SubmitStatus::kAccepted);
  f.provisioner->WaitIdle();
  assert(f.joined.load() == 1);
}

void TestSuccessfulApplyNotifiesAndDisarms() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);

  assert(f.provisioner->SubmitCredentials({"Office", "password1"}).status == SubmitStatus::kAccepted);
  f.provisioner->WaitIdle();

  assert(f.joined.load() == 1);
  assert(!f.access_point->Running());
  assert(f.access_point->Starts() == 1);
  assert(!f.provisioner->Active());
  assert(f.provisioner->Snapshot().last_error.empty());
}

void TestRouterServesFormAndStatus() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);

  const auto index = f.router->Handle("GET", "/", "", "");
  assert(index.status == 200);
  assert(Contains(index.content_type, "text/html"));
  assert(Contains(index.body, kDeviceId));
  assert(Contains(index.body, "<option value=\"Office\">"));

  const auto status = f.router->Handle("GET", "/api/status?fresh=1", "", "");
  assert(status.status == 200);
  assert(status.content_type == "application/json");
  assert(Contains(status.body, "\"device_id\""));
  assert(Contains(status.body, kDeviceId));

  const auto scan = f.router->Handle("GET", "/api/wifi/scan", "", "");
  assert(scan.status == 200);
  assert(Contains(scan.body, "\"networks\""));
  assert(Contains(scan.body, "\"Guest\""));
}

void TestRouterRejectsUnknownRoutesAndMethods() {
  Fixture f;
  assert(f.router->Handle("GET", "/missing", "", "").status == 404);
  assert(f.router->Handle("POST", "/api/status", "application/json", "{}").status == 404);
  assert(f.router->Handle("DELETE", "/", "", "").status == 405);
  assert(f.router->Handle("PUT", "/api/wifi/connect", "application/json", "{}").status == 405);
}

void TestRouterJsonConnect() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);

  const auto bad = f.router->Handle("POST", "/api/wifi/connect", "application/json", "not json");
  assert(bad.status == 400);
  assert(Contains(bad.body, "\"invalid\""));

  const auto invalid = f.router->Handle("POST", "/api/wifi/connect", "application/json", R"({"ssid":"","password":"password1"})");
  assert(invalid.status == 400);

  f.wifi->Hold();
  const auto accepted =
      f.router->Handle("POST", "/api/wifi/connect", "application/json", R"({"ssid":"Office","password":"password1"})");
  assert(accepted.status == 202);
  assert(Contains(accepted.body, "\"accepted\""));
  assert(Contains(accepted.body, "connecting to Office"));

  const auto busy =
      f.router->Handle("POST", "/api/wifi/connect", "application/json", R"({"ssid":"Guest","passphrase":"password2"})");
  assert(busy.status == 409);
  assert(Contains(busy.body, "\"busy\""));

  f.wifi->Release();
  f.provisioner->WaitIdle();
  assert(f.joined.load() == 1);
}

void TestRouterFormConnect() {
  Fixture f;
  f.provisioner->Activate(kDeviceId);

  const auto response = f.router->Handle("POST", "/connect", "application/x-www-form-urlencoded",
                                         "ssid=My+Home%21&password=p%40ss+word");
  assert(response.status == 202);
  assert(Contains(response.content_type, "text/html"));
  f.provisioner->WaitIdle();

  const auto applied = f.wifi->Applied();
  assert(applied.size() == 1);
  assert(applied[0] == "My Home!");

  // the JSON endpoint also takes form bodies
  const auto form = f.router->Handle("POST", "/api/wifi/connect", "application/x-www-form-urlencoded; charset=UTF-8",
                                     "ssid=Guest&password=short");
  assert(form.status == 400);
}

void TestFormDecodeAndHtmlEscape() {
  assert(FormDecode("a+b%20c") == "a b c");
  assert(FormDecode("100%") == "100%");
  assert(FormDecode("%zz") == "%zz");
  assert(FormDecode("%C3%A4") == "\xC3\xA4");
  assert(HtmlEscape("<a href=\"x\">'&'</a>") == "&lt;a href=&quot;x&quot;&gt;&#39;&amp;&#39;&lt;/a&gt;");
}

void TestScanOutputParsing() {
  const auto nmcli = digiplayer::provisioning::ParseNmcliScan("Office\nCafe\\:Bar\n\nOffice\nGuest\n");
  assert(nmcli.size() == 3);
  assert(nmcli[1] == "Cafe:Bar");

  const auto iwlist = digiplayer::provisioning::ParseIwlistScan(
      "wlan0     Scan completed :\n"
      "          Cell 01 - Address: 00:11:22:33:44:55\n"
      "                    ESSID:\"Office\"\n"
      "          Cell 02 - Address: 00:11:22:33:44:56\n"
      "                    ESSID:\"\"\n"
      "          Cell 03 - Address: 00:11:22:33:44:57\n"
      "                    ESSID:\"Guest\"\n");
  assert(iwlist.size() == 2);
  assert(iwlist[0] == "Office");
  assert(iwlist[1] == "Guest");
}

void TestNmcliBackendsIssueExpectedCommands() {
  auto runner = std::make_shared<FakeProcessRunner>();

  digiplayer::provisioning::AccessPointOptions ap_options;
  ap_options.passphrase = "setup-pass";
  digiplayer::provisioning::NmcliAccessPoint access_point(runner, ap_options);
  access_point.Start("DigiPlayer-DIG1");
  assert(access_point.Running());

  assert(runner->calls.size() == 3);
  const auto& add = runner->calls[1];
  assert(add[1] == "connection" && add[2] == "add");
  assert(std::find(add.begin(), add.end(), "DigiPlayer-DIG1") != add.end());
  assert(std::find(add.begin(), add.end(), "setup-pass") != add.end());
  assert(runner->calls[2] == (std::vector<std::string>{"nmcli", "connection", "up", "digiplayer-ap"}));

  access_point.Stop();
  assert(!access_point.Running());
  assert(runner->calls.back() == (std::vector<std::string>{"nmcli", "connection", "down", "digiplayer-ap"}));

  runner->calls.clear();
  digiplayer::provisioning::NmcliWifiConfigurator wifi(runner, {});
  wifi.Apply({"Office", "password1"});
  const auto& connect = runner->calls.back();
  assert(connect[0] == "nmcli");
  assert(std::find(connect.begin(), connect.end(), "Office") != connect.end());
  assert(std::find(connect.begin(), connect.end(), "password1") != connect.end());

  runner->handler = [](const std::vector<std::string>&) {
    digiplayer::util::ProcessResult failed;
    failed.exit_code = 10;
    failed.output    = "Error: No network with SSID 'Office' found.";
    return failed;
  };
  bool threw = false;
  try {
    wifi.Apply({"Office", "password1"});
  } catch (const digiplayer::util::ExecutionError&) {
    threw = true;
  }
  assert(threw);
  assert(wifi.Scan().empty());
}

void TestHostapdBackendWritesConfig() {
  const auto dir    = digiplayer::testing::FreshDir("digiplayer_provisioner_test", "hostapd");
  auto       runner = std::make_shared<FakeProcessRunner>();

  digiplayer::provisioning::AccessPointOptions options;
  options.hostapd_conf = dir / "hostapd.conf";
  digiplayer::provisioning::HostapdAccessPoint access_point(runner, options);
  access_point.Start("DigiPlayer-DIG1");

  const auto written = digiplayer::storage::ReadFileContents(options.hostapd_conf);
  assert(written.has_value());
  assert(Contains(*written, "ssid=DigiPlayer-DIG1\n"));
  assert(Contains(*written, "interface=wlan0\n"));
  assert(!Contains(*written, "wpa_passphrase"));
  assert(runner->calls.size() == 2);
  assert(runner->calls[0] == (std::vector<std::string>{"systemctl", "restart", "hostapd"}));

  const auto secured = digiplayer::provisioning::RenderHostapdConfig("wlan1", "Setup", "setup-pass");
  assert(Contains(secured, "wpa_passphrase=setup-pass\n"));
  assert(Contains(secured, "interface=wlan1\n"));
}

void TestWpaSupplicantBlockRendering() {
  const auto secured = digiplayer::provisioning::RenderWpaNetworkBlock({"Office", "password1"});
  assert(Contains(secured, "ssid=\"Office\""));
  assert(Contains(secured, "psk=\"password1\""));

  const auto open = digiplayer::provisioning::RenderWpaNetworkBlock({"Cafe", ""});
  assert(Contains(open, "key_mgmt=NONE"));
  assert(!Contains(open, "psk="));
}

} // namespace

int main() {
  TestActivateScansThenStartsAccessPoint();
  TestDeactivateStopsAccessPoint();
  TestActivateFailurePropagates();
  TestInvalidCredentialsAreRejected();
  TestSubmissionWhileInactiveIsRejected();
  TestSecondSubmissionWhileApplyingIsBusy();
  TestFailedApplyRearmsAccessPoint();
  TestSuccessfulApplyNotifiesAndDisarms();
  TestRouterServesFormAndStatus();
  TestRouterRejectsUnknownRoutesAndMethods();
  TestRouterJsonConnect();
  TestRouterFormConnect();
  TestFormDecodeAndHtmlEscape();
  TestScanOutputParsing();
  TestNmcliBackendsIssueExpectedCommands();
  TestHostapdBackendWritesConfig();
  TestWpaSupplicantBlockRendering();

  std::cout << "digiplayer_unit_provisioner: pass\n";
  return 0;
}
