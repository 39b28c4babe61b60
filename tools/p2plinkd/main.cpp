/**
 * @file main.cpp
 * @brief p2plinkd: runs the P2P service against the local wpa_supplicant
 *
 * Usage: p2plinkd [-c config] [-i iface]... [-d] [-v]
 *
 * Registers one client that keeps the interface active and discovers
 * peers. Incoming requests are accepted or rejected according to
 * auto_accept_requests in the configuration.
 */

#define P2PLINK_LOG_TAG "p2plinkd"

#include "p2plink/p2plink.h"
#include "platform/linux/wpa_supplicant_driver.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <getopt.h>
#include <thread>

using namespace p2plink;

namespace {

std::atomic<bool> g_running{true};

void on_signal(int) { g_running = false; }

// ============================================================================
// Daemon Collaborators
// ============================================================================

/// Answers authorization requests from configuration
class PolicyAuthorizer : public UserAuthorizer {
public:
  PolicyAuthorizer(P2pService &service, bool auto_accept)
      : service_(service), auto_accept_(auto_accept) {}

  void request_authorization(const AuthorizationRequest &request) override {
    AuthorizationResponse response;
    response.kind = request.kind;
    response.peer = request.peer.address;
    response.decision = auto_accept_ ? AuthorizationDecision::Accept
                                     : AuthorizationDecision::Reject;
    P2PLINK_LOGI("%s request from %s (%s): %s",
                 authorization_kind_name(request.kind),
                 request.peer.address.to_string().c_str(),
                 request.peer.name.c_str(),
                 authorization_decision_name(response.decision));
    service_.on_authorization_decision(response);
  }

  void show_pin(const P2pDevice &peer, const std::string &pin) override {
    P2PLINK_LOGI("Enter PIN %s on %s", pin.c_str(),
                 peer.address.to_string().c_str());
  }

  void dismiss(AuthorizationKind kind) override {
    P2PLINK_LOGD("%s dialog dismissed", authorization_kind_name(kind));
  }

private:
  P2pService &service_;
  bool auto_accept_;
};

/// This daemon is the only radio user
class ImmediateArbiter : public ResourceArbiter {
public:
  ArbitrationResult request_interface() override {
    return ArbitrationResult::Proceed;
  }
  void release_interface() override {}
};

/// Leaves client addressing to the system's DHCP client
class SystemIpProvisioner : public IpProvisioner {
public:
  Result<void> start(const std::string &interface_name,
                     IpProvisioningMode mode) override {
    P2PLINK_LOGI("Addressing of %s (%s) left to the system", interface_name.c_str(),
                 ip_provisioning_mode_name(mode));
    return Result<void>::ok();
  }
  void stop() override {}
};

/// Reports the owner interface ready at once; the DHCP server runs outside
class ExternalTethering : public TetheringCoordinator {
public:
  explicit ExternalTethering(P2pService &service) : service_(service) {}

  Result<void> request_tethering(const std::string &interface_name,
                                 const std::string &server_address) override {
    P2PLINK_LOGI("Group owner %s at %s", interface_name.c_str(),
                 server_address.c_str());
    service_.on_tethering_ready(interface_name);
    return Result<void>::ok();
  }

  void stop_tethering(const std::string &interface_name) override {
    P2PLINK_LOGD("Tethering on %s stopped", interface_name.c_str());
  }

private:
  P2pService &service_;
};

class SystemNetwork : public LocalNetworkManager {
public:
  Result<void> add_interface_routes(const std::string &interface_name,
                                    const IpProvisioningResult &result) override {
    P2PLINK_LOGD("%zu routes on %s", result.routes.size(),
                 interface_name.c_str());
    return Result<void>::ok();
  }
  void remove_interface(const std::string &) override {}
};

// ============================================================================
// Console Client
// ============================================================================

class ConsoleListener : public ClientListener {
public:
  void on_command_result(RequestId request,
                         const Result<void> &result) override {
    if (result.is_error()) {
      P2PLINK_LOGW("Request %u failed: %s", request,
                   result.error().to_string().c_str());
    }
  }

  void on_p2p_state_changed(P2pAvailability availability) override {
    P2PLINK_LOGI("P2P %s", p2p_availability_name(availability));
  }

  void on_peers_changed(const std::vector<P2pDevice> &peers) override {
    P2PLINK_LOGI("%zu peers", peers.size());
    for (const auto &peer : peers) {
      P2PLINK_LOGD("  %s %s (%s)", peer.address.to_string().c_str(),
                   peer.name.c_str(), peer_status_name(peer.status));
    }
  }

  void on_connection_changed(NetworkState state, const ConnectionInfo &info,
                             const std::optional<P2pGroup> &group) override {
    P2PLINK_LOGI("Connection %s%s%s", network_state_name(state),
                 info.is_group_owner ? " (owner)" : "",
                 group ? (" " + group->to_string()).c_str() : "");
  }

  void on_group_creation_failed(const MacAddress &peer,
                                ConnectionFailure reason) override {
    P2PLINK_LOGW("Group with %s failed: %s", peer.to_string().c_str(),
                 connection_failure_name(reason));
  }
};

void print_usage(const char *argv0) {
  std::fprintf(stderr,
               "Usage: %s [-c config] [-i iface]... [-d] [-v]\n"
               "  -c  configuration file\n"
               "  -i  station interface to use (repeatable)\n"
               "  -d  debug logging\n"
               "  -v  print version and exit\n",
               argv0);
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::vector<std::string> interfaces;
  bool debug = false;

  int opt;
  while ((opt = getopt(argc, argv, "c:i:dvh")) != -1) {
    switch (opt) {
    case 'c':
      config_path = optarg;
      break;
    case 'i':
      interfaces.emplace_back(optarg);
      break;
    case 'd':
      debug = true;
      break;
    case 'v':
      std::printf("p2plinkd %s\n", get_version().version_string);
      return 0;
    default:
      print_usage(argv[0]);
      return opt == 'h' ? 0 : 2;
    }
  }

  log_set_level(debug ? LogLevel::Debug : LogLevel::Info);

  ConfigManager config_manager;
  auto loaded = config_manager.init(config_path);
  if (loaded.is_error()) {
    P2PLINK_LOGE("Configuration: %s", loaded.error().to_string().c_str());
    return 1;
  }
  P2pServiceConfig config = config_manager.get();

  P2pService service;

  Collaborators deps;
  deps.driver = std::make_shared<WpaSupplicantDriver>(interfaces);
  deps.arbiter = std::make_shared<ImmediateArbiter>();
  deps.authorizer =
      std::make_shared<PolicyAuthorizer>(service, config.auto_accept_requests);
  deps.ip_provisioner = std::make_shared<SystemIpProvisioner>();
  deps.tethering = std::make_shared<ExternalTethering>(service);
  deps.network = std::make_shared<SystemNetwork>();
  deps.config_store = &config_manager;

  auto initialized = service.init(deps, config);
  if (initialized.is_error()) {
    P2PLINK_LOGE("Init failed: %s", initialized.error().to_string().c_str());
    return 1;
  }
  auto started = service.start();
  if (started.is_error()) {
    P2PLINK_LOGE("Start failed: %s", started.error().to_string().c_str());
    return 1;
  }

  auto client = service.register_client(std::make_shared<ConsoleListener>());
  if (client.is_error()) {
    P2PLINK_LOGE("Client registration failed: %s",
                 client.error().to_string().c_str());
    service.shutdown();
    return 1;
  }
  const ClientId id = client.value();

  auto activated = service.request_activation(id);
  auto discovering = service.discover_peers(id);
  if (activated.is_error() || discovering.is_error()) {
    P2PLINK_LOGE("Could not queue startup requests");
    service.shutdown();
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  P2PLINK_LOGI("p2plinkd %s running", get_version().version_string);
  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  P2PLINK_LOGI("Shutting down");
  auto released = service.release_activation(id);
  if (released.is_error()) {
    P2PLINK_LOGW("release_activation: %s", released.error().to_string().c_str());
  }
  // Give the machine a moment to disable the interface
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  service.shutdown();
  return 0;
}
