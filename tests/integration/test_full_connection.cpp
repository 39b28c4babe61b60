/**
 * @file test_full_connection.cpp
 * @brief Integration test for complete connection flows through P2pService
 */

#include <gtest/gtest.h>
#include <p2plink/p2plink.h>

#include "test_fakes.h"

#include <chrono>
#include <memory>

using namespace p2plink;
using namespace p2plink::fakes;

namespace {

const char *kPeer = "02:00:00:00:00:0a";
const char *kLaptop = "02:00:00:00:00:0c";

class IntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    driver = std::make_shared<FakeDriver>();
    arbiter = std::make_shared<FakeArbiter>();
    authorizer = std::make_shared<FakeAuthorizer>();
    ip = std::make_shared<FakeIpProvisioner>();
    tethering = std::make_shared<FakeTethering>();
    network = std::make_shared<FakeNetwork>();
    infra = std::make_shared<FakeInfraLink>();
    clock = std::make_shared<ManualClock>();

    config.load_defaults();
    config.device_name = "Living Room";
  }

  Collaborators collaborators() const {
    Collaborators deps;
    deps.driver = driver;
    deps.arbiter = arbiter;
    deps.authorizer = authorizer;
    deps.ip_provisioner = ip;
    deps.tethering = tethering;
    deps.network = network;
    deps.infra = infra;
    return deps;
  }

  void init() { ASSERT_TRUE(service.init(collaborators(), config, clock).is_ok()); }

  ClientId add_client(const std::shared_ptr<RecordingListener> &listener) {
    auto client = service.register_client(listener);
    EXPECT_TRUE(client.is_ok());
    service.dispatch_pending();
    return client.value();
  }

  /// Unwrap a queued request id and run the machine
  RequestId run(const Result<RequestId> &queued) {
    EXPECT_TRUE(queued.is_ok());
    service.dispatch_pending();
    return queued.is_ok() ? queued.value() : 0;
  }

  DriverEventSink &events() { return *driver->sink; }

  P2pState state() { return service.state_machine().current_state(); }

  std::shared_ptr<FakeDriver> driver;
  std::shared_ptr<FakeArbiter> arbiter;
  std::shared_ptr<FakeAuthorizer> authorizer;
  std::shared_ptr<FakeIpProvisioner> ip;
  std::shared_ptr<FakeTethering> tethering;
  std::shared_ptr<FakeNetwork> network;
  std::shared_ptr<FakeInfraLink> infra;
  std::shared_ptr<ManualClock> clock;
  P2pServiceConfig config;
  P2pService service;
};

} // namespace

// ============================================================================
// Service Lifecycle
// ============================================================================

TEST_F(IntegrationTest, Initialize) {
  EXPECT_FALSE(service.is_initialized());
  init();
  EXPECT_TRUE(service.is_initialized());
  EXPECT_FALSE(service.is_running());
  EXPECT_EQ(state(), P2pState::DisabledIdle);
}

TEST_F(IntegrationTest, DoubleInitialize) {
  init();
  auto again = service.init(collaborators(), config, clock);
  ASSERT_TRUE(again.is_error());
  EXPECT_EQ(again.error().code, ErrorCode::AlreadyInitialized);
}

TEST_F(IntegrationTest, InitRequiresCollaborators) {
  Collaborators deps = collaborators();
  deps.driver.reset();
  auto result = service.init(deps, config, clock);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
  EXPECT_FALSE(service.is_initialized());
}

TEST_F(IntegrationTest, InitRejectsBadConfig) {
  config.reject_wait_ms = 0;
  auto result = service.init(collaborators(), config, clock);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(IntegrationTest, RequestsBeforeInit) {
  auto listener = std::make_shared<RecordingListener>();
  auto client = service.register_client(listener);
  ASSERT_TRUE(client.is_error());
  EXPECT_EQ(client.error().code, ErrorCode::NotInitialized);

  auto discover = service.discover_peers(1);
  ASSERT_TRUE(discover.is_error());
  EXPECT_EQ(discover.error().code, ErrorCode::NotInitialized);
}

TEST_F(IntegrationTest, ClientRegistration) {
  init();
  auto missing = service.register_client(nullptr);
  ASSERT_TRUE(missing.is_error());
  EXPECT_EQ(missing.error().code, ErrorCode::InvalidArgument);

  auto unknown = service.discover_peers(42);
  ASSERT_TRUE(unknown.is_error());
  EXPECT_EQ(unknown.error().code, ErrorCode::UnknownClient);

  auto listener = std::make_shared<RecordingListener>();
  ClientId client = add_client(listener);
  EXPECT_EQ(listener->availability,
            (std::vector<P2pAvailability>{P2pAvailability::Disabled}));

  EXPECT_TRUE(service.unregister_client(client).is_ok());
  auto twice = service.unregister_client(client);
  ASSERT_TRUE(twice.is_error());
  EXPECT_EQ(twice.error().code, ErrorCode::UnknownClient);
}

TEST_F(IntegrationTest, ThreadedLifecycle) {
  init();
  ASSERT_TRUE(service.start().is_ok());
  EXPECT_TRUE(service.is_running());

  auto again = service.start();
  ASSERT_TRUE(again.is_error());
  EXPECT_EQ(again.error().code, ErrorCode::AlreadyInitialized);
  EXPECT_EQ(service.dispatch_pending(), 0u);

  service.shutdown();
  EXPECT_FALSE(service.is_running());
  EXPECT_TRUE(service.is_initialized());
}

// ============================================================================
// Request Validation
// ============================================================================

TEST_F(IntegrationTest, InvalidRequestsRejectedUpFront) {
  init();
  auto listener = std::make_shared<RecordingListener>();
  ClientId client = add_client(listener);

  ConnectConfig nobody;
  auto connect = service.connect(client, nobody);
  ASSERT_TRUE(connect.is_error());
  EXPECT_EQ(connect.error().code, ErrorCode::InvalidAddress);

  ConnectConfig half;
  half.network_name = "DIRECT-xy";
  auto fast = service.connect(client, half);
  ASSERT_TRUE(fast.is_error());
  EXPECT_EQ(fast.error().code, ErrorCode::InvalidPassphrase);

  auto name = service.set_device_name(client, "");
  ASSERT_TRUE(name.is_error());
  EXPECT_EQ(name.error().code, ErrorCode::InvalidDeviceName);

  auto usd = service.start_usd_service_discovery(client, UsdServiceConfig());
  ASSERT_TRUE(usd.is_error());
  EXPECT_EQ(usd.error().code, ErrorCode::InvalidUsdConfig);

  auto group = service.delete_persistent_group(client, -1);
  ASSERT_TRUE(group.is_error());
  EXPECT_EQ(group.error().code, ErrorCode::InvalidArgument);

  auto answer = service.set_connection_request_result(
      client, mac(kPeer), ConnectionRequestResponse::DeferShowPin);
  ASSERT_TRUE(answer.is_error());
  EXPECT_EQ(answer.error().code, ErrorCode::InvalidArgument);

  // Nothing reached the machine
  service.dispatch_pending();
  EXPECT_TRUE(listener->results.empty());
}

// ============================================================================
// Full Flows
// ============================================================================

TEST_F(IntegrationTest, ConnectToGroupOwnerAndDisconnect) {
  init();
  auto listener = std::make_shared<RecordingListener>();
  ClientId client = add_client(listener);

  RequestId activation = run(service.request_activation(client));
  EXPECT_EQ(listener->result_of(activation), ErrorCode::Success);
  ASSERT_EQ(state(), P2pState::Inactive);
  ASSERT_NE(driver->sink, nullptr);

  RequestId discover = run(service.discover_peers(client));
  EXPECT_EQ(listener->result_of(discover), ErrorCode::Success);

  events().on_device_found(make_peer(kPeer, "Television"));
  service.dispatch_pending();
  ASSERT_EQ(listener->peer_updates.size(), 1u);
  EXPECT_EQ(listener->peer_updates[0][0].name, "Television");

  ConnectConfig request;
  request.device_address = mac(kPeer);
  request.wps.method = WpsMethod::Pbc;
  RequestId connect = run(service.connect(client, request));
  EXPECT_EQ(listener->result_of(connect), ErrorCode::Success);
  EXPECT_EQ(state(), P2pState::ProvisionDiscovery);

  ProvisionDiscoveryEvent response;
  response.kind = ProvisionDiscoveryEvent::Kind::PbcResponse;
  response.device = make_peer(kPeer, "Television");
  events().on_provision_discovery(response);
  events().on_go_negotiation_success();
  service.dispatch_pending();
  EXPECT_EQ(state(), P2pState::GroupNegotiation);

  P2pGroup group;
  group.interface_name = "p2p-wlan0-0";
  group.network_name = "DIRECT-tv";
  group.role = GroupRole::Client;
  group.owner = make_peer(kPeer);
  events().on_group_formation_success();
  events().on_group_started(group);
  service.dispatch_pending();
  ASSERT_EQ(state(), P2pState::GroupCreated);

  IpProvisioningResult lease;
  lease.address = "192.168.49.33";
  lease.prefix_length = 24;
  lease.server_address = "192.168.49.1";
  service.on_ip_provisioning_pre_dhcp();
  service.on_ip_provisioning_success(lease);
  service.dispatch_pending();
  EXPECT_EQ(listener->connection,
            (std::vector<NetworkState>{NetworkState::Connected}));

  run(service.request_connection_info(client));
  ASSERT_TRUE(listener->last_info.has_value());
  EXPECT_TRUE(listener->last_info->group_formed);
  EXPECT_FALSE(listener->last_info->is_group_owner);
  EXPECT_EQ(listener->last_info->group_owner_address, "192.168.49.1");

  RequestId remove = run(service.remove_group(client));
  EXPECT_EQ(listener->result_of(remove), ErrorCode::Success);
  events().on_group_removed(group);
  service.dispatch_pending();

  EXPECT_EQ(state(), P2pState::Inactive);
  EXPECT_EQ(listener->connection.back(), NetworkState::Disconnected);
  EXPECT_EQ(ip->stops, 1);
  EXPECT_EQ(network->removed, (std::vector<std::string>{"p2p-wlan0-0"}));
}

TEST_F(IntegrationTest, GroupOwnerWithApprovingCompanion) {
  init();
  auto owner_app = std::make_shared<RecordingListener>();
  auto companion = std::make_shared<RecordingListener>();
  ClientId owner_client = add_client(owner_app);
  ClientId companion_client = add_client(companion);

  run(service.request_activation(owner_client));
  RequestId approver =
      run(service.add_external_approver(companion_client, MacAddress::broadcast()));
  EXPECT_EQ(companion->result_of(approver), ErrorCode::Success);

  RequestId create = run(service.create_group(owner_client));
  EXPECT_EQ(owner_app->result_of(create), ErrorCode::Success);

  P2pGroup group;
  group.interface_name = "p2p-wlan0-1";
  group.network_name = "DIRECT-lr";
  group.role = GroupRole::Owner;
  events().on_group_started(group);
  service.dispatch_pending();
  service.on_tethering_ready("p2p-wlan0-1");
  service.dispatch_pending();
  ASSERT_EQ(state(), P2pState::GroupCreated);
  EXPECT_EQ(owner_app->connection.size(), 1u);
  EXPECT_EQ(companion->connection.size(), 1u);

  // A laptop asks to join; the companion decides
  ProvisionDiscoveryEvent join;
  join.kind = ProvisionDiscoveryEvent::Kind::PbcRequest;
  join.device = make_peer(kLaptop, "Laptop");
  events().on_provision_discovery(join);
  service.dispatch_pending();
  EXPECT_EQ(state(), P2pState::UserAuthorizingJoin);
  ASSERT_EQ(companion->connection_requests.size(), 1u);
  EXPECT_EQ(companion->connection_requests[0].first, AuthorizationKind::Join);
  EXPECT_EQ(companion->connection_requests[0].second, mac(kLaptop));
  EXPECT_TRUE(owner_app->connection_requests.empty());
  EXPECT_TRUE(authorizer->requests.empty());

  // Only the approver may answer
  RequestId stranger = run(service.set_connection_request_result(
      owner_client, mac(kLaptop), ConnectionRequestResponse::Accept));
  EXPECT_EQ(owner_app->result_of(stranger), ErrorCode::ApproverNotFound);

  RequestId accept = run(service.set_connection_request_result(
      companion_client, mac(kLaptop), ConnectionRequestResponse::Accept));
  EXPECT_EQ(companion->result_of(accept), ErrorCode::Success);
  EXPECT_EQ(state(), P2pState::GroupCreated);
  EXPECT_EQ(driver->count("start_wps_pbc"), 1u);

  events().on_station_connected(make_peer(kLaptop, "Laptop"), "192.168.49.50");
  service.dispatch_pending();
  ASSERT_TRUE(service.state_machine().group().has_value());
  EXPECT_EQ(service.state_machine().group()->clients.size(), 1u);
  EXPECT_EQ(owner_app->connection.size(), 2u);
  EXPECT_EQ(companion->connection.size(), 2u);
}

TEST_F(IntegrationTest, LastClientLeavingShutsP2pDown) {
  init();
  auto listener = std::make_shared<RecordingListener>();
  ClientId client = add_client(listener);
  run(service.request_activation(client));
  ASSERT_EQ(state(), P2pState::Inactive);

  ASSERT_TRUE(service.unregister_client(client).is_ok());
  service.dispatch_pending();
  EXPECT_EQ(state(), P2pState::Inactive);

  clock->advance(std::chrono::milliseconds(config.idle_shutdown_timeout_ms));
  service.dispatch_pending();
  EXPECT_EQ(state(), P2pState::DisabledIdle);
  EXPECT_EQ(driver->count("teardown_interface"), 1u);
  EXPECT_EQ(arbiter->releases, 1);
}

TEST_F(IntegrationTest, RadioToggle) {
  init();
  auto listener = std::make_shared<RecordingListener>();
  ClientId client = add_client(listener);
  run(service.request_activation(client));

  service.on_radio_state_changed(false);
  service.dispatch_pending();
  EXPECT_EQ(state(), P2pState::DisabledIdle);
  EXPECT_EQ(listener->availability.back(), P2pAvailability::Unavailable);

  RequestId discover = run(service.discover_peers(client));
  EXPECT_EQ(listener->result_of(discover), ErrorCode::P2pDisabled);

  service.on_radio_state_changed(true);
  service.dispatch_pending();
  EXPECT_EQ(state(), P2pState::Inactive);
  EXPECT_EQ(listener->availability.back(), P2pAvailability::Enabled);
}
