/**
 * @file test_state_machine.cpp
 * @brief Unit tests for the P2P connection state machine
 *
 * The machine runs on the test thread: messages are drained with
 * dispatch_pending() and timers fire by advancing a ManualClock.
 */

#include <gtest/gtest.h>
#include <p2plink/state_machine.h>

#include "test_fakes.h"

#include <chrono>
#include <memory>

using namespace p2plink;
using namespace p2plink::fakes;

namespace {

const char *kPeer = "02:00:00:00:00:0a";
const char *kOther = "02:00:00:00:00:0b";
const char *kSelf = "02:00:00:00:00:01";

constexpr ClientId kClient = 1;

ConnectConfig connect_config(const char *address) {
  ConnectConfig config;
  config.device_address = mac(address);
  config.wps.method = WpsMethod::Pbc;
  return config;
}

ProvisionDiscoveryEvent pd_event(ProvisionDiscoveryEvent::Kind kind,
                                 const char *address,
                                 const std::string &pin = "") {
  ProvisionDiscoveryEvent event;
  event.kind = kind;
  event.device = make_peer(address);
  event.pin = pin;
  return event;
}

P2pGroup client_group() {
  P2pGroup group;
  group.interface_name = "p2p-wlan0-0";
  group.network_name = "DIRECT-ab-peer";
  group.role = GroupRole::Client;
  group.owner = make_peer(kPeer);
  return group;
}

P2pGroup owner_group() {
  P2pGroup group;
  group.interface_name = "p2p-wlan0-1";
  group.network_name = "DIRECT-cd-self";
  group.role = GroupRole::Owner;
  return group;
}

AuthorizationResponse decision(AuthorizationKind kind, const char *peer,
                               AuthorizationDecision answer,
                               const std::string &pin = "") {
  AuthorizationResponse response;
  response.kind = kind;
  response.peer = mac(peer);
  response.decision = answer;
  response.pin = pin;
  return response;
}

ConnectionRequestResult approver_answer(const MacAddress &address,
                                        ConnectionRequestResponse response) {
  ConnectionRequestResult result;
  result.address = address;
  result.response = response;
  return result;
}

PersistentGroupProfile stored_group(int net_id, const char *owner,
                                    std::vector<MacAddress> clients = {}) {
  PersistentGroupProfile profile;
  profile.net_id = net_id;
  profile.owner_address = mac(owner);
  profile.network_name = "DIRECT-xy-stored";
  profile.clients = std::move(clients);
  return profile;
}

class P2pStateMachineTest : public ::testing::Test {
protected:
  void SetUp() override {
    driver = std::make_shared<FakeDriver>();
    arbiter = std::make_shared<FakeArbiter>();
    authorizer = std::make_shared<FakeAuthorizer>();
    ip = std::make_shared<FakeIpProvisioner>();
    tethering = std::make_shared<FakeTethering>();
    network = std::make_shared<FakeNetwork>();
    infra = std::make_shared<FakeInfraLink>();
    listener = std::make_shared<RecordingListener>();
    clock = std::make_shared<ManualClock>();

    config.load_defaults();
    config.device_name = "test-device";
  }

  /// Build and start the machine, then register the test client
  void attach() {
    Collaborators deps;
    deps.driver = driver;
    deps.arbiter = arbiter;
    deps.authorizer = authorizer;
    deps.ip_provisioner = ip;
    deps.tethering = tethering;
    deps.network = network;
    deps.infra = infra;
    sm = std::make_unique<P2pStateMachine>(deps, config, clock);
    sm->start();

    sm->post(Message(Cmd::ClientAttached)
                 .from(kClient, 0)
                 .with(std::shared_ptr<ClientListener>(listener)));
    pump();
  }

  void enable() {
    attach();
    RequestId id = send(Message(Cmd::RequestActivation));
    ASSERT_EQ(listener->result_of(id), ErrorCode::Success);
    ASSERT_EQ(sm->current_state(), P2pState::Inactive);
  }

  /// Post a client request and drain the queue
  RequestId send(Message msg) { return send_as(kClient, std::move(msg)); }

  RequestId send_as(ClientId client, Message msg) {
    RequestId id = ++last_request_;
    msg.from(client, id);
    sm->post(std::move(msg));
    pump();
    return id;
  }

  /// Register another client with its own listener
  void attach_client(ClientId client,
                     const std::shared_ptr<RecordingListener> &other) {
    post(Message(Cmd::ClientAttached)
             .from(client, 0)
             .with(std::shared_ptr<ClientListener>(other)));
  }

  void post(Message msg) {
    sm->post(std::move(msg));
    pump();
  }

  void pump() { sm->dispatch_pending(); }

  void elapse(int ms) {
    clock->advance(std::chrono::milliseconds(ms));
    pump();
  }

  void found(const P2pDevice &device) {
    sm->on_device_found(device);
    pump();
  }

  /// Outgoing connection to kPeer, up to provision discovery
  void connect_to_peer() {
    enable();
    found(make_peer(kPeer));
    RequestId id = send(Message(Cmd::Connect).with(connect_config(kPeer)));
    ASSERT_EQ(listener->result_of(id), ErrorCode::Success);
    ASSERT_EQ(sm->current_state(), P2pState::ProvisionDiscovery);
  }

  /// Outgoing connection to kPeer, up to GO negotiation
  void negotiate_with_peer() {
    connect_to_peer();
    sm->on_provision_discovery(
        pd_event(ProvisionDiscoveryEvent::Kind::PbcResponse, kPeer));
    pump();
    ASSERT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  }

  /// Autonomous group with this device as owner
  void create_group() {
    enable();
    RequestId id = send(Message(Cmd::CreateGroup));
    ASSERT_EQ(listener->result_of(id), ErrorCode::Success);
    sm->on_group_started(owner_group());
    pump();
    post(Message(Cmd::TetheringReady).with(owner_group().interface_name));
    ASSERT_EQ(sm->current_state(), P2pState::GroupCreated);
  }

  /// Incoming GO negotiation request from @p peer
  void incoming_request(const char *peer) {
    sm->on_go_negotiation_request(connect_config(peer));
    pump();
  }

  std::shared_ptr<FakeDriver> driver;
  std::shared_ptr<FakeArbiter> arbiter;
  std::shared_ptr<FakeAuthorizer> authorizer;
  std::shared_ptr<FakeIpProvisioner> ip;
  std::shared_ptr<FakeTethering> tethering;
  std::shared_ptr<FakeNetwork> network;
  std::shared_ptr<FakeInfraLink> infra;
  std::shared_ptr<RecordingListener> listener;
  std::shared_ptr<ManualClock> clock;
  P2pServiceConfig config;
  std::unique_ptr<P2pStateMachine> sm;

private:
  RequestId last_request_ = 0;
};

} // namespace

// ============================================================================
// State Hierarchy
// ============================================================================

TEST(P2pStateTest, Parents) {
  EXPECT_FALSE(p2p_state_parent(P2pState::Root).has_value());
  EXPECT_EQ(p2p_state_parent(P2pState::DisabledIdle), P2pState::Disabled);
  EXPECT_EQ(p2p_state_parent(P2pState::RejectWait), P2pState::GroupCreating);
  EXPECT_EQ(p2p_state_parent(P2pState::OngoingGroupRemoval),
            P2pState::GroupCreated);
  EXPECT_EQ(p2p_state_parent(P2pState::GroupCreated), P2pState::Enabled);
}

TEST(P2pStateTest, Within) {
  EXPECT_TRUE(p2p_state_is_within(P2pState::ProvisionDiscovery,
                                  P2pState::GroupCreating));
  EXPECT_TRUE(p2p_state_is_within(P2pState::ProvisionDiscovery,
                                  P2pState::Enabled));
  EXPECT_TRUE(p2p_state_is_within(P2pState::Inactive, P2pState::Inactive));
  EXPECT_FALSE(p2p_state_is_within(P2pState::Inactive, P2pState::Disabled));
  EXPECT_STREQ(p2p_state_name(P2pState::UserAuthorizingJoin),
               "UserAuthorizingJoin");
}

// ============================================================================
// Enabling and Disabling
// ============================================================================

TEST_F(P2pStateMachineTest, StartsDisabled) {
  attach();
  EXPECT_EQ(sm->current_state(), P2pState::DisabledIdle);
  EXPECT_TRUE(sm->is_in_state(P2pState::Disabled));
  EXPECT_EQ(sm->availability(), P2pAvailability::Disabled);
  EXPECT_EQ(arbiter->requests, 0);
  EXPECT_EQ(listener->availability,
            (std::vector<P2pAvailability>{P2pAvailability::Disabled}));
}

TEST_F(P2pStateMachineTest, ActivationEnables) {
  enable();
  EXPECT_EQ(listener->availability,
            (std::vector<P2pAvailability>{P2pAvailability::Disabled,
                                          P2pAvailability::Enabled}));
  EXPECT_EQ(arbiter->requests, 1);
  EXPECT_EQ(driver->count("setup_interface"), 1u);
  EXPECT_EQ(sm->this_device().address, mac(kSelf));
  EXPECT_EQ(sm->this_device().name, "test-device");
  EXPECT_EQ(sm->this_device().status, PeerStatus::Available);
  EXPECT_EQ(driver->last_device_name, "test-device");
  EXPECT_EQ(driver->count("list_networks"), 1u);
  EXPECT_EQ(listener->persistent_group_updates, 1);
}

TEST_F(P2pStateMachineTest, ActionsRefusedWhileDisabled) {
  attach();
  RequestId discover = send(Message(Cmd::DiscoverPeers));
  RequestId remove = send(Message(Cmd::DeletePersistentGroup, 0));
  EXPECT_EQ(listener->result_of(discover), ErrorCode::P2pDisabled);
  EXPECT_EQ(listener->result_of(remove), ErrorCode::P2pDisabled);
  EXPECT_EQ(driver->count("start_discovery"), 0u);
}

TEST_F(P2pStateMachineTest, NotSupported) {
  driver->supported = false;
  attach();
  EXPECT_EQ(sm->current_state(), P2pState::NotSupported);

  RequestId activate = send(Message(Cmd::RequestActivation));
  EXPECT_EQ(listener->result_of(activate), ErrorCode::Success);
  EXPECT_EQ(sm->current_state(), P2pState::NotSupported);

  RequestId discover = send(Message(Cmd::DiscoverPeers));
  EXPECT_EQ(listener->result_of(discover), ErrorCode::P2pUnsupported);
  EXPECT_EQ(arbiter->requests, 0);
}

TEST_F(P2pStateMachineTest, ArbiterAbort) {
  arbiter->answer = ArbitrationResult::Abort;
  attach();
  send(Message(Cmd::RequestActivation));

  EXPECT_EQ(sm->current_state(), P2pState::DisabledIdle);
  EXPECT_EQ(sm->availability(), P2pAvailability::Unavailable);
  EXPECT_EQ(driver->count("setup_interface"), 0u);
}

TEST_F(P2pStateMachineTest, ArbiterWaitsForUser) {
  arbiter->answer = ArbitrationResult::WaitForUser;
  attach();
  send(Message(Cmd::RequestActivation));
  EXPECT_EQ(sm->current_state(), P2pState::WaitingForResourceArbitration);

  post(Message(Cmd::ArbitrationResult, 1));
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(sm->availability(), P2pAvailability::Enabled);
}

TEST_F(P2pStateMachineTest, ArbiterUserRefuses) {
  arbiter->answer = ArbitrationResult::WaitForUser;
  attach();
  send(Message(Cmd::RequestActivation));

  post(Message(Cmd::ArbitrationResult, 0));
  EXPECT_EQ(sm->current_state(), P2pState::DisabledIdle);
  EXPECT_EQ(sm->availability(), P2pAvailability::Unavailable);
}

TEST_F(P2pStateMachineTest, InterfaceSetupFailure) {
  driver->fail("setup_interface");
  attach();
  send(Message(Cmd::RequestActivation));

  EXPECT_EQ(sm->current_state(), P2pState::DisabledIdle);
  EXPECT_EQ(sm->availability(), P2pAvailability::Unavailable);
  EXPECT_EQ(arbiter->releases, 1);
}

TEST_F(P2pStateMachineTest, IdleShutdownAfterRelease) {
  enable();
  RequestId release = send(Message(Cmd::ReleaseActivation));
  EXPECT_EQ(listener->result_of(release), ErrorCode::Success);

  elapse(config.idle_shutdown_timeout_ms - 1);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);

  elapse(1);
  EXPECT_EQ(sm->current_state(), P2pState::DisabledIdle);
  EXPECT_EQ(sm->availability(), P2pAvailability::Disabled);
  EXPECT_EQ(driver->count("teardown_interface"), 1u);
  EXPECT_EQ(arbiter->releases, 1);

  send(Message(Cmd::RequestActivation));
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(driver->count("setup_interface"), 2u);
}

TEST_F(P2pStateMachineTest, ActivationCancelsIdleShutdown) {
  enable();
  send(Message(Cmd::ReleaseActivation));
  elapse(1000);
  EXPECT_EQ(sm->loop().delayed_count(), 1u);
  send(Message(Cmd::RequestActivation));
  EXPECT_EQ(sm->loop().delayed_count(), 0u);

  elapse(config.idle_shutdown_timeout_ms);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(driver->count("teardown_interface"), 0u);
}

TEST_F(P2pStateMachineTest, RadioLossDisablesUntilRestored) {
  enable();
  post(Message(Cmd::RadioStateChanged, 0));

  EXPECT_EQ(sm->current_state(), P2pState::DisabledIdle);
  EXPECT_EQ(sm->availability(), P2pAvailability::Unavailable);
  EXPECT_EQ(driver->count("teardown_interface"), 1u);

  post(Message(Cmd::RadioStateChanged, 1));
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(listener->availability.back(), P2pAvailability::Enabled);
}

TEST_F(P2pStateMachineTest, DeferredWhileDisablingReplayInOrder) {
  enable();
  driver->disconnect_on_teardown = false;
  post(Message(Cmd::RadioStateChanged, 0));
  ASSERT_EQ(sm->current_state(), P2pState::Disabling);

  RequestId release = send(Message(Cmd::ReleaseActivation));
  post(Message(Cmd::RadioStateChanged, 1));
  RequestId activate = send(Message(Cmd::RequestActivation));
  EXPECT_EQ(sm->deferred_count(), 3u);
  EXPECT_FALSE(listener->answered(release));
  EXPECT_FALSE(listener->answered(activate));

  const size_t answered = listener->answer_order.size();
  sm->on_driver_disconnected();
  pump();

  EXPECT_EQ(sm->deferred_count(), 0u);
  ASSERT_EQ(listener->answer_order.size(), answered + 2);
  EXPECT_EQ(listener->answer_order[answered], release);
  EXPECT_EQ(listener->answer_order[answered + 1], activate);

  // Release, radio back, then activation: ends enabled again
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(driver->count("setup_interface"), 2u);
  EXPECT_EQ(listener->availability.back(), P2pAvailability::Enabled);
}

TEST_F(P2pStateMachineTest, DriverLossFailsAttemptAndReenables) {
  connect_to_peer();
  sm->on_driver_disconnected();
  pump();

  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].first, mac(kPeer));
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::Disabled);
  EXPECT_EQ(driver->count("teardown_interface"), 0u);
  EXPECT_EQ(arbiter->releases, 1);

  // The client is still activated, so the interface comes back
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(driver->count("setup_interface"), 2u);
  EXPECT_TRUE(sm->peers().empty());
}

// ============================================================================
// Discovery and Peers
// ============================================================================

TEST_F(P2pStateMachineTest, PeersFoundAndLost) {
  enable();
  found(make_peer(kPeer));
  found(make_peer(kSelf));
  EXPECT_EQ(sm->peers().size(), 1u);
  ASSERT_EQ(listener->peer_updates.size(), 1u);
  EXPECT_EQ(listener->peer_updates[0][0].address, mac(kPeer));

  sm->on_device_lost(make_peer(kPeer));
  pump();
  EXPECT_TRUE(sm->peers().empty());
  EXPECT_EQ(listener->peer_updates.size(), 2u);
}

TEST_F(P2pStateMachineTest, DiscoveryStartsAndStops) {
  enable();
  RequestId id = send(Message(Cmd::DiscoverPeers));
  EXPECT_EQ(listener->result_of(id), ErrorCode::Success);
  EXPECT_TRUE(sm->discovery_active());
  EXPECT_EQ(driver->last_discovery.timeout_s, config.discovery_timeout_s);

  sm->on_find_stopped();
  pump();
  EXPECT_FALSE(sm->discovery_active());
  EXPECT_EQ(listener->discovery, (std::vector<bool>{true, false}));
}

TEST_F(P2pStateMachineTest, DiscoveryFailureReported) {
  enable();
  driver->fail("start_discovery", ErrorCode::DriverTimeout);
  RequestId id = send(Message(Cmd::DiscoverPeers));
  EXPECT_EQ(listener->result_of(id), ErrorCode::DriverTimeout);
  EXPECT_FALSE(sm->discovery_active());
}

TEST_F(P2pStateMachineTest, Queries) {
  enable();
  found(make_peer(kPeer));
  send(Message(Cmd::RequestPeers));
  send(Message(Cmd::RequestConnectionInfo));

  ASSERT_TRUE(listener->last_peers.has_value());
  EXPECT_EQ(listener->last_peers->size(), 1u);
  ASSERT_TRUE(listener->last_info.has_value());
  EXPECT_FALSE(listener->last_info->group_formed);
}

// ============================================================================
// Outgoing Connection
// ============================================================================

TEST_F(P2pStateMachineTest, ConnectToUnknownPeer) {
  enable();
  RequestId id = send(Message(Cmd::Connect).with(connect_config(kPeer)));
  EXPECT_EQ(listener->result_of(id), ErrorCode::PeerNotFound);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
}

TEST_F(P2pStateMachineTest, ConnectAsClient) {
  connect_to_peer();
  EXPECT_EQ(driver->count("provision_discovery"), 1u);
  EXPECT_EQ(driver->count("stop_discovery"), 1u);
  EXPECT_TRUE(sm->session_active());
  EXPECT_EQ(sm->peers().get(mac(kPeer))->status, PeerStatus::Invited);

  sm->on_provision_discovery(
      pd_event(ProvisionDiscoveryEvent::Kind::PbcResponse, kPeer));
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->last_connect.device_address, mac(kPeer));
  EXPECT_EQ(driver->last_connect.wps.method, WpsMethod::Pbc);
  EXPECT_FALSE(driver->last_join);

  sm->on_group_started(client_group());
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::GroupCreated);
  EXPECT_EQ(ip->started, (std::vector<std::string>{"p2p-wlan0-0"}));
  EXPECT_EQ(sm->peers().get(mac(kPeer))->status, PeerStatus::Connected);
  EXPECT_EQ(sm->this_device().status, PeerStatus::Connected);
  EXPECT_TRUE(sm->connection_info().group_formed);
  EXPECT_FALSE(sm->connection_info().is_group_owner);
  EXPECT_FALSE(sm->session_active());

  // Connected is announced once the address is provisioned
  EXPECT_TRUE(listener->connection.empty());

  IpProvisioningResult lease;
  lease.address = "192.168.49.20";
  lease.prefix_length = 24;
  lease.server_address = "192.168.49.1";
  post(Message(Cmd::IpProvisioningSuccess).with(lease));
  EXPECT_EQ(listener->connection,
            (std::vector<NetworkState>{NetworkState::Connected}));
  EXPECT_EQ(network->routes_added, 1);
  EXPECT_EQ(sm->connection_info().group_owner_address, "192.168.49.1");
}

TEST_F(P2pStateMachineTest, RemoveClientGroup) {
  negotiate_with_peer();
  sm->on_group_started(client_group());
  pump();
  ASSERT_EQ(sm->current_state(), P2pState::GroupCreated);

  RequestId id = send(Message(Cmd::RemoveGroup));
  EXPECT_EQ(listener->result_of(id), ErrorCode::Success);
  EXPECT_EQ(sm->current_state(), P2pState::OngoingGroupRemoval);
  EXPECT_EQ(driver->last_group_removed, "p2p-wlan0-0");

  sm->on_group_removed(client_group());
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_FALSE(sm->group().has_value());
  EXPECT_EQ(ip->stops, 1);
  EXPECT_EQ(network->removed, (std::vector<std::string>{"p2p-wlan0-0"}));
  EXPECT_FALSE(sm->peers().contains(mac(kPeer)));
  EXPECT_EQ(sm->this_device().status, PeerStatus::Available);
  EXPECT_EQ(listener->connection.back(), NetworkState::Disconnected);
  EXPECT_EQ(driver->count("flush"), 1u);

  ASSERT_EQ(driver->idle_timeouts.size(), 2u);
  EXPECT_EQ(driver->idle_timeouts[0].second, config.group_idle_time_s);
  EXPECT_EQ(driver->idle_timeouts[1].second, 0);
}

TEST_F(P2pStateMachineTest, ClientIpProvisioningFailure) {
  negotiate_with_peer();
  ip->fail_start = true;
  sm->on_group_started(client_group());
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::CreateGroupFailed);
  EXPECT_EQ(driver->last_group_removed, "p2p-wlan0-0");
}

TEST_F(P2pStateMachineTest, FastConnectWithCredentials) {
  enable();
  ConnectConfig fast;
  fast.network_name = "DIRECT-ab-tv";
  fast.passphrase = "secret123";
  RequestId id = send(Message(Cmd::Connect).with(fast));

  EXPECT_EQ(listener->result_of(id), ErrorCode::Success);
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_TRUE(driver->last_group_add.join);
  ASSERT_TRUE(driver->last_group_add.config.has_value());
  EXPECT_EQ(driver->last_group_add.config->network_name, "DIRECT-ab-tv");
  EXPECT_EQ(driver->count("provision_discovery"), 0u);
}

TEST_F(P2pStateMachineTest, DisplayPinFromProvisionDiscovery) {
  connect_to_peer();
  sm->on_provision_discovery(
      pd_event(ProvisionDiscoveryEvent::Kind::ShowPin, kPeer, "12345670"));
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  ASSERT_EQ(authorizer->pins.size(), 1u);
  EXPECT_EQ(authorizer->pins[0].second, "12345670");
  EXPECT_EQ(driver->last_connect.wps.method, WpsMethod::Display);
  EXPECT_EQ(driver->last_connect.wps.pin, "12345670");
}

TEST_F(P2pStateMachineTest, KeypadPinAskedFromUser) {
  connect_to_peer();
  sm->on_provision_discovery(
      pd_event(ProvisionDiscoveryEvent::Kind::EnterPin, kPeer));
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].wps, WpsMethod::Keypad);

  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Negotiation, kPeer,
                          AuthorizationDecision::Accept, "12345670")));
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->last_connect.wps.method, WpsMethod::Keypad);
  EXPECT_EQ(driver->last_connect.wps.pin, "12345670");
}

TEST_F(P2pStateMachineTest, ProvisionDiscoveryEventsForOtherPeersIgnored) {
  connect_to_peer();
  sm->on_provision_discovery(
      pd_event(ProvisionDiscoveryEvent::Kind::PbcResponse, kOther));
  sm->on_provision_discovery_failure(mac(kOther),
                                     ProvisionDiscoveryStatus::Rejected);
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::ProvisionDiscovery);
  EXPECT_EQ(driver->count("connect"), 0u);
}

// ============================================================================
// Connection Failures
// ============================================================================

TEST_F(P2pStateMachineTest, BusyWhileConnecting) {
  connect_to_peer();
  RequestId discover = send(Message(Cmd::DiscoverPeers));
  RequestId create = send(Message(Cmd::CreateGroup));
  RequestId again = send(Message(Cmd::Connect).with(connect_config(kPeer)));

  EXPECT_EQ(listener->result_of(discover), ErrorCode::Busy);
  EXPECT_EQ(listener->result_of(create), ErrorCode::Busy);
  EXPECT_EQ(listener->result_of(again), ErrorCode::Busy);
  EXPECT_EQ(sm->current_state(), P2pState::ProvisionDiscovery);
}

TEST_F(P2pStateMachineTest, GroupCreationTimeout) {
  connect_to_peer();
  elapse(config.group_creating_timeout_ms - 1);
  EXPECT_EQ(sm->current_state(), P2pState::ProvisionDiscovery);

  elapse(1);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].first, mac(kPeer));
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::Timeout);
  EXPECT_EQ(listener->connection,
            (std::vector<NetworkState>{NetworkState::Failed}));
  EXPECT_EQ(driver->count("cancel_connect"), 1u);
  EXPECT_FALSE(sm->peers().contains(mac(kPeer)));

  // Discovery resumes after a failed attempt
  EXPECT_EQ(driver->count("start_discovery"), 1u);
  EXPECT_TRUE(sm->discovery_active());
}

TEST_F(P2pStateMachineTest, ProvisionDiscoveryFailure) {
  connect_to_peer();
  sm->on_provision_discovery_failure(mac(kPeer),
                                     ProvisionDiscoveryStatus::Timeout);
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].second,
            ConnectionFailure::ProvisionDiscoveryFailure);
}

TEST_F(P2pStateMachineTest, CancelConnect) {
  connect_to_peer();
  RequestId id = send(Message(Cmd::CancelConnect));

  EXPECT_EQ(listener->result_of(id), ErrorCode::Success);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::Cancel);
}

TEST_F(P2pStateMachineTest, CancelConnectTwiceFailsOnce) {
  connect_to_peer();
  RequestId first = send(Message(Cmd::CancelConnect));
  RequestId second = send(Message(Cmd::CancelConnect));

  EXPECT_EQ(listener->result_of(first), ErrorCode::Success);
  EXPECT_EQ(listener->result_of(second), ErrorCode::Success);
  EXPECT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->connection,
            (std::vector<NetworkState>{NetworkState::Failed}));
  EXPECT_EQ(driver->count("cancel_connect"), 1u);

  // The first attempt's timer is harmless once the attempt is over
  elapse(config.group_creating_timeout_ms);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(driver->count("cancel_connect"), 1u);
}

TEST_F(P2pStateMachineTest, StaleGroupCreationTimerIgnored) {
  connect_to_peer();
  elapse(1000);
  send(Message(Cmd::CancelConnect));
  ASSERT_EQ(listener->failures.size(), 1u);

  // Second attempt, started 1s after the first
  found(make_peer(kPeer));
  RequestId id = send(Message(Cmd::Connect).with(connect_config(kPeer)));
  ASSERT_EQ(listener->result_of(id), ErrorCode::Success);
  ASSERT_EQ(sm->current_state(), P2pState::ProvisionDiscovery);

  elapse(config.group_creating_timeout_ms - 1000);
  EXPECT_EQ(sm->current_state(), P2pState::ProvisionDiscovery);
  EXPECT_EQ(listener->failures.size(), 1u);

  elapse(1000);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 2u);
  EXPECT_EQ(listener->failures[1].second, ConnectionFailure::Timeout);
}

TEST_F(P2pStateMachineTest, NegotiationFailure) {
  negotiate_with_peer();
  sm->on_go_negotiation_failure(P2pStatus::BothGoIntent15);
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::NegotiationFailure);
}

TEST_F(P2pStateMachineTest, PeerLostDuringConnectionKeptUntilFailure) {
  connect_to_peer();
  sm->on_device_lost(make_peer(kPeer));
  pump();
  EXPECT_TRUE(sm->peers().contains(mac(kPeer)));
  EXPECT_TRUE(sm->peers().is_lost_during_connection(mac(kPeer)));

  send(Message(Cmd::CancelConnect));
  EXPECT_FALSE(sm->peers().contains(mac(kPeer)));
}

TEST_F(P2pStateMachineTest, GroupWithoutOwnerFailsAttempt) {
  negotiate_with_peer();
  P2pGroup started = client_group();
  started.owner.reset();
  sm->on_group_started(started);
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].first, mac(kPeer));
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::CreateGroupFailed);
  EXPECT_EQ(driver->count("group_remove"), 1u);
  EXPECT_EQ(driver->last_group_removed, "p2p-wlan0-0");
  EXPECT_TRUE(ip->started.empty());
  EXPECT_FALSE(sm->group().has_value());
}

// ============================================================================
// Incoming Requests
// ============================================================================

TEST_F(P2pStateMachineTest, IncomingNegotiationAccepted) {
  enable();
  found(make_peer(kPeer));
  incoming_request(kPeer);

  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  EXPECT_TRUE(sm->session_active());
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].kind, AuthorizationKind::Negotiation);
  EXPECT_EQ(authorizer->requests[0].peer.address, mac(kPeer));

  // Answers for another peer are stale
  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Negotiation, kOther,
                          AuthorizationDecision::Accept)));
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);

  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Negotiation, kPeer,
                          AuthorizationDecision::Accept)));
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->last_connect.device_address, mac(kPeer));
  EXPECT_EQ(sm->peers().get(mac(kPeer))->status, PeerStatus::Invited);
  EXPECT_EQ(authorizer->dismissed,
            (std::vector<AuthorizationKind>{AuthorizationKind::Negotiation}));
}

TEST_F(P2pStateMachineTest, RejectedPeerHeldOffDuringRejectWait) {
  enable();
  found(make_peer(kPeer));
  incoming_request(kPeer);
  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Negotiation, kPeer,
                          AuthorizationDecision::Reject)));

  EXPECT_EQ(sm->current_state(), P2pState::RejectWait);
  EXPECT_EQ(driver->count("reject"), 1u);
  EXPECT_FALSE(sm->session_active());
  EXPECT_TRUE(sm->pending_config().is_empty());
  EXPECT_EQ(sm->peers().get(mac(kPeer))->status, PeerStatus::Available);
  EXPECT_TRUE(listener->failures.empty());

  // Same peer again is dropped, others wait their turn
  incoming_request(kPeer);
  EXPECT_EQ(sm->deferred_count(), 0u);
  incoming_request(kOther);
  EXPECT_EQ(sm->deferred_count(), 1u);
  RequestId connect = send(Message(Cmd::Connect).with(connect_config(kPeer)));
  EXPECT_EQ(sm->deferred_count(), 2u);
  EXPECT_FALSE(listener->answered(connect));

  elapse(config.reject_wait_ms);
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  EXPECT_EQ(sm->pending_config().device_address, mac(kOther));
  EXPECT_EQ(listener->result_of(connect), ErrorCode::Busy);
  EXPECT_EQ(sm->deferred_count(), 0u);
}

TEST_F(P2pStateMachineTest, InvitationAcceptedJoinsGroup) {
  enable();
  found(make_peer(kPeer));

  P2pGroup invitation = client_group();
  sm->on_invitation_received(invitation);
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingInviteRequest);
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].kind, AuthorizationKind::Invitation);

  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Invitation, kPeer,
                          AuthorizationDecision::Accept)));
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_TRUE(driver->last_join);
  EXPECT_EQ(driver->last_connect.device_address, mac(kPeer));
}

TEST_F(P2pStateMachineTest, UnexpectedTemporaryGroupRemoved) {
  enable();
  sm->on_group_started(client_group());
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(driver->last_group_removed, "p2p-wlan0-0");
}

// ============================================================================
// External Approvers
// ============================================================================

TEST_F(P2pStateMachineTest, ExternalApproverDecides) {
  enable();
  found(make_peer(kPeer));
  RequestId add = send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  EXPECT_EQ(listener->result_of(add), ErrorCode::Success);
  EXPECT_EQ(listener->approvers_attached, (std::vector<MacAddress>{mac(kPeer)}));

  incoming_request(kPeer);
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  ASSERT_EQ(listener->connection_requests.size(), 1u);
  EXPECT_EQ(listener->connection_requests[0].first,
            AuthorizationKind::Negotiation);
  EXPECT_TRUE(authorizer->requests.empty());

  RequestId unknown = send(
      Message(Cmd::SetConnectionRequestResult)
          .with(approver_answer(mac(kOther), ConnectionRequestResponse::Accept)));
  EXPECT_EQ(listener->result_of(unknown), ErrorCode::ApproverNotFound);

  // A wildcard registration lets the client answer for anyone
  send(Message(Cmd::AddExternalApprover).with(MacAddress::broadcast()));
  RequestId mismatch = send(
      Message(Cmd::SetConnectionRequestResult)
          .with(approver_answer(mac(kOther), ConnectionRequestResponse::Accept)));
  EXPECT_EQ(listener->result_of(mismatch), ErrorCode::ApproverMismatch);

  RequestId accept = send(
      Message(Cmd::SetConnectionRequestResult)
          .with(approver_answer(mac(kPeer), ConnectionRequestResponse::Accept)));
  EXPECT_EQ(listener->result_of(accept), ErrorCode::Success);
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->count("connect"), 1u);
}

TEST_F(P2pStateMachineTest, ConnectionRequestResultWithoutRequest) {
  enable();
  send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  RequestId id = send(
      Message(Cmd::SetConnectionRequestResult)
          .with(approver_answer(mac(kPeer), ConnectionRequestResponse::Accept)));
  EXPECT_EQ(listener->result_of(id), ErrorCode::InvalidState);
}

TEST_F(P2pStateMachineTest, ApproverDeferToLocalDialog) {
  enable();
  send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  incoming_request(kPeer);

  send(Message(Cmd::SetConnectionRequestResult)
           .with(approver_answer(mac(kPeer),
                                 ConnectionRequestResponse::DeferToService)));
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].peer.address, mac(kPeer));
}

TEST_F(P2pStateMachineTest, ApproverRemoval) {
  enable();
  RequestId missing =
      send(Message(Cmd::RemoveExternalApprover).with(mac(kPeer)));
  EXPECT_EQ(listener->result_of(missing), ErrorCode::ApproverNotFound);

  send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  RequestId removed =
      send(Message(Cmd::RemoveExternalApprover).with(mac(kPeer)));
  EXPECT_EQ(listener->result_of(removed), ErrorCode::Success);
  ASSERT_EQ(listener->approvers_detached.size(), 1u);
  EXPECT_EQ(listener->approvers_detached[0].second,
            ApproverDetachReason::Removed);
}

TEST_F(P2pStateMachineTest, DetachedApproverHandsBackToUser) {
  enable();
  send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  incoming_request(kPeer);
  EXPECT_TRUE(authorizer->requests.empty());

  post(Message(Cmd::ClientDetached).from(kClient, 0));
  ASSERT_EQ(listener->approvers_detached.size(), 1u);
  EXPECT_EQ(listener->approvers_detached[0].second,
            ApproverDetachReason::ClientClosed);
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].kind, AuthorizationKind::Negotiation);
}

TEST_F(P2pStateMachineTest, OnlyDelegatedApproverMayAnswer) {
  constexpr ClientId kSecond = 2;
  auto second = std::make_shared<RecordingListener>();
  enable();
  attach_client(kSecond, second);
  found(make_peer(kPeer));

  send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  send_as(kSecond, Message(Cmd::AddExternalApprover).with(MacAddress::broadcast()));

  // The exact registration wins over the wildcard
  incoming_request(kPeer);
  ASSERT_EQ(listener->connection_requests.size(), 1u);
  EXPECT_TRUE(second->connection_requests.empty());

  RequestId intruder = send_as(
      kSecond,
      Message(Cmd::SetConnectionRequestResult)
          .with(approver_answer(mac(kPeer), ConnectionRequestResponse::Accept)));
  EXPECT_EQ(second->result_of(intruder), ErrorCode::ApproverMismatch);
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  EXPECT_EQ(driver->count("connect"), 0u);

  RequestId owner = send(
      Message(Cmd::SetConnectionRequestResult)
          .with(approver_answer(mac(kPeer), ConnectionRequestResponse::Accept)));
  EXPECT_EQ(listener->result_of(owner), ErrorCode::Success);
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
}

TEST_F(P2pStateMachineTest, ApproverCannotAnswerAfterDeferring) {
  enable();
  send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  incoming_request(kPeer);
  send(Message(Cmd::SetConnectionRequestResult)
           .with(approver_answer(mac(kPeer),
                                 ConnectionRequestResponse::DeferToService)));
  ASSERT_EQ(authorizer->requests.size(), 1u);

  RequestId late = send(
      Message(Cmd::SetConnectionRequestResult)
          .with(approver_answer(mac(kPeer), ConnectionRequestResponse::Accept)));
  EXPECT_EQ(listener->result_of(late), ErrorCode::ApproverMismatch);
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  EXPECT_EQ(driver->count("connect"), 0u);
}

TEST_F(P2pStateMachineTest, RemovedApproverHandsBackToUser) {
  enable();
  found(make_peer(kPeer));
  send(Message(Cmd::AddExternalApprover).with(mac(kPeer)));
  incoming_request(kPeer);
  ASSERT_EQ(listener->connection_requests.size(), 1u);
  EXPECT_TRUE(authorizer->requests.empty());

  RequestId removed =
      send(Message(Cmd::RemoveExternalApprover).with(mac(kPeer)));
  EXPECT_EQ(listener->result_of(removed), ErrorCode::Success);
  ASSERT_EQ(listener->approvers_detached.size(), 1u);
  EXPECT_EQ(listener->approvers_detached[0].second,
            ApproverDetachReason::Removed);
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingNegotiationRequest);
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].kind, AuthorizationKind::Negotiation);
  EXPECT_EQ(authorizer->requests[0].peer.address, mac(kPeer));

  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Negotiation, kPeer,
                          AuthorizationDecision::Accept)));
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->count("connect"), 1u);
}

// ============================================================================
// Frequency Conflict
// ============================================================================

TEST_F(P2pStateMachineTest, FrequencyConflictDropsInfraAndRetries) {
  negotiate_with_peer();
  sm->on_go_negotiation_failure(P2pStatus::NoCommonChannel);
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::FrequencyConflict);
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].kind, AuthorizationKind::FrequencyConflict);

  post(Message(Cmd::FrequencyConflictResult, 1));
  EXPECT_EQ(infra->requests, (std::vector<bool>{true}));

  post(Message(Cmd::InfraDisconnectResponse, 1));
  EXPECT_EQ(sm->current_state(), P2pState::ProvisionDiscovery);
  EXPECT_EQ(driver->count("provision_discovery"), 2u);
  EXPECT_TRUE(listener->failures.empty());
  EXPECT_EQ(authorizer->dismissed,
            (std::vector<AuthorizationKind>{
                AuthorizationKind::FrequencyConflict}));

  // The infrastructure link comes back when the attempt ends
  send(Message(Cmd::CancelConnect));
  EXPECT_EQ(infra->requests, (std::vector<bool>{true, false}));
}

TEST_F(P2pStateMachineTest, FrequencyConflictDeclined) {
  negotiate_with_peer();
  sm->on_go_negotiation_failure(P2pStatus::NoCommonChannel);
  pump();

  post(Message(Cmd::FrequencyConflictResult, 0));
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::UserRejected);
  EXPECT_TRUE(infra->requests.empty());
}

TEST_F(P2pStateMachineTest, FrequencyConflictPolicyNever) {
  config.frequency_conflict_policy = FrequencyConflictPolicy::Never;
  negotiate_with_peer();
  sm->on_go_negotiation_failure(P2pStatus::NoCommonChannel);
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::NegotiationFailure);
  EXPECT_TRUE(authorizer->requests.empty());
}

TEST_F(P2pStateMachineTest, FrequencyConflictWithoutInfraLink) {
  infra->connected = false;
  negotiate_with_peer();
  sm->on_go_negotiation_failure(P2pStatus::NoCommonChannel);
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_TRUE(infra->requests.empty());
}

TEST_F(P2pStateMachineTest, FrequencyConflictAlwaysDropInfra) {
  config.frequency_conflict_policy = FrequencyConflictPolicy::AlwaysDropInfra;
  negotiate_with_peer();
  sm->on_go_negotiation_failure(P2pStatus::NoCommonChannel);
  pump();

  EXPECT_EQ(sm->current_state(), P2pState::FrequencyConflict);
  EXPECT_EQ(infra->requests, (std::vector<bool>{true}));
  EXPECT_TRUE(authorizer->requests.empty());

  post(Message(Cmd::InfraDisconnectResponse, 0));
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
}

// ============================================================================
// Persistent Groups
// ============================================================================

TEST_F(P2pStateMachineTest, ReinvokeStoredGroup) {
  driver->networks = {stored_group(3, kSelf, {mac(kPeer)})};
  enable();
  ASSERT_NE(sm->persistent_groups().get(3), nullptr);

  P2pDevice peer = make_peer(kPeer);
  peer.device_capability = device_capability::kInvitationProcedure;
  found(peer);

  send(Message(Cmd::Connect).with(connect_config(kPeer)));
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->last_reinvoke_net_id, 3);
  EXPECT_EQ(driver->count("provision_discovery"), 0u);

  // Peer forgot the group: prune it and fall back to a fresh connect
  sm->on_invitation_result(P2pStatus::UnknownP2pGroup);
  pump();
  EXPECT_EQ(sm->persistent_groups().get(3), nullptr);
  EXPECT_EQ(driver->removed_networks, (std::vector<int>{3}));
  EXPECT_EQ(driver->count("connect"), 1u);
  EXPECT_EQ(driver->last_connect.net_id, kNetworkIdPersistent);
  EXPECT_EQ(listener->persistent_group_updates, 2);
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
}

TEST_F(P2pStateMachineTest, InfoUnavailableFallsBackToNegotiation) {
  driver->networks = {stored_group(3, kSelf, {mac(kPeer)})};
  enable();
  P2pDevice peer = make_peer(kPeer);
  peer.device_capability = device_capability::kInvitationProcedure;
  found(peer);
  send(Message(Cmd::Connect).with(connect_config(kPeer)));
  ASSERT_EQ(driver->last_reinvoke_net_id, 3);

  sm->on_invitation_result(P2pStatus::InformationIsCurrentlyUnavailable);
  pump();

  // The stored group is kept, only this attempt negotiates afresh
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->count("connect"), 1u);
  EXPECT_EQ(driver->last_connect.net_id, kNetworkIdPersistent);
  EXPECT_NE(sm->persistent_groups().get(3), nullptr);
  EXPECT_TRUE(driver->removed_networks.empty());
  EXPECT_TRUE(listener->failures.empty());
}

TEST_F(P2pStateMachineTest, InfoUnavailableWaitsForPeerInvite) {
  config.wait_for_peer_invite_on_info_unavailable = true;
  driver->networks = {stored_group(3, kSelf, {mac(kPeer)})};
  enable();
  P2pDevice peer = make_peer(kPeer);
  peer.device_capability = device_capability::kInvitationProcedure;
  found(peer);
  send(Message(Cmd::Connect).with(connect_config(kPeer)));

  sm->on_invitation_result(P2pStatus::InformationIsCurrentlyUnavailable);
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(driver->count("connect"), 0u);
  EXPECT_TRUE(listener->failures.empty());

  // No invitation arrives, so the attempt times out
  elapse(config.group_creating_timeout_ms);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  ASSERT_EQ(listener->failures.size(), 1u);
  EXPECT_EQ(listener->failures[0].second, ConnectionFailure::Timeout);
}

TEST_F(P2pStateMachineTest, DeletePersistentGroup) {
  driver->networks = {stored_group(4, kPeer)};
  enable();

  RequestId deleted = send(Message(Cmd::DeletePersistentGroup, 4));
  EXPECT_EQ(listener->result_of(deleted), ErrorCode::Success);
  EXPECT_EQ(listener->persistent_group_updates, 2);

  RequestId missing = send(Message(Cmd::DeletePersistentGroup, 4));
  EXPECT_EQ(listener->result_of(missing), ErrorCode::NotFound);
}

TEST_F(P2pStateMachineTest, SettingsWhileDisabledApplyOnEnable) {
  driver->networks = {stored_group(1, kPeer)};
  attach();

  RequestId reset = send(Message(Cmd::FactoryReset));
  RequestId rename = send(Message(Cmd::SetDeviceName).with(std::string("Kitchen")));
  EXPECT_EQ(listener->result_of(reset), ErrorCode::Success);
  EXPECT_EQ(listener->result_of(rename), ErrorCode::Success);
  EXPECT_TRUE(sm->config().pending_factory_reset);
  EXPECT_EQ(driver->count("remove_network"), 0u);

  send(Message(Cmd::RequestActivation));
  ASSERT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(driver->last_device_name, "Kitchen");
  EXPECT_EQ(driver->removed_networks, (std::vector<int>{1}));
  EXPECT_EQ(sm->persistent_groups().size(), 0u);
  EXPECT_FALSE(sm->config().pending_factory_reset);
}

// ============================================================================
// Group Owner
// ============================================================================

TEST_F(P2pStateMachineTest, AutonomousGroup) {
  enable();
  send(Message(Cmd::CreateGroup));
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_FALSE(driver->last_group_add.persistent);

  sm->on_group_started(owner_group());
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);
  EXPECT_EQ(tethering->requested, (std::vector<std::string>{"p2p-wlan0-1"}));
  EXPECT_TRUE(driver->idle_timeouts.empty());

  post(Message(Cmd::TetheringReady).with(std::string("p2p-wlan0-9")));
  EXPECT_EQ(sm->current_state(), P2pState::GroupNegotiation);

  post(Message(Cmd::TetheringReady).with(std::string("p2p-wlan0-1")));
  EXPECT_EQ(sm->current_state(), P2pState::GroupCreated);
  EXPECT_EQ(listener->connection,
            (std::vector<NetworkState>{NetworkState::Connected}));
  EXPECT_TRUE(sm->connection_info().is_group_owner);
  EXPECT_EQ(sm->connection_info().group_owner_address, "192.168.49.1");
  ASSERT_TRUE(sm->group()->owner.has_value());
  EXPECT_EQ(sm->group()->owner->address, mac(kSelf));
}

TEST_F(P2pStateMachineTest, StationsJoinAndLeave) {
  create_group();
  sm->on_station_connected(make_peer(kPeer), "192.168.49.20");
  pump();
  EXPECT_EQ(sm->group()->clients.size(), 1u);
  EXPECT_EQ(sm->peers().get(mac(kPeer))->status, PeerStatus::Connected);
  EXPECT_EQ(listener->connection.size(), 2u);

  RequestId unknown =
      send(Message(Cmd::RemoveGroupClient).with(mac(kOther)));
  EXPECT_EQ(listener->result_of(unknown), ErrorCode::PeerNotFound);
  RequestId kick = send(Message(Cmd::RemoveGroupClient).with(mac(kPeer)));
  EXPECT_EQ(listener->result_of(kick), ErrorCode::Success);
  EXPECT_EQ(driver->count("remove_client"), 1u);

  // An autonomous group stays up without clients
  sm->on_station_disconnected(make_peer(kPeer));
  pump();
  EXPECT_TRUE(sm->group()->clients.empty());
  EXPECT_EQ(sm->current_state(), P2pState::GroupCreated);
  EXPECT_EQ(driver->count("group_remove"), 0u);
  EXPECT_EQ(listener->connection.size(), 3u);
}

TEST_F(P2pStateMachineTest, NegotiatedGroupRemovedWhenEmpty) {
  negotiate_with_peer();
  sm->on_group_started(owner_group());
  pump();
  ASSERT_EQ(driver->idle_timeouts.size(), 1u);
  EXPECT_EQ(driver->idle_timeouts[0].first, "p2p-wlan0-1");

  post(Message(Cmd::TetheringReady).with(std::string("p2p-wlan0-1")));
  ASSERT_EQ(sm->current_state(), P2pState::GroupCreated);

  sm->on_station_connected(make_peer(kPeer), "192.168.49.20");
  sm->on_station_disconnected(make_peer(kPeer));
  pump();
  EXPECT_EQ(driver->count("group_remove"), 1u);
  EXPECT_EQ(driver->last_group_removed, "p2p-wlan0-1");

  sm->on_group_removed(owner_group());
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(tethering->stopped, (std::vector<std::string>{"p2p-wlan0-1"}));
}

TEST_F(P2pStateMachineTest, RemoveOwnedGroup) {
  create_group();
  RequestId id = send(Message(Cmd::RemoveGroup));
  EXPECT_EQ(listener->result_of(id), ErrorCode::Success);
  EXPECT_EQ(sm->current_state(), P2pState::OngoingGroupRemoval);

  RequestId repeat = send(Message(Cmd::RemoveGroup));
  EXPECT_EQ(listener->result_of(repeat), ErrorCode::Success);

  sm->on_group_removed(owner_group());
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_EQ(tethering->stopped, (std::vector<std::string>{"p2p-wlan0-1"}));
  EXPECT_EQ(listener->connection.back(), NetworkState::Disconnected);
}

TEST_F(P2pStateMachineTest, RemoveGroupDriverFailure) {
  create_group();
  driver->fail("group_remove");
  RequestId id = send(Message(Cmd::RemoveGroup));

  EXPECT_EQ(listener->result_of(id), ErrorCode::DriverCommandFailed);
  EXPECT_EQ(sm->current_state(), P2pState::Inactive);
  EXPECT_FALSE(sm->group().has_value());
}

TEST_F(P2pStateMachineTest, JoinRequestAuthorized) {
  create_group();
  found(make_peer(kPeer));
  sm->on_provision_discovery(
      pd_event(ProvisionDiscoveryEvent::Kind::PbcRequest, kPeer));
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::UserAuthorizingJoin);
  ASSERT_EQ(authorizer->requests.size(), 1u);
  EXPECT_EQ(authorizer->requests[0].kind, AuthorizationKind::Join);

  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Join, kPeer,
                          AuthorizationDecision::Accept)));
  EXPECT_EQ(sm->current_state(), P2pState::GroupCreated);
  EXPECT_EQ(driver->count("start_wps_pbc"), 1u);
  EXPECT_EQ(authorizer->dismissed,
            (std::vector<AuthorizationKind>{AuthorizationKind::Join}));
}

TEST_F(P2pStateMachineTest, JoinRequestRejectedClearsPending) {
  create_group();
  found(make_peer(kPeer));
  sm->on_provision_discovery(
      pd_event(ProvisionDiscoveryEvent::Kind::PbcRequest, kPeer));
  pump();
  ASSERT_EQ(sm->current_state(), P2pState::UserAuthorizingJoin);
  EXPECT_EQ(sm->pending_config().device_address, mac(kPeer));

  post(Message(Cmd::AuthorizationResult)
           .with(decision(AuthorizationKind::Join, kPeer,
                          AuthorizationDecision::Reject)));
  EXPECT_EQ(sm->current_state(), P2pState::GroupCreated);
  EXPECT_TRUE(sm->pending_config().is_empty());
  EXPECT_EQ(driver->count("start_wps_pbc"), 0u);
  EXPECT_EQ(driver->count("reject"), 0u);
}

TEST_F(P2pStateMachineTest, RadioLossRemovesGroupFirst) {
  create_group();
  post(Message(Cmd::RadioStateChanged, 0));
  EXPECT_EQ(sm->current_state(), P2pState::OngoingGroupRemoval);
  EXPECT_EQ(driver->count("group_remove"), 1u);
  EXPECT_EQ(driver->count("teardown_interface"), 0u);

  sm->on_group_removed(owner_group());
  pump();
  EXPECT_EQ(sm->current_state(), P2pState::DisabledIdle);
  EXPECT_EQ(driver->count("teardown_interface"), 1u);
  EXPECT_EQ(sm->availability(), P2pAvailability::Unavailable);
  EXPECT_EQ(tethering->stopped, (std::vector<std::string>{"p2p-wlan0-1"}));
}

// ============================================================================
// Services
// ============================================================================

TEST_F(P2pStateMachineTest, ServiceDiscoveryRouting) {
  enable();
  RequestId empty = send(Message(Cmd::DiscoverServices));
  EXPECT_EQ(listener->result_of(empty), ErrorCode::NoServiceRequests);

  ServiceRequest request;
  request.protocol = ServiceProtocol::Bonjour;
  RequestId added = send(Message(Cmd::AddServiceRequest).with(request));
  EXPECT_EQ(listener->result_of(added), ErrorCode::Success);

  RequestId discover = send(Message(Cmd::DiscoverServices));
  EXPECT_EQ(listener->result_of(discover), ErrorCode::Success);
  EXPECT_TRUE(sm->discovery_active());
  EXPECT_EQ(driver->count("request_service_discovery"), 2u);

  sm->on_service_discovery_response(mac(kPeer),
                                    Bytes{0x04, 0x00, 0x01, 0x01, 0x00, 0x33});
  pump();
  ASSERT_EQ(listener->service_responses.size(), 1u);
  EXPECT_EQ(listener->service_responses[0].source, mac(kPeer));
  EXPECT_EQ(listener->service_responses[0].data, (Bytes{0x33}));

  // Plain peer discovery drops the service query
  size_t cancels = driver->count("cancel_service_discovery");
  send(Message(Cmd::DiscoverPeers));
  EXPECT_EQ(driver->count("cancel_service_discovery"), cancels + 1);
}

TEST_F(P2pStateMachineTest, UsdSessions) {
  enable();
  UsdRequest request;
  request.config.service_name = "game";

  RequestId discovery = send(Message(Cmd::StartUsdDiscovery).with(request));
  EXPECT_EQ(listener->result_of(discovery), ErrorCode::Success);
  ASSERT_EQ(listener->usd_sessions.count(discovery), 1u);
  int session = listener->usd_sessions[discovery];

  UsdDiscoveryResult result;
  result.session_id = session;
  result.peer = mac(kPeer);
  sm->on_usd_discovery_result(result);
  result.session_id = session + 100;
  sm->on_usd_discovery_result(result);
  pump();
  EXPECT_EQ(listener->usd_results.size(), 1u);

  RequestId bad_stop = send(Message(Cmd::StopUsdDiscovery, session + 100));
  EXPECT_EQ(listener->result_of(bad_stop), ErrorCode::NotFound);
  RequestId stop = send(Message(Cmd::StopUsdDiscovery, session));
  EXPECT_EQ(listener->result_of(stop), ErrorCode::Success);

  RequestId advertise =
      send(Message(Cmd::StartUsdAdvertisement).with(request));
  EXPECT_EQ(listener->result_of(advertise), ErrorCode::Success);
  int adv_session = listener->usd_sessions[advertise];
  sm->on_usd_session_terminated(adv_session, true);
  pump();
  EXPECT_EQ(listener->usd_terminated, (std::vector<int>{adv_session}));

  RequestId gone = send(Message(Cmd::StopUsdAdvertisement));
  EXPECT_EQ(listener->result_of(gone), ErrorCode::NotFound);
}

TEST_F(P2pStateMachineTest, LocalServicesNeedP2p) {
  attach();
  LocalService service;
  service.entries = {"_ipp._tcp"};
  RequestId disabled = send(Message(Cmd::AddLocalService).with(service));
  EXPECT_EQ(listener->result_of(disabled), ErrorCode::P2pDisabled);

  send(Message(Cmd::RequestActivation));
  RequestId enabled = send(Message(Cmd::AddLocalService).with(service));
  EXPECT_EQ(listener->result_of(enabled), ErrorCode::Success);
  EXPECT_EQ(driver->count("service_add"), 1u);
}
