/**
 * @file state_machine.cpp
 * @brief State machine engine and procedures shared by several states
 */

#define P2PLINK_LOG_TAG "P2pStateMachine"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <iterator>
#include <map>

#include "p2plink/log.h"
#include "state_machine_pimpl.h"

namespace p2plink {

// ============================================================================
// State Hierarchy
// ============================================================================

namespace {

const std::map<P2pState, P2pState> kParents = {
    {P2pState::NotSupported, P2pState::Root},
    {P2pState::Disabling, P2pState::Root},
    {P2pState::Disabled, P2pState::Root},
    {P2pState::DisabledIdle, P2pState::Disabled},
    {P2pState::WaitingForResourceArbitration, P2pState::Disabled},
    {P2pState::Enabled, P2pState::Root},
    {P2pState::Inactive, P2pState::Enabled},
    {P2pState::GroupCreating, P2pState::Enabled},
    {P2pState::UserAuthorizingInviteRequest, P2pState::GroupCreating},
    {P2pState::UserAuthorizingNegotiationRequest, P2pState::GroupCreating},
    {P2pState::ProvisionDiscovery, P2pState::GroupCreating},
    {P2pState::GroupNegotiation, P2pState::GroupCreating},
    {P2pState::FrequencyConflict, P2pState::GroupCreating},
    {P2pState::RejectWait, P2pState::GroupCreating},
    {P2pState::GroupCreated, P2pState::Enabled},
    {P2pState::UserAuthorizingJoin, P2pState::GroupCreated},
    {P2pState::OngoingGroupRemoval, P2pState::GroupCreated}};

} // namespace

const char *p2p_state_name(P2pState state) {
  switch (state) {
  case P2pState::Root:
    return "Root";
  case P2pState::NotSupported:
    return "NotSupported";
  case P2pState::Disabling:
    return "Disabling";
  case P2pState::Disabled:
    return "Disabled";
  case P2pState::DisabledIdle:
    return "DisabledIdle";
  case P2pState::WaitingForResourceArbitration:
    return "WaitingForResourceArbitration";
  case P2pState::Enabled:
    return "Enabled";
  case P2pState::Inactive:
    return "Inactive";
  case P2pState::GroupCreating:
    return "GroupCreating";
  case P2pState::UserAuthorizingInviteRequest:
    return "UserAuthorizingInviteRequest";
  case P2pState::UserAuthorizingNegotiationRequest:
    return "UserAuthorizingNegotiationRequest";
  case P2pState::ProvisionDiscovery:
    return "ProvisionDiscovery";
  case P2pState::GroupNegotiation:
    return "GroupNegotiation";
  case P2pState::FrequencyConflict:
    return "FrequencyConflict";
  case P2pState::RejectWait:
    return "RejectWait";
  case P2pState::GroupCreated:
    return "GroupCreated";
  case P2pState::UserAuthorizingJoin:
    return "UserAuthorizingJoin";
  case P2pState::OngoingGroupRemoval:
    return "OngoingGroupRemoval";
  }
  return "Unknown";
}

std::optional<P2pState> p2p_state_parent(P2pState state) {
  auto it = kParents.find(state);
  if (it == kParents.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool p2p_state_is_within(P2pState state, P2pState ancestor) {
  for (std::optional<P2pState> s = state; s; s = p2p_state_parent(*s)) {
    if (*s == ancestor) {
      return true;
    }
  }
  return false;
}

Result<void> Collaborators::validate() const {
  P2PLINK_REQUIRE(driver, ErrorCode::InvalidArgument, "Driver is required");
  P2PLINK_REQUIRE(arbiter, ErrorCode::InvalidArgument,
                  "Resource arbiter is required");
  P2PLINK_REQUIRE(authorizer, ErrorCode::InvalidArgument,
                  "User authorizer is required");
  P2PLINK_REQUIRE(ip_provisioner, ErrorCode::InvalidArgument,
                  "IP provisioner is required");
  P2PLINK_REQUIRE(tethering, ErrorCode::InvalidArgument,
                  "Tethering coordinator is required");
  P2PLINK_REQUIRE(network, ErrorCode::InvalidArgument,
                  "Local network manager is required");
  return Result<void>::ok();
}

// ============================================================================
// Public Interface
// ============================================================================

P2pStateMachine::P2pStateMachine(Collaborators collaborators,
                                 P2pServiceConfig config,
                                 std::shared_ptr<Clock> clock)
    : impl_(std::make_unique<Impl>(*this, std::move(collaborators),
                                   std::move(config), std::move(clock))) {}

P2pStateMachine::~P2pStateMachine() = default;

void P2pStateMachine::start() { impl_->start(); }

void P2pStateMachine::post(Message msg) { impl_->loop.post(std::move(msg)); }

size_t P2pStateMachine::dispatch_pending() {
  return impl_->loop.dispatch_pending(
      [this](const Message &msg) { impl_->handle_message(msg); });
}

void P2pStateMachine::run() {
  impl_->loop.run([this](const Message &msg) { impl_->handle_message(msg); });
}

void P2pStateMachine::quit() { impl_->loop.quit(); }

EventLoop &P2pStateMachine::loop() { return impl_->loop; }

P2pState P2pStateMachine::current_state() const { return impl_->state; }

bool P2pStateMachine::is_in_state(P2pState state) const {
  return p2p_state_is_within(impl_->state, state);
}

const PeerRegistry &P2pStateMachine::peers() const { return impl_->peers; }

const std::optional<P2pGroup> &P2pStateMachine::group() const {
  return impl_->group;
}

const PersistentGroupStore &P2pStateMachine::persistent_groups() const {
  return impl_->persistent_groups;
}

const ServiceDiscoveryTracker &P2pStateMachine::services() const {
  return impl_->services;
}

const ApproverRegistry &P2pStateMachine::approvers() const {
  return impl_->approvers;
}

const ConnectConfig &P2pStateMachine::pending_config() const {
  return impl_->saved_config;
}

const P2pDevice &P2pStateMachine::this_device() const {
  return impl_->this_device;
}

const ConnectionInfo &P2pStateMachine::connection_info() const {
  return impl_->connection_info;
}

P2pAvailability P2pStateMachine::availability() const {
  return impl_->availability;
}

bool P2pStateMachine::discovery_active() const {
  return impl_->discovery_active;
}

bool P2pStateMachine::session_active() const { return impl_->session_active; }

size_t P2pStateMachine::deferred_count() const {
  return impl_->deferred.size();
}

const P2pServiceConfig &P2pStateMachine::config() const {
  return impl_->config;
}

// ============================================================================
// Driver Events
// ============================================================================

void P2pStateMachine::on_device_found(const P2pDevice &device) {
  post(Message(Cmd::DeviceFound).with(device));
}

void P2pStateMachine::on_device_lost(const P2pDevice &device) {
  post(Message(Cmd::DeviceLost).with(device));
}

void P2pStateMachine::on_find_stopped() { post(Message(Cmd::FindStopped)); }

void P2pStateMachine::on_go_negotiation_request(const ConnectConfig &config) {
  post(Message(Cmd::GoNegotiationRequest).with(config));
}

void P2pStateMachine::on_go_negotiation_success() {
  post(Message(Cmd::GoNegotiationSuccess));
}

void P2pStateMachine::on_go_negotiation_failure(P2pStatus status) {
  post(Message(Cmd::GoNegotiationFailure, static_cast<int>(status)));
}

void P2pStateMachine::on_group_formation_success() {
  post(Message(Cmd::GroupFormationSuccess));
}

void P2pStateMachine::on_group_formation_failure(const std::string &reason) {
  post(Message(Cmd::GroupFormationFailure).with(reason));
}

void P2pStateMachine::on_group_started(const P2pGroup &group) {
  post(Message(Cmd::GroupStarted).with(group));
}

void P2pStateMachine::on_group_removed(const P2pGroup &group) {
  post(Message(Cmd::GroupRemoved).with(group));
}

void P2pStateMachine::on_invitation_received(const P2pGroup &group) {
  post(Message(Cmd::InvitationReceived).with(group));
}

void P2pStateMachine::on_invitation_result(P2pStatus status) {
  post(Message(Cmd::InvitationResult, static_cast<int>(status)));
}

void P2pStateMachine::on_provision_discovery(
    const ProvisionDiscoveryEvent &event) {
  Cmd what = Cmd::ProvisionDiscoveryPbcRequest;
  switch (event.kind) {
  case ProvisionDiscoveryEvent::Kind::PbcRequest:
    what = Cmd::ProvisionDiscoveryPbcRequest;
    break;
  case ProvisionDiscoveryEvent::Kind::PbcResponse:
    what = Cmd::ProvisionDiscoveryPbcResponse;
    break;
  case ProvisionDiscoveryEvent::Kind::EnterPin:
    what = Cmd::ProvisionDiscoveryEnterPin;
    break;
  case ProvisionDiscoveryEvent::Kind::ShowPin:
    what = Cmd::ProvisionDiscoveryShowPin;
    break;
  }
  post(Message(what).with(event));
}

void P2pStateMachine::on_provision_discovery_failure(
    const MacAddress &peer, ProvisionDiscoveryStatus status) {
  post(Message(Cmd::ProvisionDiscoveryFailure)
           .with(ProvisionDiscoveryFailureEvent{peer, status}));
}

void P2pStateMachine::on_service_discovery_response(const MacAddress &source,
                                                    const Bytes &tlvs) {
  post(Message(Cmd::ServiceDiscoveryResponse)
           .with(ServiceResponseFrame{source, tlvs}));
}

void P2pStateMachine::on_usd_discovery_result(
    const UsdDiscoveryResult &result) {
  post(Message(Cmd::UsdDiscoveryResult).with(result));
}

void P2pStateMachine::on_usd_session_terminated(int session_id,
                                                bool advertisement) {
  post(Message(Cmd::UsdSessionTerminated, session_id, advertisement ? 1 : 0));
}

void P2pStateMachine::on_station_connected(const P2pDevice &device,
                                           const std::string &ip_address) {
  post(Message(Cmd::StationConnected).with(StationEvent{device, ip_address}));
}

void P2pStateMachine::on_station_disconnected(const P2pDevice &device) {
  post(Message(Cmd::StationDisconnected).with(StationEvent{device, ""}));
}

void P2pStateMachine::on_frequency_changed(int frequency_mhz) {
  post(Message(Cmd::FrequencyChanged, frequency_mhz));
}

void P2pStateMachine::on_driver_disconnected() {
  post(Message(Cmd::DriverDisconnected));
}

// ============================================================================
// Engine
// ============================================================================

P2pStateMachine::Impl::Impl(P2pStateMachine &owner_ref,
                            Collaborators collaborators,
                            P2pServiceConfig service_config,
                            std::shared_ptr<Clock> clock)
    : owner(owner_ref), deps(std::move(collaborators)),
      config(std::move(service_config)), loop(std::move(clock)) {
  if (config.verbose_logging) {
    log_set_level(LogLevel::Verbose);
  }
}

void P2pStateMachine::Impl::start() {
  if (started) {
    return;
  }
  started = true;

  state = P2pState::Root;
  if (!deps.driver->is_supported()) {
    P2PLINK_LOGW("P2P is not supported by the driver");
    transition_to(P2pState::NotSupported);
  } else {
    transition_to(P2pState::DisabledIdle);
  }
  perform_transitions();
}

void P2pStateMachine::Impl::handle_message(const Message &msg) {
  P2pState current = state;
  P2PLINK_LOGV("%s: %s", p2p_state_name(current), cmd_name(msg.what));

  Handling result = Handling::NotHandled;
  for (std::optional<P2pState> s = current; s; s = p2p_state_parent(*s)) {
    result = dispatch_to(*s, msg);
    if (result != Handling::NotHandled) {
      break;
    }
  }

  if (result == Handling::Deferred) {
    P2PLINK_LOGD("%s deferred in %s", cmd_name(msg.what),
                 p2p_state_name(current));
    deferred.push_back(msg);
  } else if (result == Handling::NotHandled) {
    P2PLINK_LOGD("%s not handled in %s", cmd_name(msg.what),
                 p2p_state_name(current));
  }

  perform_transitions();
}

Handling P2pStateMachine::Impl::dispatch_to(P2pState s, const Message &msg) {
  switch (s) {
  case P2pState::Root:
    return handle_root(msg);
  case P2pState::NotSupported:
    return handle_not_supported(msg);
  case P2pState::Disabling:
    return handle_disabling(msg);
  case P2pState::Disabled:
    return handle_disabled(msg);
  case P2pState::DisabledIdle:
    return handle_disabled_idle(msg);
  case P2pState::WaitingForResourceArbitration:
    return handle_waiting_for_arbitration(msg);
  case P2pState::Enabled:
    return handle_enabled(msg);
  case P2pState::Inactive:
    return handle_inactive(msg);
  case P2pState::GroupCreating:
    return handle_group_creating(msg);
  case P2pState::UserAuthorizingInviteRequest:
    return handle_user_authorizing_invite(msg);
  case P2pState::UserAuthorizingNegotiationRequest:
    return handle_user_authorizing_negotiation(msg);
  case P2pState::ProvisionDiscovery:
    return handle_provision_discovery(msg);
  case P2pState::GroupNegotiation:
    return handle_group_negotiation(msg);
  case P2pState::FrequencyConflict:
    return handle_frequency_conflict(msg);
  case P2pState::RejectWait:
    return handle_reject_wait(msg);
  case P2pState::GroupCreated:
    return handle_group_created(msg);
  case P2pState::UserAuthorizingJoin:
    return handle_user_authorizing_join(msg);
  case P2pState::OngoingGroupRemoval:
    return handle_ongoing_group_removal(msg);
  }
  return Handling::NotHandled;
}

void P2pStateMachine::Impl::enter_state(P2pState s) {
  switch (s) {
  case P2pState::Disabling:
    enter_disabling();
    break;
  case P2pState::Disabled:
    enter_disabled();
    break;
  case P2pState::Enabled:
    enter_enabled();
    break;
  case P2pState::Inactive:
    enter_inactive();
    break;
  case P2pState::GroupCreating:
    arm_timer(Cmd::GroupCreatingTimedOut, group_creating_generation,
              config.group_creating_timeout_ms);
    break;
  case P2pState::UserAuthorizingInviteRequest:
    start_decision(AuthorizationKind::Invitation);
    break;
  case P2pState::UserAuthorizingNegotiationRequest:
    start_decision(AuthorizationKind::Negotiation);
    break;
  case P2pState::UserAuthorizingJoin:
    start_decision(AuthorizationKind::Join);
    break;
  case P2pState::ProvisionDiscovery:
    enter_provision_discovery();
    break;
  case P2pState::FrequencyConflict:
    enter_frequency_conflict();
    break;
  case P2pState::RejectWait:
    arm_timer(Cmd::RejectWaitElapsed, reject_wait_generation,
              config.reject_wait_ms);
    break;
  case P2pState::GroupCreated:
    enter_group_created();
    break;
  default:
    break;
  }
}

void P2pStateMachine::Impl::exit_state(P2pState s) {
  switch (s) {
  case P2pState::Disabling:
    ++disable_generation;
    break;
  case P2pState::Enabled:
    exit_enabled();
    break;
  case P2pState::Inactive:
    disarm_idle_shutdown();
    break;
  case P2pState::GroupCreating:
    ++group_creating_generation;
    break;
  case P2pState::UserAuthorizingInviteRequest:
  case P2pState::UserAuthorizingNegotiationRequest:
  case P2pState::UserAuthorizingJoin:
  case P2pState::FrequencyConflict:
    end_decision();
    break;
  case P2pState::RejectWait:
    ++reject_wait_generation;
    rejected_peer = MacAddress();
    break;
  case P2pState::GroupCreated:
    exit_group_created();
    break;
  default:
    break;
  }
}

void P2pStateMachine::Impl::perform_transitions() {
  bool moved = false;
  while (pending_transition) {
    P2pState dest = *pending_transition;
    pending_transition.reset();
    if (dest == state) {
      continue;
    }
    do_transition(dest);
    moved = true;
  }

  if (moved && !deferred.empty()) {
    std::vector<Message> replay;
    replay.swap(deferred);
    loop.post_front(std::move(replay));
  }
}

void P2pStateMachine::Impl::do_transition(P2pState dest) {
  P2pState from = state;
  P2PLINK_LOGI("%s -> %s", p2p_state_name(from), p2p_state_name(dest));

  std::vector<P2pState> dest_chain;
  for (std::optional<P2pState> s = dest; s; s = p2p_state_parent(*s)) {
    dest_chain.push_back(*s);
  }

  // Exit up to the closest common ancestor
  P2pState common = P2pState::Root;
  for (std::optional<P2pState> s = from; s; s = p2p_state_parent(*s)) {
    if (std::find(dest_chain.begin(), dest_chain.end(), *s) !=
        dest_chain.end()) {
      common = *s;
      break;
    }
    exit_state(*s);
    state = p2p_state_parent(*s).value_or(P2pState::Root);
  }

  // Enter from below the common ancestor down to the destination
  auto common_it = std::find(dest_chain.begin(), dest_chain.end(), common);
  for (auto it = std::make_reverse_iterator(common_it); it != dest_chain.rend();
       ++it) {
    state = *it;
    enter_state(*it);
  }
}

// ============================================================================
// Clients and Notifications
// ============================================================================

std::shared_ptr<ClientListener>
P2pStateMachine::Impl::listener_for(ClientId client) const {
  auto it = clients.find(client);
  return it == clients.end() ? nullptr : it->second.listener;
}

bool P2pStateMachine::Impl::has_activated_clients() const {
  return std::any_of(clients.begin(), clients.end(),
                     [](const auto &entry) { return entry.second.activated; });
}

void P2pStateMachine::Impl::reply(const Message &msg,
                                  const Result<void> &result) {
  if (msg.client == kInternalClient) {
    return;
  }
  auto listener = listener_for(msg.client);
  if (!listener) {
    P2PLINK_LOGD("Result for detached client %u dropped", msg.client);
    return;
  }
  if (result.is_error()) {
    P2PLINK_LOGD("%s from client %u failed: %s", cmd_name(msg.what),
                 msg.client, result.error().to_string().c_str());
  }
  listener->on_command_result(msg.request_id, result);
}

void P2pStateMachine::Impl::reply_error(const Message &msg, ErrorCode code,
                                        const std::string &message) {
  reply(msg, Result<void>(Error(code, message)));
}

void P2pStateMachine::Impl::set_availability(P2pAvailability value) {
  if (availability == value) {
    return;
  }
  availability = value;
  P2PLINK_LOGI("P2P availability: %s", p2p_availability_name(value));
  broadcast([value](ClientListener &l) { l.on_p2p_state_changed(value); });
}

void P2pStateMachine::Impl::send_peers_changed() {
  auto list = peers.list();
  broadcast([&list](ClientListener &l) { l.on_peers_changed(list); });
}

void P2pStateMachine::Impl::send_discovery_changed(bool active) {
  discovery_active = active;
  broadcast([active](ClientListener &l) { l.on_discovery_changed(active); });
}

void P2pStateMachine::Impl::send_connection_changed(NetworkState network) {
  P2PLINK_LOGD("Connection %s", network_state_name(network));
  broadcast([this, network](ClientListener &l) {
    l.on_connection_changed(network, connection_info, group);
  });
}

void P2pStateMachine::Impl::send_this_device_changed() {
  broadcast([this](ClientListener &l) { l.on_this_device_changed(this_device); });
}

void P2pStateMachine::Impl::send_persistent_groups_changed() {
  broadcast([](ClientListener &l) { l.on_persistent_groups_changed(); });
}

void P2pStateMachine::Impl::update_this_device_status(PeerStatus status) {
  this_device.status = status;
  send_this_device_changed();
}

void P2pStateMachine::Impl::detach_approvers(
    const std::vector<ApproverEntry> &entries, ApproverDetachReason reason) {
  for (const auto &entry : entries) {
    P2PLINK_LOGD("Approver %s of client %u detached: %s",
                 entry.address.to_string().c_str(), entry.owner,
                 approver_detach_reason_name(reason));
    auto listener = listener_for(entry.owner);
    if (listener) {
      listener->on_approver_detached(entry.address, reason);
    }
  }
  if (reason != ApproverDetachReason::Replaced) {
    return_decision_to_user(entries);
  }
}

void P2pStateMachine::Impl::return_decision_to_user(
    const std::vector<ApproverEntry> &entries) {
  if (!session_active || !decision_source || !decision_source->is_external()) {
    return;
  }
  const ApproverEntry &asked =
      static_cast<ExternalApproverDecisionSource &>(*decision_source).entry();
  for (const auto &entry : entries) {
    if (entry.owner == asked.owner && entry.address == asked.address) {
      P2PLINK_LOGI("Approver for %s went away, asking the user",
                   saved_config.device_address.to_string().c_str());
      start_decision(decision_kind, std::make_unique<LocalDialogDecisionSource>(
                                        *deps.authorizer));
      return;
    }
  }
}

void P2pStateMachine::Impl::detach_approvers_for_peer(
    const MacAddress &peer, ApproverDetachReason reason) {
  detach_approvers(approvers.remove_for_peer(peer), reason);
}

// ============================================================================
// Timers
// ============================================================================

void P2pStateMachine::Impl::arm_timer(Cmd what, int &generation,
                                      int delay_ms) {
  ++generation;
  loop.post_delayed(Message(what, generation),
                    std::chrono::milliseconds(delay_ms));
}

void P2pStateMachine::Impl::arm_idle_shutdown() {
  if (idle_shutdown_armed) {
    return;
  }
  P2PLINK_LOGD("Idle shutdown in %d ms", config.idle_shutdown_timeout_ms);
  idle_shutdown_armed = true;
  arm_timer(Cmd::IdleShutdown, idle_shutdown_generation,
            config.idle_shutdown_timeout_ms);
}

void P2pStateMachine::Impl::disarm_idle_shutdown() {
  if (!idle_shutdown_armed) {
    return;
  }
  idle_shutdown_armed = false;
  ++idle_shutdown_generation;
  loop.remove(Cmd::IdleShutdown);
}

// ============================================================================
// Connection Failure and Group Removal
// ============================================================================

void P2pStateMachine::Impl::handle_group_creation_failure(
    ConnectionFailure reason) {
  if (!session_active) {
    P2PLINK_LOGD("No connection attempt in progress, %s ignored",
                 connection_failure_name(reason));
    return;
  }
  session_active = false;

  MacAddress peer = saved_config.device_address;
  P2PLINK_LOGI("Connection attempt with %s failed: %s",
               peer.to_string().c_str(), connection_failure_name(reason));

  auto cancelled = deps.driver->cancel_connect();
  if (cancelled.is_error()) {
    P2PLINK_LOGD("cancel_connect: %s", cancelled.error().to_string().c_str());
  }
  remove_half_started_group();

  connection_info = ConnectionInfo();
  send_connection_changed(NetworkState::Failed);
  if (deps.metrics) {
    deps.metrics->end_connection_event(reason);
  }
  broadcast([&peer, reason](ClientListener &l) {
    l.on_group_creation_failed(peer, reason);
  });

  // Keep other discovered peers; only the failed and lost ones go
  bool peers_changed = false;
  for (const auto &lost : peers.prune_lost_during_connection()) {
    detach_approvers_for_peer(lost, ApproverDetachReason::PeerRemoved);
    peers_changed = true;
  }
  if (!peer.is_zero()) {
    if (peers.remove(peer)) {
      peers_changed = true;
    }
    detach_approvers_for_peer(peer, ApproverDetachReason::Failure);
  }
  if (peers_changed) {
    send_peers_changed();
  }

  services.forget_driver_request();
  restore_infra_link();
  autonomous_group = false;
  join_existing_group = false;

  loop.post(Message(Cmd::DiscoverPeers));
}

void P2pStateMachine::Impl::remove_half_started_group() {
  if (!group) {
    return;
  }
  P2PLINK_LOGD("Removing half-started group %s",
               group->interface_name.c_str());
  auto removed = deps.driver->group_remove(group->interface_name);
  if (removed.is_error()) {
    P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
  }
  if (group->is_group_owner()) {
    if (tethering_requested) {
      deps.tethering->stop_tethering(group->interface_name);
    }
  } else {
    deps.ip_provisioner->stop();
  }
  if (deps.metrics) {
    deps.metrics->end_group_event();
  }
  group.reset();
  tethering_requested = false;
}

void P2pStateMachine::Impl::handle_group_removed() {
  if (!group) {
    return;
  }
  P2PLINK_LOGI("Group removed: %s", group->to_string().c_str());

  if (group->is_group_owner()) {
    if (tethering_requested) {
      deps.tethering->stop_tethering(group->interface_name);
    }
  } else {
    deps.ip_provisioner->stop();
    deps.network->remove_interface(group->interface_name);
  }

  // Clear the timeout in case the main interface hosted the group
  auto idle = deps.driver->set_group_idle_timeout(group->interface_name, 0);
  if (idle.is_error()) {
    P2PLINK_LOGD("Clearing group idle timeout failed: %s",
                 idle.error().to_string().c_str());
  }

  // Only members of the group leave the peer table
  std::vector<MacAddress> removed;
  for (const auto &client : group->clients) {
    if (peers.remove(client.address)) {
      removed.push_back(client.address);
    }
  }
  if (group->owner && group->owner->address != this_device.address &&
      peers.remove(group->owner->address)) {
    removed.push_back(group->owner->address);
  }
  for (const auto &lost : peers.prune_lost_during_connection()) {
    removed.push_back(lost);
  }
  for (const auto &addr : removed) {
    detach_approvers_for_peer(addr, ApproverDetachReason::PeerRemoved);
  }
  if (!removed.empty()) {
    send_peers_changed();
  }

  group.reset();
  tethering_requested = false;

  auto flushed = deps.driver->flush();
  if (flushed.is_error()) {
    P2PLINK_LOGW("flush: %s", flushed.error().to_string().c_str());
  }
  services.forget_driver_request();
  restore_infra_link();

  if (deps.metrics) {
    deps.metrics->end_group_event();
  }
}

// ============================================================================
// Connection Helpers
// ============================================================================

P2pDevice
P2pStateMachine::Impl::fetch_current_device_details(const MacAddress &address) {
  auto capability = deps.driver->get_group_capability(address);
  if (capability) {
    peers.update_group_capability(address, capability.value());
  }
  const P2pDevice *device = peers.get(address);
  if (device) {
    return *device;
  }
  P2pDevice unknown;
  unknown.address = address;
  return unknown;
}

bool P2pStateMachine::Impl::connect_with_pin_display(ConnectTrigger trigger) {
  P2pDevice device = fetch_current_device_details(saved_config.device_address);

  if (saved_config.group_owner_intent == kGroupOwnerIntentAuto) {
    saved_config.group_owner_intent = config.default_group_owner_intent;
  }

  bool join = trigger == ConnectTrigger::Invitation ? join_existing_group
                                                    : device.is_group_owner();
  auto pin = deps.driver->connect(saved_config, join);
  if (pin.is_error()) {
    P2PLINK_LOGE("connect to %s failed: %s",
                 saved_config.device_address.to_string().c_str(),
                 pin.error().to_string().c_str());
    return false;
  }
  if (!pin.value().empty()) {
    show_pin(saved_config.device_address, pin.value());
  }
  return true;
}

bool P2pStateMachine::Impl::reinvoke_persistent_group(bool invited) {
  const MacAddress peer = saved_config.device_address;
  P2pDevice device = fetch_current_device_details(peer);

  std::string ssid;
  if (device.is_group_owner()) {
    auto result = deps.driver->get_ssid(peer);
    if (result) {
      ssid = result.value();
    }
  }

  ReinvocationPlan plan =
      persistent_groups.plan_reinvocation(device, saved_config, ssid, invited);
  P2PLINK_LOGD("Reinvocation with %s: %s (%s)", peer.to_string().c_str(),
               reinvocation_action_name(plan.action), plan.reason);

  switch (plan.action) {
  case ReinvocationPlan::Action::JoinPersistent: {
    GroupAddRequest request;
    request.persistent = true;
    request.net_id = plan.net_id;
    auto added = deps.driver->group_add(request);
    if (added.is_error()) {
      P2PLINK_LOGE("Restarting stored group %d failed: %s", plan.net_id,
                   added.error().to_string().c_str());
      return false;
    }
    saved_config.net_id = plan.net_id;
    return true;
  }
  case ReinvocationPlan::Action::Reinvoke: {
    auto reinvoked = deps.driver->reinvoke(plan.net_id, peer, device.dik_id);
    if (reinvoked.is_error()) {
      P2PLINK_LOGE("Reinvoke of %d failed, refreshing stored groups",
                   plan.net_id);
      reload_persistent_groups();
      return false;
    }
    saved_config.net_id = plan.net_id;
    return true;
  }
  case ReinvocationPlan::Action::Fresh:
    break;
  }
  return false;
}

AuthorizationRequest
P2pStateMachine::Impl::authorization_request(AuthorizationKind kind) const {
  AuthorizationRequest request;
  request.kind = kind;
  const P2pDevice *known = peers.get(saved_config.device_address);
  if (known) {
    request.peer = *known;
  } else {
    request.peer.address = saved_config.device_address;
  }
  request.wps = saved_config.wps.method;
  request.pin = saved_config.wps.pin;
  return request;
}

void P2pStateMachine::Impl::start_decision(
    AuthorizationKind kind, std::unique_ptr<DecisionSource> source) {
  end_decision();
  if (!source) {
    source = select_decision_source(
        approvers, saved_config.device_address, *deps.authorizer,
        [this](ClientId id) { return listener_for(id); });
  }
  decision_kind = kind;
  decision_source = std::move(source);
  P2PLINK_LOGI("%s request from %s, asking %s", authorization_kind_name(kind),
               saved_config.device_address.to_string().c_str(),
               decision_source->name());
  decision_source->request(authorization_request(kind));
}

void P2pStateMachine::Impl::end_decision() {
  if (decision_source) {
    decision_source->dismiss(decision_kind);
    decision_source.reset();
  }
}

void P2pStateMachine::Impl::show_pin(const MacAddress &peer,
                                     const std::string &pin) {
  P2pDevice device;
  const P2pDevice *known = peers.get(peer);
  if (known) {
    device = *known;
  } else {
    device.address = peer;
  }

  if (decision_source) {
    decision_source->show_pin(device, pin);
    return;
  }
  auto source =
      select_decision_source(approvers, peer, *deps.authorizer,
                             [this](ClientId id) { return listener_for(id); });
  source->show_pin(device, pin);
}

Handling
P2pStateMachine::Impl::handle_connection_request_result(const Message &msg,
                                                        AuthorizationKind kind) {
  const auto *result = msg.get<ConnectionRequestResult>();
  if (!result) {
    reply_error(msg, ErrorCode::InvalidArgument);
    return Handling::Handled;
  }
  if (!approvers.find(msg.client, result->address) &&
      !approvers.find(msg.client, MacAddress::broadcast())) {
    reply_error(msg, ErrorCode::ApproverNotFound);
    return Handling::Handled;
  }
  // Only the approver the request was delegated to may answer
  if (!decision_source || !decision_source->is_external() ||
      static_cast<ExternalApproverDecisionSource &>(*decision_source)
              .entry()
              .owner != msg.client) {
    reply_error(msg, ErrorCode::ApproverMismatch,
                "Request is not delegated to this client");
    return Handling::Handled;
  }
  if (result->address != saved_config.device_address) {
    reply_error(msg, ErrorCode::ApproverMismatch,
                "Pending request is for another peer");
    return Handling::Handled;
  }

  P2PLINK_LOGI("Approver %u answered %s", msg.client,
               connection_request_response_name(result->response));
  reply_ok(msg);

  switch (result->response) {
  case ConnectionRequestResponse::Accept:
    if (!result->pin.empty()) {
      saved_config.wps.pin = result->pin;
    }
    accept_incoming(kind);
    break;
  case ConnectionRequestResponse::Reject:
    reject_incoming(kind);
    break;
  case ConnectionRequestResponse::DeferToService:
    start_decision(kind,
                   std::make_unique<LocalDialogDecisionSource>(*deps.authorizer));
    break;
  case ConnectionRequestResponse::DeferShowPin: {
    saved_config.wps.pin = result->pin;
    LocalDialogDecisionSource local(*deps.authorizer);
    local.show_pin(authorization_request(kind).peer, result->pin);
    accept_incoming(kind);
    break;
  }
  }
  return Handling::Handled;
}

Handling P2pStateMachine::Impl::handle_authorization_result(
    const Message &msg, AuthorizationKind kind) {
  const auto *response = msg.get<AuthorizationResponse>();
  if (!response || response->kind != kind ||
      response->peer != saved_config.device_address) {
    P2PLINK_LOGD("Stale authorization result ignored");
    return Handling::Handled;
  }

  switch (response->decision) {
  case AuthorizationDecision::Accept:
    if (!response->pin.empty()) {
      saved_config.wps.pin = response->pin;
    }
    accept_incoming(kind);
    break;
  case AuthorizationDecision::Reject:
    reject_incoming(kind);
    break;
  case AuthorizationDecision::DeferToExternalApprover: {
    auto entry = approvers.resolve(saved_config.device_address);
    auto listener = entry ? listener_for(entry->owner) : nullptr;
    if (!listener) {
      P2PLINK_LOGW("No approver for %s, still waiting",
                   saved_config.device_address.to_string().c_str());
      break;
    }
    start_decision(kind, std::make_unique<ExternalApproverDecisionSource>(
                             *entry, std::move(listener)));
    break;
  }
  }
  return Handling::Handled;
}

// ============================================================================
// Device and Interface
// ============================================================================

void P2pStateMachine::Impl::restore_infra_link() {
  if (infra_dropped && deps.infra) {
    P2PLINK_LOGI("Restoring infrastructure link");
    deps.infra->request_disconnect(false);
  }
  infra_dropped = false;
}

void P2pStateMachine::Impl::reload_persistent_groups() {
  auto reloaded = persistent_groups.reload(*deps.driver, this_device.address);
  if (reloaded.is_error()) {
    P2PLINK_LOGW("Reloading persistent groups failed: %s",
                 reloaded.error().to_string().c_str());
  }
  send_persistent_groups_changed();
}

void P2pStateMachine::Impl::prune_persistent_client(int net_id,
                                                    const MacAddress &client) {
  auto outcome = persistent_groups.prune_client(*deps.driver, net_id, client);
  if (outcome.is_error()) {
    P2PLINK_LOGW("Pruning %s from group %d failed: %s",
                 client.to_string().c_str(), net_id,
                 outcome.error().to_string().c_str());
    return;
  }
  if (outcome.value() != PersistentGroupStore::PruneOutcome::NotFound) {
    send_persistent_groups_changed();
  }
}

std::string P2pStateMachine::Impl::default_device_name() const {
  if (!config.device_name.empty()) {
    return config.device_name;
  }
  char host[HOST_NAME_MAX + 1] = {};
  if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    std::string name(host);
    return name.substr(0, 32);
  }
  return "p2plink";
}

Result<void> P2pStateMachine::Impl::apply_device_name(const std::string &name) {
  P2PLINK_TRY(deps.driver->set_device_name(name));
  this_device.name = name;
  send_this_device_changed();
  return Result<void>::ok();
}

void P2pStateMachine::Impl::factory_reset_now() {
  P2PLINK_LOGI("Factory reset");
  auto removed = persistent_groups.remove_all(*deps.driver);
  if (removed.is_error()) {
    P2PLINK_LOGW("Removing persistent groups failed: %s",
                 removed.error().to_string().c_str());
  }
  services.clear_all(deps.driver.get());
  send_persistent_groups_changed();

  config.pending_factory_reset = false;
  if (deps.config_store) {
    auto saved = deps.config_store->set_pending_factory_reset(false);
    if (saved.is_error()) {
      P2PLINK_LOGW("Saving config failed: %s",
                   saved.error().to_string().c_str());
    }
  }
}

void P2pStateMachine::Impl::teardown_p2p() {
  P2PLINK_LOGI("Tearing down P2P interface %s", interface_name.c_str());
  handle_group_creation_failure(ConnectionFailure::Disabled);
  end_decision();

  if (peers.clear()) {
    send_peers_changed();
  }
  persistent_groups.clear();
  services.clear_all(deps.driver.get());
  if (discovery_active) {
    send_discovery_changed(false);
  }

  deps.driver->teardown_interface();
  deps.arbiter->release_interface();
  transition_to(P2pState::Disabling);
}

void P2pStateMachine::Impl::cleanup_after_driver_loss() {
  P2PLINK_LOGW("P2P driver disconnected");
  handle_group_creation_failure(ConnectionFailure::Disabled);
  end_decision();

  if (peers.clear()) {
    send_peers_changed();
  }
  persistent_groups.clear();
  services.clear_all(nullptr);
  if (discovery_active) {
    send_discovery_changed(false);
  }

  deps.arbiter->release_interface();
  transition_to(P2pState::DisabledIdle);
}

void P2pStateMachine::Impl::check_and_reenable() {
  if (has_activated_clients() && radio_available &&
      in_state(P2pState::Disabled)) {
    loop.post(Message(Cmd::EnableP2p));
  }
}

void P2pStateMachine::Impl::enable_interface() {
  auto iface = deps.driver->setup_interface(&owner);
  if (iface.is_error()) {
    P2PLINK_LOGE("Failed to set up P2P interface: %s",
                 iface.error().to_string().c_str());
    deps.arbiter->release_interface();
    set_availability(P2pAvailability::Unavailable);
    transition_to(P2pState::DisabledIdle);
    return;
  }
  interface_name = iface.value();
  P2PLINK_LOGI("P2P interface %s up", interface_name.c_str());
  transition_to(P2pState::Inactive);
}

} // namespace p2plink
