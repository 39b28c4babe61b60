/**
 * @file state_machine_group_creating.cpp
 * @brief GroupCreating and the negotiation states below it
 */

#define P2PLINK_LOG_TAG "P2pStateMachine"

#include "p2plink/log.h"
#include "state_machine_pimpl.h"

namespace p2plink {

// ============================================================================
// GroupCreating
// ============================================================================

Handling P2pStateMachine::Impl::handle_group_creating(const Message &msg) {
  switch (msg.what) {
  case Cmd::GroupCreatingTimedOut:
    if (msg.arg1 != group_creating_generation) {
      return Handling::NotHandled;
    }
    P2PLINK_LOGW("Group creation timed out");
    handle_group_creation_failure(ConnectionFailure::Timeout);
    transition_to(P2pState::Inactive);
    return Handling::Handled;

  case Cmd::DeviceLost: {
    const auto *device = msg.get<P2pDevice>();
    if (!device || device->address != saved_config.device_address) {
      return Handling::NotHandled;
    }
    P2PLINK_LOGD("Peer %s lost during connection, kept until it resolves",
                 device->address.to_string().c_str());
    peers.mark_lost_during_connection(*device);
    return Handling::Handled;
  }

  case Cmd::DiscoverPeers:
    reply_error(msg, ErrorCode::Busy);
    return Handling::Handled;

  case Cmd::CancelConnect:
    handle_group_creation_failure(ConnectionFailure::Cancel);
    transition_to(P2pState::Inactive);
    reply_ok(msg);
    return Handling::Handled;

  case Cmd::GoNegotiationSuccess:
    transition_to(P2pState::GroupNegotiation);
    return Handling::Handled;

  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// User Authorization
// ============================================================================

Handling
P2pStateMachine::Impl::handle_user_authorizing_negotiation(const Message &msg) {
  switch (msg.what) {
  case Cmd::AuthorizationResult:
    return handle_authorization_result(msg, AuthorizationKind::Negotiation);
  case Cmd::SetConnectionRequestResult:
    return handle_connection_request_result(msg,
                                            AuthorizationKind::Negotiation);
  default:
    return Handling::NotHandled;
  }
}

Handling
P2pStateMachine::Impl::handle_user_authorizing_invite(const Message &msg) {
  switch (msg.what) {
  case Cmd::AuthorizationResult:
    return handle_authorization_result(msg, AuthorizationKind::Invitation);
  case Cmd::SetConnectionRequestResult:
    return handle_connection_request_result(msg,
                                            AuthorizationKind::Invitation);
  default:
    return Handling::NotHandled;
  }
}

void P2pStateMachine::Impl::accept_incoming(AuthorizationKind kind) {
  const MacAddress peer = saved_config.device_address;
  P2PLINK_LOGI("%s with %s accepted", authorization_kind_name(kind),
               peer.to_string().c_str());

  switch (kind) {
  case AuthorizationKind::Negotiation:
    if (!connect_with_pin_display(ConnectTrigger::NegotiationRequest)) {
      handle_group_creation_failure(ConnectionFailure::NegotiationFailure);
      transition_to(P2pState::Inactive);
      return;
    }
    break;

  case AuthorizationKind::Invitation:
    if (!reinvoke_persistent_group(true) &&
        !connect_with_pin_display(ConnectTrigger::Invitation)) {
      handle_group_creation_failure(ConnectionFailure::InvitationFailure);
      transition_to(P2pState::Inactive);
      return;
    }
    break;

  case AuthorizationKind::Join: {
    auto stopped = deps.driver->stop_discovery();
    if (stopped.is_error()) {
      P2PLINK_LOGD("stop_discovery: %s", stopped.error().to_string().c_str());
    }
    if (group) {
      auto started =
          saved_config.wps.method == WpsMethod::Pbc
              ? deps.driver->start_wps_pbc(group->interface_name)
              : deps.driver->start_wps_pin_keypad(group->interface_name,
                                                  saved_config.wps.pin);
      if (started.is_error()) {
        P2PLINK_LOGE("Starting WPS for %s failed: %s",
                     peer.to_string().c_str(),
                     started.error().to_string().c_str());
      }
    }
    transition_to(P2pState::GroupCreated);
    return;
  }

  case AuthorizationKind::FrequencyConflict:
    return;
  }

  peers.update_status(peer, PeerStatus::Invited);
  send_peers_changed();
  transition_to(P2pState::GroupNegotiation);
}

void P2pStateMachine::Impl::reject_incoming(AuthorizationKind kind) {
  const MacAddress peer = saved_config.device_address;
  P2PLINK_LOGI("%s with %s rejected", authorization_kind_name(kind),
               peer.to_string().c_str());

  if (kind == AuthorizationKind::Join) {
    saved_config.invalidate();
    transition_to(P2pState::GroupCreated);
    return;
  }

  auto rejected = deps.driver->reject(peer);
  if (rejected.is_error()) {
    P2PLINK_LOGW("reject: %s", rejected.error().to_string().c_str());
  }
  if (deps.metrics) {
    deps.metrics->end_connection_event(ConnectionFailure::UserRejected);
  }
  session_active = false;
  if (peers.update_status(peer, PeerStatus::Available)) {
    send_peers_changed();
  }

  saved_config.invalidate();
  rejected_peer = peer;
  transition_to(P2pState::RejectWait);
}

// ============================================================================
// RejectWait
// ============================================================================

Handling P2pStateMachine::Impl::handle_reject_wait(const Message &msg) {
  switch (msg.what) {
  case Cmd::RejectWaitElapsed:
    if (msg.arg1 != reject_wait_generation) {
      return Handling::NotHandled;
    }
    transition_to(P2pState::Inactive);
    return Handling::Handled;

  case Cmd::GoNegotiationRequest: {
    const auto *request = msg.get<ConnectConfig>();
    if (request && request->device_address == rejected_peer) {
      P2PLINK_LOGD("Repeated request from rejected peer dropped");
      return Handling::Handled;
    }
    return Handling::Deferred;
  }

  case Cmd::InvitationReceived: {
    const auto *invitation = msg.get<P2pGroup>();
    MacAddress owner;
    if (invitation && invitation->owner) {
      owner = invitation->owner->address;
    } else if (invitation) {
      owner = persistent_groups.owner_address(invitation->net_id)
                  .value_or(MacAddress());
    }
    if (owner == rejected_peer) {
      P2PLINK_LOGD("Repeated invitation from rejected peer dropped");
      return Handling::Handled;
    }
    return Handling::Deferred;
  }

  case Cmd::ProvisionDiscoveryPbcRequest:
  case Cmd::ProvisionDiscoveryEnterPin:
  case Cmd::ProvisionDiscoveryShowPin: {
    const auto *event = msg.get<ProvisionDiscoveryEvent>();
    if (event && event->device.address == rejected_peer) {
      return Handling::Handled;
    }
    return Handling::Deferred;
  }

  case Cmd::Connect:
  case Cmd::CreateGroup:
    return Handling::Deferred;

  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// ProvisionDiscovery
// ============================================================================

void P2pStateMachine::Impl::enter_provision_discovery() {
  auto sent = deps.driver->provision_discovery(saved_config);
  if (sent.is_error()) {
    P2PLINK_LOGE("Provision discovery with %s failed: %s",
                 saved_config.device_address.to_string().c_str(),
                 sent.error().to_string().c_str());
    handle_group_creation_failure(ConnectionFailure::ProvisionDiscoveryFailure);
    transition_to(P2pState::Inactive);
  }
}

Handling P2pStateMachine::Impl::handle_provision_discovery(const Message &msg) {
  auto connect_or_fail = [this]() {
    if (connect_with_pin_display(ConnectTrigger::ProvisionDiscovery)) {
      transition_to(P2pState::GroupNegotiation);
    } else {
      handle_group_creation_failure(ConnectionFailure::NegotiationFailure);
      transition_to(P2pState::Inactive);
    }
  };

  switch (msg.what) {
  case Cmd::ProvisionDiscoveryPbcResponse:
  case Cmd::ProvisionDiscoveryEnterPin:
  case Cmd::ProvisionDiscoveryShowPin: {
    const auto *event = msg.get<ProvisionDiscoveryEvent>();
    if (!event || event->device.address != saved_config.device_address) {
      return Handling::Handled;
    }

    if (msg.what == Cmd::ProvisionDiscoveryPbcResponse) {
      saved_config.wps.method = WpsMethod::Pbc;
      connect_or_fail();
    } else if (msg.what == Cmd::ProvisionDiscoveryEnterPin) {
      saved_config.wps.method = WpsMethod::Keypad;
      if (!saved_config.wps.pin.empty()) {
        connect_or_fail();
      } else {
        join_existing_group = false;
        transition_to(P2pState::UserAuthorizingNegotiationRequest);
      }
    } else {
      saved_config.wps.method = WpsMethod::Display;
      saved_config.wps.pin = event->pin;
      show_pin(saved_config.device_address, event->pin);
      connect_or_fail();
    }
    return Handling::Handled;
  }

  case Cmd::ProvisionDiscoveryFailure: {
    const auto *failure = msg.get<ProvisionDiscoveryFailureEvent>();
    if (!failure || failure->peer != saved_config.device_address) {
      return Handling::Handled;
    }
    P2PLINK_LOGW("Provision discovery failed: %s",
                 provision_discovery_status_name(failure->status));
    handle_group_creation_failure(ConnectionFailure::ProvisionDiscoveryFailure);
    transition_to(P2pState::Inactive);
    return Handling::Handled;
  }

  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// GroupNegotiation
// ============================================================================

Handling P2pStateMachine::Impl::handle_group_negotiation(const Message &msg) {
  switch (msg.what) {
  case Cmd::GoNegotiationSuccess:
  case Cmd::GroupFormationSuccess:
    P2PLINK_LOGD("%s", cmd_name(msg.what));
    return Handling::Handled;

  case Cmd::GoNegotiationFailure: {
    P2pStatus status = p2p_status_from_int(msg.arg1);
    P2PLINK_LOGW("GO negotiation failed: %s", p2p_status_name(status));
    if (status == P2pStatus::NoCommonChannel) {
      transition_to(P2pState::FrequencyConflict);
      return Handling::Handled;
    }
    handle_group_creation_failure(ConnectionFailure::NegotiationFailure);
    transition_to(P2pState::Inactive);
    return Handling::Handled;
  }

  case Cmd::GroupFormationFailure:
    handle_group_creation_failure(ConnectionFailure::NegotiationFailure);
    transition_to(P2pState::Inactive);
    return Handling::Handled;

  case Cmd::GroupRemoved:
    handle_group_creation_failure(ConnectionFailure::GroupRemoved);
    transition_to(P2pState::Inactive);
    return Handling::Handled;

  case Cmd::InvitationResult: {
    P2pStatus status = p2p_status_from_int(msg.arg1);
    P2PLINK_LOGI("Invitation result: %s", p2p_status_name(status));
    switch (status) {
    case P2pStatus::Success:
      break;

    case P2pStatus::UnknownP2pGroup:
    case P2pStatus::InformationIsCurrentlyUnavailable:
      if (status == P2pStatus::UnknownP2pGroup) {
        if (saved_config.net_id >= 0) {
          prune_persistent_client(saved_config.net_id,
                                  saved_config.device_address);
        }
      } else if (config.wait_for_peer_invite_on_info_unavailable) {
        P2PLINK_LOGI("Waiting for the peer to invite us");
        break;
      }
      saved_config.net_id = kNetworkIdPersistent;
      if (!connect_with_pin_display(ConnectTrigger::Other)) {
        handle_group_creation_failure(ConnectionFailure::InvitationFailure);
        transition_to(P2pState::Inactive);
      }
      break;

    case P2pStatus::NoCommonChannel:
      transition_to(P2pState::FrequencyConflict);
      break;

    default:
      handle_group_creation_failure(ConnectionFailure::InvitationFailure);
      transition_to(P2pState::Inactive);
      break;
    }
    return Handling::Handled;
  }

  case Cmd::GroupStarted: {
    const auto *started = msg.get<P2pGroup>();
    if (!started) {
      return Handling::Handled;
    }
    group = *started;
    P2PLINK_LOGI("Group started: %s", group->to_string().c_str());

    if (group->net_id == kNetworkIdPersistent) {
      reload_persistent_groups();
      MacAddress owner_address = group->is_group_owner()
                                     ? this_device.address
                                     : (group->owner ? group->owner->address
                                                     : MacAddress());
      group->net_id =
          persistent_groups.network_id(owner_address, group->network_name);
    }
    if (deps.metrics) {
      deps.metrics->start_group_event(*group);
    }

    const std::string iface = group->interface_name;
    if (group->is_group_owner()) {
      group->owner = this_device;
      if (!autonomous_group) {
        auto idle =
            deps.driver->set_group_idle_timeout(iface, config.group_idle_time_s);
        if (idle.is_error()) {
          P2PLINK_LOGW("Group idle timeout: %s",
                       idle.error().to_string().c_str());
        }
      }
      tethering_requested = true;
      auto tethering =
          deps.tethering->request_tethering(iface, config.group_owner_address);
      if (tethering.is_error()) {
        P2PLINK_LOGE("Tethering on %s failed: %s", iface.c_str(),
                     tethering.error().to_string().c_str());
        handle_group_creation_failure(ConnectionFailure::CreateGroupFailed);
        transition_to(P2pState::Inactive);
      }
      // GroupCreated follows TetheringReady
      return Handling::Handled;
    }

    if (!group->owner || group->owner->address.is_zero()) {
      P2PLINK_LOGE("Group %s has no owner, removing", iface.c_str());
      handle_group_creation_failure(ConnectionFailure::CreateGroupFailed);
      remove_half_started_group();
      transition_to(P2pState::Inactive);
      return Handling::Handled;
    }
    if (const P2pDevice *known = peers.get(group->owner->address)) {
      group->owner = *known;
    }

    auto idle =
        deps.driver->set_group_idle_timeout(iface, config.group_idle_time_s);
    if (idle.is_error()) {
      P2PLINK_LOGW("Group idle timeout: %s", idle.error().to_string().c_str());
    }

    auto provisioning =
        deps.ip_provisioner->start(iface, config.client_ip_mode);
    if (provisioning.is_error()) {
      P2PLINK_LOGE("IP provisioning on %s failed: %s", iface.c_str(),
                   provisioning.error().to_string().c_str());
      handle_group_creation_failure(ConnectionFailure::CreateGroupFailed);
      transition_to(P2pState::Inactive);
      return Handling::Handled;
    }

    if (peers.update_status(group->owner->address, PeerStatus::Connected)) {
      send_peers_changed();
    }
    transition_to(P2pState::GroupCreated);
    return Handling::Handled;
  }

  case Cmd::TetheringReady: {
    const auto *iface = msg.get<std::string>();
    if (!group || !group->is_group_owner() || !iface ||
        *iface != group->interface_name) {
      P2PLINK_LOGD("Tethering ready for an unknown interface");
      return Handling::Handled;
    }
    transition_to(P2pState::GroupCreated);
    return Handling::Handled;
  }

  case Cmd::ProvisionDiscoveryPbcRequest:
  case Cmd::ProvisionDiscoveryEnterPin:
  case Cmd::ProvisionDiscoveryShowPin:
    return Handling::Handled;

  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// FrequencyConflict
// ============================================================================

void P2pStateMachine::Impl::enter_frequency_conflict() {
  FrequencyConflictPolicy policy = config.frequency_conflict_policy;
  P2PLINK_LOGI("No common channel with %s, policy %s",
               saved_config.device_address.to_string().c_str(),
               frequency_conflict_policy_name(policy));

  if (policy == FrequencyConflictPolicy::Never || !deps.infra ||
      !deps.infra->is_connected()) {
    handle_group_creation_failure(ConnectionFailure::NegotiationFailure);
    transition_to(P2pState::Inactive);
    return;
  }
  if (policy == FrequencyConflictPolicy::AlwaysDropInfra) {
    deps.infra->request_disconnect(true);
    return;
  }
  start_decision(AuthorizationKind::FrequencyConflict,
                 std::make_unique<LocalDialogDecisionSource>(*deps.authorizer));
}

Handling P2pStateMachine::Impl::handle_frequency_conflict(const Message &msg) {
  auto decide = [this](bool drop_infra) {
    if (drop_infra) {
      deps.infra->request_disconnect(true);
      return;
    }
    handle_group_creation_failure(ConnectionFailure::UserRejected);
    transition_to(P2pState::Inactive);
  };

  switch (msg.what) {
  case Cmd::FrequencyConflictResult:
    decide(msg.arg1 != 0);
    return Handling::Handled;

  case Cmd::AuthorizationResult: {
    const auto *response = msg.get<AuthorizationResponse>();
    if (!response || response->kind != AuthorizationKind::FrequencyConflict) {
      return Handling::Handled;
    }
    decide(response->decision == AuthorizationDecision::Accept);
    return Handling::Handled;
  }

  case Cmd::InfraDisconnectResponse: {
    if (msg.arg1 == 0) {
      P2PLINK_LOGW("Infrastructure link could not be dropped");
      handle_group_creation_failure(ConnectionFailure::NegotiationFailure);
      transition_to(P2pState::Inactive);
      return Handling::Handled;
    }
    P2PLINK_LOGI("Infrastructure link dropped, retrying");
    infra_dropped = true;
    if (deps.metrics) {
      deps.metrics->end_connection_event(ConnectionFailure::NewConnectionAttempt);
    }
    session_active = false;
    ConnectConfig retry = saved_config;
    transition_to(P2pState::Inactive);
    loop.post(Message(Cmd::Connect).with(retry));
    return Handling::Handled;
  }

  case Cmd::GoNegotiationSuccess:
  case Cmd::GoNegotiationFailure:
  case Cmd::GroupFormationSuccess:
  case Cmd::GroupFormationFailure:
    return Handling::Handled;

  case Cmd::GroupStarted: {
    const auto *started = msg.get<P2pGroup>();
    if (started) {
      auto removed = deps.driver->group_remove(started->interface_name);
      if (removed.is_error()) {
        P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
      }
    }
    return Handling::Handled;
  }

  default:
    return Handling::NotHandled;
  }
}

} // namespace p2plink
