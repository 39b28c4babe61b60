/**
 * @file state_machine_group_created.cpp
 * @brief GroupCreated, UserAuthorizingJoin and OngoingGroupRemoval
 */

#define P2PLINK_LOG_TAG "P2pStateMachine"

#include "p2plink/log.h"
#include "state_machine_pimpl.h"

namespace p2plink {

// ============================================================================
// GroupCreated
// ============================================================================

void P2pStateMachine::Impl::enter_group_created() {
  if (!group) {
    P2PLINK_LOGE("Entered GroupCreated without a group");
    transition_to(P2pState::Inactive);
    return;
  }

  saved_config.invalidate();
  session_active = false;
  update_this_device_status(PeerStatus::Connected);

  connection_info.group_formed = true;
  connection_info.is_group_owner = group->is_group_owner();
  connection_info.group_owner_address =
      group->is_group_owner() ? config.group_owner_address : "";

  if (deps.metrics) {
    deps.metrics->end_connection_event(ConnectionFailure::None);
  }

  // Lost peers that made it into the group stay
  std::set<MacAddress> members;
  if (group->owner) {
    members.insert(group->owner->address);
  }
  for (const auto &client : group->clients) {
    members.insert(client.address);
  }
  auto pruned = peers.prune_lost_during_connection(members);
  for (const auto &address : pruned) {
    detach_approvers_for_peer(address, ApproverDetachReason::PeerRemoved);
  }
  if (!pruned.empty()) {
    send_peers_changed();
  }

  // A client announces once its address is provisioned
  if (group->is_group_owner() || autonomous_group) {
    send_connection_changed(NetworkState::Connected);
  }
}

void P2pStateMachine::Impl::exit_group_created() {
  if (group) {
    handle_group_removed();
  }
  update_this_device_status(PeerStatus::Available);
  connection_info = ConnectionInfo();
  send_connection_changed(NetworkState::Disconnected);
  autonomous_group = false;
  join_existing_group = false;
}

Handling P2pStateMachine::Impl::handle_group_created(const Message &msg) {
  if (!group) {
    return Handling::NotHandled;
  }
  const std::string iface = group->interface_name;

  switch (msg.what) {
  // ------------------------------------------------------------------------
  // Members
  // ------------------------------------------------------------------------
  case Cmd::StationConnected: {
    const auto *station = msg.get<StationEvent>();
    if (!station) {
      return Handling::Handled;
    }
    const MacAddress &address = station->device.address;
    P2PLINK_LOGI("Station %s joined %s", address.to_string().c_str(),
                 iface.c_str());
    group->add_client(station->device, station->ip_address);
    peers.update_supplicant_details(station->device);
    peers.update_status(address, PeerStatus::Connected);
    send_peers_changed();
    send_connection_changed(NetworkState::Connected);
    return Handling::Handled;
  }

  case Cmd::StationDisconnected: {
    const auto *station = msg.get<StationEvent>();
    if (!station) {
      return Handling::Handled;
    }
    const MacAddress &address = station->device.address;
    if (!group->remove_client(address)) {
      return Handling::Handled;
    }
    P2PLINK_LOGI("Station %s left %s", address.to_string().c_str(),
                 iface.c_str());
    if (peers.update_status(address, PeerStatus::Available)) {
      send_peers_changed();
    }
    if (!autonomous_group && group->is_client_list_empty()) {
      P2PLINK_LOGI("Last client left, removing group");
      auto removed = deps.driver->group_remove(iface);
      if (removed.is_error()) {
        P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
      }
    } else {
      send_connection_changed(NetworkState::Connected);
    }
    return Handling::Handled;
  }

  case Cmd::RemoveGroupClient: {
    const auto *address = msg.get<MacAddress>();
    if (!group->is_group_owner()) {
      reply_error(msg, ErrorCode::InvalidState, "Not the group owner");
      return Handling::Handled;
    }
    if (!address || !group->contains(*address)) {
      reply_error(msg, ErrorCode::PeerNotFound);
      return Handling::Handled;
    }
    reply(msg, deps.driver->remove_client(*address));
    return Handling::Handled;
  }

  case Cmd::DeviceLost: {
    const auto *device = msg.get<P2pDevice>();
    if (device && group->contains(device->address)) {
      return Handling::Handled;
    }
    return Handling::NotHandled;
  }

  case Cmd::FrequencyChanged:
    group->frequency_mhz = msg.arg1;
    P2PLINK_LOGD("Group moved to %d MHz", msg.arg1);
    return Handling::Handled;

  // ------------------------------------------------------------------------
  // IP provisioning (client role)
  // ------------------------------------------------------------------------
  case Cmd::IpProvisioningPreDhcp:
  case Cmd::IpProvisioningPostDhcp: {
    bool enable = msg.what == Cmd::IpProvisioningPostDhcp;
    auto power = deps.driver->set_power_save(iface, enable);
    if (power.is_error()) {
      P2PLINK_LOGD("set_power_save: %s", power.error().to_string().c_str());
    }
    return Handling::Handled;
  }

  case Cmd::IpProvisioningSuccess: {
    const auto *lease = msg.get<IpProvisioningResult>();
    if (!lease) {
      return Handling::Handled;
    }
    auto routed = deps.network->add_interface_routes(iface, *lease);
    if (routed.is_error()) {
      P2PLINK_LOGE("Adding routes on %s failed: %s", iface.c_str(),
                   routed.error().to_string().c_str());
      auto removed = deps.driver->group_remove(iface);
      if (removed.is_error()) {
        P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
      }
      return Handling::Handled;
    }
    P2PLINK_LOGI("Address %s/%d on %s", lease->address.c_str(),
                 lease->prefix_length, iface.c_str());
    connection_info.group_owner_address = lease->server_address;
    auto power = deps.driver->set_power_save(iface, true);
    if (power.is_error()) {
      P2PLINK_LOGD("set_power_save: %s", power.error().to_string().c_str());
    }
    send_connection_changed(NetworkState::Connected);
    return Handling::Handled;
  }

  case Cmd::IpProvisioningFailure: {
    P2PLINK_LOGE("IP provisioning failed on %s, removing group",
                 iface.c_str());
    auto removed = deps.driver->group_remove(iface);
    if (removed.is_error()) {
      P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
    }
    return Handling::Handled;
  }

  // ------------------------------------------------------------------------
  // Removal
  // ------------------------------------------------------------------------
  case Cmd::RemoveGroup: {
    auto removed = deps.driver->group_remove(iface);
    if (removed) {
      transition_to(P2pState::OngoingGroupRemoval);
      reply_ok(msg);
      return Handling::Handled;
    }
    P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
    handle_group_removed();
    transition_to(P2pState::Inactive);
    reply(msg, removed);
    return Handling::Handled;
  }

  case Cmd::GroupRemoved: {
    const auto *removed = msg.get<P2pGroup>();
    if (removed && !removed->interface_name.empty() &&
        removed->interface_name != iface) {
      return Handling::Handled;
    }
    handle_group_removed();
    transition_to(P2pState::Inactive);
    return Handling::Handled;
  }

  case Cmd::DisableP2p:
    loop.post(Message(Cmd::RemoveGroup));
    return Handling::Deferred;

  // ------------------------------------------------------------------------
  // Extending the group
  // ------------------------------------------------------------------------
  case Cmd::Connect: {
    const auto *requested = msg.get<ConnectConfig>();
    if (!requested) {
      reply_error(msg, ErrorCode::MissingConfiguration);
      return Handling::Handled;
    }
    const MacAddress &address = requested->device_address;
    if (!peers.contains(address)) {
      reply_error(msg, ErrorCode::PeerNotFound, address.to_string());
      return Handling::Handled;
    }
    auto invited = deps.driver->invite(*group, address);
    if (invited) {
      saved_config = *requested;
      peers.update_status(address, PeerStatus::Invited);
      send_peers_changed();
    }
    reply(msg, invited);
    return Handling::Handled;
  }

  case Cmd::InvitationResult: {
    P2pStatus status = p2p_status_from_int(msg.arg1);
    P2PLINK_LOGI("Invitation result: %s", p2p_status_name(status));
    if (status != P2pStatus::UnknownP2pGroup || saved_config.is_empty()) {
      return Handling::Handled;
    }
    const PersistentGroupProfile *profile =
        persistent_groups.get(group->net_id);
    if (!profile || !profile->has_client(saved_config.device_address)) {
      return Handling::Handled;
    }
    // Peer forgot the group; drop it from the profile and invite again
    prune_persistent_client(group->net_id, saved_config.device_address);
    loop.post(Message(Cmd::Connect).with(saved_config));
    return Handling::Handled;
  }

  case Cmd::ProvisionDiscoveryPbcRequest:
  case Cmd::ProvisionDiscoveryEnterPin:
  case Cmd::ProvisionDiscoveryShowPin: {
    const auto *event = msg.get<ProvisionDiscoveryEvent>();
    if (!event) {
      return Handling::Handled;
    }
    if (!group->is_group_owner()) {
      P2PLINK_LOGD("Join request while group client ignored");
      return Handling::Handled;
    }

    saved_config.invalidate();
    saved_config.device_address = event->device.address;
    if (peers.update_supplicant_details(event->device)) {
      send_peers_changed();
    }
    if (msg.what == Cmd::ProvisionDiscoveryPbcRequest) {
      saved_config.wps.method = WpsMethod::Pbc;
    } else if (msg.what == Cmd::ProvisionDiscoveryEnterPin) {
      saved_config.wps.method = WpsMethod::Keypad;
    } else {
      saved_config.wps.method = WpsMethod::Display;
      saved_config.wps.pin = event->pin;
      show_pin(event->device.address, event->pin);
    }
    transition_to(P2pState::UserAuthorizingJoin);
    return Handling::Handled;
  }

  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// UserAuthorizingJoin
// ============================================================================

Handling P2pStateMachine::Impl::handle_user_authorizing_join(const Message &msg) {
  switch (msg.what) {
  case Cmd::AuthorizationResult:
    return handle_authorization_result(msg, AuthorizationKind::Join);
  case Cmd::SetConnectionRequestResult:
    return handle_connection_request_result(msg, AuthorizationKind::Join);
  case Cmd::ProvisionDiscoveryPbcRequest:
  case Cmd::ProvisionDiscoveryEnterPin:
  case Cmd::ProvisionDiscoveryShowPin:
    return Handling::Handled;
  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// OngoingGroupRemoval
// ============================================================================

Handling P2pStateMachine::Impl::handle_ongoing_group_removal(const Message &msg) {
  switch (msg.what) {
  case Cmd::RemoveGroup:
    reply_ok(msg);
    return Handling::Handled;
  case Cmd::DisableP2p:
  case Cmd::Connect:
  case Cmd::CreateGroup:
    return Handling::Deferred;
  default:
    return Handling::NotHandled;
  }
}

} // namespace p2plink
