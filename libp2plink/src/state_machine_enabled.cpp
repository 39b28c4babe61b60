/**
 * @file state_machine_enabled.cpp
 * @brief Enabled and Inactive states
 */

#define P2PLINK_LOG_TAG "P2pStateMachine"

#include "p2plink/log.h"
#include "state_machine_pimpl.h"

namespace p2plink {

// ============================================================================
// Enabled
// ============================================================================

void P2pStateMachine::Impl::enter_enabled() {
  set_availability(P2pAvailability::Enabled);

  auto address = deps.driver->get_device_address();
  if (address) {
    this_device.address = address.value();
  } else {
    P2PLINK_LOGW("Device address unavailable: %s",
                 address.error().to_string().c_str());
  }

  auto named = apply_device_name(default_device_name());
  if (named.is_error()) {
    P2PLINK_LOGW("Setting device name failed: %s",
                 named.error().to_string().c_str());
  }
  update_this_device_status(PeerStatus::Available);

  reload_persistent_groups();
  if (config.pending_factory_reset) {
    factory_reset_now();
  }
}

void P2pStateMachine::Impl::exit_enabled() {
  if (discovery_active) {
    send_discovery_changed(false);
  }
  set_availability(P2pAvailability::Disabled);
}

Handling P2pStateMachine::Impl::handle_enabled(const Message &msg) {
  if (handle_service_command(msg) == Handling::Handled) {
    return Handling::Handled;
  }

  switch (msg.what) {
  case Cmd::EnableP2p:
    return Handling::Handled;

  case Cmd::DisableP2p:
    teardown_p2p();
    return Handling::Handled;

  case Cmd::DriverDisconnected:
    cleanup_after_driver_loss();
    return Handling::Handled;

  // ------------------------------------------------------------------------
  // Discovery
  // ------------------------------------------------------------------------
  case Cmd::DiscoverPeers: {
    DiscoveryParams params;
    if (const auto *requested = msg.get<DiscoveryParams>()) {
      params = *requested;
    }
    if (params.timeout_s == 0) {
      params.timeout_s = config.discovery_timeout_s;
    }
    // Plain peer discovery must not carry service queries
    services.cancel_driver_request(*deps.driver);

    auto started = deps.driver->start_discovery(params);
    if (started) {
      send_discovery_changed(true);
    }
    reply(msg, started);
    return Handling::Handled;
  }

  case Cmd::StopDiscovery: {
    auto stopped = deps.driver->stop_discovery();
    if (stopped && discovery_active) {
      send_discovery_changed(false);
    }
    reply(msg, stopped);
    return Handling::Handled;
  }

  case Cmd::FindStopped:
    if (discovery_active) {
      send_discovery_changed(false);
    }
    return Handling::Handled;

  case Cmd::DiscoverServices: {
    if (!services.has_requests()) {
      reply_error(msg, ErrorCode::NoServiceRequests);
      return Handling::Handled;
    }
    auto updated = services.update_driver_request(*deps.driver);
    if (updated.is_error()) {
      reply(msg, updated);
      return Handling::Handled;
    }
    DiscoveryParams params;
    if (const auto *requested = msg.get<DiscoveryParams>()) {
      params = *requested;
    }
    if (params.timeout_s == 0) {
      params.timeout_s = config.discovery_timeout_s;
    }
    auto started = deps.driver->start_discovery(params);
    if (started) {
      send_discovery_changed(true);
    }
    reply(msg, started);
    return Handling::Handled;
  }

  case Cmd::StartListen: {
    auto stopped = deps.driver->stop_discovery();
    if (stopped.is_error()) {
      P2PLINK_LOGD("stop_discovery: %s", stopped.error().to_string().c_str());
    }
    reply(msg, deps.driver->set_extended_listen(true, 500, 5000));
    return Handling::Handled;
  }

  case Cmd::StopListen:
    reply(msg, deps.driver->set_extended_listen(false, 0, 0));
    return Handling::Handled;

  // ------------------------------------------------------------------------
  // Peers
  // ------------------------------------------------------------------------
  case Cmd::DeviceFound: {
    const auto *device = msg.get<P2pDevice>();
    if (!device || device->address == this_device.address) {
      return Handling::Handled;
    }
    if (peers.update_supplicant_details(*device)) {
      send_peers_changed();
    }
    return Handling::Handled;
  }

  case Cmd::DeviceLost: {
    const auto *device = msg.get<P2pDevice>();
    if (!device) {
      return Handling::Handled;
    }
    if (peers.remove(device->address)) {
      detach_approvers_for_peer(device->address,
                                ApproverDetachReason::PeerRemoved);
      send_peers_changed();
    }
    return Handling::Handled;
  }

  // ------------------------------------------------------------------------
  // Connection
  // ------------------------------------------------------------------------
  case Cmd::CancelConnect:
    handle_group_creation_failure(ConnectionFailure::Cancel);
    reply_ok(msg);
    return Handling::Handled;

  case Cmd::RemoveGroup:
  case Cmd::RemoveGroupClient:
    reply_error(msg, ErrorCode::NoActiveGroup);
    return Handling::Handled;

  case Cmd::GroupStarted: {
    const auto *started = msg.get<P2pGroup>();
    if (!started) {
      return Handling::Handled;
    }
    if (group && group->interface_name == started->interface_name) {
      return Handling::Handled;
    }
    P2PLINK_LOGW("Unexpected group %s, removing",
                 started->interface_name.c_str());
    auto removed = deps.driver->group_remove(started->interface_name);
    if (removed.is_error()) {
      P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
    }
    return Handling::Handled;
  }

  // ------------------------------------------------------------------------
  // Service discovery results
  // ------------------------------------------------------------------------
  case Cmd::ServiceDiscoveryResponse: {
    const auto *frame = msg.get<ServiceResponseFrame>();
    if (!frame) {
      return Handling::Handled;
    }
    for (const auto &routed : services.route_responses(frame->source,
                                                       frame->tlvs)) {
      auto listener = listener_for(routed.first);
      if (listener) {
        listener->on_service_response(routed.second);
      }
    }
    return Handling::Handled;
  }

  case Cmd::UsdDiscoveryResult: {
    const auto *result = msg.get<UsdDiscoveryResult>();
    if (!result) {
      return Handling::Handled;
    }
    auto owner = services.usd_session_owner(result->session_id, false);
    auto listener = owner ? listener_for(*owner) : nullptr;
    if (!listener) {
      P2PLINK_LOGD("USD result for unknown session %d dropped",
                   result->session_id);
      return Handling::Handled;
    }
    listener->on_usd_discovery_result(*result);
    return Handling::Handled;
  }

  case Cmd::UsdSessionTerminated: {
    bool advertisement = msg.arg2 != 0;
    auto owner = services.on_usd_session_terminated(msg.arg1, advertisement);
    auto listener = owner ? listener_for(*owner) : nullptr;
    if (listener) {
      listener->on_usd_session_terminated(msg.arg1, advertisement);
    }
    return Handling::Handled;
  }

  // ------------------------------------------------------------------------
  // Device settings
  // ------------------------------------------------------------------------
  case Cmd::SetDeviceName: {
    const auto *name = msg.get<std::string>();
    if (!name) {
      reply_error(msg, ErrorCode::InvalidDeviceName);
      return Handling::Handled;
    }
    auto applied = apply_device_name(*name);
    if (applied.is_error()) {
      reply(msg, applied);
      return Handling::Handled;
    }
    config.device_name = *name;
    if (deps.config_store) {
      auto saved = deps.config_store->set_device_name(*name);
      if (saved.is_error()) {
        P2PLINK_LOGW("Saving device name failed: %s",
                     saved.error().to_string().c_str());
      }
    }
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::DeletePersistentGroup: {
    auto removed = persistent_groups.remove(*deps.driver, msg.arg1);
    if (removed) {
      send_persistent_groups_changed();
    }
    reply(msg, removed);
    return Handling::Handled;
  }

  case Cmd::FactoryReset:
    factory_reset_now();
    reply_ok(msg);
    return Handling::Handled;

  default:
    return Handling::NotHandled;
  }
}

Handling P2pStateMachine::Impl::handle_service_command(const Message &msg) {
  DriverCommandInterface &driver = *deps.driver;

  switch (msg.what) {
  case Cmd::AddLocalService: {
    const auto *service = msg.get<LocalService>();
    if (!service) {
      reply_error(msg, ErrorCode::InvalidServiceInfo);
      return Handling::Handled;
    }
    reply(msg, services.add_local_service(driver, msg.client, *service));
    return Handling::Handled;
  }

  case Cmd::RemoveLocalService: {
    const auto *service = msg.get<LocalService>();
    if (service) {
      services.remove_local_service(driver, msg.client, *service);
    }
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::ClearLocalServices:
    services.clear_local_services(driver, msg.client);
    reply_ok(msg);
    return Handling::Handled;

  case Cmd::AddServiceRequest: {
    const auto *request = msg.get<ServiceRequest>();
    if (!request) {
      reply_error(msg, ErrorCode::InvalidServiceRequest);
      return Handling::Handled;
    }
    auto added = services.add_request(driver, msg.client, *request);
    if (added.is_error()) {
      reply(msg, Result<void>(added.error()));
    } else {
      reply_ok(msg);
    }
    return Handling::Handled;
  }

  case Cmd::RemoveServiceRequest: {
    const auto *request = msg.get<ServiceRequest>();
    if (request) {
      services.remove_request(driver, msg.client, *request);
    }
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::ClearServiceRequests:
    services.clear_requests(driver, msg.client);
    reply_ok(msg);
    return Handling::Handled;

  case Cmd::StartUsdDiscovery:
  case Cmd::StartUsdAdvertisement: {
    const auto *request = msg.get<UsdRequest>();
    if (!request) {
      reply_error(msg, ErrorCode::InvalidUsdConfig);
      return Handling::Handled;
    }
    bool advertise = msg.what == Cmd::StartUsdAdvertisement;
    auto session =
        advertise ? services.start_usd_advertisement(
                        driver, msg.client, request->config,
                        config.usd_session_timeout_s)
                  : services.start_usd_discovery(driver, msg.client,
                                                 request->config,
                                                 config.usd_session_timeout_s);
    if (session.is_error()) {
      reply(msg, Result<void>(session.error()));
      return Handling::Handled;
    }
    auto listener = listener_for(msg.client);
    if (listener) {
      listener->on_usd_session_started(msg.request_id, session.value());
    }
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::StopUsdDiscovery:
    if (!services.stop_usd_discovery(driver, msg.client, msg.arg1)) {
      reply_error(msg, ErrorCode::NotFound, "No such USD session");
      return Handling::Handled;
    }
    reply_ok(msg);
    return Handling::Handled;

  case Cmd::StopUsdAdvertisement:
    if (!services.stop_usd_advertisement(driver, msg.client)) {
      reply_error(msg, ErrorCode::NotFound, "No USD advertisement");
      return Handling::Handled;
    }
    reply_ok(msg);
    return Handling::Handled;

  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// Inactive
// ============================================================================

void P2pStateMachine::Impl::enter_inactive() {
  saved_config.invalidate();
  session_active = false;
  autonomous_group = false;
  join_existing_group = false;
  if (!has_activated_clients()) {
    arm_idle_shutdown();
  }
}

Handling P2pStateMachine::Impl::handle_inactive(const Message &msg) {
  switch (msg.what) {
  case Cmd::Connect:
    handle_connect_inactive(msg);
    return Handling::Handled;

  case Cmd::CreateGroup:
    handle_create_group_inactive(msg);
    return Handling::Handled;

  case Cmd::GoNegotiationRequest: {
    const auto *request = msg.get<ConnectConfig>();
    if (!request || request->is_empty()) {
      return Handling::Handled;
    }
    P2PLINK_LOGI("GO negotiation request from %s",
                 request->device_address.to_string().c_str());
    saved_config = *request;
    session_active = true;
    if (deps.metrics) {
      deps.metrics->start_connection_event(ConnectionType::Incoming,
                                           saved_config);
    }
    transition_to(P2pState::UserAuthorizingNegotiationRequest);
    return Handling::Handled;
  }

  case Cmd::InvitationReceived: {
    const auto *invitation = msg.get<P2pGroup>();
    if (!invitation) {
      return Handling::Handled;
    }
    MacAddress owner;
    if (invitation->owner) {
      owner = invitation->owner->address;
    } else if (auto stored = persistent_groups.owner_address(invitation->net_id)) {
      owner = *stored;
    }
    if (owner.is_zero() || owner == this_device.address) {
      P2PLINK_LOGW("Invitation without a resolvable owner ignored");
      return Handling::Handled;
    }

    P2PLINK_LOGI("Invitation from %s to %s", owner.to_string().c_str(),
                 invitation->network_name.c_str());
    saved_config.invalidate();
    saved_config.device_address = owner;
    saved_config.net_id = invitation->net_id;

    const P2pDevice *peer = peers.get(owner);
    if (peer) {
      if (peer->wps_pbc_supported()) {
        saved_config.wps.method = WpsMethod::Pbc;
      } else if (peer->wps_keypad_supported()) {
        saved_config.wps.method = WpsMethod::Keypad;
      } else if (peer->wps_display_supported()) {
        saved_config.wps.method = WpsMethod::Display;
      }
    }

    join_existing_group = true;
    session_active = true;
    if (deps.metrics) {
      deps.metrics->start_connection_event(ConnectionType::Incoming,
                                           saved_config);
    }
    transition_to(P2pState::UserAuthorizingInviteRequest);
    return Handling::Handled;
  }

  case Cmd::ProvisionDiscoveryPbcRequest:
  case Cmd::ProvisionDiscoveryEnterPin:
  case Cmd::ProvisionDiscoveryShowPin:
    // Negotiation follows if the peer goes on
    return Handling::Handled;

  case Cmd::GroupStarted: {
    const auto *started = msg.get<P2pGroup>();
    if (!started) {
      return Handling::Handled;
    }
    if (started->net_id == kNetworkIdTemporary) {
      P2PLINK_LOGW("Unexpected group %s, removing",
                   started->interface_name.c_str());
      auto removed = deps.driver->group_remove(started->interface_name);
      if (removed.is_error()) {
        P2PLINK_LOGW("group_remove: %s", removed.error().to_string().c_str());
      }
      return Handling::Handled;
    }

    // The supplicant reinvoked a stored group on its own
    P2PLINK_LOGI("Persistent group %s started by the supplicant",
                 started->interface_name.c_str());
    autonomous_group = false;
    session_active = true;
    if (started->owner) {
      saved_config.device_address = started->owner->address;
    }
    if (deps.metrics) {
      deps.metrics->start_connection_event(ConnectionType::Reinvoke,
                                           saved_config);
    }
    transition_to(P2pState::GroupNegotiation);
    return Handling::Deferred;
  }

  case Cmd::IdleShutdown:
    if (!idle_shutdown_armed || msg.arg1 != idle_shutdown_generation) {
      return Handling::NotHandled;
    }
    idle_shutdown_armed = false;
    P2PLINK_LOGI("Idle, shutting P2P down");
    teardown_p2p();
    return Handling::Handled;

  default:
    return Handling::NotHandled;
  }
}

void P2pStateMachine::Impl::handle_connect_inactive(const Message &msg) {
  const auto *requested = msg.get<ConnectConfig>();
  if (!requested) {
    reply_error(msg, ErrorCode::MissingConfiguration);
    return;
  }

  if (requested->has_group_credentials()) {
    GroupAddRequest request;
    request.config = *requested;
    request.join = true;
    request.frequency_mhz = requested->frequency_mhz;
    auto added = deps.driver->group_add(request);
    if (added.is_error()) {
      reply(msg, added);
      return;
    }
    P2PLINK_LOGI("Joining %s directly", requested->network_name.c_str());
    saved_config = *requested;
    session_active = true;
    if (deps.metrics) {
      deps.metrics->start_connection_event(ConnectionType::Fast, saved_config);
    }
    reply_ok(msg);
    transition_to(P2pState::GroupNegotiation);
    return;
  }

  const MacAddress &address = requested->device_address;
  if (!peers.contains(address)) {
    reply_error(msg, ErrorCode::PeerNotFound, address.to_string());
    return;
  }

  auto stopped = deps.driver->stop_discovery();
  if (stopped.is_error()) {
    P2PLINK_LOGD("stop_discovery: %s", stopped.error().to_string().c_str());
  }

  saved_config = *requested;
  session_active = true;

  bool reinvoked = reinvoke_persistent_group(false);
  if (deps.metrics) {
    deps.metrics->start_connection_event(
        reinvoked ? ConnectionType::Reinvoke : ConnectionType::Fresh,
        saved_config);
  }

  peers.update_status(address, PeerStatus::Invited);
  send_peers_changed();
  reply_ok(msg);

  transition_to(reinvoked ? P2pState::GroupNegotiation
                          : P2pState::ProvisionDiscovery);
}

void P2pStateMachine::Impl::handle_create_group_inactive(const Message &msg) {
  CreateGroupRequest requested;
  if (const auto *payload = msg.get<CreateGroupRequest>()) {
    requested = *payload;
  }

  GroupAddRequest request;
  if (requested.config) {
    request.config = requested.config;
    request.frequency_mhz = requested.config->frequency_mhz;
  } else if (requested.net_id >= 0) {
    request.net_id = requested.net_id;
  } else if (requested.persistent ||
             requested.net_id == kNetworkIdPersistent) {
    int stored = persistent_groups.network_id(this_device.address);
    if (stored >= 0) {
      request.net_id = stored;
    } else {
      request.persistent = true;
    }
  }

  auto added = deps.driver->group_add(request);
  if (added.is_error()) {
    reply(msg, added);
    return;
  }

  P2PLINK_LOGI("Autonomous group requested (net id %d)", request.net_id);
  autonomous_group = true;
  session_active = true;
  if (deps.metrics) {
    deps.metrics->start_connection_event(ConnectionType::Local, saved_config);
  }
  reply_ok(msg);
  transition_to(P2pState::GroupNegotiation);
}

} // namespace p2plink
