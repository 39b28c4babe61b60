/**
 * @file state_machine_disabled.cpp
 * @brief Root defaults and the NotSupported, Disabling and Disabled subtree
 */

#define P2PLINK_LOG_TAG "P2pStateMachine"

#include "p2plink/log.h"
#include "state_machine_pimpl.h"

namespace p2plink {

namespace {

/// Client requests that need an enabled, idle machine
bool is_action_command(Cmd what) {
  switch (what) {
  case Cmd::DiscoverPeers:
  case Cmd::StopDiscovery:
  case Cmd::StartListen:
  case Cmd::StopListen:
  case Cmd::Connect:
  case Cmd::CancelConnect:
  case Cmd::CreateGroup:
  case Cmd::RemoveGroup:
  case Cmd::RemoveGroupClient:
  case Cmd::AddLocalService:
  case Cmd::RemoveLocalService:
  case Cmd::ClearLocalServices:
  case Cmd::AddServiceRequest:
  case Cmd::RemoveServiceRequest:
  case Cmd::ClearServiceRequests:
  case Cmd::DiscoverServices:
  case Cmd::StartUsdDiscovery:
  case Cmd::StopUsdDiscovery:
  case Cmd::StartUsdAdvertisement:
  case Cmd::StopUsdAdvertisement:
    return true;
  default:
    return false;
  }
}

bool is_timer(Cmd what) {
  return what == Cmd::GroupCreatingTimedOut || what == Cmd::DisableTimedOut ||
         what == Cmd::IdleShutdown || what == Cmd::RejectWaitElapsed;
}

} // namespace

// ============================================================================
// Root
// ============================================================================

Handling P2pStateMachine::Impl::handle_root(const Message &msg) {
  if (is_action_command(msg.what)) {
    if (in_state(P2pState::Enabled)) {
      reply_error(msg, ErrorCode::Busy);
    } else {
      reply_error(msg, ErrorCode::P2pDisabled);
    }
    return Handling::Handled;
  }
  if (is_timer(msg.what)) {
    P2PLINK_LOGD("Stale %s (generation %d) ignored", cmd_name(msg.what),
                 msg.arg1);
    return Handling::Handled;
  }

  switch (msg.what) {
  // ------------------------------------------------------------------------
  // Client lifecycle
  // ------------------------------------------------------------------------
  case Cmd::ClientAttached: {
    const auto *listener = msg.get<std::shared_ptr<ClientListener>>();
    if (!listener || !*listener) {
      return Handling::Handled;
    }
    clients[msg.client] = ClientRecord{*listener, false};
    P2PLINK_LOGI("Client %u attached (%zu total)", msg.client, clients.size());
    (*listener)->on_p2p_state_changed(availability);
    return Handling::Handled;
  }

  case Cmd::ClientDetached: {
    if (clients.count(msg.client) == 0) {
      return Handling::Handled;
    }
    P2PLINK_LOGI("Client %u detached", msg.client);

    DriverCommandInterface *driver =
        in_state(P2pState::Enabled) ? deps.driver.get() : nullptr;
    services.remove_client(driver, msg.client);
    detach_approvers(approvers.remove_all_for_owner(msg.client),
                     ApproverDetachReason::ClientClosed);

    clients.erase(msg.client);
    if (!has_activated_clients() && in_state(P2pState::Inactive)) {
      arm_idle_shutdown();
    }
    return Handling::Handled;
  }

  case Cmd::RequestActivation: {
    auto it = clients.find(msg.client);
    if (it == clients.end()) {
      reply_error(msg, ErrorCode::UnknownClient);
      return Handling::Handled;
    }
    it->second.activated = true;
    disarm_idle_shutdown();
    check_and_reenable();
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::ReleaseActivation: {
    auto it = clients.find(msg.client);
    if (it == clients.end()) {
      reply_error(msg, ErrorCode::UnknownClient);
      return Handling::Handled;
    }
    it->second.activated = false;
    if (!has_activated_clients() && in_state(P2pState::Inactive)) {
      arm_idle_shutdown();
    }
    reply_ok(msg);
    return Handling::Handled;
  }

  // ------------------------------------------------------------------------
  // Queries
  // ------------------------------------------------------------------------
  case Cmd::RequestPeers:
  case Cmd::RequestConnectionInfo:
  case Cmd::RequestGroupInfo:
  case Cmd::RequestPersistentGroupInfo:
  case Cmd::RequestP2pState:
  case Cmd::RequestDiscoveryState:
  case Cmd::RequestDeviceInfo: {
    auto listener = listener_for(msg.client);
    if (!listener) {
      return Handling::Handled;
    }
    switch (msg.what) {
    case Cmd::RequestPeers:
      listener->on_peers(msg.request_id, peers.list());
      break;
    case Cmd::RequestConnectionInfo:
      listener->on_connection_info(msg.request_id, connection_info);
      break;
    case Cmd::RequestGroupInfo:
      listener->on_group_info(msg.request_id, group);
      break;
    case Cmd::RequestPersistentGroupInfo:
      listener->on_persistent_groups(msg.request_id, persistent_groups.list());
      break;
    case Cmd::RequestP2pState:
      listener->on_p2p_state(msg.request_id, availability);
      break;
    case Cmd::RequestDiscoveryState:
      listener->on_discovery_state(msg.request_id, discovery_active);
      break;
    default:
      listener->on_device_info(msg.request_id, this_device);
      break;
    }
    return Handling::Handled;
  }

  // ------------------------------------------------------------------------
  // External approvers
  // ------------------------------------------------------------------------
  case Cmd::AddExternalApprover: {
    const auto *address = msg.get<MacAddress>();
    auto listener = listener_for(msg.client);
    if (!address || !listener) {
      reply_error(msg, ErrorCode::InvalidArgument);
      return Handling::Handled;
    }
    auto replaced = approvers.add(msg.client, *address);
    if (replaced) {
      detach_approvers({*replaced}, ApproverDetachReason::Replaced);
    }
    P2PLINK_LOGI("Client %u approves for %s", msg.client,
                 address->to_string().c_str());
    listener->on_approver_attached(*address);
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::RemoveExternalApprover: {
    const auto *address = msg.get<MacAddress>();
    if (!address) {
      reply_error(msg, ErrorCode::InvalidArgument);
      return Handling::Handled;
    }
    auto removed = approvers.remove(msg.client, *address);
    if (!removed) {
      reply_error(msg, ErrorCode::ApproverNotFound);
      return Handling::Handled;
    }
    detach_approvers({*removed}, ApproverDetachReason::Removed);
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::SetConnectionRequestResult:
    reply_error(msg, ErrorCode::InvalidState, "No pending connection request");
    return Handling::Handled;

  // ------------------------------------------------------------------------
  // Device settings while disabled
  // ------------------------------------------------------------------------
  case Cmd::SetDeviceName: {
    const auto *name = msg.get<std::string>();
    if (!name) {
      reply_error(msg, ErrorCode::InvalidDeviceName);
      return Handling::Handled;
    }
    config.device_name = *name;
    if (deps.config_store) {
      auto saved = deps.config_store->set_device_name(*name);
      if (saved.is_error()) {
        reply(msg, saved);
        return Handling::Handled;
      }
    }
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::FactoryReset: {
    P2PLINK_LOGI("Factory reset deferred until P2P is enabled");
    config.pending_factory_reset = true;
    if (deps.config_store) {
      auto saved = deps.config_store->set_pending_factory_reset(true);
      if (saved.is_error()) {
        reply(msg, saved);
        return Handling::Handled;
      }
    }
    reply_ok(msg);
    return Handling::Handled;
  }

  case Cmd::DeletePersistentGroup:
    reply_error(msg, ErrorCode::P2pDisabled);
    return Handling::Handled;

  // ------------------------------------------------------------------------
  // System
  // ------------------------------------------------------------------------
  case Cmd::RadioStateChanged: {
    bool available = msg.arg1 != 0;
    if (available == radio_available) {
      return Handling::Handled;
    }
    radio_available = available;
    P2PLINK_LOGI("Radio %s", available ? "available" : "lost");
    if (!available) {
      if (in_state(P2pState::Enabled)) {
        loop.post(Message(Cmd::DisableP2p));
      } else {
        set_availability(P2pAvailability::Unavailable);
      }
    } else {
      if (!in_state(P2pState::Enabled)) {
        set_availability(P2pAvailability::Disabled);
      }
      check_and_reenable();
    }
    return Handling::Handled;
  }

  default:
    P2PLINK_LOGD("%s ignored in %s", cmd_name(msg.what),
                 p2p_state_name(state));
    return Handling::Handled;
  }
}

// ============================================================================
// NotSupported
// ============================================================================

Handling P2pStateMachine::Impl::handle_not_supported(const Message &msg) {
  if (is_action_command(msg.what) || msg.what == Cmd::EnableP2p ||
      msg.what == Cmd::DeletePersistentGroup) {
    reply_error(msg, ErrorCode::P2pUnsupported);
    return Handling::Handled;
  }
  return Handling::NotHandled;
}

// ============================================================================
// Disabling
// ============================================================================

void P2pStateMachine::Impl::enter_disabling() {
  arm_timer(Cmd::DisableTimedOut, disable_generation,
            config.disable_timeout_ms);
}

Handling P2pStateMachine::Impl::handle_disabling(const Message &msg) {
  switch (msg.what) {
  case Cmd::DriverDisconnected:
    P2PLINK_LOGD("P2P interface released");
    transition_to(P2pState::DisabledIdle);
    return Handling::Handled;

  case Cmd::DisableTimedOut:
    if (msg.arg1 != disable_generation) {
      return Handling::NotHandled;
    }
    P2PLINK_LOGW("Timed out waiting for the interface to go down");
    transition_to(P2pState::DisabledIdle);
    return Handling::Handled;

  case Cmd::EnableP2p:
  case Cmd::DisableP2p:
  case Cmd::RadioStateChanged:
  case Cmd::ClientDetached:
  case Cmd::RequestActivation:
  case Cmd::ReleaseActivation:
    return Handling::Deferred;

  default:
    return Handling::NotHandled;
  }
}

// ============================================================================
// Disabled
// ============================================================================

void P2pStateMachine::Impl::enter_disabled() {
  interface_name.clear();
  set_availability(radio_available ? P2pAvailability::Disabled
                                   : P2pAvailability::Unavailable);
  check_and_reenable();
}

Handling P2pStateMachine::Impl::handle_disabled(const Message &msg) {
  switch (msg.what) {
  case Cmd::DisableP2p:
    return Handling::Handled;
  default:
    return Handling::NotHandled;
  }
}

Handling P2pStateMachine::Impl::handle_disabled_idle(const Message &msg) {
  if (msg.what != Cmd::EnableP2p) {
    return Handling::NotHandled;
  }

  if (!has_activated_clients()) {
    P2PLINK_LOGD("No activated client, staying disabled");
    return Handling::Handled;
  }
  if (!radio_available) {
    set_availability(P2pAvailability::Unavailable);
    return Handling::Handled;
  }

  ArbitrationResult result = deps.arbiter->request_interface();
  P2PLINK_LOGI("Interface arbitration: %s", arbitration_result_name(result));
  switch (result) {
  case ArbitrationResult::Proceed:
    enable_interface();
    break;
  case ArbitrationResult::Abort:
    set_availability(P2pAvailability::Unavailable);
    break;
  case ArbitrationResult::WaitForUser:
    transition_to(P2pState::WaitingForResourceArbitration);
    break;
  }
  return Handling::Handled;
}

Handling
P2pStateMachine::Impl::handle_waiting_for_arbitration(const Message &msg) {
  switch (msg.what) {
  case Cmd::ArbitrationResult:
    if (msg.arg1 != 0) {
      enable_interface();
    } else {
      P2PLINK_LOGW("Interface creation refused");
      set_availability(P2pAvailability::Unavailable);
      transition_to(P2pState::DisabledIdle);
    }
    return Handling::Handled;

  case Cmd::EnableP2p:
    return Handling::Handled;

  case Cmd::DisableP2p:
    deps.arbiter->release_interface();
    transition_to(P2pState::DisabledIdle);
    return Handling::Handled;

  default:
    return Handling::NotHandled;
  }
}

} // namespace p2plink
