/**
 * @file p2p_service.cpp
 * @brief P2pService implementation
 */

#define P2PLINK_LOG_TAG "P2pService"

#include "p2plink/p2p_service.h"
#include "p2plink/log.h"
#include "p2plink/p2plink.h"
#include "p2plink/validation.h"
#include <atomic>
#include <mutex>
#include <set>
#include <thread>

namespace p2plink {

// ============================================================================
// Version Information
// ============================================================================

VersionInfo get_version() { return VersionInfo{}; }

// ============================================================================
// Service Implementation
// ============================================================================

class P2pService::Impl {
public:
  std::mutex mutex;
  std::unique_ptr<P2pStateMachine> machine;
  std::thread thread;
  bool running = false;

  std::set<ClientId> registered;
  ClientId next_client_id = 1;
  std::atomic<RequestId> next_request_id{1};

  Result<void> check_client(ClientId client) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!machine) {
      return Error(ErrorCode::NotInitialized, "P2P service not initialized");
    }
    if (registered.count(client) == 0) {
      return Error(ErrorCode::UnknownClient,
                   "Client " + std::to_string(client) + " is not registered");
    }
    return Result<void>::ok();
  }

  Result<RequestId> submit(ClientId client, Message msg) {
    P2PLINK_TRY(check_client(client));
    RequestId request = next_request_id.fetch_add(1);
    msg.from(client, request);
    P2PLINK_LOGD("Client %u: %s (request %u)", client, cmd_name(msg.what),
                 request);
    machine->post(std::move(msg));
    return request;
  }

  void post_internal(Message msg) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!machine) {
      P2PLINK_LOGW("%s before init dropped", cmd_name(msg.what));
      return;
    }
    machine->post(std::move(msg));
  }
};

P2pService::P2pService() : impl_(std::make_unique<Impl>()) {}

P2pService::~P2pService() { shutdown(); }

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> P2pService::init(Collaborators collaborators,
                              const P2pServiceConfig &config,
                              std::shared_ptr<Clock> clock) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->machine) {
    return Error(ErrorCode::AlreadyInitialized, "P2P service already initialized");
  }

  P2PLINK_TRY(collaborators.validate());
  P2PLINK_TRY(config.validate());

  impl_->machine = std::make_unique<P2pStateMachine>(
      std::move(collaborators), config, std::move(clock));
  impl_->machine->start();

  P2PLINK_LOGI("P2P service initialized in %s",
               p2p_state_name(impl_->machine->current_state()));
  return Result<void>::ok();
}

Result<void> P2pService::start() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->machine) {
    return Error(ErrorCode::NotInitialized, "P2P service not initialized");
  }
  if (impl_->running) {
    return Error(ErrorCode::AlreadyInitialized, "P2P service already running");
  }

  P2pStateMachine *machine = impl_->machine.get();
  impl_->thread = std::thread([machine]() { machine->run(); });
  impl_->running = true;
  return Result<void>::ok();
}

void P2pService::shutdown() {
  std::thread thread;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->running) {
      return;
    }
    impl_->running = false;
    impl_->machine->quit();
    thread = std::move(impl_->thread);
  }
  if (thread.joinable()) {
    thread.join();
  }
  P2PLINK_LOGI("P2P service stopped");
}

bool P2pService::is_initialized() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->machine != nullptr;
}

bool P2pService::is_running() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->running;
}

size_t P2pService::dispatch_pending() {
  P2pStateMachine *machine = nullptr;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->machine || impl_->running) {
      return 0;
    }
    machine = impl_->machine.get();
  }
  return machine->dispatch_pending();
}

P2pStateMachine &P2pService::state_machine() { return *impl_->machine; }

// ============================================================================
// Clients
// ============================================================================

Result<ClientId>
P2pService::register_client(std::shared_ptr<ClientListener> listener) {
  if (!listener) {
    return Error(ErrorCode::InvalidArgument, "Listener is required");
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (!impl_->machine) {
    return Error(ErrorCode::NotInitialized, "P2P service not initialized");
  }
  ClientId id = impl_->next_client_id++;
  impl_->registered.insert(id);
  impl_->machine->post(
      Message(Cmd::ClientAttached).from(id, 0).with(std::move(listener)));
  return id;
}

Result<void> P2pService::unregister_client(ClientId client) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->registered.erase(client) == 0) {
    return Error(ErrorCode::UnknownClient);
  }
  impl_->machine->post(Message(Cmd::ClientDetached).from(client, 0));
  return Result<void>::ok();
}

Result<RequestId> P2pService::request_activation(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestActivation));
}

Result<RequestId> P2pService::release_activation(ClientId client) {
  return impl_->submit(client, Message(Cmd::ReleaseActivation));
}

// ============================================================================
// Discovery
// ============================================================================

Result<RequestId> P2pService::discover_peers(ClientId client,
                                             const DiscoveryParams &params) {
  P2PLINK_REQUIRE(params.timeout_s >= 0, ErrorCode::InvalidArgument,
                  "Negative discovery timeout");
  P2PLINK_REQUIRE(params.scan_type != ScanType::SpecificFrequency ||
                      params.frequency_mhz > 0,
                  ErrorCode::InvalidArgument,
                  "Specific-frequency scan needs a frequency");
  return impl_->submit(client, Message(Cmd::DiscoverPeers).with(params));
}

Result<RequestId> P2pService::stop_peer_discovery(ClientId client) {
  return impl_->submit(client, Message(Cmd::StopDiscovery));
}

Result<RequestId> P2pService::start_listening(ClientId client) {
  return impl_->submit(client, Message(Cmd::StartListen));
}

Result<RequestId> P2pService::stop_listening(ClientId client) {
  return impl_->submit(client, Message(Cmd::StopListen));
}

// ============================================================================
// Connection
// ============================================================================

Result<RequestId> P2pService::connect(ClientId client,
                                      const ConnectConfig &config) {
  P2PLINK_TRY(validate_connect_config(config));
  return impl_->submit(client, Message(Cmd::Connect).with(config));
}

Result<RequestId> P2pService::cancel_connect(ClientId client) {
  return impl_->submit(client, Message(Cmd::CancelConnect));
}

Result<RequestId> P2pService::create_group(ClientId client,
                                           const CreateGroupRequest &request) {
  if (request.config) {
    P2PLINK_REQUIRE(request.config->has_group_credentials(),
                    ErrorCode::MissingConfiguration,
                    "Group config needs network name and passphrase");
    P2PLINK_TRY(validate_group_config(*request.config));
  }
  return impl_->submit(client, Message(Cmd::CreateGroup).with(request));
}

Result<RequestId> P2pService::remove_group(ClientId client) {
  return impl_->submit(client, Message(Cmd::RemoveGroup));
}

Result<RequestId> P2pService::remove_group_client(ClientId client,
                                                  const MacAddress &peer) {
  P2PLINK_REQUIRE(!peer.is_zero() && !peer.is_broadcast(),
                  ErrorCode::InvalidAddress, "Peer address required");
  return impl_->submit(client, Message(Cmd::RemoveGroupClient).with(peer));
}

// ============================================================================
// Services
// ============================================================================

Result<RequestId> P2pService::add_local_service(ClientId client,
                                                const LocalService &service) {
  P2PLINK_TRY(validate_local_service(service));
  return impl_->submit(client, Message(Cmd::AddLocalService).with(service));
}

Result<RequestId>
P2pService::remove_local_service(ClientId client, const LocalService &service) {
  P2PLINK_TRY(validate_local_service(service));
  return impl_->submit(client, Message(Cmd::RemoveLocalService).with(service));
}

Result<RequestId> P2pService::clear_local_services(ClientId client) {
  return impl_->submit(client, Message(Cmd::ClearLocalServices));
}

Result<RequestId>
P2pService::add_service_request(ClientId client, const ServiceRequest &request) {
  P2PLINK_TRY(validate_service_request(request));
  return impl_->submit(client, Message(Cmd::AddServiceRequest).with(request));
}

Result<RequestId>
P2pService::remove_service_request(ClientId client,
                                   const ServiceRequest &request) {
  P2PLINK_TRY(validate_service_request(request));
  return impl_->submit(client,
                       Message(Cmd::RemoveServiceRequest).with(request));
}

Result<RequestId> P2pService::clear_service_requests(ClientId client) {
  return impl_->submit(client, Message(Cmd::ClearServiceRequests));
}

Result<RequestId> P2pService::discover_services(ClientId client,
                                                const DiscoveryParams &params) {
  P2PLINK_REQUIRE(params.timeout_s >= 0, ErrorCode::InvalidArgument,
                  "Negative discovery timeout");
  return impl_->submit(client, Message(Cmd::DiscoverServices).with(params));
}

Result<RequestId>
P2pService::start_usd_service_discovery(ClientId client,
                                        const UsdServiceConfig &config) {
  P2PLINK_TRY(validate_usd_config(config));
  return impl_->submit(client,
                       Message(Cmd::StartUsdDiscovery).with(UsdRequest{config, 0}));
}

Result<RequestId> P2pService::stop_usd_service_discovery(ClientId client,
                                                         int session_id) {
  P2PLINK_REQUIRE(session_id > 0, ErrorCode::InvalidArgument,
                  "Invalid USD session id");
  return impl_->submit(client, Message(Cmd::StopUsdDiscovery, session_id));
}

Result<RequestId>
P2pService::start_usd_service_advertisement(ClientId client,
                                            const UsdServiceConfig &config) {
  P2PLINK_TRY(validate_usd_config(config));
  return impl_->submit(
      client, Message(Cmd::StartUsdAdvertisement).with(UsdRequest{config, 0}));
}

Result<RequestId> P2pService::stop_usd_service_advertisement(ClientId client) {
  return impl_->submit(client, Message(Cmd::StopUsdAdvertisement));
}

// ============================================================================
// External Approvers
// ============================================================================

Result<RequestId> P2pService::add_external_approver(ClientId client,
                                                    const MacAddress &address) {
  P2PLINK_REQUIRE(!address.is_zero(), ErrorCode::InvalidAddress,
                  "Approver address required");
  return impl_->submit(client, Message(Cmd::AddExternalApprover).with(address));
}

Result<RequestId>
P2pService::remove_external_approver(ClientId client,
                                     const MacAddress &address) {
  P2PLINK_REQUIRE(!address.is_zero(), ErrorCode::InvalidAddress,
                  "Approver address required");
  return impl_->submit(client,
                       Message(Cmd::RemoveExternalApprover).with(address));
}

Result<RequestId> P2pService::set_connection_request_result(
    ClientId client, const MacAddress &address,
    ConnectionRequestResponse response, const std::string &pin) {
  P2PLINK_REQUIRE(!address.is_zero() && !address.is_broadcast(),
                  ErrorCode::InvalidAddress, "Peer address required");
  P2PLINK_REQUIRE(response != ConnectionRequestResponse::DeferShowPin ||
                      !pin.empty(),
                  ErrorCode::InvalidArgument, "PIN required");
  return impl_->submit(client,
                       Message(Cmd::SetConnectionRequestResult)
                           .with(ConnectionRequestResult{address, response, pin}));
}

// ============================================================================
// Device
// ============================================================================

Result<RequestId> P2pService::set_device_name(ClientId client,
                                              const std::string &name) {
  P2PLINK_TRY(validate_device_name(name));
  return impl_->submit(client, Message(Cmd::SetDeviceName).with(name));
}

Result<RequestId> P2pService::delete_persistent_group(ClientId client,
                                                      int net_id) {
  P2PLINK_REQUIRE(net_id >= 0, ErrorCode::InvalidArgument,
                  "Invalid network id");
  return impl_->submit(client, Message(Cmd::DeletePersistentGroup, net_id));
}

Result<RequestId> P2pService::factory_reset(ClientId client) {
  return impl_->submit(client, Message(Cmd::FactoryReset));
}

// ============================================================================
// Queries
// ============================================================================

Result<RequestId> P2pService::request_peers(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestPeers));
}

Result<RequestId> P2pService::request_connection_info(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestConnectionInfo));
}

Result<RequestId> P2pService::request_group_info(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestGroupInfo));
}

Result<RequestId> P2pService::request_persistent_group_info(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestPersistentGroupInfo));
}

Result<RequestId> P2pService::request_p2p_state(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestP2pState));
}

Result<RequestId> P2pService::request_discovery_state(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestDiscoveryState));
}

Result<RequestId> P2pService::request_device_info(ClientId client) {
  return impl_->submit(client, Message(Cmd::RequestDeviceInfo));
}

// ============================================================================
// Collaborator Entry Points
// ============================================================================

void P2pService::on_radio_state_changed(bool available) {
  impl_->post_internal(Message(Cmd::RadioStateChanged, available ? 1 : 0));
}

void P2pService::on_arbitration_result(bool approved) {
  impl_->post_internal(Message(Cmd::ArbitrationResult, approved ? 1 : 0));
}

void P2pService::on_authorization_decision(
    const AuthorizationResponse &response) {
  impl_->post_internal(Message(Cmd::AuthorizationResult).with(response));
}

void P2pService::on_frequency_conflict_decision(bool drop_infra) {
  impl_->post_internal(
      Message(Cmd::FrequencyConflictResult, drop_infra ? 1 : 0));
}

void P2pService::on_ip_provisioning_pre_dhcp() {
  impl_->post_internal(Message(Cmd::IpProvisioningPreDhcp));
}

void P2pService::on_ip_provisioning_post_dhcp() {
  impl_->post_internal(Message(Cmd::IpProvisioningPostDhcp));
}

void P2pService::on_ip_provisioning_success(
    const IpProvisioningResult &result) {
  impl_->post_internal(Message(Cmd::IpProvisioningSuccess).with(result));
}

void P2pService::on_ip_provisioning_failure() {
  impl_->post_internal(Message(Cmd::IpProvisioningFailure));
}

void P2pService::on_tethering_ready(const std::string &interface_name) {
  impl_->post_internal(Message(Cmd::TetheringReady).with(interface_name));
}

void P2pService::on_infra_disconnect_response(bool disconnected) {
  impl_->post_internal(
      Message(Cmd::InfraDisconnectResponse, disconnected ? 1 : 0));
}

} // namespace p2plink
