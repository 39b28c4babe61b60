/**
 * @file p2p_service.h
 * @brief Thread-safe entry point for local clients and collaborators
 *
 * Every request is validated on the calling thread, tagged with a request
 * id and queued to the state machine. The outcome arrives later through
 * the client's ClientListener::on_command_result (or the matching query
 * callback) carrying the same request id.
 *
 * @code
 *   p2plink::P2pService service;
 *   service.init(collaborators, config);
 *   service.start();
 *
 *   auto client = service.register_client(listener);
 *   service.request_activation(client.value());
 *   service.discover_peers(client.value());
 * @endcode
 */

#ifndef P2PLINK_P2P_SERVICE_H
#define P2PLINK_P2P_SERVICE_H

#include "collaborators.h"
#include "config.h"
#include "error.h"
#include "event_loop.h"
#include "listener.h"
#include "message.h"
#include "platform.h"
#include "service_types.h"
#include "state_machine.h"
#include "types.h"
#include <memory>
#include <string>

namespace p2plink {

class P2PLINK_API P2pService {
public:
  P2pService();
  ~P2pService();

  // Non-copyable
  P2pService(const P2pService &) = delete;
  P2pService &operator=(const P2pService &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Validate collaborators and configuration, build the machine
   * @param clock Time source for timers, steady clock if null
   */
  Result<void> init(Collaborators collaborators, const P2pServiceConfig &config,
                    std::shared_ptr<Clock> clock = nullptr);

  /// Run the state machine on a dedicated thread
  Result<void> start();

  /// Stop the thread; queued messages are dropped
  void shutdown();

  bool is_initialized() const;
  bool is_running() const;

  /**
   * @brief Handle ready messages on the calling thread
   *
   * For embedding in a foreign loop or for tests; do not combine with
   * start().
   */
  size_t dispatch_pending();

  /// The machine itself, for driver wiring and inspection
  P2pStateMachine &state_machine();

  // ========================================================================
  // Clients
  // ========================================================================

  Result<ClientId> register_client(std::shared_ptr<ClientListener> listener);
  Result<void> unregister_client(ClientId client);

  Result<RequestId> request_activation(ClientId client);
  Result<RequestId> release_activation(ClientId client);

  // ========================================================================
  // Discovery
  // ========================================================================

  Result<RequestId> discover_peers(ClientId client,
                                   const DiscoveryParams &params = {});
  Result<RequestId> stop_peer_discovery(ClientId client);
  Result<RequestId> start_listening(ClientId client);
  Result<RequestId> stop_listening(ClientId client);

  // ========================================================================
  // Connection
  // ========================================================================

  Result<RequestId> connect(ClientId client, const ConnectConfig &config);
  Result<RequestId> cancel_connect(ClientId client);
  Result<RequestId> create_group(ClientId client,
                                 const CreateGroupRequest &request = {});
  Result<RequestId> remove_group(ClientId client);
  Result<RequestId> remove_group_client(ClientId client,
                                        const MacAddress &peer);

  // ========================================================================
  // Services
  // ========================================================================

  Result<RequestId> add_local_service(ClientId client,
                                      const LocalService &service);
  Result<RequestId> remove_local_service(ClientId client,
                                         const LocalService &service);
  Result<RequestId> clear_local_services(ClientId client);

  Result<RequestId> add_service_request(ClientId client,
                                        const ServiceRequest &request);
  Result<RequestId> remove_service_request(ClientId client,
                                           const ServiceRequest &request);
  Result<RequestId> clear_service_requests(ClientId client);
  Result<RequestId> discover_services(ClientId client,
                                      const DiscoveryParams &params = {});

  /// The session id arrives via ClientListener::on_usd_session_started
  Result<RequestId> start_usd_service_discovery(ClientId client,
                                                const UsdServiceConfig &config);
  Result<RequestId> stop_usd_service_discovery(ClientId client,
                                               int session_id);
  Result<RequestId>
  start_usd_service_advertisement(ClientId client,
                                  const UsdServiceConfig &config);
  Result<RequestId> stop_usd_service_advertisement(ClientId client);

  // ========================================================================
  // External Approvers
  // ========================================================================

  /// MacAddress::broadcast() registers for every peer
  Result<RequestId> add_external_approver(ClientId client,
                                          const MacAddress &address);
  Result<RequestId> remove_external_approver(ClientId client,
                                             const MacAddress &address);
  Result<RequestId>
  set_connection_request_result(ClientId client, const MacAddress &address,
                                ConnectionRequestResponse response,
                                const std::string &pin = "");

  // ========================================================================
  // Device
  // ========================================================================

  Result<RequestId> set_device_name(ClientId client, const std::string &name);
  Result<RequestId> delete_persistent_group(ClientId client, int net_id);
  Result<RequestId> factory_reset(ClientId client);

  // ========================================================================
  // Queries
  // ========================================================================

  Result<RequestId> request_peers(ClientId client);
  Result<RequestId> request_connection_info(ClientId client);
  Result<RequestId> request_group_info(ClientId client);
  Result<RequestId> request_persistent_group_info(ClientId client);
  Result<RequestId> request_p2p_state(ClientId client);
  Result<RequestId> request_discovery_state(ClientId client);
  Result<RequestId> request_device_info(ClientId client);

  // ========================================================================
  // Collaborator Entry Points
  // ========================================================================

  void on_radio_state_changed(bool available);
  void on_arbitration_result(bool approved);
  void on_authorization_decision(const AuthorizationResponse &response);
  void on_frequency_conflict_decision(bool drop_infra);
  void on_ip_provisioning_pre_dhcp();
  void on_ip_provisioning_post_dhcp();
  void on_ip_provisioning_success(const IpProvisioningResult &result);
  void on_ip_provisioning_failure();
  void on_tethering_ready(const std::string &interface_name);
  void on_infra_disconnect_response(bool disconnected);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace p2plink

#endif // P2PLINK_P2P_SERVICE_H
