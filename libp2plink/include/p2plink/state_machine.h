/**
 * @file state_machine.h
 * @brief Hierarchical state machine for the P2P connection lifecycle
 *
 * Owns the peer registry, active group, persistent group cache, service
 * discovery tracker and approver registry. All of them are touched only
 * from the thread that dispatches the machine's queue.
 */

#ifndef P2PLINK_STATE_MACHINE_H
#define P2PLINK_STATE_MACHINE_H

#include "approver.h"
#include "collaborators.h"
#include "config.h"
#include "driver.h"
#include "error.h"
#include "event_loop.h"
#include "group.h"
#include "listener.h"
#include "message.h"
#include "peer.h"
#include "persistent_groups.h"
#include "platform.h"
#include "service_discovery.h"
#include <memory>
#include <optional>

namespace p2plink {

// ============================================================================
// States
// ============================================================================

enum class P2pState : uint8_t {
  Root,
  NotSupported,
  Disabling,
  Disabled,
  DisabledIdle,
  WaitingForResourceArbitration,
  Enabled,
  Inactive,
  GroupCreating,
  UserAuthorizingInviteRequest,
  UserAuthorizingNegotiationRequest,
  ProvisionDiscovery,
  GroupNegotiation,
  FrequencyConflict,
  RejectWait,
  GroupCreated,
  UserAuthorizingJoin,
  OngoingGroupRemoval
};

P2PLINK_API const char *p2p_state_name(P2pState state);

/// Parent in the hierarchy, nullopt for Root
P2PLINK_API std::optional<P2pState> p2p_state_parent(P2pState state);

/// True if @p state is @p ancestor or lies below it
P2PLINK_API bool p2p_state_is_within(P2pState state, P2pState ancestor);

// ============================================================================
// Collaborators
// ============================================================================

/**
 * @brief Everything the machine talks to
 *
 * @c infra, @c metrics and @c config_store may be null.
 */
struct Collaborators {
  std::shared_ptr<DriverCommandInterface> driver;
  std::shared_ptr<ResourceArbiter> arbiter;
  std::shared_ptr<UserAuthorizer> authorizer;
  std::shared_ptr<IpProvisioner> ip_provisioner;
  std::shared_ptr<TetheringCoordinator> tethering;
  std::shared_ptr<LocalNetworkManager> network;
  std::shared_ptr<InfraLinkController> infra;
  std::shared_ptr<MetricsRecorder> metrics;

  /// Persists device name and pending factory reset
  ConfigManager *config_store = nullptr;

  Result<void> validate() const;
};

// ============================================================================
// State Machine
// ============================================================================

/**
 * @brief The connection and group lifecycle engine
 *
 * Driver events arrive through the DriverEventSink interface from any
 * thread and are queued. Everything else is queued with post().
 *
 * @code
 *   P2pStateMachine sm(collaborators, config);
 *   sm.start();
 *   sm.post(Message(Cmd::EnableP2p));
 *   sm.dispatch_pending();  // or sm.run() on a dedicated thread
 * @endcode
 */
class P2PLINK_API P2pStateMachine : public DriverEventSink {
public:
  P2pStateMachine(Collaborators collaborators, P2pServiceConfig config,
                  std::shared_ptr<Clock> clock = nullptr);
  ~P2pStateMachine() override;

  // Non-copyable
  P2pStateMachine(const P2pStateMachine &) = delete;
  P2pStateMachine &operator=(const P2pStateMachine &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /// Enter the initial state; NotSupported if the driver says so
  void start();

  void post(Message msg);

  /// Handle every ready message on the calling thread
  size_t dispatch_pending();

  /// Handle messages until quit()
  void run();
  void quit();

  EventLoop &loop();

  // ========================================================================
  // State
  // ========================================================================

  /// Safe from any thread
  P2pState current_state() const;

  /// Current state is @p state or one of its descendants
  bool is_in_state(P2pState state) const;

  // ========================================================================
  // Inspection (dispatching thread only)
  // ========================================================================

  const PeerRegistry &peers() const;
  const std::optional<P2pGroup> &group() const;
  const PersistentGroupStore &persistent_groups() const;
  const ServiceDiscoveryTracker &services() const;
  const ApproverRegistry &approvers() const;
  const ConnectConfig &pending_config() const;
  const P2pDevice &this_device() const;
  const ConnectionInfo &connection_info() const;
  P2pAvailability availability() const;
  bool discovery_active() const;
  bool session_active() const;
  size_t deferred_count() const;
  const P2pServiceConfig &config() const;

  // ========================================================================
  // DriverEventSink
  // ========================================================================

  void on_device_found(const P2pDevice &device) override;
  void on_device_lost(const P2pDevice &device) override;
  void on_find_stopped() override;
  void on_go_negotiation_request(const ConnectConfig &config) override;
  void on_go_negotiation_success() override;
  void on_go_negotiation_failure(P2pStatus status) override;
  void on_group_formation_success() override;
  void on_group_formation_failure(const std::string &reason) override;
  void on_group_started(const P2pGroup &group) override;
  void on_group_removed(const P2pGroup &group) override;
  void on_invitation_received(const P2pGroup &group) override;
  void on_invitation_result(P2pStatus status) override;
  void on_provision_discovery(const ProvisionDiscoveryEvent &event) override;
  void on_provision_discovery_failure(const MacAddress &peer,
                                      ProvisionDiscoveryStatus status) override;
  void on_service_discovery_response(const MacAddress &source,
                                     const Bytes &tlvs) override;
  void on_usd_discovery_result(const UsdDiscoveryResult &result) override;
  void on_usd_session_terminated(int session_id, bool advertisement) override;
  void on_station_connected(const P2pDevice &device,
                            const std::string &ip_address) override;
  void on_station_disconnected(const P2pDevice &device) override;
  void on_frequency_changed(int frequency_mhz) override;
  void on_driver_disconnected() override;

  class Impl;

private:
  std::unique_ptr<Impl> impl_;
};

} // namespace p2plink

#endif // P2PLINK_STATE_MACHINE_H
