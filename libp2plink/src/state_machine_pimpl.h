#ifndef P2PLINK_STATE_MACHINE_PIMPL_H
#define P2PLINK_STATE_MACHINE_PIMPL_H

#include "p2plink/decision_source.h"
#include "p2plink/state_machine.h"
#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace p2plink {

/// Outcome of offering a message to one state's handler
enum class Handling : uint8_t { Handled, NotHandled, Deferred };

/// What started a connect call, decides join vs. negotiate
enum class ConnectTrigger : uint8_t {
  ProvisionDiscovery,
  NegotiationRequest,
  Invitation,
  Other
};

class P2pStateMachine::Impl {
public:
  Impl(P2pStateMachine &owner, Collaborators collaborators,
       P2pServiceConfig config, std::shared_ptr<Clock> clock);

  // ========================================================================
  // Engine (state_machine.cpp)
  // ========================================================================

  void start();
  void handle_message(const Message &msg);
  Handling dispatch_to(P2pState state, const Message &msg);
  void enter_state(P2pState state);
  void exit_state(P2pState state);
  void transition_to(P2pState dest) { pending_transition = dest; }
  void perform_transitions();
  void do_transition(P2pState dest);
  bool in_state(P2pState s) const { return p2p_state_is_within(state, s); }

  // ========================================================================
  // Clients and Notifications (state_machine.cpp)
  // ========================================================================

  struct ClientRecord {
    std::shared_ptr<ClientListener> listener;
    bool activated = false;
  };

  std::shared_ptr<ClientListener> listener_for(ClientId client) const;
  bool has_activated_clients() const;
  void reply(const Message &msg, const Result<void> &result);
  void reply_ok(const Message &msg) { reply(msg, Result<void>::ok()); }
  void reply_error(const Message &msg, ErrorCode code,
                   const std::string &message = "");

  template <typename Fn> void broadcast(Fn fn) {
    for (auto &entry : clients) {
      fn(*entry.second.listener);
    }
  }

  void set_availability(P2pAvailability value);
  void send_peers_changed();
  void send_discovery_changed(bool active);
  void send_connection_changed(NetworkState network_state);
  void send_this_device_changed();
  void send_persistent_groups_changed();
  void update_this_device_status(PeerStatus status);
  void detach_approvers(const std::vector<ApproverEntry> &entries,
                        ApproverDetachReason reason);
  void detach_approvers_for_peer(const MacAddress &peer,
                                 ApproverDetachReason reason);
  /// Hand a pending request to the local dialog if its approver is in @p entries
  void return_decision_to_user(const std::vector<ApproverEntry> &entries);

  // ========================================================================
  // Timers (state_machine.cpp)
  // ========================================================================

  void arm_timer(Cmd what, int &generation, int delay_ms);
  void arm_idle_shutdown();
  void disarm_idle_shutdown();

  // ========================================================================
  // Shared Procedures (state_machine.cpp)
  // ========================================================================

  void handle_group_creation_failure(ConnectionFailure reason);
  void handle_group_removed();
  void remove_half_started_group();
  bool connect_with_pin_display(ConnectTrigger trigger);
  P2pDevice fetch_current_device_details(const MacAddress &address);
  bool reinvoke_persistent_group(bool invited);
  AuthorizationRequest authorization_request(AuthorizationKind kind) const;
  void start_decision(AuthorizationKind kind,
                      std::unique_ptr<DecisionSource> source = nullptr);
  void end_decision();
  void show_pin(const MacAddress &peer, const std::string &pin);
  void restore_infra_link();
  void reload_persistent_groups();
  void prune_persistent_client(int net_id, const MacAddress &client);
  std::string default_device_name() const;
  Result<void> apply_device_name(const std::string &name);
  void factory_reset_now();
  void teardown_p2p();
  void cleanup_after_driver_loss();
  void check_and_reenable();
  void enable_interface();
  Handling handle_connection_request_result(const Message &msg,
                                            AuthorizationKind kind);

  // ========================================================================
  // State Handlers
  // ========================================================================

  // state_machine_disabled.cpp
  Handling handle_root(const Message &msg);
  Handling handle_not_supported(const Message &msg);
  Handling handle_disabling(const Message &msg);
  Handling handle_disabled(const Message &msg);
  Handling handle_disabled_idle(const Message &msg);
  Handling handle_waiting_for_arbitration(const Message &msg);
  void enter_disabling();
  void enter_disabled();

  // state_machine_enabled.cpp
  Handling handle_enabled(const Message &msg);
  Handling handle_inactive(const Message &msg);
  void enter_enabled();
  void exit_enabled();
  void enter_inactive();
  Handling handle_service_command(const Message &msg);
  void handle_connect_inactive(const Message &msg);
  void handle_create_group_inactive(const Message &msg);

  // state_machine_group_creating.cpp
  Handling handle_group_creating(const Message &msg);
  Handling handle_user_authorizing_invite(const Message &msg);
  Handling handle_user_authorizing_negotiation(const Message &msg);
  Handling handle_provision_discovery(const Message &msg);
  Handling handle_group_negotiation(const Message &msg);
  Handling handle_frequency_conflict(const Message &msg);
  Handling handle_reject_wait(const Message &msg);
  void enter_provision_discovery();
  void enter_frequency_conflict();
  void accept_incoming(AuthorizationKind kind);
  void reject_incoming(AuthorizationKind kind);
  Handling handle_authorization_result(const Message &msg,
                                       AuthorizationKind kind);

  // state_machine_group_created.cpp
  Handling handle_group_created(const Message &msg);
  Handling handle_user_authorizing_join(const Message &msg);
  Handling handle_ongoing_group_removal(const Message &msg);
  void enter_group_created();
  void exit_group_created();

  // ========================================================================
  // Data
  // ========================================================================

  P2pStateMachine &owner;
  Collaborators deps;
  P2pServiceConfig config;
  EventLoop loop;

  std::atomic<P2pState> state{P2pState::Root};
  std::optional<P2pState> pending_transition;
  std::vector<Message> deferred;
  bool started = false;

  std::map<ClientId, ClientRecord> clients;
  bool radio_available = true;
  P2pAvailability availability = P2pAvailability::Disabled;

  PeerRegistry peers;
  PersistentGroupStore persistent_groups;
  ServiceDiscoveryTracker services;
  ApproverRegistry approvers;

  std::string interface_name;
  P2pDevice this_device;
  std::optional<P2pGroup> group;
  ConnectConfig saved_config;
  ConnectionInfo connection_info;
  bool discovery_active = false;

  // Connection session
  bool session_active = false;
  bool autonomous_group = false;
  bool join_existing_group = false;
  bool tethering_requested = false;
  bool infra_dropped = false;
  MacAddress rejected_peer;

  // Authorization in progress
  std::unique_ptr<DecisionSource> decision_source;
  AuthorizationKind decision_kind = AuthorizationKind::Negotiation;

  // Timer generations
  int group_creating_generation = 0;
  int disable_generation = 0;
  int idle_shutdown_generation = 0;
  int reject_wait_generation = 0;
  bool idle_shutdown_armed = false;
};

} // namespace p2plink

#endif // P2PLINK_STATE_MACHINE_PIMPL_H
