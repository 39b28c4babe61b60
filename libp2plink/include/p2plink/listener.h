/**
 * @file listener.h
 * @brief Client notification interface and the values it carries
 */

#ifndef P2PLINK_LISTENER_H
#define P2PLINK_LISTENER_H

#include "approver.h"
#include "collaborators.h"
#include "error.h"
#include "group.h"
#include "peer.h"
#include "platform.h"
#include "service_types.h"
#include "types.h"
#include <optional>
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Notification Values
// ============================================================================

enum class P2pAvailability : uint8_t {
  Disabled,
  Enabled,
  Unavailable ///< Blocked by resource contention or missing radio
};

P2PLINK_API const char *p2p_availability_name(P2pAvailability availability);

/// Coarse link state reported with connection changes
enum class NetworkState : uint8_t {
  Idle,
  Connecting,
  Connected,
  Disconnected,
  Failed
};

P2PLINK_API const char *network_state_name(NetworkState state);

struct ConnectionInfo {
  bool group_formed = false;
  bool is_group_owner = false;
  std::string group_owner_address; ///< IPv4 of the owner, empty if unknown
};

/**
 * @brief An approver's answer to a connection request
 *
 * DeferToService hands the decision back to the local dialog.
 * DeferShowPin accepts and displays @c pin locally.
 */
enum class ConnectionRequestResponse : uint8_t {
  Accept,
  Reject,
  DeferToService,
  DeferShowPin
};

P2PLINK_API const char *
connection_request_response_name(ConnectionRequestResponse response);

// ============================================================================
// Client Listener
// ============================================================================

/**
 * @brief Receives results and notifications for one registered client
 *
 * All callbacks run on the state machine thread and must not block.
 * Default implementations ignore the notification.
 */
class ClientListener {
public:
  virtual ~ClientListener() = default;

  // ========================================================================
  // Request Outcomes
  // ========================================================================

  /// Outcome of an action request
  virtual void on_command_result(RequestId /*request*/,
                                 const Result<void> & /*result*/) {}

  virtual void on_peers(RequestId /*request*/,
                        const std::vector<P2pDevice> & /*peers*/) {}
  virtual void on_connection_info(RequestId /*request*/,
                                  const ConnectionInfo & /*info*/) {}
  virtual void on_group_info(RequestId /*request*/,
                             const std::optional<P2pGroup> & /*group*/) {}
  virtual void
  on_persistent_groups(RequestId /*request*/,
                       const std::vector<PersistentGroupProfile> & /*groups*/) {}
  virtual void on_p2p_state(RequestId /*request*/,
                            P2pAvailability /*availability*/) {}
  virtual void on_discovery_state(RequestId /*request*/, bool /*active*/) {}
  virtual void on_device_info(RequestId /*request*/,
                              const P2pDevice & /*device*/) {}

  /// A USD session was created for the request
  virtual void on_usd_session_started(RequestId /*request*/,
                                      int /*session_id*/) {}

  // ========================================================================
  // Broadcasts
  // ========================================================================

  virtual void on_p2p_state_changed(P2pAvailability /*availability*/) {}
  virtual void on_peers_changed(const std::vector<P2pDevice> & /*peers*/) {}
  virtual void on_discovery_changed(bool /*active*/) {}
  virtual void
  on_connection_changed(NetworkState /*state*/, const ConnectionInfo & /*info*/,
                        const std::optional<P2pGroup> & /*group*/) {}
  virtual void on_this_device_changed(const P2pDevice & /*device*/) {}
  virtual void on_persistent_groups_changed() {}
  virtual void on_group_creation_failed(const MacAddress & /*peer*/,
                                        ConnectionFailure /*reason*/) {}

  // ========================================================================
  // Targeted
  // ========================================================================

  virtual void on_service_response(const ServiceResponse & /*response*/) {}
  virtual void on_usd_discovery_result(const UsdDiscoveryResult & /*result*/) {}
  virtual void on_usd_session_terminated(int /*session_id*/,
                                         bool /*advertisement*/) {}

  virtual void on_approver_attached(const MacAddress & /*address*/) {}
  virtual void on_approver_detached(const MacAddress & /*address*/,
                                    ApproverDetachReason /*reason*/) {}

  /// Sent to the approver responsible for @p device
  virtual void on_connection_requested(AuthorizationKind /*kind*/,
                                       const P2pDevice & /*device*/,
                                       WpsMethod /*wps*/) {}

  /// PIN to display for a pending request handled by this approver
  virtual void on_pin_generated(const MacAddress & /*peer*/,
                                const std::string & /*pin*/) {}
};

} // namespace p2plink

#endif // P2PLINK_LISTENER_H
