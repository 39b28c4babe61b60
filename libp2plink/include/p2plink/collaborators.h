/**
 * @file collaborators.h
 * @brief External components the state machine depends on
 *
 * Every collaborator is called from the state machine thread. Calls that
 * need an asynchronous answer return immediately; the answer is fed back
 * through the matching P2pService entry point, which queues it.
 */

#ifndef P2PLINK_COLLABORATORS_H
#define P2PLINK_COLLABORATORS_H

#include "error.h"
#include "group.h"
#include "peer.h"
#include "platform.h"
#include "types.h"
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Resource Arbitration
// ============================================================================

enum class ArbitrationResult : uint8_t {
  Proceed,    ///< Create the interface now
  Abort,      ///< Another consumer holds the radio
  WaitForUser ///< Answer arrives later via P2pService::on_arbitration_result
};

P2PLINK_API const char *arbitration_result_name(ArbitrationResult result);

/**
 * @brief Serializes interface creation against other radio users
 */
class ResourceArbiter {
public:
  virtual ~ResourceArbiter() = default;

  virtual ArbitrationResult request_interface() = 0;
  virtual void release_interface() = 0;
};

// ============================================================================
// User Authorization
// ============================================================================

enum class AuthorizationKind : uint8_t {
  Negotiation,      ///< Peer started GO negotiation
  Invitation,       ///< Peer invited us to a group
  Join,             ///< Peer wants to join our group
  FrequencyConflict ///< Drop infrastructure Wi-Fi to free the channel?
};

P2PLINK_API const char *authorization_kind_name(AuthorizationKind kind);

enum class AuthorizationDecision : uint8_t {
  Accept,
  Reject,
  /// The user deferred to a registered external approver
  DeferToExternalApprover
};

P2PLINK_API const char *authorization_decision_name(AuthorizationDecision d);

/**
 * @brief What the user is asked to authorize
 *
 * @c pin is set when the user must enter or confirm a PIN.
 */
struct AuthorizationRequest {
  AuthorizationKind kind = AuthorizationKind::Negotiation;
  P2pDevice peer;
  WpsMethod wps = WpsMethod::Pbc;
  std::string pin;
};

/**
 * @brief Answer to an AuthorizationRequest
 *
 * @c pin carries a PIN the user typed for keypad provisioning.
 */
struct AuthorizationResponse {
  AuthorizationKind kind = AuthorizationKind::Negotiation;
  MacAddress peer;
  AuthorizationDecision decision = AuthorizationDecision::Reject;
  std::string pin;
};

/**
 * @brief Local dialogs or policy
 */
class UserAuthorizer {
public:
  virtual ~UserAuthorizer() = default;

  virtual void request_authorization(const AuthorizationRequest &request) = 0;

  /// Display a generated PIN the peer must enter
  virtual void show_pin(const P2pDevice &peer, const std::string &pin) = 0;

  /// Withdraw an outstanding dialog of @p kind
  virtual void dismiss(AuthorizationKind kind) = 0;
};

// ============================================================================
// IP Provisioning
// ============================================================================

enum class IpProvisioningMode : uint8_t { Dhcp, LinkLocal };

P2PLINK_API const char *ip_provisioning_mode_name(IpProvisioningMode mode);

struct IpRoute {
  std::string destination; ///< CIDR
  std::string gateway;
};

/**
 * @brief Lease or link information of a provisioned client interface
 */
struct IpProvisioningResult {
  std::string address;
  int prefix_length = 0;
  std::string server_address; ///< DHCP server, the group owner
  std::vector<IpRoute> routes;
};

/**
 * @brief Obtains an address on the group interface (client role)
 */
class IpProvisioner {
public:
  virtual ~IpProvisioner() = default;

  virtual Result<void> start(const std::string &interface_name,
                             IpProvisioningMode mode) = 0;
  virtual void stop() = 0;
};

// ============================================================================
// Group Owner Networking
// ============================================================================

/**
 * @brief Runs the DHCP server on a group we own
 */
class TetheringCoordinator {
public:
  virtual ~TetheringCoordinator() = default;

  /// Readiness is reported via P2pService::on_tethering_ready
  virtual Result<void> request_tethering(const std::string &interface_name,
                                         const std::string &server_address) = 0;
  virtual void stop_tethering(const std::string &interface_name) = 0;
};

/**
 * @brief Host routing table and interface registration
 */
class LocalNetworkManager {
public:
  virtual ~LocalNetworkManager() = default;

  virtual Result<void>
  add_interface_routes(const std::string &interface_name,
                       const IpProvisioningResult &result) = 0;
  virtual void remove_interface(const std::string &interface_name) = 0;
};

// ============================================================================
// Infrastructure Link
// ============================================================================

/**
 * @brief Controls the station-mode connection sharing the radio
 *
 * Optional. Without it frequency conflicts fail immediately.
 */
class InfraLinkController {
public:
  virtual ~InfraLinkController() = default;

  virtual bool is_connected() const = 0;

  /**
   * @brief Drop (true) or restore (false) the infrastructure link
   *
   * A drop is confirmed via P2pService::on_infra_disconnect_response.
   */
  virtual void request_disconnect(bool disconnect) = 0;
};

// ============================================================================
// Metrics
// ============================================================================

/**
 * @brief Connection and group lifetime events, optional
 */
class MetricsRecorder {
public:
  virtual ~MetricsRecorder() = default;

  virtual void start_connection_event(ConnectionType type,
                                      const ConnectConfig &config) = 0;
  virtual void end_connection_event(ConnectionFailure failure) = 0;
  virtual void start_group_event(const P2pGroup &group) = 0;
  virtual void end_group_event() = 0;
};

} // namespace p2plink

#endif // P2PLINK_COLLABORATORS_H
