/**
 * @file driver.h
 * @brief Interface to the P2P driver (wpa_supplicant or a HAL)
 *
 * The command interface is synchronous. Commands never retry; protocol
 * level outcomes (peer absent, negotiation refused) arrive later through
 * the DriverEventSink.
 */

#ifndef P2PLINK_DRIVER_H
#define P2PLINK_DRIVER_H

#include "error.h"
#include "group.h"
#include "peer.h"
#include "platform.h"
#include "service_types.h"
#include "types.h"
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Command Parameters
// ============================================================================

/**
 * @brief Parameters for starting a group locally
 *
 * With @c config set the group uses the supplied credentials (fast
 * connection, join when @c join is true). Otherwise a non-negative
 * @c net_id restarts that stored profile, or @c persistent asks for a
 * new persistent group.
 */
struct GroupAddRequest {
  bool persistent = false;
  int net_id = kNetworkIdTemporary;
  std::optional<ConnectConfig> config;
  bool join = false;
  int frequency_mhz = 0;
};

// ============================================================================
// Driver Events
// ============================================================================

/**
 * @brief Provision discovery request or response
 *
 * EnterPin: the peer displays a PIN that we must enter.
 * ShowPin: we must display @c pin to the user.
 */
struct ProvisionDiscoveryEvent {
  enum class Kind : uint8_t { PbcRequest, PbcResponse, EnterPin, ShowPin };

  Kind kind = Kind::PbcRequest;
  P2pDevice device;
  std::string pin;
};

/**
 * @brief Receiver of asynchronous driver notifications
 *
 * Implementations must be callable from any thread.
 */
class DriverEventSink {
public:
  virtual ~DriverEventSink() = default;

  virtual void on_device_found(const P2pDevice &device) = 0;
  virtual void on_device_lost(const P2pDevice &device) = 0;
  virtual void on_find_stopped() = 0;

  /// Peer started GO negotiation; config carries the peer and method
  virtual void on_go_negotiation_request(const ConnectConfig &config) = 0;
  virtual void on_go_negotiation_success() = 0;
  virtual void on_go_negotiation_failure(P2pStatus status) = 0;
  virtual void on_group_formation_success() = 0;
  virtual void on_group_formation_failure(const std::string &reason) = 0;

  virtual void on_group_started(const P2pGroup &group) = 0;
  virtual void on_group_removed(const P2pGroup &group) = 0;

  /// Peer invites us; the group may lack an owner for persistent ids
  virtual void on_invitation_received(const P2pGroup &group) = 0;
  virtual void on_invitation_result(P2pStatus status) = 0;

  virtual void
  on_provision_discovery(const ProvisionDiscoveryEvent &event) = 0;
  virtual void
  on_provision_discovery_failure(const MacAddress &peer,
                                 ProvisionDiscoveryStatus status) = 0;

  virtual void on_service_discovery_response(const MacAddress &source,
                                             const Bytes &tlvs) = 0;
  virtual void on_usd_discovery_result(const UsdDiscoveryResult &result) = 0;
  virtual void on_usd_session_terminated(int session_id,
                                         bool advertisement) = 0;

  /// A client joined our group (owner role)
  virtual void on_station_connected(const P2pDevice &device,
                                    const std::string &ip_address) = 0;
  virtual void on_station_disconnected(const P2pDevice &device) = 0;

  virtual void on_frequency_changed(int frequency_mhz) = 0;

  /// The P2P interface is gone (torn down or daemon exited)
  virtual void on_driver_disconnected() = 0;
};

// ============================================================================
// Driver Commands
// ============================================================================

/**
 * @brief Synchronous command surface of the P2P driver
 */
class DriverCommandInterface {
public:
  virtual ~DriverCommandInterface() = default;

  /// Whether the hardware and daemon support P2P at all
  virtual bool is_supported() const = 0;

  // ========================================================================
  // Interface Lifecycle
  // ========================================================================

  /**
   * @brief Bring the P2P interface up and start delivering events
   * @param sink Receiver for all subsequent events
   * @return Interface name
   */
  virtual Result<std::string> setup_interface(DriverEventSink *sink) = 0;

  /// Stop events and release the interface
  virtual void teardown_interface() = 0;

  virtual Result<MacAddress> get_device_address() = 0;
  virtual Result<void> set_device_name(const std::string &name) = 0;

  // ========================================================================
  // Discovery
  // ========================================================================

  virtual Result<void> start_discovery(const DiscoveryParams &params) = 0;
  virtual Result<void> stop_discovery() = 0;
  virtual Result<void> set_extended_listen(bool enable, int period_ms,
                                           int interval_ms) = 0;

  /// Flush the supplicant's peer table and pending service queries
  virtual Result<void> flush() = 0;

  // ========================================================================
  // Connection
  // ========================================================================

  /**
   * @brief Start WPS provisioning / GO negotiation with a peer
   * @param join Join the peer's existing group instead of negotiating
   * @return Generated PIN for display methods, empty otherwise
   */
  virtual Result<std::string> connect(const ConnectConfig &config,
                                      bool join) = 0;
  virtual Result<void> cancel_connect() = 0;
  virtual Result<void> provision_discovery(const ConnectConfig &config) = 0;
  virtual Result<void> reject(const MacAddress &peer) = 0;

  virtual Result<void> group_add(const GroupAddRequest &request) = 0;
  virtual Result<void> group_remove(const std::string &interface_name) = 0;
  virtual Result<void> invite(const P2pGroup &group,
                              const MacAddress &peer) = 0;
  virtual Result<void> reinvoke(int net_id, const MacAddress &peer,
                                int dik_id) = 0;

  virtual Result<void> remove_client(const MacAddress &peer) = 0;
  virtual Result<void> start_wps_pbc(const std::string &interface_name) = 0;
  virtual Result<void> start_wps_pin_keypad(const std::string &interface_name,
                                            const std::string &pin) = 0;

  /// 0 disables the idle timeout
  virtual Result<void> set_group_idle_timeout(const std::string &interface_name,
                                              int seconds) = 0;
  virtual Result<void> set_power_save(const std::string &interface_name,
                                      bool enable) = 0;

  // ========================================================================
  // Peer Information
  // ========================================================================

  virtual Result<int> get_group_capability(const MacAddress &peer) = 0;

  /// SSID of the group the peer currently owns
  virtual Result<std::string> get_ssid(const MacAddress &peer) = 0;

  // ========================================================================
  // Persistent Groups
  // ========================================================================

  virtual Result<std::vector<PersistentGroupProfile>> list_networks() = 0;
  virtual Result<void> remove_network(int net_id) = 0;
  virtual Result<void> set_client_list(int net_id,
                                       const std::vector<MacAddress> &clients) = 0;
  virtual Result<void> save_config() = 0;

  // ========================================================================
  // Frame-Based Service Discovery
  // ========================================================================

  virtual Result<void> service_add(const LocalService &service) = 0;
  virtual Result<void> service_remove(const LocalService &service) = 0;
  virtual Result<void> service_flush() = 0;

  /**
   * @brief Register a service query sent during the next find
   * @param peer Target, all-zero for every peer
   * @param query Concatenated TLVs as hex
   * @return Driver request id
   */
  virtual Result<std::string> request_service_discovery(const MacAddress &peer,
                                                        const std::string &query) = 0;
  virtual Result<void> cancel_service_discovery(const std::string &request_id) = 0;

  // ========================================================================
  // USD Service Discovery
  // ========================================================================

  /// @return Positive session id
  virtual Result<int> start_usd_discovery(const UsdServiceConfig &config,
                                          int timeout_s) = 0;
  virtual void stop_usd_discovery(int session_id) = 0;
  virtual Result<int> start_usd_advertisement(const UsdServiceConfig &config,
                                              int timeout_s) = 0;
  virtual void stop_usd_advertisement(int session_id) = 0;
};

} // namespace p2plink

#endif // P2PLINK_DRIVER_H
