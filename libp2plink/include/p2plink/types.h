/**
 * @file types.h
 * @brief Core type definitions for p2plink
 */

#ifndef P2PLINK_TYPES_H
#define P2PLINK_TYPES_H

#include "platform.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Identifies a registered local client
using ClientId = uint32_t;

/// Identifies one asynchronous client request
using RequestId = uint32_t;

/// Messages generated inside the service carry no client
constexpr ClientId kInternalClient = 0;

// ============================================================================
// MAC Address
// ============================================================================

/**
 * @brief 48-bit IEEE MAC address, the stable identifier of a P2P device
 *
 * The broadcast address doubles as the wildcard for external approvers.
 */
struct MacAddress {
  static constexpr size_t SIZE = 6;
  std::array<Byte, SIZE> bytes{};

  bool operator==(const MacAddress &other) const {
    return bytes == other.bytes;
  }
  bool operator!=(const MacAddress &other) const {
    return bytes != other.bytes;
  }
  bool operator<(const MacAddress &other) const {
    return bytes < other.bytes;
  }

  /// "aa:bb:cc:dd:ee:ff", lowercase
  std::string to_string() const;

  /// Accepts colon separated hex, case-insensitive
  static std::optional<MacAddress> from_string(const std::string &str);

  /// ff:ff:ff:ff:ff:ff
  static MacAddress broadcast();

  bool is_zero() const;
  bool is_broadcast() const;
};

// ============================================================================
// Network Identifiers
// ============================================================================

/// Group is not stored by the supplicant
constexpr int kNetworkIdTemporary = -1;

/// Let the supplicant decide, or a persistent group whose id is unknown
constexpr int kNetworkIdPersistent = -2;

/// Let the supplicant pick the group owner intent
constexpr int kGroupOwnerIntentAuto = -1;
constexpr int kGroupOwnerIntentMin = 0;
constexpr int kGroupOwnerIntentMax = 15;

// ============================================================================
// WPS Provisioning
// ============================================================================

enum class WpsMethod : uint8_t {
  Pbc = 0,     ///< Push button
  Display = 1, ///< We display the PIN
  Keypad = 2,  ///< We enter the PIN shown by the peer
  Label = 3,
  Invalid = 4
};

/// "pbc", "display", "keypad", "label", "invalid"
P2PLINK_API const char *wps_method_name(WpsMethod method);

struct WpsInfo {
  WpsMethod method = WpsMethod::Pbc;
  std::string pin;
};

/// WPS config method bits advertised by a peer
namespace config_methods {
constexpr int kDisplay = 0x0008;
constexpr int kPushButton = 0x0080;
constexpr int kKeypad = 0x0100;
} // namespace config_methods

/// Pairing/bootstrapping parameters carried by newer P2P peers
struct PairingBootstrapping {
  int method = 0;
  std::string password;
};

// ============================================================================
// Connection Configuration
// ============================================================================

/**
 * @brief Target of a connection attempt (the pending peer configuration)
 *
 * Empty when the device address is all-zero.
 */
struct ConnectConfig {
  MacAddress device_address;
  WpsInfo wps;
  int group_owner_intent = kGroupOwnerIntentAuto;
  int net_id = kNetworkIdPersistent;

  /// Fast connection: join a known group directly
  std::string network_name;
  std::string passphrase;
  int frequency_mhz = 0;

  std::optional<PairingBootstrapping> pairing;

  bool is_empty() const { return device_address.is_zero(); }
  void invalidate() { *this = ConnectConfig(); }

  /// Both network name and passphrase present
  bool has_group_credentials() const {
    return !network_name.empty() && !passphrase.empty();
  }
};

// ============================================================================
// Protocol Status Codes
// ============================================================================

/**
 * @brief Status codes carried in P2P negotiation and invitation frames
 */
enum class P2pStatus : int {
  Unknown = -1,
  Success = 0,
  InformationIsCurrentlyUnavailable = 1,
  IncompatibleParameters = 2,
  LimitReached = 3,
  InvalidParameter = 4,
  UnableToAccommodateRequest = 5,
  PreviousProtocolError = 6,
  NoCommonChannel = 7,
  UnknownP2pGroup = 8,
  BothGoIntent15 = 9,
  IncompatibleProvisioningMethod = 10,
  RejectedByUser = 11
};

P2PLINK_API const char *p2p_status_name(P2pStatus status);

/// Map a raw status value from the driver; out of range maps to Unknown
P2PLINK_API P2pStatus p2p_status_from_int(int value);

enum class ProvisionDiscoveryStatus : uint8_t {
  Success,
  Timeout,
  Rejected,
  TimeoutJoin,
  InfoUnavailable,
  Unknown
};

P2PLINK_API const char *
provision_discovery_status_name(ProvisionDiscoveryStatus status);

// ============================================================================
// Connection Outcome
// ============================================================================

/**
 * @brief Why a connection attempt ended without a group
 */
enum class ConnectionFailure : uint8_t {
  None,
  Timeout,
  Cancel,
  ProvisionDiscoveryFailure,
  InvitationFailure,
  NegotiationFailure,
  UserRejected,
  NewConnectionAttempt,
  GroupRemoved,
  CreateGroupFailed,
  Disabled,
  Unknown
};

P2PLINK_API const char *connection_failure_name(ConnectionFailure failure);

/// How a connection attempt was started
enum class ConnectionType : uint8_t {
  Fresh,     ///< Provision discovery + GO negotiation
  Reinvoke,  ///< Persistent group reinvocation
  Local,     ///< Autonomous group
  Fast,      ///< Credentials supplied by the client
  Incoming   ///< Peer-initiated negotiation or invitation
};

P2PLINK_API const char *connection_type_name(ConnectionType type);

// ============================================================================
// Discovery Parameters
// ============================================================================

enum class ScanType : uint8_t {
  Full,             ///< All channels
  Social,           ///< Social channels 1, 6, 11
  SpecificFrequency ///< One channel
};

struct DiscoveryParams {
  int timeout_s = 0; ///< 0 uses the configured default
  ScanType scan_type = ScanType::Full;
  int frequency_mhz = 0;
};

// ============================================================================
// Helper Functions
// ============================================================================

/// Hex encode bytes, lowercase
P2PLINK_API std::string bytes_to_hex(const Bytes &data);

/// Decode an even-length hex string
P2PLINK_API std::optional<Bytes> hex_to_bytes(const std::string &hex);

} // namespace p2plink

#endif // P2PLINK_TYPES_H
