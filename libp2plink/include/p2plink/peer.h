/**
 * @file peer.h
 * @brief Discovered P2P devices and the peer registry
 */

#ifndef P2PLINK_PEER_H
#define P2PLINK_PEER_H

#include "platform.h"
#include "types.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Peer Status
// ============================================================================

enum class PeerStatus : uint8_t {
  Connected = 0,
  Invited = 1,
  Failed = 2,
  Available = 3,
  Unavailable = 4
};

P2PLINK_API const char *peer_status_name(PeerStatus status);

/// Device capability bitmap (P2P IE)
namespace device_capability {
constexpr int kServiceDiscovery = 0x01;
constexpr int kClientDiscoverability = 0x02;
constexpr int kConcurrentOperation = 0x04;
constexpr int kInfrastructureManaged = 0x08;
constexpr int kDeviceLimit = 0x10;
constexpr int kInvitationProcedure = 0x20;
} // namespace device_capability

/// Group capability bitmap (P2P IE)
namespace group_capability {
constexpr int kGroupOwner = 0x01;
constexpr int kPersistentGroup = 0x02;
constexpr int kGroupLimit = 0x04;
constexpr int kIntraBssDistribution = 0x08;
constexpr int kCrossConnection = 0x10;
constexpr int kPersistentReconnect = 0x20;
constexpr int kGroupFormation = 0x40;
} // namespace group_capability

// ============================================================================
// P2P Device
// ============================================================================

/**
 * @brief A P2P device as reported by the supplicant
 *
 * Used both for remote peers and for this device.
 */
struct P2pDevice {
  MacAddress address;
  std::string name;
  std::string primary_type;
  std::string secondary_type;

  int wps_config_methods = 0;
  int device_capability = 0;
  int group_capability = 0;

  PeerStatus status = PeerStatus::Unavailable;

  /// Device identity key id for paired-device reinvocation, -1 if none
  int dik_id = -1;

  bool wps_pbc_supported() const {
    return (wps_config_methods & config_methods::kPushButton) != 0;
  }
  bool wps_keypad_supported() const {
    return (wps_config_methods & config_methods::kKeypad) != 0;
  }
  bool wps_display_supported() const {
    return (wps_config_methods & config_methods::kDisplay) != 0;
  }
  bool is_service_discovery_capable() const {
    return (device_capability & device_capability::kServiceDiscovery) != 0;
  }
  bool is_invitation_capable() const {
    return (device_capability & device_capability::kInvitationProcedure) != 0;
  }
  bool is_device_limit() const {
    return (device_capability & device_capability::kDeviceLimit) != 0;
  }
  bool is_group_owner() const {
    return (group_capability & group_capability::kGroupOwner) != 0;
  }
  bool is_group_limit() const {
    return (group_capability & group_capability::kGroupLimit) != 0;
  }

  /// Copy everything the supplicant reports, keeping our status
  void update_supplicant_details(const P2pDevice &from);
};

// ============================================================================
// Peer Registry
// ============================================================================

/**
 * @brief Table of currently known peers, keyed by address
 *
 * Owned by the state machine thread; not thread-safe.
 *
 * A peer whose loss is reported while a connection attempt involving it
 * is in flight is kept in the table and marked in a secondary
 * lost-during-connection set. The set is resolved when the attempt ends.
 */
class P2PLINK_API PeerRegistry {
public:
  PeerRegistry() = default;

  /**
   * @brief Insert a peer or refresh its supplicant details
   * @return true if the table changed
   */
  bool update_supplicant_details(const P2pDevice &device);

  /**
   * @brief Update a known peer's status
   * @return true if the peer exists
   */
  bool update_status(const MacAddress &address, PeerStatus status);

  /**
   * @brief Store a freshly queried group capability bitmap
   * @return true if the peer exists
   */
  bool update_group_capability(const MacAddress &address, int capability);

  /// Lookup, nullptr if unknown
  const P2pDevice *get(const MacAddress &address) const;

  bool contains(const MacAddress &address) const;

  /// Remove one peer; also drops it from the lost-during-connection set
  std::optional<P2pDevice> remove(const MacAddress &address);

  /// Remove all peers; true if anything was removed
  bool clear();

  std::vector<P2pDevice> list() const;
  size_t size() const { return peers_.size(); }
  bool empty() const { return peers_.empty(); }

  // ========================================================================
  // Lost During Connection
  // ========================================================================

  /// Record a loss event for a peer involved in the current attempt
  void mark_lost_during_connection(const P2pDevice &device);

  bool is_lost_during_connection(const MacAddress &address) const;

  const std::set<MacAddress> &lost_during_connection() const {
    return lost_during_connection_;
  }

  /**
   * @brief Evict every peer marked lost, except those in @p keep
   * @return Addresses removed from the table
   */
  std::vector<MacAddress>
  prune_lost_during_connection(const std::set<MacAddress> &keep = {});

private:
  std::map<MacAddress, P2pDevice> peers_;
  std::set<MacAddress> lost_during_connection_;
};

} // namespace p2plink

#endif // P2PLINK_PEER_H
