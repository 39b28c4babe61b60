/**
 * @file group.h
 * @brief Active P2P group and persistent group profiles
 */

#ifndef P2PLINK_GROUP_H
#define P2PLINK_GROUP_H

#include "peer.h"
#include "platform.h"
#include "types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Active Group
// ============================================================================

enum class GroupRole : uint8_t { Owner, Client };

P2PLINK_API const char *group_role_name(GroupRole role);

/**
 * @brief The group this device currently takes part in
 *
 * Created when the supplicant reports the group as started and destroyed
 * when it reports the group removed. At most one exists at a time.
 */
struct P2pGroup {
  std::string interface_name;
  std::string network_name;
  std::string passphrase;
  GroupRole role = GroupRole::Client;
  int net_id = kNetworkIdTemporary;
  int frequency_mhz = 0;

  /// Set for both roles; equals this device when we are the owner
  std::optional<P2pDevice> owner;

  /// Connected clients (owner role only)
  std::vector<P2pDevice> clients;

  /// Member IP addresses as learned from station events or DHCP
  std::map<MacAddress, std::string> client_addresses;

  bool is_group_owner() const { return role == GroupRole::Owner; }

  /// Add or refresh a client; returns false if it was already listed
  bool add_client(const P2pDevice &device, const std::string &ip = "");

  /// Returns false if the client was not a member
  bool remove_client(const MacAddress &address);

  /// True for the owner or any client
  bool contains(const MacAddress &address) const;

  bool is_client_list_empty() const { return clients.empty(); }

  std::string to_string() const;
};

// ============================================================================
// Persistent Group Profile
// ============================================================================

/**
 * @brief A group stored by the supplicant for later reinvocation
 */
struct PersistentGroupProfile {
  int net_id = kNetworkIdTemporary;
  MacAddress owner_address;
  std::string network_name;

  /// Clients that joined while we were the owner
  std::vector<MacAddress> clients;

  bool has_client(const MacAddress &address) const;
};

} // namespace p2plink

#endif // P2PLINK_GROUP_H
