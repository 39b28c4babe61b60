/**
 * @file persistent_groups.h
 * @brief Cache of the supplicant's persistent group profiles
 */

#ifndef P2PLINK_PERSISTENT_GROUPS_H
#define P2PLINK_PERSISTENT_GROUPS_H

#include "driver.h"
#include "error.h"
#include "group.h"
#include "peer.h"
#include "platform.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Reinvocation Decision
// ============================================================================

/**
 * @brief How to reach a peer we may share a persistent group with
 */
struct ReinvocationPlan {
  enum class Action : uint8_t {
    JoinPersistent, ///< Peer owns a stored group; restart it locally as client
    Reinvoke,       ///< Send an invitation for a stored group
    Fresh           ///< Fall back to provision discovery and negotiation
  };

  Action action = Action::Fresh;
  int net_id = kNetworkIdTemporary;
  const char *reason = "";
};

P2PLINK_API const char *reinvocation_action_name(ReinvocationPlan::Action a);

// ============================================================================
// Persistent Group Store
// ============================================================================

/**
 * @brief In-memory mirror of the profiles the supplicant keeps on disk
 *
 * The supplicant is the source of truth. Every mutation goes through the
 * driver first and is then mirrored here. Not thread-safe.
 */
class P2PLINK_API PersistentGroupStore {
public:
  enum class PruneOutcome : uint8_t { NotFound, ClientRemoved, ProfileDeleted };

  PersistentGroupStore() = default;

  // ========================================================================
  // Loading
  // ========================================================================

  /**
   * @brief Reload every profile from the driver
   *
   * Profiles owned by @p self are reported with the owner address set to
   * this device. The driver configuration is saved afterwards.
   */
  Result<void> reload(DriverCommandInterface &driver, const MacAddress &self);

  /// Replace the cache without touching the driver
  void replace(std::vector<PersistentGroupProfile> profiles);

  /// Drop the cache; true if it was non-empty
  bool clear();

  // ========================================================================
  // Lookup
  // ========================================================================

  const PersistentGroupProfile *get(int net_id) const;

  /// Profile owned by @p owner with network name @p ssid, -1 if none
  int network_id(const MacAddress &owner, const std::string &ssid) const;

  /// Any profile owned by @p owner, -1 if none
  int network_id(const MacAddress &owner) const;

  /// First profile listing @p client in its client list, -1 if none
  int network_id_from_client_list(const MacAddress &client) const;

  std::optional<MacAddress> owner_address(int net_id) const;

  std::vector<PersistentGroupProfile> list() const;
  size_t size() const { return profiles_.size(); }
  bool empty() const { return profiles_.empty(); }

  // ========================================================================
  // Mutation
  // ========================================================================

  /// Delete a profile in the driver and the cache
  Result<void> remove(DriverCommandInterface &driver, int net_id);

  /**
   * @brief Remove one client from a profile's stored client list
   *
   * A profile whose client list becomes empty is deleted outright.
   */
  Result<PruneOutcome> prune_client(DriverCommandInterface &driver, int net_id,
                                    const MacAddress &client);

  /// Delete every profile; used by factory reset
  Result<void> remove_all(DriverCommandInterface &driver);

  // ========================================================================
  // Reinvocation
  // ========================================================================

  /**
   * @brief Decide between reinvocation and fresh negotiation
   * @param peer Peer with freshly queried group capability
   * @param config Pending connect configuration
   * @param peer_ssid SSID of the group the peer currently owns, may be empty
   * @param invited The peer invited us
   */
  ReinvocationPlan plan_reinvocation(const P2pDevice &peer,
                                     const ConnectConfig &config,
                                     const std::string &peer_ssid,
                                     bool invited) const;

private:
  std::map<int, PersistentGroupProfile> profiles_;
};

} // namespace p2plink

#endif // P2PLINK_PERSISTENT_GROUPS_H
