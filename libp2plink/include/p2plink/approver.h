/**
 * @file approver.h
 * @brief Registry of external connection approvers
 */

#ifndef P2PLINK_APPROVER_H
#define P2PLINK_APPROVER_H

#include "platform.h"
#include "types.h"
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace p2plink {

// ============================================================================
// Approver Types
// ============================================================================

enum class ApproverDetachReason : uint8_t {
  Removed,     ///< The owner unregistered it
  Failure,     ///< The pending request it was asked about failed
  Replaced,    ///< A newer registration for the same (owner, address)
  ClientClosed,///< The owning client detached
  PeerRemoved  ///< The peer it was registered for disappeared
};

P2PLINK_API const char *approver_detach_reason_name(ApproverDetachReason r);

/**
 * @brief One registration
 *
 * An address equal to MacAddress::broadcast() matches any peer.
 */
struct ApproverEntry {
  ClientId owner = kInternalClient;
  MacAddress address;
  uint64_t serial = 0; ///< Registration order, newest is highest

  bool is_wildcard() const { return address.is_broadcast(); }
};

// ============================================================================
// Approver Registry
// ============================================================================

/**
 * @brief Delegation table for connection authorization decisions
 *
 * At most one entry exists per (owner, address). When several owners
 * registered for the same peer, the newest exact registration wins, then
 * the newest wildcard. Owned by the state machine thread.
 */
class P2PLINK_API ApproverRegistry {
public:
  ApproverRegistry() = default;

  /**
   * @brief Register @p owner for @p address
   * @return The entry this registration replaced, if any
   */
  std::optional<ApproverEntry> add(ClientId owner, const MacAddress &address);

  /// Unregister; nullopt if there was no such entry
  std::optional<ApproverEntry> remove(ClientId owner,
                                      const MacAddress &address);

  /// Drop every registration of @p owner
  std::vector<ApproverEntry> remove_all_for_owner(ClientId owner);

  /// Drop the registrations made for exactly @p peer (wildcards stay)
  std::vector<ApproverEntry> remove_for_peer(const MacAddress &peer);

  const ApproverEntry *find(ClientId owner, const MacAddress &address) const;

  /// Approver responsible for @p peer, exact match before wildcard
  std::optional<ApproverEntry> resolve(const MacAddress &peer) const;

  std::vector<ApproverEntry> list() const;
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  void clear() { entries_.clear(); }

private:
  using Key = std::pair<ClientId, MacAddress>;

  std::map<Key, ApproverEntry> entries_;
  uint64_t next_serial_ = 1;
};

} // namespace p2plink

#endif // P2PLINK_APPROVER_H
