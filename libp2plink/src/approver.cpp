/**
 * @file approver.cpp
 * @brief External approver registry
 */

#include "p2plink/approver.h"

namespace p2plink {

const char *approver_detach_reason_name(ApproverDetachReason r) {
  switch (r) {
  case ApproverDetachReason::Removed:
    return "Removed";
  case ApproverDetachReason::Failure:
    return "Failure";
  case ApproverDetachReason::Replaced:
    return "Replaced";
  case ApproverDetachReason::ClientClosed:
    return "ClientClosed";
  case ApproverDetachReason::PeerRemoved:
    return "PeerRemoved";
  }
  return "Unknown";
}

std::optional<ApproverEntry> ApproverRegistry::add(ClientId owner,
                                                   const MacAddress &address) {
  std::optional<ApproverEntry> replaced;
  Key key{owner, address};

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    replaced = it->second;
  }

  ApproverEntry entry;
  entry.owner = owner;
  entry.address = address;
  entry.serial = next_serial_++;
  entries_[key] = entry;
  return replaced;
}

std::optional<ApproverEntry>
ApproverRegistry::remove(ClientId owner, const MacAddress &address) {
  auto it = entries_.find(Key{owner, address});
  if (it == entries_.end()) {
    return std::nullopt;
  }
  ApproverEntry entry = it->second;
  entries_.erase(it);
  return entry;
}

std::vector<ApproverEntry> ApproverRegistry::remove_all_for_owner(ClientId owner) {
  std::vector<ApproverEntry> removed;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->first.first == owner) {
      removed.push_back(it->second);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

std::vector<ApproverEntry>
ApproverRegistry::remove_for_peer(const MacAddress &peer) {
  std::vector<ApproverEntry> removed;
  if (peer.is_broadcast()) {
    return removed;
  }
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->first.second == peer) {
      removed.push_back(it->second);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

const ApproverEntry *ApproverRegistry::find(ClientId owner,
                                            const MacAddress &address) const {
  auto it = entries_.find(Key{owner, address});
  return it == entries_.end() ? nullptr : &it->second;
}

std::optional<ApproverEntry>
ApproverRegistry::resolve(const MacAddress &peer) const {
  const ApproverEntry *exact = nullptr;
  const ApproverEntry *wildcard = nullptr;

  for (const auto &item : entries_) {
    const ApproverEntry &entry = item.second;
    if (entry.address == peer && !entry.is_wildcard()) {
      if (!exact || entry.serial > exact->serial) {
        exact = &entry;
      }
    } else if (entry.is_wildcard()) {
      if (!wildcard || entry.serial > wildcard->serial) {
        wildcard = &entry;
      }
    }
  }

  if (exact) {
    return *exact;
  }
  if (wildcard) {
    return *wildcard;
  }
  return std::nullopt;
}

std::vector<ApproverEntry> ApproverRegistry::list() const {
  std::vector<ApproverEntry> out;
  out.reserve(entries_.size());
  for (const auto &item : entries_) {
    out.push_back(item.second);
  }
  return out;
}

} // namespace p2plink
