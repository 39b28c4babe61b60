/**
 * @file peer.cpp
 * @brief Peer registry implementation
 */

#include "p2plink/peer.h"

namespace p2plink {

const char *peer_status_name(PeerStatus status) {
  switch (status) {
  case PeerStatus::Connected:
    return "Connected";
  case PeerStatus::Invited:
    return "Invited";
  case PeerStatus::Failed:
    return "Failed";
  case PeerStatus::Available:
    return "Available";
  case PeerStatus::Unavailable:
    return "Unavailable";
  }
  return "Unknown";
}

void P2pDevice::update_supplicant_details(const P2pDevice &from) {
  if (!from.name.empty()) {
    name = from.name;
  }
  primary_type = from.primary_type;
  secondary_type = from.secondary_type;
  wps_config_methods = from.wps_config_methods;
  device_capability = from.device_capability;
  group_capability = from.group_capability;
  if (from.dik_id >= 0) {
    dik_id = from.dik_id;
  }
}

// ============================================================================
// PeerRegistry
// ============================================================================

bool PeerRegistry::update_supplicant_details(const P2pDevice &device) {
  if (device.address.is_zero()) {
    return false;
  }

  auto it = peers_.find(device.address);
  if (it == peers_.end()) {
    P2pDevice fresh = device;
    fresh.status = PeerStatus::Available;
    peers_.emplace(device.address, std::move(fresh));
    return true;
  }

  it->second.update_supplicant_details(device);
  return true;
}

bool PeerRegistry::update_status(const MacAddress &address,
                                 PeerStatus status) {
  auto it = peers_.find(address);
  if (it == peers_.end()) {
    return false;
  }
  it->second.status = status;
  return true;
}

bool PeerRegistry::update_group_capability(const MacAddress &address,
                                           int capability) {
  auto it = peers_.find(address);
  if (it == peers_.end()) {
    return false;
  }
  it->second.group_capability = capability;
  return true;
}

const P2pDevice *PeerRegistry::get(const MacAddress &address) const {
  auto it = peers_.find(address);
  return it == peers_.end() ? nullptr : &it->second;
}

bool PeerRegistry::contains(const MacAddress &address) const {
  return peers_.count(address) != 0;
}

std::optional<P2pDevice> PeerRegistry::remove(const MacAddress &address) {
  lost_during_connection_.erase(address);
  auto it = peers_.find(address);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  P2pDevice removed = std::move(it->second);
  peers_.erase(it);
  return removed;
}

bool PeerRegistry::clear() {
  lost_during_connection_.clear();
  if (peers_.empty()) {
    return false;
  }
  peers_.clear();
  return true;
}

std::vector<P2pDevice> PeerRegistry::list() const {
  std::vector<P2pDevice> out;
  out.reserve(peers_.size());
  for (const auto &entry : peers_) {
    out.push_back(entry.second);
  }
  return out;
}

void PeerRegistry::mark_lost_during_connection(const P2pDevice &device) {
  if (device.address.is_zero()) {
    return;
  }
  lost_during_connection_.insert(device.address);
  // The peer may have been pruned meanwhile; keep it visible
  if (!contains(device.address)) {
    update_supplicant_details(device);
  }
}

bool PeerRegistry::is_lost_during_connection(
    const MacAddress &address) const {
  return lost_during_connection_.count(address) != 0;
}

std::vector<MacAddress> PeerRegistry::prune_lost_during_connection(
    const std::set<MacAddress> &keep) {
  std::vector<MacAddress> removed;
  std::set<MacAddress> still_lost;
  for (const auto &address : lost_during_connection_) {
    if (keep.count(address) != 0) {
      still_lost.insert(address);
      continue;
    }
    if (peers_.erase(address) != 0) {
      removed.push_back(address);
    }
  }
  lost_during_connection_ = std::move(still_lost);
  return removed;
}

} // namespace p2plink
