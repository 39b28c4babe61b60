/**
 * @file persistent_groups.cpp
 * @brief Persistent group profile store
 */

#define P2PLINK_LOG_TAG "PersistentGroups"

#include "p2plink/persistent_groups.h"
#include "p2plink/log.h"

#include <algorithm>

namespace p2plink {

const char *reinvocation_action_name(ReinvocationPlan::Action a) {
  switch (a) {
  case ReinvocationPlan::Action::JoinPersistent:
    return "JoinPersistent";
  case ReinvocationPlan::Action::Reinvoke:
    return "Reinvoke";
  case ReinvocationPlan::Action::Fresh:
    return "Fresh";
  }
  return "Unknown";
}

// ============================================================================
// Loading
// ============================================================================

Result<void> PersistentGroupStore::reload(DriverCommandInterface &driver,
                                          const MacAddress &self) {
  auto networks = driver.list_networks();
  if (networks.is_error()) {
    P2PLINK_LOGE("Failed to list persistent groups: %s",
                 networks.error().to_string().c_str());
    profiles_.clear();
    return networks.error();
  }

  profiles_.clear();
  for (auto &profile : networks.value()) {
    if (profile.net_id < 0) {
      continue;
    }
    if (profile.owner_address.is_zero()) {
      P2PLINK_LOGD("Profile %d has no owner", profile.net_id);
    }
    profiles_[profile.net_id] = std::move(profile);
  }
  P2PLINK_LOGD("Loaded %zu persistent groups (self %s)", profiles_.size(),
               self.to_string().c_str());

  auto saved = driver.save_config();
  if (saved.is_error()) {
    P2PLINK_LOGW("Failed to save supplicant config: %s",
                 saved.error().to_string().c_str());
  }
  return Result<void>::ok();
}

void PersistentGroupStore::replace(
    std::vector<PersistentGroupProfile> profiles) {
  profiles_.clear();
  for (auto &profile : profiles) {
    int id = profile.net_id;
    profiles_[id] = std::move(profile);
  }
}

bool PersistentGroupStore::clear() {
  if (profiles_.empty()) {
    return false;
  }
  profiles_.clear();
  return true;
}

// ============================================================================
// Lookup
// ============================================================================

const PersistentGroupProfile *PersistentGroupStore::get(int net_id) const {
  auto it = profiles_.find(net_id);
  return it == profiles_.end() ? nullptr : &it->second;
}

int PersistentGroupStore::network_id(const MacAddress &owner,
                                     const std::string &ssid) const {
  if (ssid.empty()) {
    return -1;
  }
  for (const auto &entry : profiles_) {
    const auto &p = entry.second;
    if (p.owner_address == owner && p.network_name == ssid) {
      return p.net_id;
    }
  }
  return -1;
}

int PersistentGroupStore::network_id(const MacAddress &owner) const {
  for (const auto &entry : profiles_) {
    if (entry.second.owner_address == owner) {
      return entry.second.net_id;
    }
  }
  return -1;
}

int PersistentGroupStore::network_id_from_client_list(
    const MacAddress &client) const {
  for (const auto &entry : profiles_) {
    if (entry.second.has_client(client)) {
      return entry.second.net_id;
    }
  }
  return -1;
}

std::optional<MacAddress> PersistentGroupStore::owner_address(int net_id) const {
  const auto *profile = get(net_id);
  if (!profile || profile->owner_address.is_zero()) {
    return std::nullopt;
  }
  return profile->owner_address;
}

std::vector<PersistentGroupProfile> PersistentGroupStore::list() const {
  std::vector<PersistentGroupProfile> out;
  out.reserve(profiles_.size());
  for (const auto &entry : profiles_) {
    out.push_back(entry.second);
  }
  return out;
}

// ============================================================================
// Mutation
// ============================================================================

Result<void> PersistentGroupStore::remove(DriverCommandInterface &driver,
                                          int net_id) {
  if (profiles_.count(net_id) == 0) {
    return Error(ErrorCode::NotFound,
                 "No persistent group " + std::to_string(net_id));
  }

  P2PLINK_TRY(driver.remove_network(net_id));
  profiles_.erase(net_id);

  auto saved = driver.save_config();
  if (saved.is_error()) {
    P2PLINK_LOGW("Failed to save supplicant config: %s",
                 saved.error().to_string().c_str());
  }
  return Result<void>::ok();
}

Result<PersistentGroupStore::PruneOutcome>
PersistentGroupStore::prune_client(DriverCommandInterface &driver, int net_id,
                                   const MacAddress &client) {
  auto it = profiles_.find(net_id);
  if (it == profiles_.end()) {
    return PruneOutcome::NotFound;
  }

  auto &clients = it->second.clients;
  auto pos = std::find(clients.begin(), clients.end(), client);
  if (pos == clients.end()) {
    return PruneOutcome::NotFound;
  }

  std::vector<MacAddress> remaining = clients;
  remaining.erase(remaining.begin() + (pos - clients.begin()));

  if (remaining.empty()) {
    P2PLINK_LOGI("Last client %s left profile %d, deleting it",
                 client.to_string().c_str(), net_id);
    P2PLINK_TRY(remove(driver, net_id));
    return PruneOutcome::ProfileDeleted;
  }

  P2PLINK_TRY(driver.set_client_list(net_id, remaining));
  clients = std::move(remaining);

  auto saved = driver.save_config();
  if (saved.is_error()) {
    P2PLINK_LOGW("Failed to save supplicant config: %s",
                 saved.error().to_string().c_str());
  }
  return PruneOutcome::ClientRemoved;
}

Result<void> PersistentGroupStore::remove_all(DriverCommandInterface &driver) {
  std::vector<int> ids;
  for (const auto &entry : profiles_) {
    ids.push_back(entry.first);
  }
  for (int id : ids) {
    P2PLINK_TRY(driver.remove_network(id));
    profiles_.erase(id);
  }
  return driver.save_config();
}

// ============================================================================
// Reinvocation
// ============================================================================

ReinvocationPlan
PersistentGroupStore::plan_reinvocation(const P2pDevice &peer,
                                        const ConnectConfig &config,
                                        const std::string &peer_ssid,
                                        bool invited) const {
  ReinvocationPlan plan;
  bool join = peer.is_group_owner();

  if (join && peer.is_group_limit()) {
    // Owner cannot take more clients; try to become owner ourselves
    join = false;
  } else if (join) {
    int net_id = network_id(peer.address, peer_ssid);
    if (invited && net_id < 0) {
      net_id = network_id(peer.address);
    }
    if (net_id >= 0) {
      plan.action = ReinvocationPlan::Action::JoinPersistent;
      plan.net_id = net_id;
      plan.reason = "peer owns a stored group";
      return plan;
    }
  }

  if (!join && peer.is_device_limit()) {
    plan.reason = "peer reached its device limit";
    return plan;
  }

  if (!join && peer.is_invitation_capable()) {
    int net_id = kNetworkIdPersistent;
    if (config.net_id >= 0) {
      auto owner = owner_address(config.net_id);
      if (owner && *owner == peer.address) {
        net_id = config.net_id;
      }
    } else {
      net_id = network_id(peer.address);
    }
    if (net_id < 0) {
      net_id = network_id_from_client_list(peer.address);
    }
    if (net_id >= 0) {
      plan.action = ReinvocationPlan::Action::Reinvoke;
      plan.net_id = net_id;
      plan.reason = "stored group shared with peer";
      return plan;
    }
    plan.reason = "no stored group for peer";
    return plan;
  }

  plan.reason = join ? "peer owns an unknown group" : "peer cannot be invited";
  return plan;
}

} // namespace p2plink
