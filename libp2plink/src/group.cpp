/**
 * @file group.cpp
 * @brief Active group helpers
 */

#include "p2plink/group.h"

#include <algorithm>
#include <sstream>

namespace p2plink {

const char *group_role_name(GroupRole role) {
  switch (role) {
  case GroupRole::Owner:
    return "GO";
  case GroupRole::Client:
    return "GC";
  }
  return "?";
}

bool P2pGroup::add_client(const P2pDevice &device, const std::string &ip) {
  if (!ip.empty()) {
    client_addresses[device.address] = ip;
  }
  for (auto &client : clients) {
    if (client.address == device.address) {
      client.update_supplicant_details(device);
      return false;
    }
  }
  clients.push_back(device);
  return true;
}

bool P2pGroup::remove_client(const MacAddress &address) {
  client_addresses.erase(address);
  auto it = std::find_if(
      clients.begin(), clients.end(),
      [&address](const P2pDevice &d) { return d.address == address; });
  if (it == clients.end()) {
    return false;
  }
  clients.erase(it);
  return true;
}

bool P2pGroup::contains(const MacAddress &address) const {
  if (owner && owner->address == address) {
    return true;
  }
  return std::any_of(
      clients.begin(), clients.end(),
      [&address](const P2pDevice &d) { return d.address == address; });
}

std::string P2pGroup::to_string() const {
  std::ostringstream oss;
  oss << "iface=" << interface_name << " ssid=" << network_name
      << " role=" << group_role_name(role) << " netId=" << net_id
      << " freq=" << frequency_mhz;
  if (owner) {
    oss << " owner=" << owner->address.to_string();
  }
  oss << " clients=" << clients.size();
  return oss.str();
}

bool PersistentGroupProfile::has_client(const MacAddress &address) const {
  return std::find(clients.begin(), clients.end(), address) != clients.end();
}

} // namespace p2plink
