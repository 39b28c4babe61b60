/**
 * @file wpa_supplicant_driver.cpp
 * @brief wpa_supplicant P2P driver implementation
 *
 * Commands map onto fi.w1.wpa_supplicant1.Interface.P2PDevice methods.
 * Signals from the P2P device, its group interfaces and the bus daemon are
 * translated into DriverEventSink calls on the event thread.
 */

#define P2PLINK_LOG_TAG "WpaSupplicant"

#include "wpa_supplicant_driver.h"
#include "dbus_helpers.h"
#include "p2plink/log.h"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace p2plink {

using namespace platform;

namespace {

constexpr int kCommandTimeoutMs = 5000;
constexpr int kConnectTimeoutMs = 30000;
constexpr int kDispatchIntervalMs = 100;

const std::vector<std::string> kDefaultInterfaces = {"wlan0", "wlp2s0",
                                                     "wlp3s0", "wlan1"};

// WPS device password ids carried in GO negotiation requests
constexpr int kDevPasswordUserSpecified = 1;
constexpr int kDevPasswordPushButton = 4;
constexpr int kDevPasswordRegistrarSpecified = 5;

std::string mac_to_path_suffix(const MacAddress &address) {
  char buf[13];
  std::snprintf(buf, sizeof(buf), "%02x%02x%02x%02x%02x%02x", address.bytes[0],
                address.bytes[1], address.bytes[2], address.bytes[3],
                address.bytes[4], address.bytes[5]);
  return buf;
}

std::optional<MacAddress> mac_from_bytes(const Bytes &bytes) {
  if (bytes.size() != MacAddress::SIZE) {
    return std::nullopt;
  }
  MacAddress address;
  std::copy(bytes.begin(), bytes.end(), address.bytes.begin());
  return address;
}

/// "10-0050F204-5" from the 8-byte WPS primary device type
std::string format_device_type(const Bytes &bytes) {
  if (bytes.size() != 8) {
    return "";
  }
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%d-%02X%02X%02X%02X-%d",
                (bytes[0] << 8) | bytes[1], bytes[2], bytes[3], bytes[4],
                bytes[5], (bytes[6] << 8) | bytes[7]);
  return buf;
}

const char *provision_method_string(WpsMethod method) {
  // The peer does the opposite of what we do
  switch (method) {
  case WpsMethod::Display:
    return "keypad";
  case WpsMethod::Keypad:
    return "display";
  default:
    return "pbc";
  }
}

const char *connect_method_string(WpsMethod method) {
  switch (method) {
  case WpsMethod::Display:
    return "display";
  case WpsMethod::Keypad:
    return "keypad";
  case WpsMethod::Label:
    return "label";
  default:
    return "pbc";
  }
}

ProvisionDiscoveryStatus provision_status_from_int(int status) {
  switch (status) {
  case 0:
    return ProvisionDiscoveryStatus::Success;
  case 1:
    return ProvisionDiscoveryStatus::Timeout;
  case 2:
    return ProvisionDiscoveryStatus::Rejected;
  case 3:
    return ProvisionDiscoveryStatus::TimeoutJoin;
  case 4:
    return ProvisionDiscoveryStatus::InfoUnavailable;
  default:
    return ProvisionDiscoveryStatus::Unknown;
  }
}

std::string strip_quotes(const std::string &value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

} // namespace

// ============================================================================
// Path Helpers
// ============================================================================

namespace platform {

std::optional<MacAddress> peer_address_from_path(const std::string &path) {
  size_t slash = path.rfind('/');
  std::string hex = slash == std::string::npos ? path : path.substr(slash + 1);
  if (hex.size() != 12) {
    return std::nullopt;
  }
  auto bytes = hex_to_bytes(hex);
  if (!bytes) {
    return std::nullopt;
  }
  return mac_from_bytes(*bytes);
}

int net_id_from_path(const std::string &path) {
  size_t slash = path.rfind('/');
  if (slash == std::string::npos || slash + 1 >= path.size()) {
    return -1;
  }
  const std::string tail = path.substr(slash + 1);
  if (tail.find_first_not_of("0123456789") != std::string::npos) {
    return -1;
  }
  return std::atoi(tail.c_str());
}

std::vector<MacAddress> parse_client_list(const std::string &value) {
  std::vector<MacAddress> out;
  std::istringstream stream(value);
  std::string token;
  while (stream >> token) {
    if (auto address = MacAddress::from_string(token)) {
      out.push_back(*address);
    }
  }
  return out;
}

} // namespace platform

// ============================================================================
// Implementation
// ============================================================================

class WpaSupplicantDriver::Impl {
public:
  std::vector<std::string> candidates;

  DBusConnectionWrapper conn;
  std::string interface_path; ///< Station interface object
  std::string interface_name;
  DriverEventSink *sink = nullptr;

  std::atomic<bool> stop_requested{false};
  std::thread event_thread;

  std::mutex mutex;
  std::map<MacAddress, std::string> peer_paths;
  std::string peers_prefix; ///< Object path under which peers appear

  struct GroupObjects {
    std::string interface_path;
    std::string group_path;
  };
  std::map<std::string, GroupObjects> groups; ///< By interface name

  mutable std::optional<bool> supported;

  // ------------------------------------------------------------------------
  // Object paths
  // ------------------------------------------------------------------------

  std::string peer_path(const MacAddress &address) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = peer_paths.find(address);
    if (it != peer_paths.end()) {
      return it->second;
    }
    const std::string prefix =
        peers_prefix.empty() ? interface_path + "/Peers/" : peers_prefix;
    return prefix + mac_to_path_suffix(address);
  }

  void remember_peer(const std::string &path) {
    auto address = peer_address_from_path(path);
    if (!address) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    peer_paths[*address] = path;
    if (peers_prefix.empty()) {
      peers_prefix = path.substr(0, path.rfind('/') + 1);
    }
  }

  std::optional<GroupObjects> group_objects(const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = groups.find(name);
    if (it == groups.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::string persistent_group_path(int net_id) {
    std::lock_guard<std::mutex> lock(mutex);
    std::string base = peers_prefix.empty()
                           ? interface_path + "/"
                           : peers_prefix.substr(0, peers_prefix.size() - 6);
    return base + "PersistentGroups/" + std::to_string(net_id);
  }

  // ------------------------------------------------------------------------
  // Method calls
  // ------------------------------------------------------------------------

  Result<void> require_connection() const {
    if (!conn) {
      return Error(ErrorCode::DriverUnavailable, "P2P interface not set up");
    }
    return Result<void>::ok();
  }

  DBusMessageWrapper new_call(const std::string &path, const char *iface,
                              const char *method) {
    return DBusMessageWrapper(
        dbus_message_new_method_call(WPA_SERVICE, path.c_str(), iface, method));
  }

  Result<DBusMessageWrapper> p2p_call_simple(const char *method) {
    P2PLINK_TRY(require_connection());
    return call_method(conn.get(), WPA_SERVICE, interface_path.c_str(),
                       WPA_P2P_IFACE, method, kCommandTimeoutMs);
  }

  /// Call a P2PDevice method taking one a{sv}; @p fill adds entries
  template <typename Fill>
  Result<DBusMessageWrapper> p2p_call_dict(const std::string &path,
                                           const char *iface,
                                           const char *method, Fill fill,
                                           int timeout_ms = kCommandTimeoutMs) {
    P2PLINK_TRY(require_connection());
    DBusMessageWrapper msg = new_call(path, iface, method);
    if (!msg) {
      return Error(ErrorCode::DBusError, "Failed to create D-Bus message");
    }
    {
      DictBuilder dict(msg.get());
      fill(dict);
    }
    return send_blocking(conn.get(), msg.get(), timeout_ms);
  }

  /// Call a method with plain arguments appended by dbus_message_append_args
  template <typename... Args>
  Result<DBusMessageWrapper> call_with_args(const std::string &path,
                                            const char *iface,
                                            const char *method,
                                            Args... args) {
    P2PLINK_TRY(require_connection());
    DBusMessageWrapper msg = new_call(path, iface, method);
    if (!msg) {
      return Error(ErrorCode::DBusError, "Failed to create D-Bus message");
    }
    dbus_message_append_args(msg.get(), args..., DBUS_TYPE_INVALID);
    return send_blocking(conn.get(), msg.get(), kCommandTimeoutMs);
  }

  // ------------------------------------------------------------------------
  // Property readers
  // ------------------------------------------------------------------------

  P2pDevice read_peer(const std::string &path) {
    P2pDevice device;
    if (auto address = peer_address_from_path(path)) {
      device.address = *address;
    }

    auto read = [&](const char *property) {
      return get_property(conn.get(), WPA_SERVICE, path.c_str(), WPA_PEER_IFACE,
                          property);
    };

    if (auto name = read("DeviceName")) {
      device.name = name.value().text;
    }
    if (auto type = read("PrimaryDeviceType")) {
      device.primary_type = format_device_type(type.value().bytes);
    }
    if (auto methods = read("config_method")) {
      device.wps_config_methods = static_cast<int>(methods.value().number);
    }
    if (auto caps = read("devicecapability")) {
      device.device_capability = static_cast<int>(caps.value().number);
    }
    if (auto caps = read("groupcapability")) {
      device.group_capability = static_cast<int>(caps.value().number);
    }
    if (auto address = read("DeviceAddress")) {
      if (auto mac = mac_from_bytes(address.value().bytes)) {
        device.address = *mac;
      }
    }
    device.status = PeerStatus::Available;
    return device;
  }

  P2pDevice peer_stub(const std::string &path) {
    P2pDevice device;
    if (auto address = peer_address_from_path(path)) {
      device.address = *address;
    }
    return device;
  }

  std::string read_ifname(const std::string &iface_path) {
    auto name = get_property(conn.get(), WPA_SERVICE, iface_path.c_str(),
                             WPA_IFACE_IFACE, "Ifname");
    return name ? name.value().text : std::string();
  }

  // ------------------------------------------------------------------------
  // Signal handling (event thread)
  // ------------------------------------------------------------------------

  static DBusHandlerResult filter(DBusConnection *, DBusMessage *msg,
                                  void *data) {
    auto *self = static_cast<Impl *>(data);
    if (dbus_message_get_type(msg) == DBUS_MESSAGE_TYPE_SIGNAL) {
      self->handle_signal(msg);
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
  }

  void handle_signal(DBusMessage *msg) {
    if (!sink) {
      return;
    }
    const char *iface = dbus_message_get_interface(msg);
    const char *member = dbus_message_get_member(msg);
    if (!iface || !member) {
      return;
    }
    const std::string interface(iface);

    if (interface == WPA_P2P_IFACE) {
      handle_p2p_signal(msg, member);
    } else if (interface == WPA_IFACE_IFACE) {
      handle_interface_signal(msg, member);
    } else if (interface == DBUS_INTERFACE_PROPERTIES &&
               std::string(member) == "PropertiesChanged") {
      handle_properties_changed(msg);
    } else if (interface == DBUS_INTERFACE_DBUS &&
               std::string(member) == "NameOwnerChanged") {
      const char *name = nullptr;
      const char *old_owner = nullptr;
      const char *new_owner = nullptr;
      if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &name,
                                DBUS_TYPE_STRING, &old_owner, DBUS_TYPE_STRING,
                                &new_owner, DBUS_TYPE_INVALID) &&
          std::string(name) == WPA_SERVICE && new_owner[0] == '\0') {
        P2PLINK_LOGW("wpa_supplicant left the bus");
        sink->on_driver_disconnected();
      }
    } else if (interface == WPA_IFACE &&
               std::string(member) == "InterfaceRemoved") {
      const char *path = nullptr;
      if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_OBJECT_PATH, &path,
                                DBUS_TYPE_INVALID) &&
          interface_path == path) {
        P2PLINK_LOGW("Interface %s removed", interface_name.c_str());
        sink->on_driver_disconnected();
      }
    }
  }

  /// First argument as an object path, empty if absent
  static std::string path_arg(DBusMessage *msg) {
    const char *path = nullptr;
    DBusMessageIter iter;
    if (dbus_message_iter_init(msg, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_OBJECT_PATH) {
      dbus_message_iter_get_basic(&iter, &path);
    }
    return path ? path : "";
  }

  /// First argument as a dictionary
  static VariantMap dict_arg(DBusMessage *msg) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) {
      return VariantMap();
    }
    return read_dict(&iter);
  }

  void handle_p2p_signal(DBusMessage *msg, const std::string &member) {
    if (member == "DeviceFound") {
      const std::string path = path_arg(msg);
      remember_peer(path);
      sink->on_device_found(read_peer(path));
    } else if (member == "DeviceLost") {
      const std::string path = path_arg(msg);
      P2pDevice device = peer_stub(path);
      {
        std::lock_guard<std::mutex> lock(mutex);
        peer_paths.erase(device.address);
      }
      sink->on_device_lost(device);
    } else if (member == "FindStopped") {
      sink->on_find_stopped();
    } else if (member == "GONegotiationRequest") {
      handle_go_negotiation_request(msg);
    } else if (member == "GONegotiationSuccess") {
      sink->on_go_negotiation_success();
    } else if (member == "GONegotiationFailure") {
      VariantMap info = dict_arg(msg);
      sink->on_go_negotiation_failure(
          p2p_status_from_int(static_cast<int>(dict_number(info, "status", -1))));
    } else if (member == "GroupFormationFailure") {
      const char *reason = nullptr;
      dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &reason,
                            DBUS_TYPE_INVALID);
      sink->on_group_formation_failure(reason ? reason : "");
    } else if (member == "GroupStarted") {
      handle_group_started(msg);
    } else if (member == "GroupFinished") {
      handle_group_finished(msg);
    } else if (member == "InvitationReceived") {
      handle_invitation_received(msg);
    } else if (member == "InvitationResult") {
      VariantMap info = dict_arg(msg);
      sink->on_invitation_result(
          p2p_status_from_int(static_cast<int>(dict_number(info, "status", -1))));
    } else if (member == "ProvisionDiscoveryPBCRequest" ||
               member == "ProvisionDiscoveryPBCResponse" ||
               member == "ProvisionDiscoveryRequestEnterPin" ||
               member == "ProvisionDiscoveryResponseEnterPin" ||
               member == "ProvisionDiscoveryRequestDisplayPin" ||
               member == "ProvisionDiscoveryResponseDisplayPin") {
      handle_provision_discovery(msg, member);
    } else if (member == "ProvisionDiscoveryFailure") {
      const char *path = nullptr;
      dbus_int32_t status = -1;
      if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_OBJECT_PATH, &path,
                                DBUS_TYPE_INT32, &status, DBUS_TYPE_INVALID)) {
        sink->on_provision_discovery_failure(peer_stub(path).address,
                                             provision_status_from_int(status));
      }
    } else if (member == "ServiceDiscoveryResponse") {
      VariantMap info = dict_arg(msg);
      P2pDevice source = peer_stub(dict_string(info, "peer_object"));
      sink->on_service_discovery_response(source.address,
                                          dict_bytes(info, "tlvs"));
    }
  }

  void handle_go_negotiation_request(DBusMessage *msg) {
    const char *path = nullptr;
    dbus_uint16_t password_id = 0;
    unsigned char intent = 0;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_OBJECT_PATH, &path,
                               DBUS_TYPE_UINT16, &password_id, DBUS_TYPE_BYTE,
                               &intent, DBUS_TYPE_INVALID)) {
      P2PLINK_LOGW("Malformed GONegotiationRequest");
      return;
    }

    ConnectConfig config;
    config.device_address = peer_stub(path).address;
    config.group_owner_intent = intent;
    switch (password_id) {
    case kDevPasswordUserSpecified:
      config.wps.method = WpsMethod::Display;
      break;
    case kDevPasswordPushButton:
      config.wps.method = WpsMethod::Pbc;
      break;
    case kDevPasswordRegistrarSpecified:
      config.wps.method = WpsMethod::Keypad;
      break;
    default:
      config.wps.method = WpsMethod::Pbc;
      break;
    }
    sink->on_go_negotiation_request(config);
  }

  void handle_group_started(DBusMessage *msg) {
    VariantMap info = dict_arg(msg);
    const std::string iface_path = dict_string(info, "interface_object");
    const std::string group_path = dict_string(info, "group_object");

    P2pGroup group;
    group.interface_name = read_ifname(iface_path);
    group.role = dict_string(info, "role") == "GO" ? GroupRole::Owner
                                                   : GroupRole::Client;

    auto read = [&](const char *property) {
      return get_property(conn.get(), WPA_SERVICE, group_path.c_str(),
                          WPA_GROUP_IFACE, property);
    };
    if (auto ssid = read("SSID")) {
      const Bytes &bytes = ssid.value().bytes;
      group.network_name.assign(bytes.begin(), bytes.end());
    }
    if (auto frequency = read("Frequency")) {
      group.frequency_mhz = static_cast<int>(frequency.value().number);
    }
    if (group.role == GroupRole::Owner) {
      if (auto passphrase = read("Passphrase")) {
        group.passphrase = passphrase.value().text;
      }
    } else {
      auto go = get_property(conn.get(), WPA_SERVICE, interface_path.c_str(),
                             WPA_P2P_IFACE, "PeerGO");
      if (go && !go.value().text.empty() && go.value().text != "/") {
        group.owner = read_peer(go.value().text);
      }
    }

    // Stored groups are resolved to their id by the caller
    auto stored = list_persistent();
    for (const auto &profile : stored) {
      if (profile.network_name == group.network_name) {
        group.net_id = kNetworkIdPersistent;
        break;
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex);
      groups[group.interface_name] = GroupObjects{iface_path, group_path};
    }
    P2PLINK_LOGI("Group %s started on %s", group.network_name.c_str(),
                 group.interface_name.c_str());
    sink->on_group_started(group);
  }

  void handle_group_finished(DBusMessage *msg) {
    VariantMap info = dict_arg(msg);
    const std::string iface_path = dict_string(info, "interface_object");

    P2pGroup group;
    {
      std::lock_guard<std::mutex> lock(mutex);
      for (auto it = groups.begin(); it != groups.end(); ++it) {
        if (it->second.interface_path == iface_path) {
          group.interface_name = it->first;
          groups.erase(it);
          break;
        }
      }
    }
    group.role = dict_string(info, "role") == "GO" ? GroupRole::Owner
                                                   : GroupRole::Client;
    sink->on_group_removed(group);
  }

  void handle_invitation_received(DBusMessage *msg) {
    VariantMap info = dict_arg(msg);

    P2pGroup group;
    group.net_id = static_cast<int>(
        dict_number(info, "persistent_id", kNetworkIdTemporary));
    group.frequency_mhz = static_cast<int>(dict_number(info, "op_freq", 0));

    auto owner = mac_from_bytes(dict_bytes(info, "go_dev_addr"));
    if (!owner || owner->is_zero()) {
      // A plain invitation comes from the owner itself
      if (group.net_id < 0) {
        owner = mac_from_bytes(dict_bytes(info, "sa"));
      } else {
        owner.reset();
      }
    }
    if (owner && !owner->is_zero()) {
      P2pDevice device;
      device.address = *owner;
      group.owner = device;
    }
    sink->on_invitation_received(group);
  }

  void handle_provision_discovery(DBusMessage *msg, const std::string &member) {
    const char *path = nullptr;
    const char *pin = nullptr;
    bool with_pin = member.find("DisplayPin") != std::string::npos;
    bool ok = with_pin
                  ? dbus_message_get_args(msg, nullptr, DBUS_TYPE_OBJECT_PATH,
                                          &path, DBUS_TYPE_STRING, &pin,
                                          DBUS_TYPE_INVALID)
                  : dbus_message_get_args(msg, nullptr, DBUS_TYPE_OBJECT_PATH,
                                          &path, DBUS_TYPE_INVALID);
    if (!ok) {
      P2PLINK_LOGW("Malformed %s", member.c_str());
      return;
    }

    ProvisionDiscoveryEvent event;
    event.device = read_peer(path);
    if (member == "ProvisionDiscoveryPBCRequest") {
      event.kind = ProvisionDiscoveryEvent::Kind::PbcRequest;
    } else if (member == "ProvisionDiscoveryPBCResponse") {
      event.kind = ProvisionDiscoveryEvent::Kind::PbcResponse;
    } else if (with_pin) {
      event.kind = ProvisionDiscoveryEvent::Kind::ShowPin;
      event.pin = pin ? pin : "";
    } else {
      event.kind = ProvisionDiscoveryEvent::Kind::EnterPin;
    }
    sink->on_provision_discovery(event);
  }

  void handle_interface_signal(DBusMessage *msg, const std::string &member) {
    if (member == "StaAuthorized" || member == "StaDeauthorized") {
      const char *mac = nullptr;
      if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &mac,
                                 DBUS_TYPE_INVALID)) {
        return;
      }
      auto address = MacAddress::from_string(mac);
      if (!address) {
        return;
      }
      P2pDevice device;
      device.address = *address;
      if (member == "StaAuthorized") {
        sink->on_station_connected(device, "");
      } else {
        sink->on_station_disconnected(device);
      }
    } else if (member == "NANDiscoveryResult") {
      VariantMap info = dict_arg(msg);
      UsdDiscoveryResult result;
      result.session_id =
          static_cast<int>(dict_number(info, "subscribe_id", 0));
      result.peer_session_id =
          static_cast<int>(dict_number(info, "publish_id", 0));
      if (auto peer = MacAddress::from_string(dict_string(info, "peer_addr"))) {
        result.peer = *peer;
      }
      result.protocol = static_cast<ServiceProtocol>(
          dict_number(info, "srv_proto_type", 1));
      result.service_specific_info = dict_bytes(info, "ssi");
      sink->on_usd_discovery_result(result);
    } else if (member == "NANSubscribeTerminated" ||
               member == "NANPublishTerminated") {
      dbus_uint32_t id = 0;
      const char *reason = nullptr;
      if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_UINT32, &id,
                                DBUS_TYPE_STRING, &reason, DBUS_TYPE_INVALID)) {
        P2PLINK_LOGD("USD session %u ended: %s", id, reason);
        sink->on_usd_session_terminated(static_cast<int>(id),
                                        member == "NANPublishTerminated");
      }
    }
  }

  void handle_properties_changed(DBusMessage *msg) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) {
      return;
    }
    const char *iface = nullptr;
    dbus_message_iter_get_basic(&iter, &iface);
    if (std::string(iface) != WPA_GROUP_IFACE) {
      return;
    }
    dbus_message_iter_next(&iter);
    VariantMap changed = read_dict(&iter);
    auto frequency = changed.find("Frequency");
    if (frequency != changed.end()) {
      sink->on_frequency_changed(static_cast<int>(frequency->second.number));
    }
  }

  void event_loop() {
    P2PLINK_LOGD("Event thread started");
    while (!stop_requested) {
      if (!dbus_connection_read_write_dispatch(conn.get(), kDispatchIntervalMs)) {
        P2PLINK_LOGE("System bus connection lost");
        if (sink) {
          sink->on_driver_disconnected();
        }
        break;
      }
    }
    P2PLINK_LOGD("Event thread stopped");
  }

  // ------------------------------------------------------------------------
  // Setup
  // ------------------------------------------------------------------------

  Result<std::string> find_interface() {
    const auto &names = candidates.empty() ? kDefaultInterfaces : candidates;
    for (const auto &name : names) {
      DBusMessageWrapper msg(dbus_message_new_method_call(
          WPA_SERVICE, WPA_PATH, WPA_IFACE, "GetInterface"));
      if (!msg) {
        continue;
      }
      const char *ifname = name.c_str();
      dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &ifname,
                               DBUS_TYPE_INVALID);
      auto reply = send_blocking(conn.get(), msg.get(), kCommandTimeoutMs);
      if (reply.is_error()) {
        continue;
      }
      const char *path = nullptr;
      if (dbus_message_get_args(reply.value().get(), nullptr,
                                DBUS_TYPE_OBJECT_PATH, &path,
                                DBUS_TYPE_INVALID)) {
        interface_name = name;
        return std::string(path);
      }
    }
    return Error(ErrorCode::HardwareNotAvailable, "No WiFi interface found");
  }

  void add_match(const char *rule) {
    DBusErrorWrapper error;
    dbus_bus_add_match(conn.get(), rule, error.get());
    if (error.is_set()) {
      P2PLINK_LOGW("Match rule '%s': %s", rule,
                   error.to_error().to_string().c_str());
    }
  }

  void close_connection() {
    if (conn) {
      dbus_connection_remove_filter(conn.get(), &Impl::filter, this);
      dbus_connection_close(conn.get());
      conn = DBusConnectionWrapper();
    }
  }

  // ------------------------------------------------------------------------
  // Persistent groups
  // ------------------------------------------------------------------------

  std::vector<PersistentGroupProfile> list_persistent() {
    std::vector<PersistentGroupProfile> out;
    auto paths = get_property(conn.get(), WPA_SERVICE, interface_path.c_str(),
                              WPA_P2P_IFACE, "PersistentGroups");
    if (paths.is_error()) {
      P2PLINK_LOGW("PersistentGroups: %s",
                   paths.error().to_string().c_str());
      return out;
    }

    for (const auto &path : paths.value().paths) {
      auto props = get_property(conn.get(), WPA_SERVICE, path.c_str(),
                                WPA_PERSISTENT_IFACE, "Properties");
      if (props.is_error()) {
        continue;
      }
      const VariantMap &dict = props.value().dict;
      PersistentGroupProfile profile;
      profile.net_id = net_id_from_path(path);
      profile.network_name = strip_quotes(dict_string(dict, "ssid"));
      // Persistent groups store the owner's device address as bssid
      if (auto owner = MacAddress::from_string(dict_string(dict, "bssid"))) {
        profile.owner_address = *owner;
      }
      profile.clients = parse_client_list(dict_string(dict, "p2p_client_list"));
      out.push_back(std::move(profile));
    }
    return out;
  }
};

// ============================================================================
// Construction
// ============================================================================

WpaSupplicantDriver::WpaSupplicantDriver(std::vector<std::string> interface_names)
    : impl_(std::make_unique<Impl>()) {
  impl_->candidates = std::move(interface_names);
}

WpaSupplicantDriver::~WpaSupplicantDriver() { teardown_interface(); }

bool WpaSupplicantDriver::is_supported() const {
  if (impl_->supported) {
    return *impl_->supported;
  }

  auto bus = open_system_bus();
  if (bus.is_error()) {
    P2PLINK_LOGW("System bus: %s", bus.error().to_string().c_str());
    return false;
  }
  DBusConnection *conn = bus.value().get();

  bool supported = false;
  DBusErrorWrapper error;
  if (dbus_bus_name_has_owner(conn, WPA_SERVICE, error.get())) {
    auto caps = get_property(conn, WPA_SERVICE, WPA_PATH, WPA_IFACE,
                             "Capabilities");
    if (caps) {
      for (const auto &cap : caps.value().paths) {
        if (cap == "p2p") {
          supported = true;
        }
      }
    }
  } else {
    P2PLINK_LOGW("wpa_supplicant is not running");
  }
  dbus_connection_close(conn);

  // Only a positive answer is cached; the daemon may start later
  if (supported) {
    impl_->supported = true;
  }
  return supported;
}

// ============================================================================
// Interface Lifecycle
// ============================================================================

Result<std::string> WpaSupplicantDriver::setup_interface(DriverEventSink *sink) {
  if (impl_->conn) {
    return impl_->interface_name;
  }

  dbus_threads_init_default();

  auto bus = open_system_bus();
  if (bus.is_error()) {
    return bus.error();
  }
  impl_->conn = std::move(bus.value());

  auto path = impl_->find_interface();
  if (path.is_error()) {
    impl_->close_connection();
    return path.error();
  }
  impl_->interface_path = path.value();
  impl_->sink = sink;

  if (!dbus_connection_add_filter(impl_->conn.get(), &Impl::filter,
                                  impl_.get(), nullptr)) {
    impl_->close_connection();
    return Error(ErrorCode::DBusError, "Failed to add signal filter");
  }

  impl_->add_match("type='signal',interface='fi.w1.wpa_supplicant1.Interface."
                   "P2PDevice'");
  impl_->add_match("type='signal',interface='fi.w1.wpa_supplicant1.Interface'");
  impl_->add_match("type='signal',interface='fi.w1.wpa_supplicant1',"
                   "member='InterfaceRemoved'");
  impl_->add_match("type='signal',sender='fi.w1.wpa_supplicant1',"
                   "interface='org.freedesktop.DBus.Properties',"
                   "member='PropertiesChanged'");
  impl_->add_match("type='signal',interface='org.freedesktop.DBus',"
                   "member='NameOwnerChanged',arg0='fi.w1.wpa_supplicant1'");

  impl_->stop_requested = false;
  Impl *impl = impl_.get();
  impl_->event_thread = std::thread([impl]() { impl->event_loop(); });

  P2PLINK_LOGI("Using %s (%s)", impl_->interface_name.c_str(),
               impl_->interface_path.c_str());
  return impl_->interface_name;
}

void WpaSupplicantDriver::teardown_interface() {
  if (!impl_->conn) {
    return;
  }

  impl_->stop_requested = true;
  if (impl_->event_thread.joinable()) {
    impl_->event_thread.join();
  }

  impl_->sink = nullptr;
  impl_->close_connection();
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->peer_paths.clear();
    impl_->groups.clear();
    impl_->peers_prefix.clear();
  }
  P2PLINK_LOGI("Released %s", impl_->interface_name.c_str());
}

Result<MacAddress> WpaSupplicantDriver::get_device_address() {
  P2PLINK_TRY(impl_->require_connection());

  auto property =
      get_property(impl_->conn.get(), WPA_SERVICE, impl_->interface_path.c_str(),
                   WPA_P2P_IFACE, "P2PDeviceAddress");
  if (property) {
    if (auto mac = mac_from_bytes(property.value().bytes)) {
      return *mac;
    }
    if (auto mac = MacAddress::from_string(property.value().text)) {
      return *mac;
    }
  }

  // Without a dedicated P2P device the address is the station's
  std::ifstream file("/sys/class/net/" + impl_->interface_name + "/address");
  std::string line;
  if (file && std::getline(file, line)) {
    if (auto mac = MacAddress::from_string(line)) {
      return *mac;
    }
  }
  return Error(ErrorCode::DriverError, "P2P device address unavailable");
}

Result<void> WpaSupplicantDriver::set_device_name(const std::string &name) {
  P2PLINK_TRY(impl_->require_connection());
  return set_dict_property(impl_->conn.get(), WPA_SERVICE,
                           impl_->interface_path.c_str(), WPA_P2P_IFACE,
                           "P2PDeviceConfig", [&](DBusMessageIter *dict) {
                             append_string_entry(dict, "DeviceName", name);
                           });
}

// ============================================================================
// Discovery
// ============================================================================

Result<void> WpaSupplicantDriver::start_discovery(const DiscoveryParams &params) {
  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_P2P_IFACE, "Find", [&](DictBuilder &dict) {
        if (params.timeout_s > 0) {
          dict.add_int32("Timeout", params.timeout_s);
        }
        switch (params.scan_type) {
        case ScanType::Social:
          dict.add_string("DiscoveryType", "social");
          break;
        case ScanType::SpecificFrequency:
          dict.add_int32("freq", params.frequency_mhz);
          break;
        default:
          dict.add_string("DiscoveryType", "start_with_full");
          break;
        }
      });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::stop_discovery() {
  auto reply = impl_->p2p_call_simple("StopFind");
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::set_extended_listen(bool enable,
                                                      int period_ms,
                                                      int interval_ms) {
  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_P2P_IFACE, "ExtendedListen",
      [&](DictBuilder &dict) {
        dict.add_int32("period", enable ? period_ms : 0);
        dict.add_int32("interval", enable ? interval_ms : 0);
      });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::flush() {
  auto reply = impl_->p2p_call_simple("Flush");
  if (reply.is_error()) {
    return reply.error();
  }
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->peer_paths.clear();
  }
  return Result<void>::ok();
}

// ============================================================================
// Connection
// ============================================================================

Result<std::string> WpaSupplicantDriver::connect(const ConnectConfig &config,
                                                 bool join) {
  const std::string peer = impl_->peer_path(config.device_address);
  const std::string pin = config.wps.pin;

  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_P2P_IFACE, "Connect",
      [&](DictBuilder &dict) {
        dict.add_object_path("peer", peer);
        dict.add_string("wps_method", connect_method_string(config.wps.method));
        if (!pin.empty()) {
          dict.add_string("pin", pin);
        }
        dict.add_bool("persistent", config.net_id != kNetworkIdTemporary);
        dict.add_bool("join", join);
        if (config.group_owner_intent != kGroupOwnerIntentAuto) {
          dict.add_int32("go_intent", config.group_owner_intent);
        }
        if (config.frequency_mhz > 0) {
          dict.add_int32("frequency", config.frequency_mhz);
        }
      },
      kConnectTimeoutMs);
  if (reply.is_error()) {
    return reply.error();
  }

  const char *generated = nullptr;
  if (config.wps.method == WpsMethod::Display && pin.empty() &&
      dbus_message_get_args(reply.value().get(), nullptr, DBUS_TYPE_STRING,
                            &generated, DBUS_TYPE_INVALID) &&
      generated) {
    return std::string(generated);
  }
  return std::string();
}

Result<void> WpaSupplicantDriver::cancel_connect() {
  auto reply = impl_->p2p_call_simple("Cancel");
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void>
WpaSupplicantDriver::provision_discovery(const ConnectConfig &config) {
  const std::string peer = impl_->peer_path(config.device_address);
  const char *peer_str = peer.c_str();
  const char *method = provision_method_string(config.wps.method);
  auto reply = impl_->call_with_args(
      impl_->interface_path, WPA_P2P_IFACE, "ProvisionDiscoveryRequest",
      DBUS_TYPE_OBJECT_PATH, &peer_str, DBUS_TYPE_STRING, &method);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::reject(const MacAddress &peer) {
  const std::string path = impl_->peer_path(peer);
  const char *path_str = path.c_str();
  auto reply = impl_->call_with_args(impl_->interface_path, WPA_P2P_IFACE,
                                     "RejectPeer", DBUS_TYPE_OBJECT_PATH,
                                     &path_str);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::group_add(const GroupAddRequest &request) {
  std::string stored_path;

  if (request.config) {
    if (request.join) {
      return Error(ErrorCode::NotSupported,
                   "Joining with credentials is not available over D-Bus");
    }
    // Store the credentials as a group profile, then start it
    auto added = impl_->p2p_call_dict(
        impl_->interface_path, WPA_P2P_IFACE, "AddPersistentGroup",
        [&](DictBuilder &dict) {
          dict.add_string("ssid", request.config->network_name);
          dict.add_string("psk", request.config->passphrase);
          dict.add_int32("mode", 3);
          dict.add_int32("disabled", 2);
        });
    if (added.is_error()) {
      return added.error();
    }
    const char *path = nullptr;
    if (!dbus_message_get_args(added.value().get(), nullptr,
                               DBUS_TYPE_OBJECT_PATH, &path,
                               DBUS_TYPE_INVALID)) {
      return Error(ErrorCode::DriverError, "AddPersistentGroup returned no path");
    }
    stored_path = path;
  } else if (request.net_id >= 0) {
    stored_path = impl_->persistent_group_path(request.net_id);
  }

  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_P2P_IFACE, "GroupAdd", [&](DictBuilder &dict) {
        dict.add_bool("persistent", request.persistent || !stored_path.empty());
        int frequency = request.frequency_mhz;
        if (request.config && request.config->frequency_mhz > 0) {
          frequency = request.config->frequency_mhz;
        }
        if (frequency > 0) {
          dict.add_int32("frequency", frequency);
        }
        if (!stored_path.empty()) {
          dict.add_object_path("persistent_group_object", stored_path);
        }
      });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void>
WpaSupplicantDriver::group_remove(const std::string &interface_name) {
  P2PLINK_TRY(impl_->require_connection());
  auto objects = impl_->group_objects(interface_name);
  const std::string path =
      objects ? objects->interface_path : impl_->interface_path;
  auto reply = call_method(impl_->conn.get(), WPA_SERVICE, path.c_str(),
                           WPA_P2P_IFACE, "Disconnect", kCommandTimeoutMs);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::invite(const P2pGroup &group,
                                         const MacAddress &peer) {
  auto objects = impl_->group_objects(group.interface_name);
  if (!objects) {
    return Error(ErrorCode::NoActiveGroup, group.interface_name);
  }
  const std::string peer_path = impl_->peer_path(peer);
  auto reply = impl_->p2p_call_dict(
      objects->interface_path, WPA_P2P_IFACE, "Invite",
      [&](DictBuilder &dict) { dict.add_object_path("peer", peer_path); });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::reinvoke(int net_id, const MacAddress &peer,
                                           int dik_id) {
  if (dik_id >= 0) {
    P2PLINK_LOGD("Identity key %d not used over D-Bus", dik_id);
  }
  const std::string peer_path = impl_->peer_path(peer);
  const std::string group_path = impl_->persistent_group_path(net_id);
  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_P2P_IFACE, "Invite", [&](DictBuilder &dict) {
        dict.add_object_path("peer", peer_path);
        dict.add_object_path("persistent_group_object", group_path);
      });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::remove_client(const MacAddress &peer) {
  const std::string peer_path = impl_->peer_path(peer);
  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_P2P_IFACE, "RemoveClient",
      [&](DictBuilder &dict) { dict.add_object_path("peer", peer_path); });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void>
WpaSupplicantDriver::start_wps_pbc(const std::string &interface_name) {
  auto objects = impl_->group_objects(interface_name);
  if (!objects) {
    return Error(ErrorCode::NoActiveGroup, interface_name);
  }
  auto reply = impl_->p2p_call_dict(
      objects->interface_path, WPA_WPS_IFACE, "Start", [](DictBuilder &dict) {
        dict.add_string("Role", "enrollee");
        dict.add_string("Type", "pbc");
      });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void>
WpaSupplicantDriver::start_wps_pin_keypad(const std::string &interface_name,
                                          const std::string &pin) {
  auto objects = impl_->group_objects(interface_name);
  if (!objects) {
    return Error(ErrorCode::NoActiveGroup, interface_name);
  }
  auto reply = impl_->p2p_call_dict(
      objects->interface_path, WPA_WPS_IFACE, "Start", [&](DictBuilder &dict) {
        dict.add_string("Role", "enrollee");
        dict.add_string("Type", "pin");
        dict.add_string("Pin", pin);
      });
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void>
WpaSupplicantDriver::set_group_idle_timeout(const std::string &interface_name,
                                            int seconds) {
  P2PLINK_TRY(impl_->require_connection());
  P2PLINK_LOGD("Idle timeout %ds for %s", seconds, interface_name.c_str());
  return set_dict_property(impl_->conn.get(), WPA_SERVICE,
                           impl_->interface_path.c_str(), WPA_P2P_IFACE,
                           "P2PDeviceConfig", [&](DBusMessageIter *dict) {
                             append_uint32_entry(
                                 dict, "GroupIdle",
                                 static_cast<uint32_t>(seconds < 0 ? 0 : seconds));
                           });
}

Result<void> WpaSupplicantDriver::set_power_save(const std::string &interface_name,
                                                 bool enable) {
  P2PLINK_UNUSED(interface_name);
  P2PLINK_UNUSED(enable);
  return Error(ErrorCode::NotSupported, "Power save is not exposed over D-Bus");
}

// ============================================================================
// Peer Information
// ============================================================================

Result<int> WpaSupplicantDriver::get_group_capability(const MacAddress &peer) {
  P2PLINK_TRY(impl_->require_connection());
  const std::string path = impl_->peer_path(peer);
  auto caps = get_property(impl_->conn.get(), WPA_SERVICE, path.c_str(),
                           WPA_PEER_IFACE, "groupcapability");
  if (caps.is_error()) {
    return caps.error();
  }
  return static_cast<int>(caps.value().number);
}

Result<std::string> WpaSupplicantDriver::get_ssid(const MacAddress &peer) {
  P2PLINK_UNUSED(peer);
  return Error(ErrorCode::NotSupported, "Peer SSID is not exposed over D-Bus");
}

// ============================================================================
// Persistent Groups
// ============================================================================

Result<std::vector<PersistentGroupProfile>> WpaSupplicantDriver::list_networks() {
  P2PLINK_TRY(impl_->require_connection());
  return impl_->list_persistent();
}

Result<void> WpaSupplicantDriver::remove_network(int net_id) {
  const std::string path = impl_->persistent_group_path(net_id);
  const char *path_str = path.c_str();
  auto reply = impl_->call_with_args(impl_->interface_path, WPA_P2P_IFACE,
                                     "RemovePersistentGroup",
                                     DBUS_TYPE_OBJECT_PATH, &path_str);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void>
WpaSupplicantDriver::set_client_list(int net_id,
                                     const std::vector<MacAddress> &clients) {
  P2PLINK_TRY(impl_->require_connection());
  std::string list;
  for (const auto &client : clients) {
    if (!list.empty()) {
      list += ' ';
    }
    list += client.to_string();
  }
  const std::string path = impl_->persistent_group_path(net_id);
  return set_dict_property(impl_->conn.get(), WPA_SERVICE, path.c_str(),
                           WPA_PERSISTENT_IFACE, "Properties",
                           [&](DBusMessageIter *dict) {
                             append_string_entry(dict, "p2p_client_list", list);
                           });
}

Result<void> WpaSupplicantDriver::save_config() {
  P2PLINK_TRY(impl_->require_connection());
  auto reply = call_method(impl_->conn.get(), WPA_SERVICE,
                           impl_->interface_path.c_str(), WPA_IFACE_IFACE,
                           "SaveConfig", kCommandTimeoutMs);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

// ============================================================================
// Frame-Based Service Discovery
// ============================================================================

namespace {

/// Fill AddService/DeleteService arguments from one p2p_service_add entry
Result<void> fill_service_entry(DictBuilder &dict, const std::string &entry,
                                bool with_response) {
  std::istringstream stream(entry);
  std::string type;
  stream >> type;

  if (type == "bonjour") {
    std::string query, response;
    stream >> query >> response;
    auto query_bytes = hex_to_bytes(query);
    if (!query_bytes) {
      return Error(ErrorCode::InvalidServiceInfo, "Bad bonjour query: " + entry);
    }
    dict.add_string("service_type", "bonjour");
    dict.add_bytes("query", *query_bytes);
    if (with_response) {
      auto response_bytes = hex_to_bytes(response);
      if (!response_bytes) {
        return Error(ErrorCode::InvalidServiceInfo,
                     "Bad bonjour response: " + entry);
      }
      dict.add_bytes("response", *response_bytes);
    }
    return Result<void>::ok();
  }

  if (type == "upnp") {
    std::string version, service;
    stream >> version;
    std::getline(stream >> std::ws, service);
    dict.add_string("service_type", "upnp");
    dict.add_uint32("version",
                    static_cast<uint32_t>(std::strtoul(version.c_str(), nullptr, 16)));
    dict.add_string("service", service);
    return Result<void>::ok();
  }

  return Error(ErrorCode::InvalidServiceInfo, "Unsupported entry: " + entry);
}

} // namespace

Result<void> WpaSupplicantDriver::service_add(const LocalService &service) {
  for (const auto &entry : service.entries) {
    Result<void> filled;
    auto reply = impl_->p2p_call_dict(
        impl_->interface_path, WPA_P2P_IFACE, "AddService",
        [&](DictBuilder &dict) { filled = fill_service_entry(dict, entry, true); });
    P2PLINK_TRY(filled);
    if (reply.is_error()) {
      return reply.error();
    }
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::service_remove(const LocalService &service) {
  for (const auto &entry : service.entries) {
    Result<void> filled;
    auto reply = impl_->p2p_call_dict(
        impl_->interface_path, WPA_P2P_IFACE, "DeleteService",
        [&](DictBuilder &dict) { filled = fill_service_entry(dict, entry, false); });
    P2PLINK_TRY(filled);
    if (reply.is_error()) {
      return reply.error();
    }
  }
  return Result<void>::ok();
}

Result<void> WpaSupplicantDriver::service_flush() {
  auto reply = impl_->p2p_call_simple("FlushService");
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<std::string>
WpaSupplicantDriver::request_service_discovery(const MacAddress &peer,
                                               const std::string &query) {
  auto tlv = hex_to_bytes(query);
  if (!tlv) {
    return Error(ErrorCode::InvalidServiceRequest, "Query is not valid hex");
  }
  const std::string peer_path = peer.is_zero() ? "" : impl_->peer_path(peer);
  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_P2P_IFACE, "ServiceDiscoveryRequest",
      [&](DictBuilder &dict) {
        if (!peer_path.empty()) {
          dict.add_object_path("peer_object", peer_path);
        }
        dict.add_bytes("tlv", *tlv);
      });
  if (reply.is_error()) {
    return reply.error();
  }

  dbus_uint64_t ref = 0;
  if (!dbus_message_get_args(reply.value().get(), nullptr, DBUS_TYPE_UINT64,
                             &ref, DBUS_TYPE_INVALID)) {
    return Error(ErrorCode::DriverError, "ServiceDiscoveryRequest returned no id");
  }
  return std::to_string(ref);
}

Result<void>
WpaSupplicantDriver::cancel_service_discovery(const std::string &request_id) {
  dbus_uint64_t ref = std::strtoull(request_id.c_str(), nullptr, 10);
  auto reply = impl_->call_with_args(impl_->interface_path, WPA_P2P_IFACE,
                                     "ServiceDiscoveryCancelRequest",
                                     DBUS_TYPE_UINT64, &ref);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

// ============================================================================
// USD Service Discovery
// ============================================================================

namespace {

void fill_usd(DictBuilder &dict, const UsdServiceConfig &config,
              int timeout_s) {
  dict.add_string("srv_name", config.service_name);
  dict.add_uint32("srv_proto_type", static_cast<uint32_t>(config.protocol));
  if (!config.service_specific_info.empty()) {
    dict.add_bytes("ssi", config.service_specific_info);
  }
  if (timeout_s > 0) {
    dict.add_uint32("ttl", static_cast<uint32_t>(timeout_s));
  }
  if (config.frequency_mhz > 0) {
    dict.add_uint32("freq", static_cast<uint32_t>(config.frequency_mhz));
  }
}

Result<int> session_id_from(const Result<DBusMessageWrapper> &reply) {
  if (reply.is_error()) {
    return reply.error();
  }
  dbus_uint32_t id = 0;
  if (!dbus_message_get_args(reply.value().get(), nullptr, DBUS_TYPE_UINT32,
                             &id, DBUS_TYPE_INVALID) ||
      id == 0) {
    return Error(ErrorCode::DriverError, "No USD session id returned");
  }
  return static_cast<int>(id);
}

} // namespace

Result<int> WpaSupplicantDriver::start_usd_discovery(const UsdServiceConfig &config,
                                                     int timeout_s) {
  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_IFACE_IFACE, "NANSubscribe",
      [&](DictBuilder &dict) {
        fill_usd(dict, config, timeout_s);
        dict.add_bool("active", true);
      });
  return session_id_from(reply);
}

void WpaSupplicantDriver::stop_usd_discovery(int session_id) {
  dbus_uint32_t id = static_cast<dbus_uint32_t>(session_id);
  auto reply = impl_->call_with_args(impl_->interface_path, WPA_IFACE_IFACE,
                                     "NANCancelSubscribe", DBUS_TYPE_UINT32, &id);
  if (reply.is_error()) {
    P2PLINK_LOGW("NANCancelSubscribe %d: %s", session_id,
                 reply.error().to_string().c_str());
  }
}

Result<int>
WpaSupplicantDriver::start_usd_advertisement(const UsdServiceConfig &config,
                                             int timeout_s) {
  auto reply = impl_->p2p_call_dict(
      impl_->interface_path, WPA_IFACE_IFACE, "NANPublish",
      [&](DictBuilder &dict) {
        fill_usd(dict, config, timeout_s);
        dict.add_bool("solicited", true);
      });
  return session_id_from(reply);
}

void WpaSupplicantDriver::stop_usd_advertisement(int session_id) {
  dbus_uint32_t id = static_cast<dbus_uint32_t>(session_id);
  auto reply = impl_->call_with_args(impl_->interface_path, WPA_IFACE_IFACE,
                                     "NANCancelPublish", DBUS_TYPE_UINT32, &id);
  if (reply.is_error()) {
    P2PLINK_LOGW("NANCancelPublish %d: %s", session_id,
                 reply.error().to_string().c_str());
  }
}

} // namespace p2plink
