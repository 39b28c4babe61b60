/**
 * @file wpa_supplicant_driver.h
 * @brief P2P driver backed by wpa_supplicant's D-Bus interface
 */

#ifndef P2PLINK_PLATFORM_LINUX_WPA_SUPPLICANT_DRIVER_H
#define P2PLINK_PLATFORM_LINUX_WPA_SUPPLICANT_DRIVER_H

#include "p2plink/driver.h"
#include <memory>
#include <string>
#include <vector>

namespace p2plink {
namespace platform {

// wpa_supplicant D-Bus constants
constexpr const char *WPA_SERVICE = "fi.w1.wpa_supplicant1";
constexpr const char *WPA_PATH = "/fi/w1/wpa_supplicant1";
constexpr const char *WPA_IFACE = "fi.w1.wpa_supplicant1";
constexpr const char *WPA_IFACE_IFACE = "fi.w1.wpa_supplicant1.Interface";
constexpr const char *WPA_P2P_IFACE =
    "fi.w1.wpa_supplicant1.Interface.P2PDevice";
constexpr const char *WPA_WPS_IFACE = "fi.w1.wpa_supplicant1.Interface.WPS";
constexpr const char *WPA_GROUP_IFACE = "fi.w1.wpa_supplicant1.Group";
constexpr const char *WPA_PEER_IFACE = "fi.w1.wpa_supplicant1.Peer";
constexpr const char *WPA_PERSISTENT_IFACE =
    "fi.w1.wpa_supplicant1.PersistentGroup";

/// "/fi/w1/wpa_supplicant1/Interfaces/0/Peers/aabbccddeeff" -> address
std::optional<MacAddress> peer_address_from_path(const std::string &path);

/// Trailing number of a persistent group object path, -1 if none
int net_id_from_path(const std::string &path);

/// Split a space separated p2p_client_list value
std::vector<MacAddress> parse_client_list(const std::string &value);

} // namespace platform

// ============================================================================
// wpa_supplicant Driver
// ============================================================================

/**
 * @brief DriverCommandInterface over fi.w1.wpa_supplicant1
 *
 * Commands run synchronously on the caller's thread. Signals are read on a
 * private event thread started by setup_interface() and forwarded to the
 * sink from there.
 */
class P2PLINK_API WpaSupplicantDriver : public DriverCommandInterface {
public:
  /**
   * @param interface_names Candidate station interfaces, tried in order;
   *        empty uses wlan0, wlp2s0, wlp3s0, wlan1
   */
  explicit WpaSupplicantDriver(std::vector<std::string> interface_names = {});
  ~WpaSupplicantDriver() override;

  // Non-copyable
  WpaSupplicantDriver(const WpaSupplicantDriver &) = delete;
  WpaSupplicantDriver &operator=(const WpaSupplicantDriver &) = delete;

  bool is_supported() const override;

  Result<std::string> setup_interface(DriverEventSink *sink) override;
  void teardown_interface() override;
  Result<MacAddress> get_device_address() override;
  Result<void> set_device_name(const std::string &name) override;

  Result<void> start_discovery(const DiscoveryParams &params) override;
  Result<void> stop_discovery() override;
  Result<void> set_extended_listen(bool enable, int period_ms,
                                   int interval_ms) override;
  Result<void> flush() override;

  Result<std::string> connect(const ConnectConfig &config, bool join) override;
  Result<void> cancel_connect() override;
  Result<void> provision_discovery(const ConnectConfig &config) override;
  Result<void> reject(const MacAddress &peer) override;

  Result<void> group_add(const GroupAddRequest &request) override;
  Result<void> group_remove(const std::string &interface_name) override;
  Result<void> invite(const P2pGroup &group, const MacAddress &peer) override;
  Result<void> reinvoke(int net_id, const MacAddress &peer,
                        int dik_id) override;

  Result<void> remove_client(const MacAddress &peer) override;
  Result<void> start_wps_pbc(const std::string &interface_name) override;
  Result<void> start_wps_pin_keypad(const std::string &interface_name,
                                    const std::string &pin) override;
  Result<void> set_group_idle_timeout(const std::string &interface_name,
                                      int seconds) override;
  Result<void> set_power_save(const std::string &interface_name,
                              bool enable) override;

  Result<int> get_group_capability(const MacAddress &peer) override;
  Result<std::string> get_ssid(const MacAddress &peer) override;

  Result<std::vector<PersistentGroupProfile>> list_networks() override;
  Result<void> remove_network(int net_id) override;
  Result<void> set_client_list(int net_id,
                               const std::vector<MacAddress> &clients) override;
  Result<void> save_config() override;

  Result<void> service_add(const LocalService &service) override;
  Result<void> service_remove(const LocalService &service) override;
  Result<void> service_flush() override;
  Result<std::string> request_service_discovery(const MacAddress &peer,
                                                const std::string &query) override;
  Result<void> cancel_service_discovery(const std::string &request_id) override;

  Result<int> start_usd_discovery(const UsdServiceConfig &config,
                                  int timeout_s) override;
  void stop_usd_discovery(int session_id) override;
  Result<int> start_usd_advertisement(const UsdServiceConfig &config,
                                      int timeout_s) override;
  void stop_usd_advertisement(int session_id) override;

  class Impl;

private:
  std::unique_ptr<Impl> impl_;
};

} // namespace p2plink

#endif // P2PLINK_PLATFORM_LINUX_WPA_SUPPLICANT_DRIVER_H
