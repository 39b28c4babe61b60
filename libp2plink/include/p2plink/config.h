/**
 * @file config.h
 * @brief Service configuration and settings for p2plink
 */

#ifndef P2PLINK_CONFIG_H
#define P2PLINK_CONFIG_H

#include "collaborators.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <filesystem>
#include <memory>
#include <string>

namespace p2plink {

/**
 * @brief What to do when negotiation finds no channel shared with the peer
 */
enum class FrequencyConflictPolicy : uint8_t {
  Ask,             ///< Let the user decide
  AlwaysDropInfra, ///< Drop infrastructure Wi-Fi without asking
  Never            ///< Fail the attempt
};

P2PLINK_API const char *
frequency_conflict_policy_name(FrequencyConflictPolicy policy);

// ============================================================================
// Service Configuration
// ============================================================================

/**
 * @brief Complete configuration of the P2P service
 */
struct P2pServiceConfig {
  // ========================================================================
  // Identity
  // ========================================================================

  /// Device name advertised to peers, empty uses the host name
  std::string device_name;

  /// Group owner intent used when a request leaves it on auto
  int default_group_owner_intent = kGroupOwnerIntentAuto;

  // ========================================================================
  // Timers
  // ========================================================================

  int group_creating_timeout_ms = 120000;
  int disable_timeout_ms = 5000;

  /// Interface torn down after this long with no active client or group
  int idle_shutdown_timeout_ms = 150000;

  /// Back-off between rejecting a peer and accepting new requests
  int reject_wait_ms = 3000;

  int discovery_timeout_s = 120;
  int group_idle_time_s = 10;
  int usd_session_timeout_s = 30;

  // ========================================================================
  // Policy
  // ========================================================================

  /// On INFORMATION_IS_CURRENTLY_UNAVAILABLE wait for the peer's invite
  bool wait_for_peer_invite_on_info_unavailable = false;

  FrequencyConflictPolicy frequency_conflict_policy =
      FrequencyConflictPolicy::Ask;

  IpProvisioningMode client_ip_mode = IpProvisioningMode::Dhcp;

  /// Address of this device when it owns a group
  std::string group_owner_address = "192.168.49.1";

  /// Accept every incoming request without asking (daemon policy)
  bool auto_accept_requests = false;

  // ========================================================================
  // State
  // ========================================================================

  bool verbose_logging = false;

  /// Factory reset requested while disabled, run on next enable
  bool pending_factory_reset = false;

  /// Path to configuration file
  std::filesystem::path config_file_path;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Load defaults based on platform
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Get default config directory for platform
  static std::filesystem::path get_default_config_dir();
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 *
 * The file holds one "key = value" pair per line; '#' starts a comment.
 * Unknown keys are ignored so older builds can read newer files.
 */
class P2PLINK_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Initialize with config file path
   * @param config_path Path to config file (created on first save)
   * @return Success, or the error from reading an existing file
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  // ========================================================================
  // Configuration Access
  // ========================================================================

  /**
   * @brief Get a snapshot of the current configuration
   */
  P2pServiceConfig get() const;

  /**
   * @brief Get mutable configuration reference
   *
   * Not synchronized. After modifying, call save() to persist changes.
   */
  P2pServiceConfig &get_mutable();

  /**
   * @brief Set entire configuration
   */
  Result<void> set(const P2pServiceConfig &config);

  // ========================================================================
  // Persistence
  // ========================================================================

  /**
   * @brief Load configuration from file
   */
  Result<void> load();

  /**
   * @brief Save configuration to file
   */
  Result<void> save();

  /**
   * @brief Reset to defaults
   */
  void reset_defaults();

  // ========================================================================
  // Individual Settings
  // ========================================================================

  /// Set device name and persist it
  Result<void> set_device_name(const std::string &name);

  /// Record or clear a factory reset to run on next enable
  Result<void> set_pending_factory_reset(bool pending);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace p2plink

#endif // P2PLINK_CONFIG_H
