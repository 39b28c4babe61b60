/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#define P2PLINK_LOG_TAG "Config"

// Standard library includes FIRST, before any project headers
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

#include <pwd.h>
#include <unistd.h>

// Project includes LAST
#include "p2plink/config.h"
#include "p2plink/log.h"

namespace fs = ::std::filesystem;

namespace p2plink {

namespace {

constexpr const char *kConfigFileName = "p2plink.conf";

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

bool parse_int(const std::string &value, int &out) {
  if (value.empty()) {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || parsed < INT32_MIN || parsed > INT32_MAX) {
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

bool parse_bool(const std::string &value, bool &out) {
  if (value == "true" || value == "1" || value == "yes") {
    out = true;
    return true;
  }
  if (value == "false" || value == "0" || value == "no") {
    out = false;
    return true;
  }
  return false;
}

bool parse_conflict_policy(const std::string &value,
                           FrequencyConflictPolicy &out) {
  if (value == "ask") {
    out = FrequencyConflictPolicy::Ask;
  } else if (value == "always_drop_infra") {
    out = FrequencyConflictPolicy::AlwaysDropInfra;
  } else if (value == "never") {
    out = FrequencyConflictPolicy::Never;
  } else {
    return false;
  }
  return true;
}

bool parse_ip_mode(const std::string &value, IpProvisioningMode &out) {
  if (value == "dhcp") {
    out = IpProvisioningMode::Dhcp;
  } else if (value == "link_local") {
    out = IpProvisioningMode::LinkLocal;
  } else {
    return false;
  }
  return true;
}

const char *ip_mode_key(IpProvisioningMode mode) {
  return mode == IpProvisioningMode::LinkLocal ? "link_local" : "dhcp";
}

/// Apply one key; false if the value does not parse
bool apply_setting(P2pServiceConfig &config, const std::string &key,
                   const std::string &value) {
  if (key == "device_name") {
    config.device_name = value;
    return true;
  }
  if (key == "default_group_owner_intent") {
    return parse_int(value, config.default_group_owner_intent);
  }
  if (key == "group_creating_timeout_ms") {
    return parse_int(value, config.group_creating_timeout_ms);
  }
  if (key == "disable_timeout_ms") {
    return parse_int(value, config.disable_timeout_ms);
  }
  if (key == "idle_shutdown_timeout_ms") {
    return parse_int(value, config.idle_shutdown_timeout_ms);
  }
  if (key == "reject_wait_ms") {
    return parse_int(value, config.reject_wait_ms);
  }
  if (key == "discovery_timeout_s") {
    return parse_int(value, config.discovery_timeout_s);
  }
  if (key == "group_idle_time_s") {
    return parse_int(value, config.group_idle_time_s);
  }
  if (key == "usd_session_timeout_s") {
    return parse_int(value, config.usd_session_timeout_s);
  }
  if (key == "wait_for_peer_invite") {
    return parse_bool(value, config.wait_for_peer_invite_on_info_unavailable);
  }
  if (key == "frequency_conflict_policy") {
    return parse_conflict_policy(value, config.frequency_conflict_policy);
  }
  if (key == "client_ip_mode") {
    return parse_ip_mode(value, config.client_ip_mode);
  }
  if (key == "group_owner_address") {
    config.group_owner_address = value;
    return true;
  }
  if (key == "auto_accept_requests") {
    return parse_bool(value, config.auto_accept_requests);
  }
  if (key == "verbose_logging") {
    return parse_bool(value, config.verbose_logging);
  }
  if (key == "pending_factory_reset") {
    return parse_bool(value, config.pending_factory_reset);
  }

  P2PLINK_LOGD("Ignoring unknown key '%s'", key.c_str());
  return true;
}

} // namespace

const char *frequency_conflict_policy_name(FrequencyConflictPolicy policy) {
  switch (policy) {
  case FrequencyConflictPolicy::Ask:
    return "ask";
  case FrequencyConflictPolicy::AlwaysDropInfra:
    return "always_drop_infra";
  case FrequencyConflictPolicy::Never:
    return "never";
  }
  return "unknown";
}

// ============================================================================
// P2pServiceConfig Methods
// ============================================================================

void P2pServiceConfig::load_defaults() {
  device_name = ""; // Resolved from the host name on enable
  default_group_owner_intent = kGroupOwnerIntentAuto;

  group_creating_timeout_ms = 120000;
  disable_timeout_ms = 5000;
  idle_shutdown_timeout_ms = 150000;
  reject_wait_ms = 3000;
  discovery_timeout_s = 120;
  group_idle_time_s = 10;
  usd_session_timeout_s = 30;

  wait_for_peer_invite_on_info_unavailable = false;
  frequency_conflict_policy = FrequencyConflictPolicy::Ask;
  client_ip_mode = IpProvisioningMode::Dhcp;
  group_owner_address = "192.168.49.1";
  auto_accept_requests = false;

  verbose_logging = false;
  pending_factory_reset = false;

  config_file_path = get_default_config_dir() / kConfigFileName;
}

Result<void> P2pServiceConfig::validate() const {
  if (device_name.length() > 32) {
    return Error(ErrorCode::InvalidDeviceName,
                 "Device name too long (max 32 chars)");
  }

  if (default_group_owner_intent != kGroupOwnerIntentAuto &&
      (default_group_owner_intent < kGroupOwnerIntentMin ||
       default_group_owner_intent > kGroupOwnerIntentMax)) {
    return Error(ErrorCode::InvalidGroupOwnerIntent,
                 "Group owner intent must be -1 or 0..15");
  }

  if (group_creating_timeout_ms <= 0 || disable_timeout_ms <= 0 ||
      idle_shutdown_timeout_ms <= 0 || reject_wait_ms <= 0) {
    return Error(ErrorCode::InvalidArgument, "Timeouts must be positive");
  }

  if (discovery_timeout_s < 0 || group_idle_time_s < 0 ||
      usd_session_timeout_s <= 0) {
    return Error(ErrorCode::InvalidArgument, "Invalid protocol timeout");
  }

  if (group_owner_address.empty()) {
    return Error(ErrorCode::InvalidArgument, "Group owner address is empty");
  }

  return Result<void>::ok();
}

fs::path P2pServiceConfig::get_default_config_dir() {
  // Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "p2plink";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "p2plink";
  }

  return fs::path("/tmp/p2plink");
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  P2pServiceConfig config;
  fs::path config_path;
  mutable std::mutex mutex;
  bool initialized = false;

  Result<void> load_locked();
  Result<void> save_locked() const;
};

Result<void> ConfigManager::Impl::load_locked() {
  std::ifstream in(config_path);
  if (!in) {
    return Error(ErrorCode::ConfigReadError, "Cannot open config file",
                 config_path.string());
  }

  P2pServiceConfig loaded;
  loaded.load_defaults();
  loaded.config_file_path = config_path;

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#') {
      continue;
    }

    size_t eq = stripped.find('=');
    if (eq == std::string::npos) {
      return Error(ErrorCode::ConfigReadError, "Missing '='",
                   config_path.string() + ":" + std::to_string(line_no));
    }

    std::string key = trim(stripped.substr(0, eq));
    std::string value = trim(stripped.substr(eq + 1));
    if (!apply_setting(loaded, key, value)) {
      return Error(ErrorCode::ConfigReadError, "Invalid value for " + key,
                   config_path.string() + ":" + std::to_string(line_no));
    }
  }

  P2PLINK_TRY(loaded.validate());
  config = loaded;
  return Result<void>::ok();
}

Result<void> ConfigManager::Impl::save_locked() const {
  auto dir = config_path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::ConfigWriteError, "Cannot create directory",
                   dir.string() + ": " + ec.message());
    }
  }

  std::ostringstream out;
  out << "# p2plink configuration\n";
  out << "device_name = " << config.device_name << "\n";
  out << "default_group_owner_intent = " << config.default_group_owner_intent
      << "\n";
  out << "group_creating_timeout_ms = " << config.group_creating_timeout_ms
      << "\n";
  out << "disable_timeout_ms = " << config.disable_timeout_ms << "\n";
  out << "idle_shutdown_timeout_ms = " << config.idle_shutdown_timeout_ms
      << "\n";
  out << "reject_wait_ms = " << config.reject_wait_ms << "\n";
  out << "discovery_timeout_s = " << config.discovery_timeout_s << "\n";
  out << "group_idle_time_s = " << config.group_idle_time_s << "\n";
  out << "usd_session_timeout_s = " << config.usd_session_timeout_s << "\n";
  out << "wait_for_peer_invite = "
      << (config.wait_for_peer_invite_on_info_unavailable ? "true" : "false")
      << "\n";
  out << "frequency_conflict_policy = "
      << frequency_conflict_policy_name(config.frequency_conflict_policy)
      << "\n";
  out << "client_ip_mode = " << ip_mode_key(config.client_ip_mode) << "\n";
  out << "group_owner_address = " << config.group_owner_address << "\n";
  out << "auto_accept_requests = "
      << (config.auto_accept_requests ? "true" : "false") << "\n";
  out << "verbose_logging = " << (config.verbose_logging ? "true" : "false")
      << "\n";
  out << "pending_factory_reset = "
      << (config.pending_factory_reset ? "true" : "false") << "\n";

  std::ofstream file(config_path, std::ios::trunc);
  if (!file) {
    return Error(ErrorCode::ConfigWriteError, "Cannot open config file",
                 config_path.string() + ": " + std::strerror(errno));
  }
  file << out.str();
  if (!file) {
    return Error(ErrorCode::ConfigWriteError, "Write failed",
                 config_path.string());
  }
  return Result<void>::ok();
}

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (config_path.empty()) {
    impl_->config_path =
        P2pServiceConfig::get_default_config_dir() / kConfigFileName;
  } else {
    impl_->config_path = config_path;
  }
  impl_->config.config_file_path = impl_->config_path;

  std::error_code ec;
  if (fs::exists(impl_->config_path, ec)) {
    auto result = impl_->load_locked();
    if (result.is_error()) {
      P2PLINK_LOGW("Using defaults: %s", result.error().to_string().c_str());
      impl_->config.load_defaults();
      impl_->config.config_file_path = impl_->config_path;
      return result;
    }
  }

  impl_->initialized = true;
  return Result<void>::ok();
}

P2pServiceConfig ConfigManager::get() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config;
}

P2pServiceConfig &ConfigManager::get_mutable() { return impl_->config; }

Result<void> ConfigManager::set(const P2pServiceConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  impl_->config.config_file_path = impl_->config_path;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->config_path.empty()) {
    return Error(ErrorCode::NotInitialized, "ConfigManager::init not called");
  }
  return impl_->save_locked();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
  if (!impl_->config_path.empty()) {
    impl_->config.config_file_path = impl_->config_path;
  }
}

Result<void> ConfigManager::set_device_name(const std::string &name) {
  if (name.empty() || name.length() > 32) {
    return Error(ErrorCode::InvalidDeviceName, "Invalid device name");
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.device_name = name;
  if (impl_->config_path.empty()) {
    return Result<void>::ok();
  }
  return impl_->save_locked();
}

Result<void> ConfigManager::set_pending_factory_reset(bool pending) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.pending_factory_reset = pending;
  if (impl_->config_path.empty()) {
    return Result<void>::ok();
  }
  return impl_->save_locked();
}

} // namespace p2plink
