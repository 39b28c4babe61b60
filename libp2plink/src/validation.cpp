/**
 * @file validation.cpp
 * @brief Client request validation
 */

#include "p2plink/validation.h"

namespace p2plink {

Result<void> validate_network_name(const std::string &name) {
  P2PLINK_REQUIRE(name.size() >= kNetworkNameMinLength &&
                      name.size() <= kNetworkNameMaxLength,
                  ErrorCode::InvalidNetworkName,
                  "Network name must be 9 to 32 characters");
  P2PLINK_REQUIRE(name.compare(0, 7, kNetworkNamePrefix) == 0,
                  ErrorCode::InvalidNetworkName,
                  "Network name must start with DIRECT-");
  return Result<void>::ok();
}

Result<void> validate_passphrase(const std::string &passphrase) {
  P2PLINK_REQUIRE(passphrase.size() >= kPassphraseMinLength &&
                      passphrase.size() <= kPassphraseMaxLength,
                  ErrorCode::InvalidPassphrase,
                  "Passphrase must be 8 to 63 characters");
  return Result<void>::ok();
}

Result<void> validate_device_name(const std::string &name) {
  P2PLINK_REQUIRE(!name.empty(), ErrorCode::InvalidDeviceName,
                  "Device name is empty");
  P2PLINK_REQUIRE(name.size() <= kDeviceNameMaxLength,
                  ErrorCode::InvalidDeviceName,
                  "Device name longer than 32 bytes");
  for (unsigned char c : name) {
    P2PLINK_REQUIRE(c >= 0x20 && c != 0x7f, ErrorCode::InvalidDeviceName,
                    "Device name contains control characters");
  }
  return Result<void>::ok();
}

Result<void> validate_group_config(const ConnectConfig &config) {
  if (config.network_name.empty() && config.passphrase.empty()) {
    return Result<void>::ok();
  }
  P2PLINK_TRY(validate_network_name(config.network_name));
  P2PLINK_TRY(validate_passphrase(config.passphrase));
  P2PLINK_REQUIRE(config.frequency_mhz >= 0, ErrorCode::InvalidArgument,
                  "Negative frequency");
  return Result<void>::ok();
}

Result<void> validate_connect_config(const ConnectConfig &config) {
  bool has_name = !config.network_name.empty();
  bool has_passphrase = !config.passphrase.empty();

  if (has_name || has_passphrase) {
    P2PLINK_REQUIRE(has_name, ErrorCode::InvalidNetworkName,
                    "Passphrase given without network name");
    P2PLINK_REQUIRE(has_passphrase, ErrorCode::InvalidPassphrase,
                    "Network name given without passphrase");
    P2PLINK_TRY(validate_group_config(config));
  } else {
    P2PLINK_REQUIRE(!config.device_address.is_zero() &&
                        !config.device_address.is_broadcast(),
                    ErrorCode::InvalidAddress, "Peer address required");
  }

  P2PLINK_REQUIRE(config.group_owner_intent == kGroupOwnerIntentAuto ||
                      (config.group_owner_intent >= kGroupOwnerIntentMin &&
                       config.group_owner_intent <= kGroupOwnerIntentMax),
                  ErrorCode::InvalidGroupOwnerIntent,
                  "Group owner intent must be -1 or 0..15");
  P2PLINK_REQUIRE(config.wps.method != WpsMethod::Invalid,
                  ErrorCode::InvalidArgument, "Invalid WPS method");
  if (config.wps.method == WpsMethod::Keypad && !config.wps.pin.empty()) {
    P2PLINK_REQUIRE(config.wps.pin.find_first_not_of("0123456789") ==
                        std::string::npos,
                    ErrorCode::InvalidArgument, "PIN must be numeric");
  }
  return Result<void>::ok();
}

Result<void> validate_service_request(const ServiceRequest &request) {
  P2PLINK_REQUIRE(request.query_hex.size() % 2 == 0 &&
                      hex_to_bytes(request.query_hex).has_value(),
                  ErrorCode::InvalidServiceRequest, "Query is not valid hex");
  // Length field of the TLV is 16 bits
  P2PLINK_REQUIRE(request.query_hex.size() / 2 + 2 <= 0xffff,
                  ErrorCode::InvalidServiceRequest, "Query too long");
  return Result<void>::ok();
}

Result<void> validate_local_service(const LocalService &service) {
  P2PLINK_REQUIRE(!service.entries.empty(), ErrorCode::InvalidServiceInfo,
                  "Service has no entries");
  for (const auto &entry : service.entries) {
    P2PLINK_REQUIRE(!entry.empty(), ErrorCode::InvalidServiceInfo,
                    "Empty service entry");
  }
  return Result<void>::ok();
}

Result<void> validate_usd_config(const UsdServiceConfig &config) {
  P2PLINK_REQUIRE(!config.service_name.empty(), ErrorCode::InvalidUsdConfig,
                  "Service name is empty");
  P2PLINK_REQUIRE(config.service_name.size() <= 255,
                  ErrorCode::InvalidUsdConfig, "Service name too long");
  P2PLINK_REQUIRE(config.protocol == ServiceProtocol::Bonjour ||
                      config.protocol == ServiceProtocol::Upnp ||
                      config.protocol == ServiceProtocol::VendorSpecific,
                  ErrorCode::InvalidUsdConfig,
                  "Unsupported USD service protocol");
  P2PLINK_REQUIRE(config.frequency_mhz >= 0, ErrorCode::InvalidUsdConfig,
                  "Negative frequency");
  return Result<void>::ok();
}

} // namespace p2plink
