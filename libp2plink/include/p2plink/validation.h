/**
 * @file validation.h
 * @brief Synchronous checks applied to client requests before queueing
 */

#ifndef P2PLINK_VALIDATION_H
#define P2PLINK_VALIDATION_H

#include "error.h"
#include "platform.h"
#include "service_types.h"
#include "types.h"
#include <string>

namespace p2plink {

/// Group network names must start with this prefix
constexpr const char *kNetworkNamePrefix = "DIRECT-";

constexpr size_t kNetworkNameMinLength = 9;
constexpr size_t kNetworkNameMaxLength = 32;
constexpr size_t kPassphraseMinLength = 8;
constexpr size_t kPassphraseMaxLength = 63;
constexpr size_t kDeviceNameMaxLength = 32;

/**
 * @brief Check a connect request
 *
 * The peer address must be a unicast address unless the request carries
 * group credentials. Credentials must be complete and well formed.
 */
P2PLINK_API Result<void> validate_connect_config(const ConnectConfig &config);

/// Credentials of an autonomous group, if supplied
P2PLINK_API Result<void> validate_group_config(const ConnectConfig &config);

P2PLINK_API Result<void> validate_network_name(const std::string &name);
P2PLINK_API Result<void> validate_passphrase(const std::string &passphrase);
P2PLINK_API Result<void> validate_device_name(const std::string &name);

/// Query must be valid hex
P2PLINK_API Result<void> validate_service_request(const ServiceRequest &request);

/// At least one entry, none empty
P2PLINK_API Result<void> validate_local_service(const LocalService &service);

P2PLINK_API Result<void> validate_usd_config(const UsdServiceConfig &config);

} // namespace p2plink

#endif // P2PLINK_VALIDATION_H
