/**
 * @file service_types.h
 * @brief Service discovery and advertisement data types
 *
 * Two sub-protocols are supported: frame-based service discovery
 * (ANQP-style TLV queries multiplexed by transaction id) and USD,
 * un-synchronized service discovery with driver-managed sessions.
 */

#ifndef P2PLINK_SERVICE_TYPES_H
#define P2PLINK_SERVICE_TYPES_H

#include "platform.h"
#include "types.h"
#include <string>
#include <vector>

namespace p2plink {

// ============================================================================
// Frame-Based Service Discovery
// ============================================================================

enum class ServiceProtocol : uint8_t {
  All = 0,
  Bonjour = 1,
  Upnp = 2,
  WsDiscovery = 3,
  WifiDisplay = 4,
  VendorSpecific = 255
};

P2PLINK_API const char *service_protocol_name(ServiceProtocol protocol);

enum class ServiceStatus : uint8_t {
  Success = 0,
  ProtocolNotAvailable = 1,
  InformationNotAvailable = 2,
  BadRequest = 3
};

/**
 * @brief A client's service discovery query
 *
 * The transaction id is assigned when the request is registered.
 */
struct ServiceRequest {
  ServiceProtocol protocol = ServiceProtocol::All;
  std::string query_hex; ///< Protocol specific query, may be empty
  uint8_t transaction_id = 0;

  /**
   * @brief TLV encoding handed to the supplicant, as hex
   *
   * Length (2 bytes, little endian) covers protocol, transaction id and
   * query.
   */
  std::string supplicant_query() const;

  /// Same protocol and query, ignoring the transaction id
  bool same_query(const ServiceRequest &other) const {
    return protocol == other.protocol && query_hex == other.query_hex;
  }
};

/**
 * @brief A locally advertised service
 *
 * Entries use the supplicant's p2p_service_add syntax, e.g.
 * "bonjour <query hex> <rdata hex>" or "upnp 10 uuid:...".
 */
struct LocalService {
  ServiceProtocol protocol = ServiceProtocol::Bonjour;
  std::vector<std::string> entries;

  bool operator==(const LocalService &other) const {
    return protocol == other.protocol && entries == other.entries;
  }
};

/**
 * @brief One response TLV from a peer
 */
struct ServiceResponse {
  MacAddress source;
  ServiceProtocol protocol = ServiceProtocol::All;
  uint8_t transaction_id = 0;
  ServiceStatus status = ServiceStatus::Success;
  Bytes data;
};

/**
 * @brief Split a service discovery response frame into TLVs
 *
 * Each TLV: length (2 bytes LE), protocol, transaction id, status, data.
 * A malformed frame yields the TLVs parsed before the error.
 */
P2PLINK_API std::vector<ServiceResponse>
parse_service_responses(const MacAddress &source, const Bytes &tlvs);

// ============================================================================
// USD Service Discovery
// ============================================================================

struct UsdServiceConfig {
  std::string service_name;
  ServiceProtocol protocol = ServiceProtocol::Bonjour;
  Bytes service_specific_info;
  int frequency_mhz = 0; ///< 0 lets the driver pick
};

struct UsdDiscoveryResult {
  int session_id = 0;
  int peer_session_id = 0;
  MacAddress peer;
  ServiceProtocol protocol = ServiceProtocol::Bonjour;
  Bytes service_specific_info;
};

} // namespace p2plink

#endif // P2PLINK_SERVICE_TYPES_H
