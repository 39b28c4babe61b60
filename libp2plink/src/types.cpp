/**
 * @file types.cpp
 * @brief Core type helpers
 */

#include "p2plink/types.h"

#include <cctype>
#include <cstdio>

namespace p2plink {

// ============================================================================
// MacAddress
// ============================================================================

std::string MacAddress::to_string() const {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0],
                bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
  return std::string(buf);
}

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

} // namespace

std::optional<MacAddress> MacAddress::from_string(const std::string &str) {
  if (str.size() != 17) {
    return std::nullopt;
  }

  MacAddress addr;
  for (size_t i = 0; i < SIZE; ++i) {
    size_t pos = i * 3;
    int hi = hex_value(str[pos]);
    int lo = hex_value(str[pos + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    if (i + 1 < SIZE && str[pos + 2] != ':') {
      return std::nullopt;
    }
    addr.bytes[i] = static_cast<Byte>((hi << 4) | lo);
  }
  return addr;
}

MacAddress MacAddress::broadcast() {
  MacAddress addr;
  addr.bytes.fill(0xff);
  return addr;
}

bool MacAddress::is_zero() const {
  for (Byte b : bytes) {
    if (b != 0) {
      return false;
    }
  }
  return true;
}

bool MacAddress::is_broadcast() const {
  for (Byte b : bytes) {
    if (b != 0xff) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// Enum Names
// ============================================================================

const char *wps_method_name(WpsMethod method) {
  switch (method) {
  case WpsMethod::Pbc:
    return "pbc";
  case WpsMethod::Display:
    return "display";
  case WpsMethod::Keypad:
    return "keypad";
  case WpsMethod::Label:
    return "label";
  case WpsMethod::Invalid:
    return "invalid";
  }
  return "invalid";
}

const char *p2p_status_name(P2pStatus status) {
  switch (status) {
  case P2pStatus::Unknown:
    return "UNKNOWN";
  case P2pStatus::Success:
    return "SUCCESS";
  case P2pStatus::InformationIsCurrentlyUnavailable:
    return "INFORMATION_IS_CURRENTLY_UNAVAILABLE";
  case P2pStatus::IncompatibleParameters:
    return "INCOMPATIBLE_PARAMETERS";
  case P2pStatus::LimitReached:
    return "LIMIT_REACHED";
  case P2pStatus::InvalidParameter:
    return "INVALID_PARAMETER";
  case P2pStatus::UnableToAccommodateRequest:
    return "UNABLE_TO_ACCOMMODATE_REQUEST";
  case P2pStatus::PreviousProtocolError:
    return "PREVIOUS_PROTOCOL_ERROR";
  case P2pStatus::NoCommonChannel:
    return "NO_COMMON_CHANNEL";
  case P2pStatus::UnknownP2pGroup:
    return "UNKNOWN_P2P_GROUP";
  case P2pStatus::BothGoIntent15:
    return "BOTH_GO_INTENT_15";
  case P2pStatus::IncompatibleProvisioningMethod:
    return "INCOMPATIBLE_PROVISIONING_METHOD";
  case P2pStatus::RejectedByUser:
    return "REJECTED_BY_USER";
  }
  return "UNKNOWN";
}

P2pStatus p2p_status_from_int(int value) {
  if (value < static_cast<int>(P2pStatus::Success) ||
      value > static_cast<int>(P2pStatus::RejectedByUser)) {
    return P2pStatus::Unknown;
  }
  return static_cast<P2pStatus>(value);
}

const char *provision_discovery_status_name(ProvisionDiscoveryStatus status) {
  switch (status) {
  case ProvisionDiscoveryStatus::Success:
    return "SUCCESS";
  case ProvisionDiscoveryStatus::Timeout:
    return "TIMEOUT";
  case ProvisionDiscoveryStatus::Rejected:
    return "REJECTED";
  case ProvisionDiscoveryStatus::TimeoutJoin:
    return "TIMEOUT_JOIN";
  case ProvisionDiscoveryStatus::InfoUnavailable:
    return "INFO_UNAVAILABLE";
  case ProvisionDiscoveryStatus::Unknown:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

const char *connection_failure_name(ConnectionFailure failure) {
  switch (failure) {
  case ConnectionFailure::None:
    return "None";
  case ConnectionFailure::Timeout:
    return "Timeout";
  case ConnectionFailure::Cancel:
    return "Cancel";
  case ConnectionFailure::ProvisionDiscoveryFailure:
    return "ProvisionDiscoveryFailure";
  case ConnectionFailure::InvitationFailure:
    return "InvitationFailure";
  case ConnectionFailure::NegotiationFailure:
    return "NegotiationFailure";
  case ConnectionFailure::UserRejected:
    return "UserRejected";
  case ConnectionFailure::NewConnectionAttempt:
    return "NewConnectionAttempt";
  case ConnectionFailure::GroupRemoved:
    return "GroupRemoved";
  case ConnectionFailure::CreateGroupFailed:
    return "CreateGroupFailed";
  case ConnectionFailure::Disabled:
    return "Disabled";
  case ConnectionFailure::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

const char *connection_type_name(ConnectionType type) {
  switch (type) {
  case ConnectionType::Fresh:
    return "Fresh";
  case ConnectionType::Reinvoke:
    return "Reinvoke";
  case ConnectionType::Local:
    return "Local";
  case ConnectionType::Fast:
    return "Fast";
  case ConnectionType::Incoming:
    return "Incoming";
  }
  return "Unknown";
}

// ============================================================================
// Hex Helpers
// ============================================================================

std::string bytes_to_hex(const Bytes &data) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (Byte b : data) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

std::optional<Bytes> hex_to_bytes(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<Byte>((hi << 4) | lo));
  }
  return out;
}

} // namespace p2plink
