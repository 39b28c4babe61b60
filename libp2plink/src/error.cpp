/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "p2plink/error.h"
#include <sstream>

namespace p2plink {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Busy:
    return "Busy";

  case ErrorCode::InvalidAddress:
    return "InvalidAddress";
  case ErrorCode::InvalidNetworkName:
    return "InvalidNetworkName";
  case ErrorCode::InvalidPassphrase:
    return "InvalidPassphrase";
  case ErrorCode::InvalidGroupOwnerIntent:
    return "InvalidGroupOwnerIntent";
  case ErrorCode::InvalidDeviceName:
    return "InvalidDeviceName";
  case ErrorCode::InvalidServiceRequest:
    return "InvalidServiceRequest";
  case ErrorCode::InvalidServiceInfo:
    return "InvalidServiceInfo";
  case ErrorCode::InvalidUsdConfig:
    return "InvalidUsdConfig";
  case ErrorCode::UnknownClient:
    return "UnknownClient";
  case ErrorCode::MissingConfiguration:
    return "MissingConfiguration";

  case ErrorCode::P2pUnsupported:
    return "P2pUnsupported";
  case ErrorCode::P2pDisabled:
    return "P2pDisabled";
  case ErrorCode::NoServiceRequests:
    return "NoServiceRequests";
  case ErrorCode::PeerNotFound:
    return "PeerNotFound";
  case ErrorCode::NoActiveGroup:
    return "NoActiveGroup";
  case ErrorCode::GroupFormationFailed:
    return "GroupFormationFailed";
  case ErrorCode::ApproverNotFound:
    return "ApproverNotFound";
  case ErrorCode::ApproverMismatch:
    return "ApproverMismatch";
  case ErrorCode::SessionLimitReached:
    return "SessionLimitReached";
  case ErrorCode::ResourceUnavailable:
    return "ResourceUnavailable";

  case ErrorCode::DriverError:
    return "DriverError";
  case ErrorCode::DriverUnavailable:
    return "DriverUnavailable";
  case ErrorCode::DriverCommandFailed:
    return "DriverCommandFailed";
  case ErrorCode::DriverTimeout:
    return "DriverTimeout";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";
  case ErrorCode::HardwareNotAvailable:
    return "HardwareNotAvailable";
  case ErrorCode::DBusError:
    return "DBusError";
  case ErrorCode::ConfigReadError:
    return "ConfigReadError";
  case ErrorCode::ConfigWriteError:
    return "ConfigWriteError";
  }
  return "Unknown";
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";
  case ErrorCode::NotFound:
    return "Requested object not found";
  case ErrorCode::Busy:
    return "Another operation is in progress";

  case ErrorCode::InvalidAddress:
    return "Malformed or missing device address";
  case ErrorCode::InvalidNetworkName:
    return "Network name is not a valid P2P group name";
  case ErrorCode::InvalidPassphrase:
    return "Passphrase length must be 8 to 63 characters";
  case ErrorCode::InvalidGroupOwnerIntent:
    return "Group owner intent out of range";
  case ErrorCode::InvalidDeviceName:
    return "Device name is empty or too long";
  case ErrorCode::InvalidServiceRequest:
    return "Malformed service discovery request";
  case ErrorCode::InvalidServiceInfo:
    return "Malformed local service description";
  case ErrorCode::InvalidUsdConfig:
    return "Malformed USD service configuration";
  case ErrorCode::UnknownClient:
    return "Client is not registered";
  case ErrorCode::MissingConfiguration:
    return "Required configuration is missing";

  case ErrorCode::P2pUnsupported:
    return "Wi-Fi Direct is not supported on this device";
  case ErrorCode::P2pDisabled:
    return "Wi-Fi Direct is disabled";
  case ErrorCode::NoServiceRequests:
    return "No service discovery requests registered";
  case ErrorCode::PeerNotFound:
    return "Peer device not found";
  case ErrorCode::NoActiveGroup:
    return "No P2P group is active";
  case ErrorCode::GroupFormationFailed:
    return "Failed to form P2P group";
  case ErrorCode::ApproverNotFound:
    return "No external approver registered for the peer";
  case ErrorCode::ApproverMismatch:
    return "Decision does not match the pending request";
  case ErrorCode::SessionLimitReached:
    return "Session limit reached for this client";
  case ErrorCode::ResourceUnavailable:
    return "Radio resource is held by another consumer";

  case ErrorCode::DriverError:
    return "Driver reported an error";
  case ErrorCode::DriverUnavailable:
    return "Driver is not reachable";
  case ErrorCode::DriverCommandFailed:
    return "Driver rejected the command";
  case ErrorCode::DriverTimeout:
    return "Driver did not answer in time";

  case ErrorCode::PlatformError:
    return "Platform-specific error";
  case ErrorCode::PermissionDenied:
    return "Permission denied";
  case ErrorCode::ServiceUnavailable:
    return "Required system service unavailable";
  case ErrorCode::HardwareNotAvailable:
    return "Required hardware not available";
  case ErrorCode::DBusError:
    return "D-Bus call failed";
  case ErrorCode::ConfigReadError:
    return "Failed to read configuration file";
  case ErrorCode::ConfigWriteError:
    return "Failed to write configuration file";
  }
  return "Unknown error";
}

// ============================================================================
// Error Recovery Classification
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::P2pUnsupported:
  case ErrorCode::HardwareNotAvailable:
  case ErrorCode::PermissionDenied:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace p2plink
