/**
 * @file listener.cpp
 * @brief Names for notification values
 */

#include "p2plink/listener.h"

namespace p2plink {

const char *p2p_availability_name(P2pAvailability availability) {
  switch (availability) {
  case P2pAvailability::Disabled:
    return "Disabled";
  case P2pAvailability::Enabled:
    return "Enabled";
  case P2pAvailability::Unavailable:
    return "Unavailable";
  }
  return "Unknown";
}

const char *network_state_name(NetworkState state) {
  switch (state) {
  case NetworkState::Idle:
    return "Idle";
  case NetworkState::Connecting:
    return "Connecting";
  case NetworkState::Connected:
    return "Connected";
  case NetworkState::Disconnected:
    return "Disconnected";
  case NetworkState::Failed:
    return "Failed";
  }
  return "Unknown";
}

const char *
connection_request_response_name(ConnectionRequestResponse response) {
  switch (response) {
  case ConnectionRequestResponse::Accept:
    return "Accept";
  case ConnectionRequestResponse::Reject:
    return "Reject";
  case ConnectionRequestResponse::DeferToService:
    return "DeferToService";
  case ConnectionRequestResponse::DeferShowPin:
    return "DeferShowPin";
  }
  return "Unknown";
}

} // namespace p2plink
