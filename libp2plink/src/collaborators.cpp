/**
 * @file collaborators.cpp
 * @brief Names for collaborator enums
 */

#include "p2plink/collaborators.h"

namespace p2plink {

const char *arbitration_result_name(ArbitrationResult result) {
  switch (result) {
  case ArbitrationResult::Proceed:
    return "Proceed";
  case ArbitrationResult::Abort:
    return "Abort";
  case ArbitrationResult::WaitForUser:
    return "WaitForUser";
  }
  return "Unknown";
}

const char *authorization_kind_name(AuthorizationKind kind) {
  switch (kind) {
  case AuthorizationKind::Negotiation:
    return "Negotiation";
  case AuthorizationKind::Invitation:
    return "Invitation";
  case AuthorizationKind::Join:
    return "Join";
  case AuthorizationKind::FrequencyConflict:
    return "FrequencyConflict";
  }
  return "Unknown";
}

const char *authorization_decision_name(AuthorizationDecision d) {
  switch (d) {
  case AuthorizationDecision::Accept:
    return "Accept";
  case AuthorizationDecision::Reject:
    return "Reject";
  case AuthorizationDecision::DeferToExternalApprover:
    return "DeferToExternalApprover";
  }
  return "Unknown";
}

const char *ip_provisioning_mode_name(IpProvisioningMode mode) {
  switch (mode) {
  case IpProvisioningMode::Dhcp:
    return "dhcp";
  case IpProvisioningMode::LinkLocal:
    return "link-local";
  }
  return "unknown";
}

} // namespace p2plink
