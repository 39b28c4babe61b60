/**
 * @file decision_source.cpp
 * @brief Local and external decision sources
 */

#define P2PLINK_LOG_TAG "DecisionSource"

#include "p2plink/decision_source.h"
#include "p2plink/log.h"

namespace p2plink {

// ============================================================================
// Local Dialog
// ============================================================================

void LocalDialogDecisionSource::request(const AuthorizationRequest &request) {
  authorizer_.request_authorization(request);
}

void LocalDialogDecisionSource::show_pin(const P2pDevice &peer,
                                         const std::string &pin) {
  authorizer_.show_pin(peer, pin);
}

void LocalDialogDecisionSource::dismiss(AuthorizationKind kind) {
  authorizer_.dismiss(kind);
}

// ============================================================================
// External Approver
// ============================================================================

void ExternalApproverDecisionSource::request(
    const AuthorizationRequest &request) {
  P2PLINK_LOGD("Delegating %s request from %s to client %u",
               authorization_kind_name(request.kind),
               request.peer.address.to_string().c_str(), entry_.owner);
  listener_->on_connection_requested(request.kind, request.peer, request.wps);
  if (!request.pin.empty()) {
    listener_->on_pin_generated(request.peer.address, request.pin);
  }
}

void ExternalApproverDecisionSource::show_pin(const P2pDevice &peer,
                                              const std::string &pin) {
  listener_->on_pin_generated(peer.address, pin);
}

// ============================================================================
// Selection
// ============================================================================

std::unique_ptr<DecisionSource>
select_decision_source(const ApproverRegistry &approvers,
                       const MacAddress &peer, UserAuthorizer &authorizer,
                       const ListenerLookup &lookup) {
  auto entry = approvers.resolve(peer);
  if (entry && lookup) {
    auto listener = lookup(entry->owner);
    if (listener) {
      return std::make_unique<ExternalApproverDecisionSource>(
          *entry, std::move(listener));
    }
    P2PLINK_LOGW("Approver owner %u is gone, using local dialog",
                 entry->owner);
  }
  return std::make_unique<LocalDialogDecisionSource>(authorizer);
}

} // namespace p2plink
