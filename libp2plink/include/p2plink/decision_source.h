/**
 * @file decision_source.h
 * @brief Where connection authorization decisions come from
 */

#ifndef P2PLINK_DECISION_SOURCE_H
#define P2PLINK_DECISION_SOURCE_H

#include "approver.h"
#include "collaborators.h"
#include "listener.h"
#include "platform.h"
#include <functional>
#include <memory>
#include <string>

namespace p2plink {

/**
 * @brief Asks someone to accept or reject a pending connection request
 *
 * The answer is queued back to the state machine: a local dialog answers
 * through P2pService::on_authorization_decision, an external approver
 * through P2pService::set_connection_request_result.
 */
class DecisionSource {
public:
  virtual ~DecisionSource() = default;

  virtual const char *name() const = 0;
  virtual bool is_external() const = 0;

  virtual void request(const AuthorizationRequest &request) = 0;

  /// Display a PIN generated for the pending request
  virtual void show_pin(const P2pDevice &peer, const std::string &pin) = 0;

  virtual void dismiss(AuthorizationKind kind) = 0;
};

/**
 * @brief Local UI or policy, backed by the UserAuthorizer collaborator
 */
class P2PLINK_API LocalDialogDecisionSource : public DecisionSource {
public:
  explicit LocalDialogDecisionSource(UserAuthorizer &authorizer)
      : authorizer_(authorizer) {}

  const char *name() const override { return "local-dialog"; }
  bool is_external() const override { return false; }

  void request(const AuthorizationRequest &request) override;
  void show_pin(const P2pDevice &peer, const std::string &pin) override;
  void dismiss(AuthorizationKind kind) override;

private:
  UserAuthorizer &authorizer_;
};

/**
 * @brief A registered client that decides instead of the local UI
 */
class P2PLINK_API ExternalApproverDecisionSource : public DecisionSource {
public:
  ExternalApproverDecisionSource(ApproverEntry entry,
                                 std::shared_ptr<ClientListener> listener)
      : entry_(entry), listener_(std::move(listener)) {}

  const char *name() const override { return "external-approver"; }
  bool is_external() const override { return true; }

  void request(const AuthorizationRequest &request) override;
  void show_pin(const P2pDevice &peer, const std::string &pin) override;
  void dismiss(AuthorizationKind /*kind*/) override {}

  const ApproverEntry &entry() const { return entry_; }

private:
  ApproverEntry entry_;
  std::shared_ptr<ClientListener> listener_;
};

using ListenerLookup = std::function<std::shared_ptr<ClientListener>(ClientId)>;

/**
 * @brief Pick the decision source for a request from @p peer
 *
 * The approver resolved for @p peer wins if its owner is still attached;
 * otherwise the local dialog decides.
 */
P2PLINK_API std::unique_ptr<DecisionSource>
select_decision_source(const ApproverRegistry &approvers,
                       const MacAddress &peer, UserAuthorizer &authorizer,
                       const ListenerLookup &lookup);

} // namespace p2plink

#endif // P2PLINK_DECISION_SOURCE_H
