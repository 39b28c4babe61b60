/**
 * @file message.h
 * @brief Messages processed by the state machine queue
 *
 * Client commands, collaborator answers, driver events and timers are all
 * turned into a Message and handled one at a time on a single thread.
 */

#ifndef P2PLINK_MESSAGE_H
#define P2PLINK_MESSAGE_H

#include "collaborators.h"
#include "driver.h"
#include "group.h"
#include "listener.h"
#include "peer.h"
#include "platform.h"
#include "service_types.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace p2plink {

// ============================================================================
// Message Codes
// ============================================================================

enum class Cmd : uint16_t {
  None = 0,

  // Client lifecycle
  ClientAttached,
  ClientDetached,
  RequestActivation,
  ReleaseActivation,

  // Client actions
  DiscoverPeers,
  StopDiscovery,
  StartListen,
  StopListen,
  Connect,
  CancelConnect,
  CreateGroup,
  RemoveGroup,
  RemoveGroupClient,
  AddLocalService,
  RemoveLocalService,
  ClearLocalServices,
  AddServiceRequest,
  RemoveServiceRequest,
  ClearServiceRequests,
  DiscoverServices,
  StartUsdDiscovery,
  StopUsdDiscovery,
  StartUsdAdvertisement,
  StopUsdAdvertisement,
  AddExternalApprover,
  RemoveExternalApprover,
  SetConnectionRequestResult,
  SetDeviceName,
  DeletePersistentGroup,
  FactoryReset,

  // Client queries
  RequestPeers,
  RequestConnectionInfo,
  RequestGroupInfo,
  RequestPersistentGroupInfo,
  RequestP2pState,
  RequestDiscoveryState,
  RequestDeviceInfo,

  // System and collaborators
  EnableP2p,
  DisableP2p,
  RadioStateChanged,
  ArbitrationResult,
  AuthorizationResult,
  FrequencyConflictResult,
  IpProvisioningPreDhcp,
  IpProvisioningPostDhcp,
  IpProvisioningSuccess,
  IpProvisioningFailure,
  TetheringReady,
  InfraDisconnectResponse,

  // Driver events
  DeviceFound,
  DeviceLost,
  FindStopped,
  GoNegotiationRequest,
  GoNegotiationSuccess,
  GoNegotiationFailure,
  GroupFormationSuccess,
  GroupFormationFailure,
  GroupStarted,
  GroupRemoved,
  InvitationReceived,
  InvitationResult,
  ProvisionDiscoveryPbcRequest,
  ProvisionDiscoveryPbcResponse,
  ProvisionDiscoveryEnterPin,
  ProvisionDiscoveryShowPin,
  ProvisionDiscoveryFailure,
  ServiceDiscoveryResponse,
  UsdDiscoveryResult,
  UsdSessionTerminated,
  StationConnected,
  StationDisconnected,
  FrequencyChanged,
  DriverDisconnected,

  // Timers, arg1 carries the generation
  GroupCreatingTimedOut,
  DisableTimedOut,
  IdleShutdown,
  RejectWaitElapsed
};

P2PLINK_API const char *cmd_name(Cmd what);

// ============================================================================
// Payloads
// ============================================================================

struct CreateGroupRequest {
  std::optional<ConnectConfig> config; ///< Fast group with given credentials
  bool persistent = false;
  int net_id = kNetworkIdTemporary;    ///< Restart a stored group if >= 0
};

struct ConnectionRequestResult {
  MacAddress address;
  ConnectionRequestResponse response = ConnectionRequestResponse::Reject;
  std::string pin;
};

struct StationEvent {
  P2pDevice device;
  std::string ip_address;
};

struct ServiceResponseFrame {
  MacAddress source;
  Bytes tlvs;
};

struct UsdRequest {
  UsdServiceConfig config;
  int session_id = 0;
};

struct ProvisionDiscoveryFailureEvent {
  MacAddress peer;
  ProvisionDiscoveryStatus status = ProvisionDiscoveryStatus::Unknown;
};

using MessagePayload =
    std::variant<std::monostate, std::string, MacAddress, ConnectConfig,
                 DiscoveryParams, P2pDevice, P2pGroup, ServiceRequest,
                 LocalService, UsdRequest, UsdDiscoveryResult,
                 ProvisionDiscoveryEvent, ProvisionDiscoveryFailureEvent,
                 AuthorizationResponse, ConnectionRequestResult,
                 CreateGroupRequest, IpProvisioningResult, StationEvent,
                 ServiceResponseFrame, std::shared_ptr<ClientListener>>;

// ============================================================================
// Message
// ============================================================================

/**
 * @brief One unit of work for the state machine
 *
 * @c client and @c request_id identify the originator of a client command
 * so its result can be routed back; internal messages leave them zero.
 */
struct Message {
  Cmd what = Cmd::None;
  int arg1 = 0;
  int arg2 = 0;
  ClientId client = kInternalClient;
  RequestId request_id = 0;
  MessagePayload payload;

  Message() = default;
  explicit Message(Cmd w, int a1 = 0, int a2 = 0) : what(w), arg1(a1), arg2(a2) {}

  template <typename T> const T *get() const {
    return std::get_if<T>(&payload);
  }

  template <typename T> Message &with(T value) {
    payload = std::move(value);
    return *this;
  }

  Message &from(ClientId c, RequestId r) {
    client = c;
    request_id = r;
    return *this;
  }
};

} // namespace p2plink

#endif // P2PLINK_MESSAGE_H
