/**
 * @file message.cpp
 * @brief Message code names
 */

#include "p2plink/message.h"

namespace p2plink {

const char *cmd_name(Cmd what) {
  switch (what) {
  case Cmd::None:
    return "None";
  case Cmd::ClientAttached:
    return "ClientAttached";
  case Cmd::ClientDetached:
    return "ClientDetached";
  case Cmd::RequestActivation:
    return "RequestActivation";
  case Cmd::ReleaseActivation:
    return "ReleaseActivation";
  case Cmd::DiscoverPeers:
    return "DiscoverPeers";
  case Cmd::StopDiscovery:
    return "StopDiscovery";
  case Cmd::StartListen:
    return "StartListen";
  case Cmd::StopListen:
    return "StopListen";
  case Cmd::Connect:
    return "Connect";
  case Cmd::CancelConnect:
    return "CancelConnect";
  case Cmd::CreateGroup:
    return "CreateGroup";
  case Cmd::RemoveGroup:
    return "RemoveGroup";
  case Cmd::RemoveGroupClient:
    return "RemoveGroupClient";
  case Cmd::AddLocalService:
    return "AddLocalService";
  case Cmd::RemoveLocalService:
    return "RemoveLocalService";
  case Cmd::ClearLocalServices:
    return "ClearLocalServices";
  case Cmd::AddServiceRequest:
    return "AddServiceRequest";
  case Cmd::RemoveServiceRequest:
    return "RemoveServiceRequest";
  case Cmd::ClearServiceRequests:
    return "ClearServiceRequests";
  case Cmd::DiscoverServices:
    return "DiscoverServices";
  case Cmd::StartUsdDiscovery:
    return "StartUsdDiscovery";
  case Cmd::StopUsdDiscovery:
    return "StopUsdDiscovery";
  case Cmd::StartUsdAdvertisement:
    return "StartUsdAdvertisement";
  case Cmd::StopUsdAdvertisement:
    return "StopUsdAdvertisement";
  case Cmd::AddExternalApprover:
    return "AddExternalApprover";
  case Cmd::RemoveExternalApprover:
    return "RemoveExternalApprover";
  case Cmd::SetConnectionRequestResult:
    return "SetConnectionRequestResult";
  case Cmd::SetDeviceName:
    return "SetDeviceName";
  case Cmd::DeletePersistentGroup:
    return "DeletePersistentGroup";
  case Cmd::FactoryReset:
    return "FactoryReset";
  case Cmd::RequestPeers:
    return "RequestPeers";
  case Cmd::RequestConnectionInfo:
    return "RequestConnectionInfo";
  case Cmd::RequestGroupInfo:
    return "RequestGroupInfo";
  case Cmd::RequestPersistentGroupInfo:
    return "RequestPersistentGroupInfo";
  case Cmd::RequestP2pState:
    return "RequestP2pState";
  case Cmd::RequestDiscoveryState:
    return "RequestDiscoveryState";
  case Cmd::RequestDeviceInfo:
    return "RequestDeviceInfo";
  case Cmd::EnableP2p:
    return "EnableP2p";
  case Cmd::DisableP2p:
    return "DisableP2p";
  case Cmd::RadioStateChanged:
    return "RadioStateChanged";
  case Cmd::ArbitrationResult:
    return "ArbitrationResult";
  case Cmd::AuthorizationResult:
    return "AuthorizationResult";
  case Cmd::FrequencyConflictResult:
    return "FrequencyConflictResult";
  case Cmd::IpProvisioningPreDhcp:
    return "IpProvisioningPreDhcp";
  case Cmd::IpProvisioningPostDhcp:
    return "IpProvisioningPostDhcp";
  case Cmd::IpProvisioningSuccess:
    return "IpProvisioningSuccess";
  case Cmd::IpProvisioningFailure:
    return "IpProvisioningFailure";
  case Cmd::TetheringReady:
    return "TetheringReady";
  case Cmd::InfraDisconnectResponse:
    return "InfraDisconnectResponse";
  case Cmd::DeviceFound:
    return "DeviceFound";
  case Cmd::DeviceLost:
    return "DeviceLost";
  case Cmd::FindStopped:
    return "FindStopped";
  case Cmd::GoNegotiationRequest:
    return "GoNegotiationRequest";
  case Cmd::GoNegotiationSuccess:
    return "GoNegotiationSuccess";
  case Cmd::GoNegotiationFailure:
    return "GoNegotiationFailure";
  case Cmd::GroupFormationSuccess:
    return "GroupFormationSuccess";
  case Cmd::GroupFormationFailure:
    return "GroupFormationFailure";
  case Cmd::GroupStarted:
    return "GroupStarted";
  case Cmd::GroupRemoved:
    return "GroupRemoved";
  case Cmd::InvitationReceived:
    return "InvitationReceived";
  case Cmd::InvitationResult:
    return "InvitationResult";
  case Cmd::ProvisionDiscoveryPbcRequest:
    return "ProvisionDiscoveryPbcRequest";
  case Cmd::ProvisionDiscoveryPbcResponse:
    return "ProvisionDiscoveryPbcResponse";
  case Cmd::ProvisionDiscoveryEnterPin:
    return "ProvisionDiscoveryEnterPin";
  case Cmd::ProvisionDiscoveryShowPin:
    return "ProvisionDiscoveryShowPin";
  case Cmd::ProvisionDiscoveryFailure:
    return "ProvisionDiscoveryFailure";
  case Cmd::ServiceDiscoveryResponse:
    return "ServiceDiscoveryResponse";
  case Cmd::UsdDiscoveryResult:
    return "UsdDiscoveryResult";
  case Cmd::UsdSessionTerminated:
    return "UsdSessionTerminated";
  case Cmd::StationConnected:
    return "StationConnected";
  case Cmd::StationDisconnected:
    return "StationDisconnected";
  case Cmd::FrequencyChanged:
    return "FrequencyChanged";
  case Cmd::DriverDisconnected:
    return "DriverDisconnected";
  case Cmd::GroupCreatingTimedOut:
    return "GroupCreatingTimedOut";
  case Cmd::DisableTimedOut:
    return "DisableTimedOut";
  case Cmd::IdleShutdown:
    return "IdleShutdown";
  case Cmd::RejectWaitElapsed:
    return "RejectWaitElapsed";
  }
  return "Unknown";
}

} // namespace p2plink
