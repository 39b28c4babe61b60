/**
 * @file service_discovery.cpp
 * @brief Service discovery tracker implementation
 */

#define P2PLINK_LOG_TAG "ServiceDiscovery"

#include "p2plink/service_discovery.h"
#include "p2plink/log.h"

#include <algorithm>

namespace p2plink {

// ============================================================================
// Frame-Based Requests
// ============================================================================

bool ServiceDiscoveryTracker::transaction_id_in_use(uint8_t id) const {
  for (const auto &entry : clients_) {
    if (entry.second.requests.count(id) != 0) {
      return true;
    }
  }
  return false;
}

std::optional<uint8_t> ServiceDiscoveryTracker::next_transaction_id() {
  // One byte, zero is reserved
  for (int attempt = 0; attempt < 255; ++attempt) {
    ++last_transaction_id_;
    if (last_transaction_id_ == 0) {
      ++last_transaction_id_;
    }
    if (!transaction_id_in_use(last_transaction_id_)) {
      return last_transaction_id_;
    }
  }
  return std::nullopt;
}

Result<uint8_t> ServiceDiscoveryTracker::add_request(
    DriverCommandInterface &driver, ClientId client, ServiceRequest request) {
  auto id = next_transaction_id();
  if (!id) {
    return Error(ErrorCode::SessionLimitReached,
                 "All service transaction ids in use");
  }

  request.transaction_id = *id;
  clients_[client].requests[*id] = std::move(request);

  auto updated = update_driver_request(driver);
  if (updated.is_error()) {
    clients_[client].requests.erase(*id);
    erase_if_empty(client);
    return updated.error();
  }
  return *id;
}

bool ServiceDiscoveryTracker::remove_request(DriverCommandInterface &driver,
                                             ClientId client,
                                             const ServiceRequest &request) {
  auto it = clients_.find(client);
  if (it == clients_.end()) {
    return false;
  }

  auto &requests = it->second.requests;
  auto found = std::find_if(requests.begin(), requests.end(),
                            [&request](const auto &entry) {
                              return entry.second.same_query(request);
                            });
  if (found == requests.end()) {
    return false;
  }
  requests.erase(found);
  erase_if_empty(client);

  auto updated = update_driver_request(driver);
  if (updated.is_error() &&
      updated.error().code != ErrorCode::NoServiceRequests) {
    P2PLINK_LOGW("Failed to reissue service query: %s",
                 updated.error().to_string().c_str());
  }
  return true;
}

void ServiceDiscoveryTracker::clear_requests(DriverCommandInterface &driver,
                                             ClientId client) {
  auto it = clients_.find(client);
  if (it == clients_.end() || it->second.requests.empty()) {
    return;
  }
  it->second.requests.clear();
  erase_if_empty(client);

  auto updated = update_driver_request(driver);
  if (updated.is_error() &&
      updated.error().code != ErrorCode::NoServiceRequests) {
    P2PLINK_LOGW("Failed to reissue service query: %s",
                 updated.error().to_string().c_str());
  }
}

bool ServiceDiscoveryTracker::has_requests() const {
  return request_count() != 0;
}

size_t ServiceDiscoveryTracker::request_count() const {
  size_t count = 0;
  for (const auto &entry : clients_) {
    count += entry.second.requests.size();
  }
  return count;
}

std::string ServiceDiscoveryTracker::aggregate_query() const {
  std::string query;
  for (const auto &entry : clients_) {
    for (const auto &request : entry.second.requests) {
      query += request.second.supplicant_query();
    }
  }
  return query;
}

Result<void>
ServiceDiscoveryTracker::update_driver_request(DriverCommandInterface &driver) {
  cancel_driver_request(driver);

  std::string query = aggregate_query();
  if (query.empty()) {
    return Error(ErrorCode::NoServiceRequests);
  }

  auto id = driver.request_service_discovery(MacAddress(), query);
  if (id.is_error()) {
    P2PLINK_LOGE("Service discovery request failed: %s",
                 id.error().to_string().c_str());
    return id.error();
  }
  driver_request_id_ = id.value();
  P2PLINK_LOGD("Service query %s issued (%zu requests)", id.value().c_str(),
               request_count());
  return Result<void>::ok();
}

void ServiceDiscoveryTracker::cancel_driver_request(
    DriverCommandInterface &driver) {
  if (!driver_request_id_) {
    return;
  }
  auto cancelled = driver.cancel_service_discovery(*driver_request_id_);
  if (cancelled.is_error()) {
    P2PLINK_LOGD("Cancel of service query %s failed: %s",
                 driver_request_id_->c_str(),
                 cancelled.error().to_string().c_str());
  }
  driver_request_id_.reset();
}

std::vector<std::pair<ClientId, ServiceResponse>>
ServiceDiscoveryTracker::route_responses(const MacAddress &source,
                                         const Bytes &tlvs) const {
  std::vector<std::pair<ClientId, ServiceResponse>> routed;
  for (auto &response : parse_service_responses(source, tlvs)) {
    bool delivered = false;
    for (const auto &entry : clients_) {
      if (entry.second.requests.count(response.transaction_id) != 0) {
        routed.emplace_back(entry.first, response);
        delivered = true;
        break;
      }
    }
    if (!delivered) {
      P2PLINK_LOGD("Dropping service response with unknown transaction %u",
                   static_cast<unsigned>(response.transaction_id));
    }
  }
  return routed;
}

// ============================================================================
// Local Services
// ============================================================================

Result<void> ServiceDiscoveryTracker::add_local_service(
    DriverCommandInterface &driver, ClientId client,
    const LocalService &service) {
  P2PLINK_TRY(driver.service_add(service));
  clients_[client].local_services.push_back(service);
  return Result<void>::ok();
}

bool ServiceDiscoveryTracker::remove_local_service(
    DriverCommandInterface &driver, ClientId client,
    const LocalService &service) {
  auto it = clients_.find(client);
  if (it == clients_.end()) {
    return false;
  }
  auto &services = it->second.local_services;
  auto found = std::find(services.begin(), services.end(), service);
  if (found == services.end()) {
    return false;
  }

  auto removed = driver.service_remove(service);
  if (removed.is_error()) {
    P2PLINK_LOGW("Driver failed to remove service: %s",
                 removed.error().to_string().c_str());
  }
  services.erase(found);
  erase_if_empty(client);
  return true;
}

void ServiceDiscoveryTracker::clear_local_services(
    DriverCommandInterface &driver, ClientId client) {
  auto it = clients_.find(client);
  if (it == clients_.end()) {
    return;
  }
  for (const auto &service : it->second.local_services) {
    auto removed = driver.service_remove(service);
    if (removed.is_error()) {
      P2PLINK_LOGW("Driver failed to remove service: %s",
                   removed.error().to_string().c_str());
    }
  }
  it->second.local_services.clear();
  erase_if_empty(client);
}

size_t ServiceDiscoveryTracker::local_service_count(ClientId client) const {
  auto it = clients_.find(client);
  return it == clients_.end() ? 0 : it->second.local_services.size();
}

// ============================================================================
// USD Sessions
// ============================================================================

Result<int> ServiceDiscoveryTracker::start_usd_discovery(
    DriverCommandInterface &driver, ClientId client,
    const UsdServiceConfig &config, int timeout_s) {
  auto session = driver.start_usd_discovery(config, timeout_s);
  if (session.is_error()) {
    return session.error();
  }
  if (session.value() <= 0) {
    return Error(ErrorCode::DriverCommandFailed,
                 "Driver returned invalid USD session id");
  }
  clients_[client].usd_discovery_sessions.insert(session.value());
  P2PLINK_LOGD("USD discovery session %d for client %u", session.value(),
               client);
  return session.value();
}

bool ServiceDiscoveryTracker::stop_usd_discovery(DriverCommandInterface &driver,
                                                 ClientId client,
                                                 int session_id) {
  auto it = clients_.find(client);
  if (it == clients_.end() ||
      it->second.usd_discovery_sessions.erase(session_id) == 0) {
    return false;
  }
  driver.stop_usd_discovery(session_id);
  erase_if_empty(client);
  return true;
}

Result<int> ServiceDiscoveryTracker::start_usd_advertisement(
    DriverCommandInterface &driver, ClientId client,
    const UsdServiceConfig &config, int timeout_s) {
  auto it = clients_.find(client);
  if (it != clients_.end() && it->second.usd_advertisement_session) {
    return Error(ErrorCode::Busy, "Client already advertises a USD service");
  }

  auto session = driver.start_usd_advertisement(config, timeout_s);
  if (session.is_error()) {
    return session.error();
  }
  if (session.value() <= 0) {
    return Error(ErrorCode::DriverCommandFailed,
                 "Driver returned invalid USD session id");
  }
  clients_[client].usd_advertisement_session = session.value();
  return session.value();
}

bool ServiceDiscoveryTracker::stop_usd_advertisement(
    DriverCommandInterface &driver, ClientId client) {
  auto it = clients_.find(client);
  if (it == clients_.end() || !it->second.usd_advertisement_session) {
    return false;
  }
  driver.stop_usd_advertisement(*it->second.usd_advertisement_session);
  it->second.usd_advertisement_session.reset();
  erase_if_empty(client);
  return true;
}

std::optional<ClientId>
ServiceDiscoveryTracker::usd_session_owner(int session_id,
                                           bool advertisement) const {
  for (const auto &entry : clients_) {
    const auto &services = entry.second;
    if (advertisement) {
      if (services.usd_advertisement_session == session_id) {
        return entry.first;
      }
    } else if (services.usd_discovery_sessions.count(session_id) != 0) {
      return entry.first;
    }
  }
  return std::nullopt;
}

std::optional<ClientId>
ServiceDiscoveryTracker::on_usd_session_terminated(int session_id,
                                                   bool advertisement) {
  auto owner = usd_session_owner(session_id, advertisement);
  if (!owner) {
    return std::nullopt;
  }
  auto &services = clients_[*owner];
  if (advertisement) {
    services.usd_advertisement_session.reset();
  } else {
    services.usd_discovery_sessions.erase(session_id);
  }
  erase_if_empty(*owner);
  return owner;
}

// ============================================================================
// Client Lifecycle
// ============================================================================

void ServiceDiscoveryTracker::remove_client(DriverCommandInterface *driver,
                                            ClientId client) {
  auto it = clients_.find(client);
  if (it == clients_.end()) {
    return;
  }

  bool had_requests = !it->second.requests.empty();
  if (driver) {
    for (const auto &service : it->second.local_services) {
      auto removed = driver->service_remove(service);
      if (removed.is_error()) {
        P2PLINK_LOGW("Driver failed to remove service: %s",
                     removed.error().to_string().c_str());
      }
    }
    for (int session : it->second.usd_discovery_sessions) {
      driver->stop_usd_discovery(session);
    }
    if (it->second.usd_advertisement_session) {
      driver->stop_usd_advertisement(*it->second.usd_advertisement_session);
    }
  }
  clients_.erase(it);

  if (had_requests && driver) {
    auto updated = update_driver_request(*driver);
    if (updated.is_error() &&
        updated.error().code != ErrorCode::NoServiceRequests) {
      P2PLINK_LOGW("Failed to reissue service query: %s",
                   updated.error().to_string().c_str());
    }
  }
}

void ServiceDiscoveryTracker::clear_all(DriverCommandInterface *driver) {
  if (driver) {
    cancel_driver_request(*driver);
    bool has_local = false;
    for (const auto &entry : clients_) {
      has_local = has_local || !entry.second.local_services.empty();
      for (int session : entry.second.usd_discovery_sessions) {
        driver->stop_usd_discovery(session);
      }
      if (entry.second.usd_advertisement_session) {
        driver->stop_usd_advertisement(*entry.second.usd_advertisement_session);
      }
    }
    if (has_local) {
      auto flushed = driver->service_flush();
      if (flushed.is_error()) {
        P2PLINK_LOGW("Service flush failed: %s",
                     flushed.error().to_string().c_str());
      }
    }
  }
  clients_.clear();
  driver_request_id_.reset();
}

void ServiceDiscoveryTracker::erase_if_empty(ClientId client) {
  auto it = clients_.find(client);
  if (it != clients_.end() && it->second.empty()) {
    clients_.erase(it);
  }
}

} // namespace p2plink
