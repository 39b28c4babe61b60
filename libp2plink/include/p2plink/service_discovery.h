/**
 * @file service_discovery.h
 * @brief Per-client service discovery and advertisement bookkeeping
 */

#ifndef P2PLINK_SERVICE_DISCOVERY_H
#define P2PLINK_SERVICE_DISCOVERY_H

#include "driver.h"
#include "error.h"
#include "platform.h"
#include "service_types.h"
#include "types.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace p2plink {

/**
 * @brief Tracks service requests, local services and USD sessions
 *
 * Frame-based requests from every client are concatenated into a single
 * driver-level query; each request carries a one byte, non-zero
 * transaction id that routes responses back to its owner.
 *
 * USD sessions are identified by the driver's session id. A client may
 * hold one advertisement and any number of discovery sessions.
 *
 * Owned by the state machine thread; not thread-safe.
 */
class P2PLINK_API ServiceDiscoveryTracker {
public:
  ServiceDiscoveryTracker() = default;

  // ========================================================================
  // Frame-Based Requests
  // ========================================================================

  /**
   * @brief Register a request and reissue the aggregate query
   * @return Assigned transaction id
   */
  Result<uint8_t> add_request(DriverCommandInterface &driver, ClientId client,
                              ServiceRequest request);

  /**
   * @brief Remove the first request of @p client with the same query
   * @return false if no such request exists
   */
  bool remove_request(DriverCommandInterface &driver, ClientId client,
                      const ServiceRequest &request);

  /// Remove every request of @p client
  void clear_requests(DriverCommandInterface &driver, ClientId client);

  bool has_requests() const;
  size_t request_count() const;

  /// Concatenated supplicant queries of all clients, ordered by client
  std::string aggregate_query() const;

  /**
   * @brief Replace the driver-side request with the current aggregate
   *
   * Cancels the outstanding driver request, then issues a new one unless
   * no requests remain.
   */
  Result<void> update_driver_request(DriverCommandInterface &driver);

  /// Cancel the outstanding driver request, if any
  void cancel_driver_request(DriverCommandInterface &driver);

  /// The driver dropped its request on its own (flush, group removal)
  void forget_driver_request() { driver_request_id_.reset(); }

  const std::optional<std::string> &driver_request_id() const {
    return driver_request_id_;
  }

  /**
   * @brief Route a response frame to the owners of its transaction ids
   *
   * TLVs without a matching request are dropped.
   */
  std::vector<std::pair<ClientId, ServiceResponse>>
  route_responses(const MacAddress &source, const Bytes &tlvs) const;

  // ========================================================================
  // Local Services
  // ========================================================================

  Result<void> add_local_service(DriverCommandInterface &driver,
                                 ClientId client, const LocalService &service);
  bool remove_local_service(DriverCommandInterface &driver, ClientId client,
                            const LocalService &service);
  void clear_local_services(DriverCommandInterface &driver, ClientId client);
  size_t local_service_count(ClientId client) const;

  // ========================================================================
  // USD Sessions
  // ========================================================================

  /// @return Driver session id
  Result<int> start_usd_discovery(DriverCommandInterface &driver,
                                  ClientId client,
                                  const UsdServiceConfig &config,
                                  int timeout_s);

  /// false if @p client does not own @p session_id
  bool stop_usd_discovery(DriverCommandInterface &driver, ClientId client,
                          int session_id);

  /// Fails with Busy if the client already advertises
  Result<int> start_usd_advertisement(DriverCommandInterface &driver,
                                      ClientId client,
                                      const UsdServiceConfig &config,
                                      int timeout_s);

  bool stop_usd_advertisement(DriverCommandInterface &driver, ClientId client);

  std::optional<ClientId> usd_session_owner(int session_id,
                                            bool advertisement) const;

  /**
   * @brief Forget a session the driver ended (timeout or failure)
   * @return Owner of the session, if it was known
   */
  std::optional<ClientId> on_usd_session_terminated(int session_id,
                                                    bool advertisement);

  // ========================================================================
  // Client Lifecycle
  // ========================================================================

  /**
   * @brief Drop everything a client owns
   * @param driver Interface to undo driver state, nullptr when it is down
   */
  void remove_client(DriverCommandInterface *driver, ClientId client);

  /// Drop everything for every client
  void clear_all(DriverCommandInterface *driver);

private:
  struct ClientServices {
    std::map<uint8_t, ServiceRequest> requests;
    std::vector<LocalService> local_services;
    std::set<int> usd_discovery_sessions;
    std::optional<int> usd_advertisement_session;

    bool empty() const {
      return requests.empty() && local_services.empty() &&
             usd_discovery_sessions.empty() && !usd_advertisement_session;
    }
  };

  std::optional<uint8_t> next_transaction_id();
  bool transaction_id_in_use(uint8_t id) const;
  void erase_if_empty(ClientId client);

  std::map<ClientId, ClientServices> clients_;
  uint8_t last_transaction_id_ = 0;
  std::optional<std::string> driver_request_id_;
};

} // namespace p2plink

#endif // P2PLINK_SERVICE_DISCOVERY_H
