/**
 * @file service_types.cpp
 * @brief Service discovery TLV encoding
 */

#include "p2plink/service_types.h"

#include <cstdio>

namespace p2plink {

const char *service_protocol_name(ServiceProtocol protocol) {
  switch (protocol) {
  case ServiceProtocol::All:
    return "all";
  case ServiceProtocol::Bonjour:
    return "bonjour";
  case ServiceProtocol::Upnp:
    return "upnp";
  case ServiceProtocol::WsDiscovery:
    return "ws-discovery";
  case ServiceProtocol::WifiDisplay:
    return "wifi-display";
  case ServiceProtocol::VendorSpecific:
    return "vendor";
  }
  return "unknown";
}

std::string ServiceRequest::supplicant_query() const {
  size_t length = 2 + query_hex.size() / 2;
  char header[9];
  std::snprintf(header, sizeof(header), "%02x%02x%02x%02x",
                static_cast<unsigned>(length & 0xff),
                static_cast<unsigned>((length >> 8) & 0xff),
                static_cast<unsigned>(protocol),
                static_cast<unsigned>(transaction_id));
  return std::string(header) + query_hex;
}

std::vector<ServiceResponse> parse_service_responses(const MacAddress &source,
                                                     const Bytes &tlvs) {
  // length(2) + protocol + transaction id + status
  constexpr size_t kHeaderSize = 5;

  std::vector<ServiceResponse> out;
  size_t pos = 0;
  while (tlvs.size() - pos >= kHeaderSize) {
    size_t length = static_cast<size_t>(tlvs[pos]) |
                    (static_cast<size_t>(tlvs[pos + 1]) << 8);
    if (length < 3) {
      break;
    }
    size_t data_len = length - 3;
    if (tlvs.size() - pos - kHeaderSize < data_len) {
      break;
    }

    ServiceResponse resp;
    resp.source = source;
    resp.protocol = static_cast<ServiceProtocol>(tlvs[pos + 2]);
    resp.transaction_id = tlvs[pos + 3];
    resp.status = static_cast<ServiceStatus>(tlvs[pos + 4]);
    resp.data.assign(tlvs.begin() + static_cast<long>(pos + kHeaderSize),
                     tlvs.begin() +
                         static_cast<long>(pos + kHeaderSize + data_len));
    pos += kHeaderSize + data_len;

    // Empty failure responses carry nothing for the client
    if (data_len == 0 && resp.status != ServiceStatus::Success) {
      continue;
    }
    out.push_back(std::move(resp));
  }
  return out;
}

} // namespace p2plink
