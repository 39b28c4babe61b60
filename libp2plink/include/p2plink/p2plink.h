/**
 * @file p2plink.h
 * @brief Main p2plink API header
 *
 * p2plink - Wi-Fi Direct connection and group lifecycle service
 *
 * Brings up the P2P interface when a client asks for it, discovers peers
 * and services, negotiates groups, and keeps persistent groups in sync
 * with the supplicant. Every client request is queued to a single
 * state machine thread; results come back through ClientListener.
 *
 * Quick Start:
 * @code
 *   #include <p2plink/p2plink.h>
 *
 *   p2plink::P2pService service;
 *   service.init(collaborators, config);
 *   service.start();
 *
 *   auto client = service.register_client(listener).value();
 *   service.request_activation(client);
 *   service.discover_peers(client);
 * @endcode
 */

#ifndef P2PLINK_P2PLINK_H
#define P2PLINK_P2PLINK_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Domain model
#include "group.h"
#include "peer.h"
#include "service_types.h"

// Collaborators and configuration
#include "collaborators.h"
#include "config.h"
#include "driver.h"
#include "listener.h"
#include "log.h"

// Engine
#include "approver.h"
#include "event_loop.h"
#include "message.h"
#include "persistent_groups.h"
#include "service_discovery.h"
#include "state_machine.h"
#include "validation.h"

// Entry point
#include "p2p_service.h"

namespace p2plink {

// ============================================================================
// Version Information
// ============================================================================

/// p2plink major version
constexpr int VERSION_MAJOR = 1;

/// p2plink minor version
constexpr int VERSION_MINOR = 0;

/// p2plink patch version
constexpr int VERSION_PATCH = 0;

/// p2plink version string
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
};

P2PLINK_API VersionInfo get_version();

} // namespace p2plink

#endif // P2PLINK_P2PLINK_H
