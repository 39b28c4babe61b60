/**
 * @file error.h
 * @brief Error codes and result types for p2plink
 *
 * p2plink uses a Result type pattern for error handling. Driver commands,
 * validation at the service boundary and configuration I/O all report
 * failure through Result; no exceptions cross the library boundary.
 */

#ifndef P2PLINK_ERROR_H
#define P2PLINK_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace p2plink {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,
  InvalidState = 3,
  NotInitialized = 4,
  AlreadyInitialized = 5,
  NotSupported = 6,
  Timeout = 7,
  Cancelled = 8,
  NotFound = 9,
  Busy = 10,

  // Request validation errors (100-199)
  InvalidAddress = 100,
  InvalidNetworkName = 101,
  InvalidPassphrase = 102,
  InvalidGroupOwnerIntent = 103,
  InvalidDeviceName = 104,
  InvalidServiceRequest = 105,
  InvalidServiceInfo = 106,
  InvalidUsdConfig = 107,
  UnknownClient = 108,
  MissingConfiguration = 109,

  // P2P operation errors (200-299)
  P2pUnsupported = 200,
  P2pDisabled = 201,
  NoServiceRequests = 202,
  PeerNotFound = 203,
  NoActiveGroup = 204,
  GroupFormationFailed = 205,
  ApproverNotFound = 206,
  ApproverMismatch = 207,
  SessionLimitReached = 208,
  ResourceUnavailable = 209,

  // Driver errors (300-399)
  DriverError = 300,
  DriverUnavailable = 301,
  DriverCommandFailed = 302,
  DriverTimeout = 303,

  // Platform errors (400-499)
  PlatformError = 400,
  PermissionDenied = 401,
  ServiceUnavailable = 402,
  HardwareNotAvailable = 403,
  DBusError = 404,
  ConfigReadError = 405,
  ConfigWriteError = 406
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details; // Additional context

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<MacAddress> result = driver.get_device_address();
 *   if (result) {
 *       MacAddress addr = result.value();
 *   } else {
 *       Error err = result.error();
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

  /// Get optional value
  std::optional<T> to_optional() const {
    return is_ok() ? std::optional<T>(std::get<T>(data_)) : std::nullopt;
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return !error_.has_value(); }

  /// Check if result is error
  bool is_error() const { return error_.has_value(); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the error
  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define P2PLINK_TRY(result)                                                    \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define P2PLINK_REQUIRE(condition, error_code, message)                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::p2plink::Error(error_code, message);                            \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
P2PLINK_API const char *error_code_name(ErrorCode code);

/// Get description for error code
P2PLINK_API const char *error_code_description(ErrorCode code);

/// Check if error code is recoverable (worth retrying the request later)
P2PLINK_API bool is_recoverable(ErrorCode code);

} // namespace p2plink

#endif // P2PLINK_ERROR_H
