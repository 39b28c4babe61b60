/**
 * @file log.h
 * @brief Tagged logging for p2plink
 *
 * Every translation unit that logs defines P2PLINK_LOG_TAG before its
 * first include. Output goes to stderr unless a sink is installed with
 * log_set_output().
 */

#ifndef P2PLINK_LOG_H
#define P2PLINK_LOG_H

#include "platform.h"
#include <cstdarg>
#include <functional>
#include <string>

namespace p2plink {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
  None = 0,    ///< No logging
  Error = 1,   ///< Errors only
  Warn = 2,    ///< Warnings and errors
  Info = 3,    ///< Informational messages
  Debug = 4,   ///< Debug messages
  Verbose = 5, ///< Per-message tracing
};

/// Single-letter level marker ("E", "W", ...)
P2PLINK_API const char *log_level_letter(LogLevel level);

/// Parse "error", "warn", "info", "debug", "verbose" or "none"
P2PLINK_API bool log_level_from_string(const std::string &name,
                                       LogLevel &out);

// ============================================================================
// Log Output Configuration
// ============================================================================

/**
 * @brief Log output callback type
 * @param level Log level
 * @param tag Module tag
 * @param msg Formatted message
 */
using LogOutputFn =
    std::function<void(LogLevel level, const char *tag, const std::string &msg)>;

/**
 * @brief Set log output function
 * @param fn Output function (empty for the default stderr output)
 */
P2PLINK_API void log_set_output(LogOutputFn fn);

/**
 * @brief Set runtime log level
 * @param level Minimum level to output
 */
P2PLINK_API void log_set_level(LogLevel level);

/// Get current log level
P2PLINK_API LogLevel log_get_level();

/// Check whether a message at this level would be emitted
P2PLINK_API bool log_enabled(LogLevel level);

// ============================================================================
// Log Functions
// ============================================================================

/**
 * @brief Log a message at specified level
 * @param level Log level
 * @param tag Module tag
 * @param fmt Printf-style format string
 */
P2PLINK_API void log_write(LogLevel level, const char *tag, const char *fmt,
                           ...) P2PLINK_PRINTF(3, 4);

/// Log a message with va_list
P2PLINK_API void log_writev(LogLevel level, const char *tag, const char *fmt,
                            va_list args);

} // namespace p2plink

// ============================================================================
// Log Macros
// ============================================================================

#ifndef P2PLINK_LOG_TAG
#define P2PLINK_LOG_TAG "p2plink"
#endif

#define P2PLINK_LOGE(fmt, ...)                                                 \
  ::p2plink::log_write(::p2plink::LogLevel::Error, P2PLINK_LOG_TAG, fmt,       \
                       ##__VA_ARGS__)
#define P2PLINK_LOGW(fmt, ...)                                                 \
  ::p2plink::log_write(::p2plink::LogLevel::Warn, P2PLINK_LOG_TAG, fmt,        \
                       ##__VA_ARGS__)
#define P2PLINK_LOGI(fmt, ...)                                                 \
  ::p2plink::log_write(::p2plink::LogLevel::Info, P2PLINK_LOG_TAG, fmt,        \
                       ##__VA_ARGS__)
#define P2PLINK_LOGD(fmt, ...)                                                 \
  ::p2plink::log_write(::p2plink::LogLevel::Debug, P2PLINK_LOG_TAG, fmt,       \
                       ##__VA_ARGS__)
#define P2PLINK_LOGV(fmt, ...)                                                 \
  ::p2plink::log_write(::p2plink::LogLevel::Verbose, P2PLINK_LOG_TAG, fmt,     \
                       ##__VA_ARGS__)

#endif // P2PLINK_LOG_H
