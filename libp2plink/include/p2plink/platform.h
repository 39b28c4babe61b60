/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for p2plink
 *
 * p2plink drives wpa_supplicant's P2P device interface and therefore
 * only supports Linux and Android.
 */

#ifndef P2PLINK_PLATFORM_H
#define P2PLINK_PLATFORM_H

// ============================================================================
// Platform Detection (Linux and Android only)
// ============================================================================

#if defined(__ANDROID__)
#define P2PLINK_PLATFORM_ANDROID 1
#define P2PLINK_PLATFORM_LINUX 1
#define P2PLINK_PLATFORM_NAME "Android"
#elif defined(__linux__)
#define P2PLINK_PLATFORM_LINUX 1
#define P2PLINK_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. p2plink only supports Linux and Android."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define P2PLINK_COMPILER_CLANG 1
#define P2PLINK_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define P2PLINK_COMPILER_GCC 1
#define P2PLINK_COMPILER_NAME "GCC"
#else
#define P2PLINK_COMPILER_UNKNOWN 1
#define P2PLINK_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef P2PLINK_BUILDING_SHARED
#define P2PLINK_API __attribute__((visibility("default")))
#else
#define P2PLINK_API
#endif

#define P2PLINK_LOCAL __attribute__((visibility("hidden")))

// ============================================================================
// Utility Macros
// ============================================================================

#define P2PLINK_UNUSED(x) (void)(x)

// Branch prediction hints
#define P2PLINK_LIKELY(x) __builtin_expect(!!(x), 1)
#define P2PLINK_UNLIKELY(x) __builtin_expect(!!(x), 0)

// Printf-style format checking
#define P2PLINK_PRINTF(fmt_idx, args_idx)                                      \
  __attribute__((format(printf, fmt_idx, args_idx)))

// ============================================================================
// Debug/Release Detection
// ============================================================================

#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
#define P2PLINK_DEBUG 1
#else
#define P2PLINK_RELEASE 1
#endif

// ============================================================================
// Feature Detection
// ============================================================================

// The wpa_supplicant D-Bus driver is only built when libdbus-1 is found
#ifdef HAS_DBUS
#define P2PLINK_HAS_WPA_SUPPLICANT 1
#endif

#endif // P2PLINK_PLATFORM_H
