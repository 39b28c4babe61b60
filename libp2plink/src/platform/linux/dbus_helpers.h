/**
 * @file dbus_helpers.h
 * @brief D-Bus utility types for the wpa_supplicant driver
 *
 * RAII wrappers for libdbus handles, a builder for the a{sv} argument
 * dictionaries wpa_supplicant expects, and a reader that flattens
 * variants into Variant values.
 */

#ifndef P2PLINK_PLATFORM_LINUX_DBUS_HELPERS_H
#define P2PLINK_PLATFORM_LINUX_DBUS_HELPERS_H

#include "p2plink/error.h"
#include "p2plink/types.h"
#include <dbus/dbus.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace p2plink {
namespace platform {

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool add_ref = false)
      : conn_(conn) {
    if (conn_ && add_ref) {
      dbus_connection_ref(conn_);
    }
  }

  ~DBusConnectionWrapper() {
    if (conn_) {
      dbus_connection_unref(conn_);
    }
  }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      if (conn_) {
        dbus_connection_unref(conn_);
      }
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  operator bool() const { return conn_ != nullptr; }

private:
  DBusConnection *conn_ = nullptr;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert DBusError to a p2plink Error
 *
 * wpa_supplicant reports rejected commands with its own error names; those
 * map to DriverCommandFailed, transport failures to DBusError.
 */
inline Error dbus_error_to_p2plink(const DBusError &err) {
  if (!dbus_error_is_set(&err)) {
    return Error();
  }

  std::string name = err.name ? err.name : "";
  std::string message = name.empty() ? "D-Bus error" : name;
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  if (name.compare(0, 21, "fi.w1.wpa_supplicant1") == 0) {
    return Error(ErrorCode::DriverCommandFailed, message);
  }
  if (name == DBUS_ERROR_NO_REPLY || name == DBUS_ERROR_TIMEOUT) {
    return Error(ErrorCode::DriverTimeout, message);
  }
  if (name == DBUS_ERROR_SERVICE_UNKNOWN || name == DBUS_ERROR_NAME_HAS_NO_OWNER) {
    return Error(ErrorCode::DriverUnavailable, message);
  }
  return Error(ErrorCode::DBusError, message);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_p2plink(err_); }

private:
  DBusError err_;
};

// ============================================================================
// Argument Dictionaries
// ============================================================================

/**
 * @brief Writes an a{sv} dictionary into a message
 *
 * @code
 *   DictBuilder dict(msg.get());
 *   dict.add_object_path("peer", peer_path);
 *   dict.add_string("wps_method", "pbc");
 *   dict.close();
 * @endcode
 */
class DictBuilder {
public:
  explicit DictBuilder(DBusMessage *msg) {
    dbus_message_iter_init_append(msg, &iter_);
    dbus_message_iter_open_container(&iter_, DBUS_TYPE_ARRAY, "{sv}", &dict_);
  }

  ~DictBuilder() { close(); }

  // Non-copyable
  DictBuilder(const DictBuilder &) = delete;
  DictBuilder &operator=(const DictBuilder &) = delete;

  void add_string(const char *key, const std::string &value) {
    const char *str = value.c_str();
    add_basic(key, DBUS_TYPE_STRING, "s", &str);
  }

  void add_object_path(const char *key, const std::string &path) {
    const char *str = path.c_str();
    add_basic(key, DBUS_TYPE_OBJECT_PATH, "o", &str);
  }

  void add_int32(const char *key, int32_t value) {
    dbus_int32_t v = value;
    add_basic(key, DBUS_TYPE_INT32, "i", &v);
  }

  void add_uint32(const char *key, uint32_t value) {
    dbus_uint32_t v = value;
    add_basic(key, DBUS_TYPE_UINT32, "u", &v);
  }

  void add_bool(const char *key, bool value) {
    dbus_bool_t v = value ? TRUE : FALSE;
    add_basic(key, DBUS_TYPE_BOOLEAN, "b", &v);
  }

  void add_bytes(const char *key, const Bytes &value) {
    DBusMessageIter entry, variant, array;
    open_entry(key, "ay", entry, variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "y", &array);
    const Byte *data = value.data();
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data,
                                         static_cast<int>(value.size()));
    dbus_message_iter_close_container(&variant, &array);
    close_entry(entry, variant);
  }

  void close() {
    if (!closed_) {
      dbus_message_iter_close_container(&iter_, &dict_);
      closed_ = true;
    }
  }

private:
  void open_entry(const char *key, const char *sig, DBusMessageIter &entry,
                  DBusMessageIter &variant) {
    dbus_message_iter_open_container(&dict_, DBUS_TYPE_DICT_ENTRY, nullptr,
                                     &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, sig, &variant);
  }

  void close_entry(DBusMessageIter &entry, DBusMessageIter &variant) {
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(&dict_, &entry);
  }

  void add_basic(const char *key, int type, const char *sig, const void *value) {
    DBusMessageIter entry, variant;
    open_entry(key, sig, entry, variant);
    dbus_message_iter_append_basic(&variant, type, value);
    close_entry(entry, variant);
  }

  DBusMessageIter iter_;
  DBusMessageIter dict_;
  bool closed_ = false;
};

// ============================================================================
// Reading Variants
// ============================================================================

/**
 * @brief A decoded variant value
 *
 * Integers of every width land in @c number, strings and object paths in
 * @c text, byte arrays in @c bytes, object path arrays in @c paths and
 * nested dictionaries in @c dict.
 */
struct Variant {
  int type = DBUS_TYPE_INVALID;
  int64_t number = 0;
  std::string text;
  Bytes bytes;
  std::vector<std::string> paths;
  std::map<std::string, Variant> dict;
};

using VariantMap = std::map<std::string, Variant>;

inline VariantMap read_dict(DBusMessageIter *iter);

/// Decode the value @p iter points at
inline Variant read_value(DBusMessageIter *iter) {
  Variant out;
  out.type = dbus_message_iter_get_arg_type(iter);

  switch (out.type) {
  case DBUS_TYPE_VARIANT: {
    DBusMessageIter inner;
    dbus_message_iter_recurse(iter, &inner);
    return read_value(&inner);
  }
  case DBUS_TYPE_STRING:
  case DBUS_TYPE_OBJECT_PATH: {
    const char *value = nullptr;
    dbus_message_iter_get_basic(iter, &value);
    out.text = value ? value : "";
    break;
  }
  case DBUS_TYPE_BOOLEAN: {
    dbus_bool_t value = FALSE;
    dbus_message_iter_get_basic(iter, &value);
    out.number = value ? 1 : 0;
    break;
  }
  case DBUS_TYPE_BYTE: {
    unsigned char value = 0;
    dbus_message_iter_get_basic(iter, &value);
    out.number = value;
    break;
  }
  case DBUS_TYPE_INT16:
  case DBUS_TYPE_UINT16:
  case DBUS_TYPE_INT32:
  case DBUS_TYPE_UINT32:
  case DBUS_TYPE_INT64:
  case DBUS_TYPE_UINT64: {
    DBusBasicValue value;
    dbus_message_iter_get_basic(iter, &value);
    switch (out.type) {
    case DBUS_TYPE_INT16: out.number = value.i16; break;
    case DBUS_TYPE_UINT16: out.number = value.u16; break;
    case DBUS_TYPE_INT32: out.number = value.i32; break;
    case DBUS_TYPE_UINT32: out.number = value.u32; break;
    case DBUS_TYPE_INT64: out.number = value.i64; break;
    default: out.number = static_cast<int64_t>(value.u64); break;
    }
    break;
  }
  case DBUS_TYPE_ARRAY: {
    int element = dbus_message_iter_get_element_type(iter);
    DBusMessageIter array;
    dbus_message_iter_recurse(iter, &array);
    if (element == DBUS_TYPE_BYTE) {
      const Byte *data = nullptr;
      int length = 0;
      dbus_message_iter_get_fixed_array(&array, &data, &length);
      if (data && length > 0) {
        out.bytes.assign(data, data + length);
      }
    } else if (element == DBUS_TYPE_OBJECT_PATH ||
               element == DBUS_TYPE_STRING) {
      while (dbus_message_iter_get_arg_type(&array) != DBUS_TYPE_INVALID) {
        const char *value = nullptr;
        dbus_message_iter_get_basic(&array, &value);
        out.paths.emplace_back(value ? value : "");
        dbus_message_iter_next(&array);
      }
    } else if (element == DBUS_TYPE_DICT_ENTRY) {
      out.dict = read_dict(iter);
    }
    break;
  }
  default:
    break;
  }
  return out;
}

/// Decode an a{sv} dictionary at @p iter
inline VariantMap read_dict(DBusMessageIter *iter) {
  VariantMap out;
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return out;
  }

  DBusMessageIter array;
  dbus_message_iter_recurse(iter, &array);
  while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry;
    dbus_message_iter_recurse(&array, &entry);

    const char *key = nullptr;
    if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_STRING) {
      dbus_message_iter_get_basic(&entry, &key);
      dbus_message_iter_next(&entry);
      if (key) {
        out[key] = read_value(&entry);
      }
    }
    dbus_message_iter_next(&array);
  }
  return out;
}

inline std::string dict_string(const VariantMap &dict, const char *key) {
  auto it = dict.find(key);
  return it == dict.end() ? std::string() : it->second.text;
}

inline int64_t dict_number(const VariantMap &dict, const char *key,
                           int64_t fallback = 0) {
  auto it = dict.find(key);
  return it == dict.end() ? fallback : it->second.number;
}

inline Bytes dict_bytes(const VariantMap &dict, const char *key) {
  auto it = dict.find(key);
  return it == dict.end() ? Bytes() : it->second.bytes;
}

// ============================================================================
// D-Bus Helper Functions
// ============================================================================

/**
 * @brief Get a private system bus connection
 *
 * Private so that closing it on teardown does not affect other users of
 * the shared connection in the process.
 */
inline Result<DBusConnectionWrapper> open_system_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    return error.to_error();
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn);
}

/**
 * @brief Send a prepared method call and wait for the reply
 * @param timeout_ms Timeout in milliseconds (-1 for default)
 */
inline Result<DBusMessageWrapper> send_blocking(DBusConnection *conn,
                                                DBusMessage *msg,
                                                int timeout_ms = -1) {
  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg, timeout_ms, error.get());

  if (!reply || error.is_set()) {
    return error.to_error();
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Call a method that takes no arguments
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method, int timeout_ms = -1) {
  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::DBusError, "Failed to create D-Bus message");
  }

  return send_blocking(conn, msg.get(), timeout_ms);
}

/**
 * @brief Read one property through org.freedesktop.DBus.Properties.Get
 */
inline Result<Variant> get_property(DBusConnection *conn, const char *dest,
                                    const char *path, const char *iface,
                                    const char *property) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      dest, path, DBUS_INTERFACE_PROPERTIES, "Get"));

  if (!msg) {
    return Error(ErrorCode::DBusError, "Failed to create D-Bus message");
  }

  dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface,
                           DBUS_TYPE_STRING, &property, DBUS_TYPE_INVALID);

  auto reply = send_blocking(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::DBusError, "Expected variant type");
  }

  return read_value(&iter);
}

/**
 * @brief Set a basic-typed property
 */
inline Result<void> set_property(DBusConnection *conn, const char *dest,
                                 const char *path, const char *iface,
                                 const char *property, int type,
                                 const void *value) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      dest, path, DBUS_INTERFACE_PROPERTIES, "Set"));

  if (!msg) {
    return Error(ErrorCode::DBusError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, variant_iter;
  dbus_message_iter_init_append(msg.get(), &iter);

  dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);
  dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &property);

  char type_sig[2] = {static_cast<char>(type), '\0'};
  dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, type_sig,
                                   &variant_iter);
  dbus_message_iter_append_basic(&variant_iter, type, value);
  dbus_message_iter_close_container(&iter, &variant_iter);

  auto reply = send_blocking(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

/**
 * @brief Set an a{sv} property; @p fill writes the entries
 */
template <typename Fill>
Result<void> set_dict_property(DBusConnection *conn, const char *dest,
                               const char *path, const char *iface,
                               const char *property, Fill fill) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      dest, path, DBUS_INTERFACE_PROPERTIES, "Set"));

  if (!msg) {
    return Error(ErrorCode::DBusError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, variant_iter, dict_iter;
  dbus_message_iter_init_append(msg.get(), &iter);
  dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);
  dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &property);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, "a{sv}",
                                   &variant_iter);
  dbus_message_iter_open_container(&variant_iter, DBUS_TYPE_ARRAY, "{sv}",
                                   &dict_iter);
  fill(&dict_iter);
  dbus_message_iter_close_container(&variant_iter, &dict_iter);
  dbus_message_iter_close_container(&iter, &variant_iter);

  auto reply = send_blocking(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

/// Append one string entry to an open {sv} container
inline void append_string_entry(DBusMessageIter *dict, const char *key,
                                const std::string &value) {
  DBusMessageIter entry, variant;
  dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
  dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
  dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
  const char *str = value.c_str();
  dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &str);
  dbus_message_iter_close_container(&entry, &variant);
  dbus_message_iter_close_container(dict, &entry);
}

/// Append one uint32 entry to an open {sv} container
inline void append_uint32_entry(DBusMessageIter *dict, const char *key,
                                uint32_t value) {
  DBusMessageIter entry, variant;
  dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
  dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
  dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "u", &variant);
  dbus_uint32_t v = value;
  dbus_message_iter_append_basic(&variant, DBUS_TYPE_UINT32, &v);
  dbus_message_iter_close_container(&entry, &variant);
  dbus_message_iter_close_container(dict, &entry);
}

} // namespace platform
} // namespace p2plink

#endif // P2PLINK_PLATFORM_LINUX_DBUS_HELPERS_H
