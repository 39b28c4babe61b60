/**
 * @file log.cpp
 * @brief Logging backend
 */

#include "p2plink/log.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <vector>

namespace p2plink {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_output_mutex;
LogOutputFn g_output;

void default_output(LogLevel level, const char *tag, const std::string &msg) {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;
  std::tm tm_buf{};
  localtime_r(&secs, &tm_buf);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(stderr, "%s.%03d %s/%s: %s\n", stamp, static_cast<int>(millis),
               log_level_letter(level), tag, msg.c_str());
}

} // namespace

const char *log_level_letter(LogLevel level) {
  switch (level) {
  case LogLevel::None:
    return "-";
  case LogLevel::Error:
    return "E";
  case LogLevel::Warn:
    return "W";
  case LogLevel::Info:
    return "I";
  case LogLevel::Debug:
    return "D";
  case LogLevel::Verbose:
    return "V";
  }
  return "?";
}

bool log_level_from_string(const std::string &name, LogLevel &out) {
  if (name == "none") {
    out = LogLevel::None;
  } else if (name == "error") {
    out = LogLevel::Error;
  } else if (name == "warn") {
    out = LogLevel::Warn;
  } else if (name == "info") {
    out = LogLevel::Info;
  } else if (name == "debug") {
    out = LogLevel::Debug;
  } else if (name == "verbose") {
    out = LogLevel::Verbose;
  } else {
    return false;
  }
  return true;
}

void log_set_output(LogOutputFn fn) {
  std::lock_guard<std::mutex> lock(g_output_mutex);
  g_output = std::move(fn);
}

void log_set_level(LogLevel level) { g_level = static_cast<int>(level); }

LogLevel log_get_level() { return static_cast<LogLevel>(g_level.load()); }

bool log_enabled(LogLevel level) {
  return level != LogLevel::None && static_cast<int>(level) <= g_level.load();
}

void log_write(LogLevel level, const char *tag, const char *fmt, ...) {
  if (!log_enabled(level)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  log_writev(level, tag, fmt, args);
  va_end(args);
}

void log_writev(LogLevel level, const char *tag, const char *fmt,
                va_list args) {
  if (!log_enabled(level)) {
    return;
  }

  va_list copy;
  va_copy(copy, args);
  int needed = std::vsnprintf(nullptr, 0, fmt, copy);
  va_end(copy);
  if (needed < 0) {
    return;
  }

  std::vector<char> buf(static_cast<size_t>(needed) + 1);
  std::vsnprintf(buf.data(), buf.size(), fmt, args);
  std::string msg(buf.data(), static_cast<size_t>(needed));

  std::lock_guard<std::mutex> lock(g_output_mutex);
  if (g_output) {
    g_output(level, tag, msg);
  } else {
    default_output(level, tag, msg);
  }
}

} // namespace p2plink
