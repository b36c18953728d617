// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_LOG_MACROS_HPP
#define MPUPLOAD_LOG_MACROS_HPP

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "mpupload_log_severity.hpp"
#include "mpupload_upload_context.hpp"

namespace mpupload {
namespace logging {

// Thread-safe severity logger shared by every component.
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the process-wide logger instance.
 * Defined in mpupload_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured log lines.
 * Usage: MPUPLOAD_LOG_INFO("Part uploaded" << kv("part", index));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace mpupload

// Define MPUPLOAD_LOG_COMPONENT before including this header to tag every
// record emitted from the translation unit.
#ifndef MPUPLOAD_LOG_COMPONENT
#define MPUPLOAD_LOG_COMPONENT "mpupload"
#endif

// DEBUG records are compiled out of release builds.
#ifdef NDEBUG
#define MPUPLOAD_LOG_ENABLE_DEBUG 0
#else
#define MPUPLOAD_LOG_ENABLE_DEBUG 1
#endif

#define MPUPLOAD_LOG_SEV(level, msg)                                                \
  do {                                                                              \
    BOOST_LOG_SEV(::mpupload::logging::get_logger(), level)                         \
      << "[" << MPUPLOAD_LOG_COMPONENT << "] " << msg;                              \
  } while (0)

#define MPUPLOAD_LOG_DEBUG(msg)                                                     \
  do {                                                                              \
    if (MPUPLOAD_LOG_ENABLE_DEBUG) {                                                \
      MPUPLOAD_LOG_SEV(::mpupload::logging::severity_level::debug, msg);            \
    }                                                                               \
  } while (0)

#define MPUPLOAD_LOG_INFO(msg) MPUPLOAD_LOG_SEV(::mpupload::logging::severity_level::info, msg)
#define MPUPLOAD_LOG_WARN(msg) MPUPLOAD_LOG_SEV(::mpupload::logging::severity_level::warn, msg)
#define MPUPLOAD_LOG_ERROR(msg) MPUPLOAD_LOG_SEV(::mpupload::logging::severity_level::error, msg)
#define MPUPLOAD_LOG_FATAL(msg) MPUPLOAD_LOG_SEV(::mpupload::logging::severity_level::fatal, msg)

// Log at most once per interval (seconds) from a given call site.
#define MPUPLOAD_LOG_INFO_THROTTLE(interval_sec, msg)                               \
  do {                                                                              \
    static std::chrono::steady_clock::time_point _mpu_last_log_time{};              \
    static std::mutex _mpu_throttle_mutex;                                          \
    auto _mpu_now = std::chrono::steady_clock::now();                               \
    bool _mpu_should_log = false;                                                   \
    {                                                                               \
      std::lock_guard<std::mutex> _mpu_lock(_mpu_throttle_mutex);                   \
      if (_mpu_now - _mpu_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _mpu_last_log_time = _mpu_now;                                              \
        _mpu_should_log = true;                                                     \
      }                                                                             \
    }                                                                               \
    if (_mpu_should_log) {                                                          \
      MPUPLOAD_LOG_INFO(msg);                                                       \
    }                                                                               \
  } while (0)

#endif  // MPUPLOAD_LOG_MACROS_HPP
