// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_LOG_SEVERITY_HPP
#define MPUPLOAD_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <ostream>

namespace mpupload {
namespace logging {

/**
 * Severity levels for mpupload logging.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  const auto idx = static_cast<std::size_t>(level);
  if (idx < sizeof(names) / sizeof(*names)) {
    strm << names[idx];
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace mpupload

#endif  // MPUPLOAD_LOG_SEVERITY_HPP
