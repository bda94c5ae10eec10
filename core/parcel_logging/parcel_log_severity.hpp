// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_LOG_SEVERITY_HPP
#define PARCEL_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace parcel {
namespace logging {

/**
 * Severity levels for parcel logging.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  const auto index = static_cast<size_t>(level);
  if (index < sizeof(names) / sizeof(*names)) {
    strm << names[index];
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

// Boost.Log keyword for severity filtering
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace parcel

#endif  // PARCEL_LOG_SEVERITY_HPP
