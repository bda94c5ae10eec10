// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_LOG_MACROS_HPP
#define PARCEL_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "parcel_log_severity.hpp"

namespace parcel {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in parcel_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value fragment for structured messages.
 * Usage: PARCEL_LOG_INFO("part uploaded" << kv("part", n));
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
}  // namespace parcel

// Define PARCEL_LOG_COMPONENT before including this header to tag records
// with the emitting component.
#ifndef PARCEL_LOG_COMPONENT
#define PARCEL_LOG_COMPONENT "parcel"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define PARCEL_LOG_ENABLE_DEBUG 0
#else
#define PARCEL_LOG_ENABLE_DEBUG 1
#endif

#define PARCEL_LOG_SEV(level, msg)                                          \
  do {                                                                      \
    BOOST_LOG_SEV(::parcel::logging::get_logger(), level)                   \
      << "[" << PARCEL_LOG_COMPONENT << "] " << msg;                        \
  } while (0)

#define PARCEL_LOG_DEBUG(msg)                                               \
  do {                                                                      \
    if (PARCEL_LOG_ENABLE_DEBUG) {                                          \
      PARCEL_LOG_SEV(::parcel::logging::severity_level::debug, msg);        \
    }                                                                       \
  } while (0)

#define PARCEL_LOG_INFO(msg) PARCEL_LOG_SEV(::parcel::logging::severity_level::info, msg)
#define PARCEL_LOG_WARN(msg) PARCEL_LOG_SEV(::parcel::logging::severity_level::warn, msg)
#define PARCEL_LOG_ERROR(msg) PARCEL_LOG_SEV(::parcel::logging::severity_level::error, msg)
#define PARCEL_LOG_FATAL(msg) PARCEL_LOG_SEV(::parcel::logging::severity_level::fatal, msg)

// Tags every record emitted by the current thread, until the scope exits,
// with the transfer it belongs to.
// Usage: PARCEL_LOG_SCOPED_TRANSFER("bucket/key");
#define PARCEL_LOG_SCOPED_TRANSFER(transfer_id_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR(                     \
    "TransferID", boost::log::attributes::constant<std::string>(transfer_id_val))

#endif  // PARCEL_LOG_MACROS_HPP
