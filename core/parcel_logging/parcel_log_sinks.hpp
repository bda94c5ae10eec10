// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_LOG_SINKS_HPP
#define PARCEL_LOG_SINKS_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "parcel_log_severity.hpp"

namespace parcel {
namespace logging {

/**
 * Async console sink. Records are dropped when 1000 are already pending so
 * that transfer workers never block on terminal output.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Async rotating file sink with a deeper queue for slower I/O.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/parcel";
  std::string file_pattern = "parcel_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;
};

/**
 * Create the console sink writing to std::clog.
 *
 * @param min_level Records below this level are filtered out
 * @param use_colors Wrap the severity tag in ANSI color codes
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

/**
 * Create the file sink. Rotates by size and optionally at midnight, keeping
 * at most config.max_files files. Falls back to /tmp when the configured
 * directory cannot be created.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

}  // namespace logging
}  // namespace parcel

#endif  // PARCEL_LOG_SINKS_HPP
