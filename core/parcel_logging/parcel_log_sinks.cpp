// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "parcel_log_sinks.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

namespace parcel {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
    default:
      return "";
  }
}

const char* const kResetColor = "\033[0m";

// [timestamp] [LEVEL] message | transfer=...
void format_text(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[";
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
  strm << "] ";

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    if (use_colors) {
      strm << severity_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  strm << rec[expr::smessage];

  auto transfer_id = boost::log::extract<std::string>("TransferID", rec);
  if (transfer_id) {
    strm << " | transfer=" << *transfer_id;
  }
}

void format_json(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
  strm << "\",\"level\":\"";
  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << *sev;
  }
  strm << "\",\"msg\":\"" << escape_json(rec[expr::smessage].get()) << "\"";

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }

  auto transfer_id = boost::log::extract<std::string>("TransferID", rec);
  if (transfer_id) {
    strm << ",\"transfer_id\":\"" << escape_json(*transfer_id) << "\"";
  }
  strm << "}";
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [use_colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_text(rec, strm, use_colors);
    }
  );
  return sink;
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  std::string log_directory = config.directory;
  boost::filesystem::path dir_path(log_directory);

  if (!boost::filesystem::exists(dir_path)) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(dir_path, ec);
    if (ec) {
      // The logging core is not usable yet, report on stderr
      std::cerr << "[parcel_logging] Warning: Could not create log directory '"
                << config.directory << "': " << ec.message() << ". Falling back to /tmp\n";
      log_directory = "/tmp";
    }
  }

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&format_json);
  } else {
    sink->set_formatter(
      [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
        format_text(rec, strm, false);
      }
    );
  }
  return sink;
}

}  // namespace logging
}  // namespace parcel
