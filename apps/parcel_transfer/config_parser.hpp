// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_CONFIG_PARSER_HPP
#define PARCEL_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>

#include "app_config.hpp"

namespace parcel {
namespace app {

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, AppConfig& config);

  /**
   * Load configuration from YAML string. Keys absent from the document keep
   * the values already in config.
   */
  bool load_from_string(const std::string& yaml_content, AppConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const AppConfig& config, std::string& error_msg);

  /**
   * Parse a byte count such as "1048576", "8MB", "8MiB" or "5 GB".
   * KB/MB/GB/TB and KiB/MiB/GiB/TiB are all powers of 1024; case is ignored.
   *
   * @return The size in bytes, or std::nullopt if the text is not a size
   */
  static std::optional<uint64_t> parse_size(const std::string& text);

  /**
   * Get last error message
   */
  std::string get_last_error() const { return last_error_; }

private:
  bool parse_s3(const YAML::Node& node, transfer::S3Config& s3);
  bool parse_transfer(const YAML::Node& node, transfer::TransferConfig& transfer);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& logging);

  bool parse_size_field(const YAML::Node& node, const char* name, uint64_t& out);
  bool parse_level_field(const YAML::Node& node, const char* name, logging::severity_level& out);

  std::string last_error_;
};

}  // namespace app
}  // namespace parcel

#endif  // PARCEL_CONFIG_PARSER_HPP
