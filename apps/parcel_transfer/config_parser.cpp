// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

namespace parcel {
namespace app {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return s;
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::optional<uint64_t> ConfigParser::parse_size(const std::string& text) {
  std::string value = trim(text);
  size_t digits = 0;
  while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
    ++digits;
  }
  if (digits == 0) {
    return std::nullopt;
  }

  uint64_t number = 0;
  for (size_t i = 0; i < digits; ++i) {
    uint64_t digit = static_cast<uint64_t>(value[i] - '0');
    if (number > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    number = number * 10 + digit;
  }

  std::string suffix = to_lower(trim(value.substr(digits)));
  uint64_t multiplier = 1;
  if (suffix.empty() || suffix == "b") {
    multiplier = 1;
  } else if (suffix == "kb" || suffix == "kib") {
    multiplier = transfer::KiB;
  } else if (suffix == "mb" || suffix == "mib") {
    multiplier = transfer::MiB;
  } else if (suffix == "gb" || suffix == "gib") {
    multiplier = transfer::GiB;
  } else if (suffix == "tb" || suffix == "tib") {
    multiplier = 1024ULL * transfer::GiB;
  } else {
    return std::nullopt;
  }

  if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
    return std::nullopt;
  }
  return number * multiplier;
}

bool ConfigParser::load_from_file(const std::string& path, AppConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, AppConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["s3"] && !parse_s3(node["s3"], config.s3)) {
      return false;
    }
    if (node["transfer"] && !parse_transfer(node["transfer"], config.transfer)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::validate(const AppConfig& config, std::string& error_msg) {
  const auto& transfer = config.transfer;
  if (transfer.num_workers < 1 || transfer.num_workers > parcel::transfer::kMaxWorkers) {
    error_msg = "transfer.num_workers must be between 1 and " +
                std::to_string(parcel::transfer::kMaxWorkers);
    return false;
  }
  if (transfer.part_size == 0) {
    error_msg = "transfer.part_size must be positive";
    return false;
  }
  if (transfer.queue_capacity && *transfer.queue_capacity == 0) {
    error_msg = "transfer.queue_capacity must be positive (omit it for an unbounded queue)";
    return false;
  }
  if (transfer.poll_interval.count() <= 0) {
    error_msg = "transfer.poll_interval_ms must be positive";
    return false;
  }
  if (transfer.limits.max_parts == 0) {
    error_msg = "transfer.max_parts must be positive";
    return false;
  }
  if (transfer.limits.max_single_transfer_size == 0) {
    error_msg = "transfer.max_single_transfer_size must be positive";
    return false;
  }
  if (config.s3.bucket.empty()) {
    error_msg = "s3.bucket is required";
    return false;
  }
  return true;
}

bool ConfigParser::parse_s3(const YAML::Node& node, transfer::S3Config& s3) {
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    s3.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_sdk_retries"]) {
    s3.max_sdk_retries = node["max_sdk_retries"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_transfer(const YAML::Node& node, transfer::TransferConfig& transfer) {
  if (!parse_size_field(node, "part_size", transfer.part_size)) {
    return false;
  }
  if (node["num_workers"]) {
    transfer.num_workers = node["num_workers"].as<int>();
  }
  if (node["queue_capacity"]) {
    const auto& capacity = node["queue_capacity"];
    if (capacity.IsNull() || to_lower(capacity.as<std::string>()) == "unbounded") {
      transfer.queue_capacity = std::nullopt;
    } else {
      transfer.queue_capacity = capacity.as<size_t>();
    }
  }
  if (node["poll_interval_ms"]) {
    transfer.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<int64_t>());
  }
  if (node["max_parts"]) {
    transfer.limits.max_parts = node["max_parts"].as<uint64_t>();
  }
  return parse_size_field(
    node, "max_single_transfer_size", transfer.limits.max_single_transfer_size
  );
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (!parse_level_field(console, "level", logging.console_level)) {
      return false;
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (!parse_level_field(file, "level", logging.file_level)) {
      return false;
    }
    if (file["directory"]) {
      logging.file_config.directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_config.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_config.format_json = to_lower(file["format"].as<std::string>()) == "json";
    }
    if (file["rotation_size_mb"]) {
      logging.file_config.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.file_config.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.file_config.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::parse_size_field(const YAML::Node& node, const char* name, uint64_t& out) {
  if (!node[name]) {
    return true;
  }
  std::string text = node[name].as<std::string>();
  auto size = parse_size(text);
  if (!size) {
    last_error_ = std::string("Invalid size for ") + name + ": '" + text + "'";
    return false;
  }
  out = *size;
  return true;
}

bool ConfigParser::parse_level_field(
  const YAML::Node& node, const char* name, logging::severity_level& out
) {
  if (!node[name]) {
    return true;
  }
  std::string text = node[name].as<std::string>();
  auto level = logging::parse_severity_level(text);
  if (!level) {
    last_error_ = std::string("Invalid log level for ") + name + ": '" + text + "'";
    return false;
  }
  out = *level;
  return true;
}

}  // namespace app
}  // namespace parcel
