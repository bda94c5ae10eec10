// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

#include "config_parser.hpp"
#include "s3_path.hpp"

#define PARCEL_LOG_COMPONENT "parcel_transfer"
#include <parcel_log_macros.hpp>

namespace fs = std::filesystem;

namespace parcel {
namespace app {

using ::parcel::logging::kv;

namespace {

// Progress line roughly every tenth of the parts
void attach_progress_logging(transfer::TransferCoordinator& coordinator, uint64_t part_count) {
  const uint64_t every = part_count < 10 ? 1 : part_count / 10;
  const transfer::TransferStats& stats = coordinator.stats();
  coordinator.setCallback([every, part_count, &stats](
                            const transfer::PartTask&, const transfer::PartResult& result
                          ) {
    if (!result.success) {
      return;
    }
    uint64_t done = stats.parts_completed.load();
    if (done % every == 0 || done == part_count) {
      PARCEL_LOG_INFO(
        "Progress" << kv("parts_done", done) << kv("parts", part_count)
                   << kv("bytes", stats.bytes_transferred.load())
      );
    }
  });
}

int report_outcome(const transfer::TransferReport& report, const std::string& what) {
  if (report.success) {
    std::cout << what << ": " << report.bytes_transferred << " bytes in " << report.part_count
              << " parts of " << report.part_size << " bytes" << std::endl;
    return 0;
  }
  std::cerr << "Error: " << what << " failed: " << report.error_message << std::endl;
  return 1;
}

}  // namespace

void Commands::print_usage() const {
  std::cout << "Usage: parcel_transfer <command> <config.yaml> <args>\n"
            << "\n"
            << "Commands:\n"
            << "  upload   <config.yaml> <local_path> <s3://bucket/key>\n"
            << "  download <config.yaml> <s3://bucket/key> <local_path>\n"
            << "  help\n";
}

bool Commands::prepare_config(
  const std::string& config_path, const std::string& s3_path, AppConfig& config
) const {
  ConfigParser parser;
  if (!parser.load_from_file(config_path, config)) {
    std::cerr << "Error: " << parser.get_last_error() << std::endl;
    return false;
  }

  auto [bucket, key] = transfer::find_bucket_key(s3_path);
  if (key.empty()) {
    std::cerr << "Error: S3 path must name an object: " << s3_path << std::endl;
    return false;
  }
  if (!bucket.empty()) {
    config.s3.bucket = bucket;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return false;
  }

  logging::reconfigure_logging(config.logging);
  return true;
}

int Commands::upload(
  const AppConfig& config, const std::string& local_path, const std::string& s3_path
) {
  std::error_code ec;
  uint64_t size = fs::file_size(local_path, ec);
  if (ec) {
    std::cerr << "Error: Cannot read " << local_path << ": " << ec.message() << std::endl;
    return 1;
  }

  auto key = transfer::find_bucket_key(s3_path).second;
  auto connection = std::make_shared<transfer::S3Connection>(config.s3);
  auto client = std::make_shared<transfer::S3MultipartUploader>(connection, local_path, key);

  transfer::TransferCoordinator coordinator(config.transfer, client);
  transfer::ChunkSizePlanner planner(config.transfer.limits);
  attach_progress_logging(coordinator, planner.plan(size, config.transfer.part_size).part_count);

  PARCEL_LOG_INFO("Uploading" << kv("file", local_path) << kv("key", key) << kv("size", size));
  return report_outcome(coordinator.start_transfer(size), "upload");
}

int Commands::download(
  const AppConfig& config, const std::string& s3_path, const std::string& local_path
) {
  auto key = transfer::find_bucket_key(s3_path).second;
  auto connection = std::make_shared<transfer::S3Connection>(config.s3);

  auto size = connection->object_size(key);
  if (!size) {
    std::cerr << "Error: Object not found: " << s3_path << std::endl;
    return 1;
  }

  auto client = std::make_shared<transfer::S3RangedDownloader>(connection, key, local_path);
  transfer::TransferCoordinator coordinator(config.transfer, client);
  transfer::ChunkSizePlanner planner(config.transfer.limits);
  attach_progress_logging(coordinator, planner.plan(*size, config.transfer.part_size).part_count);

  PARCEL_LOG_INFO("Downloading" << kv("key", key) << kv("file", local_path) << kv("size", *size));
  return report_outcome(coordinator.start_transfer(*size), "download");
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;
  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  if (command != "upload" && command != "download") {
    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }

  if (argc != 5) {
    std::cerr << "Error: '" << command << "' takes exactly three arguments" << std::endl;
    print_usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const bool is_upload = command == "upload";
  const std::string local_path = is_upload ? argv[3] : argv[4];
  const std::string s3_path = is_upload ? argv[4] : argv[3];

  AppConfig config;
  if (!prepare_config(config_path, s3_path, config)) {
    return 1;
  }

  return is_upload ? upload(config, local_path, s3_path) : download(config, s3_path, local_path);
}

}  // namespace app
}  // namespace parcel
