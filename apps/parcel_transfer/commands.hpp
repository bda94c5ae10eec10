// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_COMMANDS_HPP
#define PARCEL_COMMANDS_HPP

#include <string>

#include "app_config.hpp"

namespace parcel {
namespace app {

/**
 * Command handler for the parcel_transfer CLI
 */
class Commands {
public:
  Commands() = default;
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Upload local_path to s3_path ("s3://bucket/key" or "bucket/key")
   */
  int upload(const AppConfig& config, const std::string& local_path, const std::string& s3_path);

  /**
   * Download s3_path to local_path
   */
  int download(const AppConfig& config, const std::string& s3_path, const std::string& local_path);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

private:
  void print_usage() const;

  // Load, override bucket from the S3 path, validate. Returns false with a message on stderr.
  bool prepare_config(
    const std::string& config_path, const std::string& s3_path, AppConfig& config
  ) const;
};

}  // namespace app
}  // namespace parcel

#endif  // PARCEL_COMMANDS_HPP
