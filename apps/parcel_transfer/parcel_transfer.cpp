// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// parcel_transfer - multipart object transfer to and from S3-compatible storage

#include <exception>
#include <iostream>

#include <parcel_log_init.hpp>

#include "commands.hpp"

/**
 * Main entry point for parcel_transfer
 */
int main(int argc, char* argv[]) {
  parcel::logging::init_logging_default();
  parcel::app::Commands commands;

  int rc = 1;
  try {
    rc = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
  }

  parcel::logging::shutdown_logging();
  return rc;
}
