// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_APP_CONFIG_HPP
#define PARCEL_APP_CONFIG_HPP

#include <parcel_log_init.hpp>

#include "s3_part_client.hpp"
#include "transfer_coordinator.hpp"

namespace parcel {
namespace app {

/**
 * Everything parcel_transfer reads from its YAML file
 */
struct AppConfig {
  transfer::S3Config s3;
  transfer::TransferConfig transfer;
  logging::LoggingConfig logging;
};

}  // namespace app
}  // namespace parcel

#endif  // PARCEL_APP_CONFIG_HPP
