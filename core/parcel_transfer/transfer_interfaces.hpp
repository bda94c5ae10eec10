// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_TRANSFER_INTERFACES_HPP
#define PARCEL_TRANSFER_INTERFACES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "part_task.hpp"

namespace parcel {
namespace transfer {

/**
 * Result of transferring one part
 */
struct PartResult {
  uint64_t part_number = 0;
  bool success = false;
  std::string etag;           // Part ETag returned by the store (uploads)
  std::string error_message;  // Error message if failed
  std::string error_code;     // Error code for classification

  static PartResult Success(uint64_t part_number, const std::string& etag = "") {
    return {part_number, true, etag, "", ""};
  }

  static PartResult Failure(
    uint64_t part_number, const std::string& message, const std::string& code = ""
  ) {
    return {part_number, false, "", message, code};
  }
};

/**
 * Remote side of a multipart transfer of one object.
 *
 * The coordinator calls begin() once, transfer_part() once per part from
 * several worker threads at the same time, and then exactly one of
 * complete() or abort(). Retries, if any, are the implementation's concern.
 */
class IPartTransferClient {
public:
  virtual ~IPartTransferClient() = default;

  /**
   * Prepare the transfer (e.g. create the multipart upload).
   *
   * @return false if the transfer cannot start; no part is sent then
   */
  virtual bool begin(uint64_t total_size, uint64_t part_size, uint64_t part_count) = 0;

  /**
   * Transfer one byte range. Must be safe to call concurrently.
   */
  virtual PartResult transfer_part(const PartTask& part) = 0;

  /**
   * Finish the transfer.
   *
   * @param parts Successful part results, ordered by part number
   * @return false if the store rejected the assembled object
   */
  virtual bool complete(const std::vector<PartResult>& parts) = 0;

  /**
   * Discard a transfer that will not be completed.
   */
  virtual void abort() = 0;

  /**
   * Human readable name for logs, e.g. "bucket/key"
   */
  virtual std::string describe() const = 0;
};

}  // namespace transfer
}  // namespace parcel

#endif  // PARCEL_TRANSFER_INTERFACES_HPP
