// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_CHUNK_SIZE_PLANNER_HPP
#define PARCEL_CHUNK_SIZE_PLANNER_HPP

#include <cstdint>

namespace parcel {
namespace transfer {

constexpr uint64_t KiB = 1024ULL;
constexpr uint64_t MiB = 1024ULL * KiB;
constexpr uint64_t GiB = 1024ULL * MiB;

/**
 * Service-imposed ceilings for a multipart transfer.
 */
struct TransferLimits {
  uint64_t max_parts = 1000;                    // Maximum number of parts per object
  uint64_t max_single_transfer_size = 5 * GiB;  // Maximum size of one part
};

/**
 * Part layout chosen for one object transfer
 */
struct TransferSizeSpec {
  uint64_t part_size = 0;
  uint64_t part_count = 0;
};

/**
 * Number of parts needed to cover total_size with parts of part_size bytes.
 * An empty object needs zero parts.
 */
uint64_t part_count(uint64_t total_size, uint64_t part_size);

/**
 * Compute a part size that keeps a multipart transfer within the limits.
 *
 * The requested size is kept when it already yields at most max_parts parts.
 * Otherwise it is doubled until the part count fits, so the result is always
 * requested_part_size * 2^k. The result never exceeds
 * max_single_transfer_size; when the doubled (or requested) size would, the
 * ceiling itself is returned.
 *
 * @throws std::invalid_argument if requested_part_size is zero or a limit is zero
 */
uint64_t plan_part_size(
  uint64_t total_size, uint64_t requested_part_size, const TransferLimits& limits = {}
);

/**
 * Planner bound to a fixed set of limits
 */
class ChunkSizePlanner {
public:
  explicit ChunkSizePlanner(const TransferLimits& limits = {});

  uint64_t plan_part_size(uint64_t total_size, uint64_t requested_part_size) const;

  /**
   * Plan the part size and report how many parts it produces.
   * An empty object is planned as a single zero-length part.
   */
  TransferSizeSpec plan(uint64_t total_size, uint64_t requested_part_size) const;

  const TransferLimits& limits() const { return limits_; }

private:
  TransferLimits limits_;
};

}  // namespace transfer
}  // namespace parcel

#endif  // PARCEL_CHUNK_SIZE_PLANNER_HPP
