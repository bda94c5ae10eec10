// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_size_planner.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace parcel {
namespace transfer {

namespace {

void validate_limits(const TransferLimits& limits) {
  if (limits.max_parts == 0) {
    throw std::invalid_argument("max_parts must be positive");
  }
  if (limits.max_single_transfer_size == 0) {
    throw std::invalid_argument("max_single_transfer_size must be positive");
  }
}

}  // namespace

uint64_t part_count(uint64_t total_size, uint64_t part_size) {
  if (part_size == 0) {
    throw std::invalid_argument("part_size must be positive");
  }
  return total_size / part_size + (total_size % part_size != 0 ? 1 : 0);
}

uint64_t plan_part_size(
  uint64_t total_size, uint64_t requested_part_size, const TransferLimits& limits
) {
  if (requested_part_size == 0) {
    throw std::invalid_argument("requested_part_size must be positive");
  }
  validate_limits(limits);

  uint64_t candidate = requested_part_size;
  while (part_count(total_size, candidate) > limits.max_parts) {
    // Past the ceiling every further doubling clamps to the same result
    if (candidate >= limits.max_single_transfer_size ||
        candidate > std::numeric_limits<uint64_t>::max() / 2) {
      break;
    }
    candidate *= 2;
  }

  return std::min(candidate, limits.max_single_transfer_size);
}

ChunkSizePlanner::ChunkSizePlanner(const TransferLimits& limits) : limits_(limits) {
  validate_limits(limits_);
}

uint64_t ChunkSizePlanner::plan_part_size(
  uint64_t total_size, uint64_t requested_part_size
) const {
  return transfer::plan_part_size(total_size, requested_part_size, limits_);
}

TransferSizeSpec ChunkSizePlanner::plan(uint64_t total_size, uint64_t requested_part_size) const {
  TransferSizeSpec spec;
  spec.part_size = plan_part_size(total_size, requested_part_size);
  spec.part_count = std::max<uint64_t>(1, part_count(total_size, spec.part_size));
  return spec;
}

}  // namespace transfer
}  // namespace parcel
