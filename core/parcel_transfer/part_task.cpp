// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_task.hpp"

#include <algorithm>
#include <stdexcept>

#include "chunk_size_planner.hpp"

namespace parcel {
namespace transfer {

PartTaskGenerator::PartTaskGenerator(uint64_t total_size, uint64_t part_size)
    : total_size_(total_size)
    , part_size_(part_size)
    , total_parts_(std::max<uint64_t>(1, part_count(total_size, part_size))) {}

bool PartTaskGenerator::next(PartTask& task) {
  if (next_part_ > total_parts_) {
    return false;
  }

  const uint64_t offset = (next_part_ - 1) * part_size_;
  task.part_number = next_part_;
  task.offset = offset;
  task.length = std::min(part_size_, total_size_ - offset);
  ++next_part_;
  return true;
}

std::vector<PartTask> split_into_parts(uint64_t total_size, uint64_t part_size) {
  PartTaskGenerator generator(total_size, part_size);
  std::vector<PartTask> parts;
  parts.reserve(generator.total_parts());

  PartTask task;
  while (generator.next(task)) {
    parts.push_back(task);
  }
  return parts;
}

}  // namespace transfer
}  // namespace parcel
