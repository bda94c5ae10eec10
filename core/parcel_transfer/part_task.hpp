// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_PART_TASK_HPP
#define PARCEL_PART_TASK_HPP

#include <cstdint>
#include <vector>

namespace parcel {
namespace transfer {

/**
 * One byte range of an object, transferred independently of the others
 */
struct PartTask {
  uint64_t part_number = 0;  // 1-based, as used by multipart APIs
  uint64_t offset = 0;       // First byte of the range
  uint64_t length = 0;       // Number of bytes in the range

  PartTask() = default;
  PartTask(uint64_t number, uint64_t off, uint64_t len)
      : part_number(number)
      , offset(off)
      , length(len) {}

  bool operator==(const PartTask& other) const {
    return part_number == other.part_number && offset == other.offset &&
           length == other.length;
  }
};

/**
 * Produces the parts of an object in order without materializing them all.
 * Every part is part_size bytes except the last, which gets the remainder.
 * An empty object yields a single zero-length part.
 *
 * Usage:
 *   PartTaskGenerator parts(object_size, part_size);
 *   PartTask part;
 *   while (parts.next(part)) { ... }
 */
class PartTaskGenerator {
public:
  /**
   * @throws std::invalid_argument if part_size is zero
   */
  PartTaskGenerator(uint64_t total_size, uint64_t part_size);

  /**
   * @return true and fills task while parts remain, false once exhausted
   */
  bool next(PartTask& task);

  uint64_t total_parts() const { return total_parts_; }

  uint64_t produced() const { return next_part_ - 1; }

private:
  uint64_t total_size_;
  uint64_t part_size_;
  uint64_t total_parts_;
  uint64_t next_part_ = 1;
};

/**
 * All parts of an object, in order.
 */
std::vector<PartTask> split_into_parts(uint64_t total_size, uint64_t part_size);

}  // namespace transfer
}  // namespace parcel

#endif  // PARCEL_PART_TASK_HPP
