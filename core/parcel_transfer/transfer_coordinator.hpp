// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_TRANSFER_COORDINATOR_HPP
#define PARCEL_TRANSFER_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunk_size_planner.hpp"
#include "part_task.hpp"
#include "task_queue.hpp"
#include "transfer_interfaces.hpp"

namespace parcel {
namespace transfer {

// Upper bound on concurrent part transfers per coordinator
constexpr int kMaxWorkers = 256;

/**
 * Configuration for the Transfer Coordinator
 */
struct TransferConfig {
  // Requested part size; the planner may raise it for large objects
  uint64_t part_size = 8 * MiB;

  // Worker configuration
  int num_workers = 10;

  // Maximum number of parts buffered ahead of the workers (std::nullopt = unbounded)
  std::optional<size_t> queue_capacity = 1000;

  // How often blocked producers and idle workers re-check the stop flag
  std::chrono::milliseconds poll_interval{100};

  TransferLimits limits;
};

/**
 * Outcome of one object transfer
 */
struct TransferReport {
  bool success = false;
  uint64_t part_size = 0;
  uint64_t part_count = 0;
  uint64_t parts_completed = 0;
  uint64_t parts_failed = 0;
  uint64_t bytes_transferred = 0;
  std::string error_message;
};

/**
 * Live counters, readable from any thread while a transfer runs
 */
struct TransferStats {
  std::atomic<uint64_t> parts_queued{0};
  std::atomic<uint64_t> parts_in_flight{0};
  std::atomic<uint64_t> parts_completed{0};
  std::atomic<uint64_t> parts_failed{0};
  std::atomic<uint64_t> bytes_transferred{0};
};

/**
 * Called by worker threads after every part, successful or not
 */
using PartCallback = std::function<void(const PartTask& part, const PartResult& result)>;

/**
 * Transfer Coordinator - moves one object through an IPartTransferClient
 *
 * Plans the part size, starts a fixed pool of workers, feeds them one task
 * per part through a bounded TaskQueue, and finally completes or aborts the
 * transfer on the client.
 *
 * Threading Model:
 * - The calling thread is the single producer; it blocks while the queue is
 *   full, which bounds memory regardless of object size
 * - Each worker loops on a blocking get(); a std::nullopt entry tells one
 *   worker to exit
 * - Parts may finish in any order; results are sorted by part number
 *   before complete()
 *
 * The first failed part stops the transfer: the producer stops feeding the
 * queue and workers exit at their next poll. cancel() does the same from
 * another thread. An in-flight transfer_part() call is never interrupted.
 *
 * Usage:
 *   TransferCoordinator coordinator(config, client);
 *   TransferReport report = coordinator.start_transfer(object_size);
 */
class TransferCoordinator {
public:
  /**
   * @throws std::invalid_argument if client is null or config.limits are invalid
   */
  TransferCoordinator(const TransferConfig& config, std::shared_ptr<IPartTransferClient> client);
  ~TransferCoordinator();

  // Non-copyable, non-movable
  TransferCoordinator(const TransferCoordinator&) = delete;
  TransferCoordinator& operator=(const TransferCoordinator&) = delete;
  TransferCoordinator(TransferCoordinator&&) = delete;
  TransferCoordinator& operator=(TransferCoordinator&&) = delete;

  /**
   * Transfer an object of total_size bytes. Blocks until every worker exits.
   *
   * @param total_size Object size in bytes
   * @param requested_part_size Preferred part size; raised if needed to fit the limits
   * @param worker_count Number of concurrent part transfers
   * @throws std::invalid_argument if requested_part_size is zero or worker_count
   *         is outside [1, kMaxWorkers]
   */
  TransferReport start_transfer(uint64_t total_size, uint64_t requested_part_size, int worker_count);

  /**
   * Transfer using the configured part size and worker count
   */
  TransferReport start_transfer(uint64_t total_size);

  /**
   * Ask a running transfer to stop. Thread-safe. A call that returns after
   * isRunning() became true is never lost to the start-up reset.
   */
  void cancel();

  bool isRunning() const;

  const TransferStats& stats() const;

  void setCallback(PartCallback callback);

  const TransferConfig& config() const;

private:
  // Queue entry; std::nullopt is the per-worker exit sentinel
  using WorkItem = std::optional<PartTask>;

  void workerLoop(int worker_id, TaskQueue<WorkItem>& queue, const std::string& transfer_id);

  // Feed every part and then one sentinel per worker. Returns early on stop.
  void produceParts(
    TaskQueue<WorkItem>& queue, uint64_t total_size, uint64_t part_size, int worker_count
  );

  // Blocking put that gives up when a stop is requested
  bool putUntilStopped(TaskQueue<WorkItem>& queue, WorkItem item);

  PartResult transferOne(const PartTask& part);

  void recordResult(const PartTask& part, const PartResult& result);

  // Complete or abort on the client and fill in the report
  void finishTransfer(TransferReport& report);

  // Must be called with state_mutex_ held
  void resetState();

  TransferConfig config_;
  ChunkSizePlanner planner_;
  std::shared_ptr<IPartTransferClient> client_;

  // Orders cancel() against the running_/stop_requested_ reset in start_transfer()
  std::mutex state_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};

  TransferStats stats_;

  std::mutex results_mutex_;
  std::vector<PartResult> results_;
  std::string first_error_;

  PartCallback callback_;
  std::mutex callback_mutex_;
};

}  // namespace transfer
}  // namespace parcel

#endif  // PARCEL_TRANSFER_COORDINATOR_HPP
