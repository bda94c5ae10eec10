// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

#define PARCEL_LOG_COMPONENT "transfer_coordinator"
#include <parcel_log_macros.hpp>

namespace parcel {
namespace transfer {

using ::parcel::logging::kv;

namespace {

// Clears the running flag on every exit path of start_transfer()
class RunningGuard {
public:
  explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~RunningGuard() { flag_ = false; }

  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

private:
  std::atomic<bool>& flag_;
};

}  // namespace

TransferCoordinator::TransferCoordinator(
  const TransferConfig& config, std::shared_ptr<IPartTransferClient> client
)
    : config_(config)
    , planner_(config.limits)
    , client_(std::move(client)) {
  if (!client_) {
    throw std::invalid_argument("TransferCoordinator requires a part transfer client");
  }
}

TransferCoordinator::~TransferCoordinator() { cancel(); }

TransferReport TransferCoordinator::start_transfer(uint64_t total_size) {
  return start_transfer(total_size, config_.part_size, config_.num_workers);
}

TransferReport TransferCoordinator::start_transfer(
  uint64_t total_size, uint64_t requested_part_size, int worker_count
) {
  if (worker_count < 1 || worker_count > kMaxWorkers) {
    throw std::invalid_argument(
      "worker_count must be between 1 and " + std::to_string(kMaxWorkers)
    );
  }

  TransferReport report;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_.exchange(true)) {
      report.error_message = "Transfer already in progress";
      return report;
    }
    resetState();
  }
  RunningGuard guard(running_);

  const std::string transfer_id = client_->describe();
  PARCEL_LOG_SCOPED_TRANSFER(transfer_id);

  TransferSizeSpec spec = planner_.plan(total_size, requested_part_size);
  report.part_size = spec.part_size;
  report.part_count = spec.part_count;

  if (spec.part_size != requested_part_size) {
    PARCEL_LOG_INFO(
      "Adjusted part size to fit transfer limits" << kv("requested", requested_part_size)
                                                  << kv("part_size", spec.part_size)
                                                  << kv("max_parts", config_.limits.max_parts)
    );
  }
  PARCEL_LOG_INFO(
    "Starting transfer" << kv("size", total_size) << kv("part_size", spec.part_size)
                        << kv("parts", spec.part_count) << kv("workers", worker_count)
  );

  try {
    if (!client_->begin(total_size, spec.part_size, spec.part_count)) {
      report.error_message = "Failed to begin transfer of " + transfer_id;
      PARCEL_LOG_ERROR(report.error_message);
      return report;
    }
  } catch (const std::exception& e) {
    report.error_message = "Failed to begin transfer of " + transfer_id + ": " + e.what();
    PARCEL_LOG_ERROR(report.error_message);
    return report;
  }

  TaskQueue<WorkItem> queue(config_.queue_capacity);

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(worker_count));
  try {
    for (int i = 0; i < worker_count; ++i) {
      workers.emplace_back(
        &TransferCoordinator::workerLoop, this, i, std::ref(queue), std::cref(transfer_id)
      );
    }
  } catch (const std::system_error& e) {
    // Started workers see the stop flag at their next poll
    stop_requested_ = true;
    PARCEL_LOG_ERROR(
      "Cannot start worker" << kv("started", workers.size()) << kv("error", e.what())
    );
    std::lock_guard<std::mutex> lock(results_mutex_);
    first_error_ = std::string("Failed to start workers: ") + e.what();
  }

  if (!stop_requested_) {
    produceParts(queue, total_size, spec.part_size, worker_count);
  }

  for (auto& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  finishTransfer(report);
  return report;
}

void TransferCoordinator::cancel() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  stop_requested_ = true;
}

bool TransferCoordinator::isRunning() const { return running_.load(); }

const TransferStats& TransferCoordinator::stats() const { return stats_; }

void TransferCoordinator::setCallback(PartCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

const TransferConfig& TransferCoordinator::config() const { return config_; }

void TransferCoordinator::workerLoop(
  int worker_id, TaskQueue<WorkItem>& queue, const std::string& transfer_id
) {
  PARCEL_LOG_SCOPED_TRANSFER(transfer_id);
  PARCEL_LOG_DEBUG("Worker started" << kv("worker", worker_id));

  while (!stop_requested_) {
    auto result = queue.get(true, config_.poll_interval);
    if (!result.ok()) {
      continue;  // Empty within the poll interval, re-check the stop flag
    }
    if (!result.item->has_value()) {
      break;  // Sentinel
    }

    const PartTask& part = **result.item;
    stats_.parts_queued--;
    stats_.parts_in_flight++;

    PartResult part_result = transferOne(part);
    recordResult(part, part_result);

    stats_.parts_in_flight--;
  }

  PARCEL_LOG_DEBUG("Worker exiting" << kv("worker", worker_id));
}

void TransferCoordinator::produceParts(
  TaskQueue<WorkItem>& queue, uint64_t total_size, uint64_t part_size, int worker_count
) {
  PartTaskGenerator parts(total_size, part_size);
  PartTask part;
  while (parts.next(part)) {
    // Counted before the put so a worker's decrement can never run first
    stats_.parts_queued++;
    if (!putUntilStopped(queue, WorkItem(part))) {
      stats_.parts_queued--;
      PARCEL_LOG_WARN(
        "Stopped producing parts" << kv("produced", parts.produced() - 1)
                                  << kv("total", parts.total_parts())
      );
      return;
    }
  }

  for (int i = 0; i < worker_count; ++i) {
    if (!putUntilStopped(queue, std::nullopt)) {
      return;
    }
  }
}

bool TransferCoordinator::putUntilStopped(TaskQueue<WorkItem>& queue, WorkItem item) {
  while (!stop_requested_) {
    // A failed put leaves item intact, so it can be offered again
    if (queue.put(std::move(item), true, config_.poll_interval) == QueueStatus::ok) {
      return true;
    }
  }
  return false;
}

PartResult TransferCoordinator::transferOne(const PartTask& part) {
  try {
    PartResult result = client_->transfer_part(part);
    result.part_number = part.part_number;
    return result;
  } catch (const std::exception& e) {
    return PartResult::Failure(part.part_number, e.what(), "ClientException");
  }
}

void TransferCoordinator::recordResult(const PartTask& part, const PartResult& result) {
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    if (result.success) {
      results_.push_back(result);
    } else if (first_error_.empty()) {
      first_error_ = "Part " + std::to_string(part.part_number) + " failed: " +
                     result.error_message;
    }
  }

  if (result.success) {
    stats_.parts_completed++;
    stats_.bytes_transferred += part.length;
    PARCEL_LOG_DEBUG(
      "Part transferred" << kv("part", part.part_number) << kv("offset", part.offset)
                         << kv("length", part.length)
    );
  } else {
    stats_.parts_failed++;
    stop_requested_ = true;
    PARCEL_LOG_ERROR(
      "Part transfer failed" << kv("part", part.part_number) << kv("error", result.error_message)
                             << kv("code", result.error_code)
    );
  }

  std::lock_guard<std::mutex> lock(callback_mutex_);
  if (callback_) {
    callback_(part, result);
  }
}

void TransferCoordinator::finishTransfer(TransferReport& report) {
  report.parts_completed = stats_.parts_completed.load();
  report.parts_failed = stats_.parts_failed.load();
  report.bytes_transferred = stats_.bytes_transferred.load();

  std::vector<PartResult> results;
  std::string first_error;
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    results = results_;
    first_error = first_error_;
  }

  if (!stop_requested_ && report.parts_completed == report.part_count) {
    std::sort(results.begin(), results.end(), [](const PartResult& a, const PartResult& b) {
      return a.part_number < b.part_number;
    });

    try {
      if (client_->complete(results)) {
        report.success = true;
        PARCEL_LOG_INFO(
          "Transfer completed" << kv("parts", report.part_count)
                               << kv("bytes", report.bytes_transferred)
        );
        return;
      }
      report.error_message = "Store rejected completion of " + client_->describe();
    } catch (const std::exception& e) {
      report.error_message = "Failed to complete " + client_->describe() + ": " + e.what();
    }
  } else if (!first_error.empty()) {
    report.error_message = first_error;
  } else {
    report.error_message = "Transfer cancelled";
  }

  PARCEL_LOG_ERROR(
    "Transfer aborted" << kv("error", report.error_message)
                       << kv("completed", report.parts_completed)
                       << kv("parts", report.part_count)
  );
  try {
    client_->abort();
  } catch (const std::exception& e) {
    PARCEL_LOG_WARN("Abort failed" << kv("error", e.what()));
  }
}

void TransferCoordinator::resetState() {
  stop_requested_ = false;
  stats_.parts_queued = 0;
  stats_.parts_in_flight = 0;
  stats_.parts_completed = 0;
  stats_.parts_failed = 0;
  stats_.bytes_transferred = 0;

  std::lock_guard<std::mutex> lock(results_mutex_);
  results_.clear();
  first_error_.clear();
}

}  // namespace transfer
}  // namespace parcel
