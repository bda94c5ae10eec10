// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_TASK_QUEUE_HPP
#define PARCEL_TASK_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace parcel {
namespace transfer {

/**
 * Outcome of a queue operation
 */
enum class QueueStatus {
  ok,     // Item was inserted or removed
  full,   // Bounded queue had no room (immediately or before the timeout)
  empty,  // Queue had no item (immediately or before the timeout)
};

inline const char* to_string(QueueStatus status) {
  switch (status) {
    case QueueStatus::ok:
      return "ok";
    case QueueStatus::full:
      return "full";
    case QueueStatus::empty:
      return "empty";
  }
  return "unknown";
}

/**
 * Result of TaskQueue::get(). item is set only when status is ok.
 */
template <typename T>
struct QueueResult {
  QueueStatus status = QueueStatus::empty;
  std::optional<T> item;

  bool ok() const { return status == QueueStatus::ok; }
};

/**
 * Thread-safe FIFO hand-off between part producers and transfer workers.
 *
 * With a capacity the queue applies backpressure: put() on a full queue
 * either fails at once (block = false) or waits for a consumer to make
 * room. Without a capacity put() always succeeds.
 *
 * Both put() and get() report Full/Empty through QueueStatus instead of
 * throwing; callers decide whether to retry, back off or stop.
 *
 * Any number of producers and consumers may share one queue. Every entry is
 * delivered to exactly one get() call, in the order the put() calls completed.
 * There is no closed state; consumers are stopped by the caller, for example
 * with a sentinel entry.
 */
template <typename T>
class TaskQueue {
public:
  using Timeout = std::optional<std::chrono::milliseconds>;

  /**
   * @param capacity Maximum number of buffered entries, std::nullopt = unbounded
   * @throws std::invalid_argument if capacity is zero
   */
  explicit TaskQueue(std::optional<size_t> capacity = std::nullopt)
      : capacity_(capacity) {
    if (capacity_ && *capacity_ == 0) {
      throw std::invalid_argument("TaskQueue capacity must be positive");
    }
  }

  // Non-copyable, non-movable
  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;
  TaskQueue(TaskQueue&&) = delete;
  TaskQueue& operator=(TaskQueue&&) = delete;

  /**
   * Append an item.
   *
   * @param item Moved into the queue on success, left untouched on failure
   * @param block Wait for room when the queue is full
   * @param timeout Upper bound on the wait (std::nullopt = wait forever).
   *                Negative values behave like zero.
   * @return QueueStatus::ok, or QueueStatus::full if no room was available
   */
  QueueStatus put(T&& item, bool block = true, Timeout timeout = std::nullopt) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto has_room = [this] { return !is_full_locked(); };
    if (!has_room()) {
      if (!block) {
        return QueueStatus::full;
      }
      if (!wait_for(not_full_, lock, timeout, has_room)) {
        return QueueStatus::full;
      }
    }

    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return QueueStatus::ok;
  }

  /**
   * Remove the oldest item.
   *
   * @param block Wait for an item when the queue is empty
   * @param timeout Upper bound on the wait (std::nullopt = wait forever).
   *                Negative values behave like zero.
   * @return The item with QueueStatus::ok, or QueueStatus::empty
   */
  QueueResult<T> get(bool block = true, Timeout timeout = std::nullopt) {
    std::unique_lock<std::mutex> lock(mutex_);

    QueueResult<T> result;
    auto has_item = [this] { return !items_.empty(); };
    if (!has_item()) {
      if (!block) {
        return result;
      }
      if (!wait_for(not_empty_, lock, timeout, has_item)) {
        return result;
      }
    }

    result.item.emplace(std::move(items_.front()));
    result.status = QueueStatus::ok;
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return result;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
  }

  bool full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_full_locked();
  }

  std::optional<size_t> capacity() const { return capacity_; }

private:
  // Must be called with mutex held
  bool is_full_locked() const { return capacity_ && items_.size() >= *capacity_; }

  template <typename Predicate>
  static bool wait_for(
    std::condition_variable& cv, std::unique_lock<std::mutex>& lock, const Timeout& timeout,
    Predicate ready
  ) {
    if (!timeout) {
      cv.wait(lock, ready);
      return true;
    }
    auto wait = *timeout < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero()
                                                             : *timeout;
    return cv.wait_until(lock, std::chrono::steady_clock::now() + wait, ready);
  }

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  const std::optional<size_t> capacity_;
};

}  // namespace transfer
}  // namespace parcel

#endif  // PARCEL_TASK_QUEUE_HPP
