// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TransferCoordinator using a mocked part transfer client
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "transfer_coordinator.hpp"
#include "transfer_mocks.hpp"

using namespace parcel::transfer;
using namespace parcel::transfer::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

namespace {

PartResult succeed(const PartTask& part) {
  return PartResult::Success(part.part_number, "etag-" + std::to_string(part.part_number));
}

std::vector<uint64_t> part_numbers(const std::vector<PartResult>& results) {
  std::vector<uint64_t> numbers;
  for (const auto& r : results) {
    numbers.push_back(r.part_number);
  }
  return numbers;
}

std::vector<uint64_t> sequence(uint64_t count) {
  std::vector<uint64_t> numbers;
  for (uint64_t i = 1; i <= count; ++i) {
    numbers.push_back(i);
  }
  return numbers;
}

}  // namespace

class TransferCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    client_ = std::make_shared<NiceMock<MockPartTransferClient>>();
    ON_CALL(*client_, describe()).WillByDefault(Return("bucket/key"));
    ON_CALL(*client_, begin(_, _, _)).WillByDefault(Return(true));
    ON_CALL(*client_, transfer_part(_)).WillByDefault(Invoke(succeed));
    ON_CALL(*client_, complete(_)).WillByDefault(Return(true));

    config_.part_size = 10;
    config_.num_workers = 3;
    config_.queue_capacity = 4;
    config_.poll_interval = std::chrono::milliseconds(10);
  }

  std::shared_ptr<NiceMock<MockPartTransferClient>> client_;
  TransferConfig config_;
};

TEST_F(TransferCoordinatorTest, TransfersAllPartsAndCompletesInOrder) {
  TransferCoordinator coordinator(config_, client_);

  std::vector<PartResult> completed;
  EXPECT_CALL(*client_, begin(95, 10, 10)).WillOnce(Return(true));
  EXPECT_CALL(*client_, transfer_part(_)).Times(10);
  EXPECT_CALL(*client_, complete(_)).WillOnce(DoAll(SaveArg<0>(&completed), Return(true)));
  EXPECT_CALL(*client_, abort()).Times(0);

  TransferReport report = coordinator.start_transfer(95);

  EXPECT_TRUE(report.success) << report.error_message;
  EXPECT_EQ(report.part_size, 10u);
  EXPECT_EQ(report.part_count, 10u);
  EXPECT_EQ(report.parts_completed, 10u);
  EXPECT_EQ(report.parts_failed, 0u);
  EXPECT_EQ(report.bytes_transferred, 95u);
  EXPECT_TRUE(report.error_message.empty());

  EXPECT_EQ(part_numbers(completed), sequence(10));
  EXPECT_EQ(completed[4].etag, "etag-5");

  EXPECT_FALSE(coordinator.isRunning());
  EXPECT_EQ(coordinator.stats().parts_completed.load(), 10u);
  EXPECT_EQ(coordinator.stats().parts_in_flight.load(), 0u);
  EXPECT_EQ(coordinator.stats().parts_queued.load(), 0u);
}

TEST_F(TransferCoordinatorTest, OutOfOrderCompletionIsSorted) {
  ON_CALL(*client_, transfer_part(_)).WillByDefault(Invoke([](const PartTask& part) {
    std::this_thread::sleep_for(std::chrono::milliseconds((part.part_number % 4) * 5));
    return succeed(part);
  }));

  std::vector<PartResult> completed;
  EXPECT_CALL(*client_, complete(_)).WillOnce(DoAll(SaveArg<0>(&completed), Return(true)));

  TransferCoordinator coordinator(config_, client_);
  TransferReport report = coordinator.start_transfer(200, 10, 4);

  ASSERT_TRUE(report.success) << report.error_message;
  EXPECT_EQ(part_numbers(completed), sequence(20));
}

TEST_F(TransferCoordinatorTest, PlannerRaisesPartSizeForLargeObjects) {
  config_.limits.max_parts = 4;
  TransferCoordinator coordinator(config_, client_);

  // 10 -> 20 -> 40 brings 100 bytes down to 3 parts
  EXPECT_CALL(*client_, begin(100, 40, 3)).WillOnce(Return(true));
  EXPECT_CALL(*client_, transfer_part(_)).Times(3);

  TransferReport report = coordinator.start_transfer(100);

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.part_size, 40u);
  EXPECT_EQ(report.part_count, 3u);
}

TEST_F(TransferCoordinatorTest, EmptyObjectIsOneEmptyPart) {
  TransferCoordinator coordinator(config_, client_);

  EXPECT_CALL(*client_, begin(0, 10, 1)).WillOnce(Return(true));
  EXPECT_CALL(*client_, transfer_part(PartTask(1, 0, 0))).WillOnce(Invoke(succeed));
  EXPECT_CALL(*client_, complete(_)).WillOnce(Return(true));

  TransferReport report = coordinator.start_transfer(0);

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.part_count, 1u);
  EXPECT_EQ(report.bytes_transferred, 0u);
}

TEST_F(TransferCoordinatorTest, BoundedQueueStillDeliversEveryPartOnce) {
  config_.queue_capacity = 1;
  TransferCoordinator coordinator(config_, client_);

  std::mutex mutex;
  std::multiset<uint64_t> seen;
  ON_CALL(*client_, transfer_part(_)).WillByDefault(Invoke([&](const PartTask& part) {
    std::lock_guard<std::mutex> lock(mutex);
    seen.insert(part.part_number);
    return succeed(part);
  }));

  TransferReport report = coordinator.start_transfer(500, 10, 2);

  ASSERT_TRUE(report.success) << report.error_message;
  std::multiset<uint64_t> expected;
  for (uint64_t i = 1; i <= 50; ++i) {
    expected.insert(i);
  }
  EXPECT_EQ(seen, expected);
}

TEST_F(TransferCoordinatorTest, UnboundedQueue) {
  config_.queue_capacity = std::nullopt;
  TransferCoordinator coordinator(config_, client_);

  TransferReport report = coordinator.start_transfer(1000);

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.parts_completed, 100u);
}

TEST_F(TransferCoordinatorTest, FailedPartAbortsTransfer) {
  ON_CALL(*client_, transfer_part(_)).WillByDefault(Invoke([](const PartTask& part) {
    if (part.part_number == 3) {
      return PartResult::Failure(part.part_number, "boom", "InternalError");
    }
    return succeed(part);
  }));

  EXPECT_CALL(*client_, complete(_)).Times(0);
  EXPECT_CALL(*client_, abort()).Times(1);

  TransferCoordinator coordinator(config_, client_);
  TransferReport report = coordinator.start_transfer(95);

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.parts_failed, 1u);
  EXPECT_LT(report.parts_completed, 10u);
  EXPECT_EQ(report.error_message, "Part 3 failed: boom");
  EXPECT_FALSE(coordinator.isRunning());
}

TEST_F(TransferCoordinatorTest, ClientExceptionFailsPart) {
  ON_CALL(*client_, transfer_part(_))
    .WillByDefault(Throw(std::runtime_error("connection reset")));

  std::vector<PartResult> failures;
  std::mutex mutex;
  EXPECT_CALL(*client_, abort()).Times(1);

  TransferCoordinator coordinator(config_, client_);
  coordinator.setCallback([&](const PartTask&, const PartResult& result) {
    std::lock_guard<std::mutex> lock(mutex);
    failures.push_back(result);
  });

  TransferReport report = coordinator.start_transfer(95, 10, 1);

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.error_message, "Part 1 failed: connection reset");
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].error_code, "ClientException");
  EXPECT_FALSE(failures[0].success);
}

TEST_F(TransferCoordinatorTest, BeginFailureSkipsParts) {
  EXPECT_CALL(*client_, begin(_, _, _)).WillOnce(Return(false));
  EXPECT_CALL(*client_, transfer_part(_)).Times(0);
  EXPECT_CALL(*client_, complete(_)).Times(0);

  TransferCoordinator coordinator(config_, client_);
  TransferReport report = coordinator.start_transfer(95);

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.error_message, "Failed to begin transfer of bucket/key");
}

TEST_F(TransferCoordinatorTest, BeginExceptionIsReported) {
  EXPECT_CALL(*client_, begin(_, _, _)).WillOnce(Throw(std::runtime_error("no such bucket")));
  EXPECT_CALL(*client_, transfer_part(_)).Times(0);

  TransferCoordinator coordinator(config_, client_);
  TransferReport report = coordinator.start_transfer(95);

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.error_message, "Failed to begin transfer of bucket/key: no such bucket");
}

TEST_F(TransferCoordinatorTest, RejectedCompletionAborts) {
  EXPECT_CALL(*client_, complete(_)).WillOnce(Return(false));
  EXPECT_CALL(*client_, abort()).Times(1);

  TransferCoordinator coordinator(config_, client_);
  TransferReport report = coordinator.start_transfer(95);

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.parts_completed, 10u);
  EXPECT_EQ(report.error_message, "Store rejected completion of bucket/key");
}

TEST_F(TransferCoordinatorTest, CancelStopsTransfer) {
  config_.queue_capacity = 4;
  TransferCoordinator coordinator(config_, client_);

  ON_CALL(*client_, transfer_part(_)).WillByDefault(Invoke([&](const PartTask& part) {
    coordinator.cancel();
    return succeed(part);
  }));
  EXPECT_CALL(*client_, transfer_part(_)).Times(1);
  EXPECT_CALL(*client_, complete(_)).Times(0);
  EXPECT_CALL(*client_, abort()).Times(1);

  TransferReport report = coordinator.start_transfer(1000, 10, 1);

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.parts_completed, 1u);
  EXPECT_EQ(report.error_message, "Transfer cancelled");
}

TEST_F(TransferCoordinatorTest, CancelOnceRunningIsNotLost) {
  TransferCoordinator coordinator(config_, client_);

  std::atomic<bool> cancelled{false};
  ON_CALL(*client_, begin(_, _, _)).WillByDefault(Invoke([&](uint64_t, uint64_t, uint64_t) {
    while (!cancelled) {
      std::this_thread::yield();
    }
    return true;
  }));
  EXPECT_CALL(*client_, transfer_part(_)).Times(0);
  EXPECT_CALL(*client_, complete(_)).Times(0);
  EXPECT_CALL(*client_, abort()).Times(1);

  // Cancel as soon as the flag flips, racing the start-up reset
  std::thread canceller([&] {
    while (!coordinator.isRunning()) {
      std::this_thread::yield();
    }
    coordinator.cancel();
    cancelled = true;
  });

  TransferReport report = coordinator.start_transfer(95);
  canceller.join();

  EXPECT_FALSE(report.success);
  EXPECT_EQ(report.parts_completed, 0u);
  EXPECT_EQ(report.error_message, "Transfer cancelled");
}

TEST_F(TransferCoordinatorTest, QueuedCountStaysWithinPartCount) {
  config_.queue_capacity = std::nullopt;
  TransferCoordinator coordinator(config_, client_);

  std::atomic<bool> done{false};
  std::atomic<uint64_t> max_queued{0};
  std::thread monitor([&] {
    while (!done) {
      uint64_t queued = coordinator.stats().parts_queued.load();
      if (queued > max_queued) {
        max_queued = queued;
      }
    }
  });

  TransferReport report = coordinator.start_transfer(10000, 10, 8);
  done = true;
  monitor.join();

  ASSERT_TRUE(report.success) << report.error_message;
  EXPECT_EQ(report.part_count, 1000u);
  EXPECT_LE(max_queued.load(), 1000u);
  EXPECT_EQ(coordinator.stats().parts_queued.load(), 0u);
  EXPECT_EQ(coordinator.stats().parts_in_flight.load(), 0u);
}

TEST_F(TransferCoordinatorTest, SecondTransferWhileRunningIsRefused) {
  TransferCoordinator coordinator(config_, client_);

  TransferReport nested;
  std::atomic<bool> attempted{false};
  ON_CALL(*client_, transfer_part(_)).WillByDefault(Invoke([&](const PartTask& part) {
    if (!attempted.exchange(true)) {
      EXPECT_TRUE(coordinator.isRunning());
      nested = coordinator.start_transfer(10);
    }
    return succeed(part);
  }));

  TransferReport report = coordinator.start_transfer(95);

  EXPECT_TRUE(report.success);
  EXPECT_FALSE(nested.success);
  EXPECT_EQ(nested.error_message, "Transfer already in progress");
}

TEST_F(TransferCoordinatorTest, CoordinatorIsReusable) {
  TransferCoordinator coordinator(config_, client_);

  EXPECT_TRUE(coordinator.start_transfer(95).success);
  TransferReport second = coordinator.start_transfer(30);
  EXPECT_TRUE(second.success);
  EXPECT_EQ(second.parts_completed, 3u);
  EXPECT_EQ(coordinator.stats().parts_completed.load(), 3u);
}

TEST_F(TransferCoordinatorTest, CallbackSeesEveryPart) {
  TransferCoordinator coordinator(config_, client_);

  std::atomic<int> calls{0};
  std::atomic<uint64_t> bytes{0};
  coordinator.setCallback([&](const PartTask& part, const PartResult& result) {
    EXPECT_TRUE(result.success);
    calls++;
    bytes += part.length;
  });

  coordinator.start_transfer(95);

  EXPECT_EQ(calls.load(), 10);
  EXPECT_EQ(bytes.load(), 95u);
}

TEST_F(TransferCoordinatorTest, InvalidArgumentsThrow) {
  TransferCoordinator coordinator(config_, client_);

  EXPECT_THROW(coordinator.start_transfer(95, 10, 0), std::invalid_argument);
  EXPECT_THROW(coordinator.start_transfer(95, 10, kMaxWorkers + 1), std::invalid_argument);
  EXPECT_THROW(coordinator.start_transfer(95, 0, 2), std::invalid_argument);
  EXPECT_FALSE(coordinator.isRunning());

  // A rejected call leaves the coordinator usable
  EXPECT_TRUE(coordinator.start_transfer(95).success);
}

TEST_F(TransferCoordinatorTest, MaxWorkersIsAccepted) {
  TransferCoordinator coordinator(config_, client_);

  TransferReport report = coordinator.start_transfer(95, 10, kMaxWorkers);

  EXPECT_TRUE(report.success) << report.error_message;
  EXPECT_EQ(report.parts_completed, 10u);
}

TEST(TransferCoordinatorConstructionTest, NullClientThrows) {
  TransferConfig config;
  EXPECT_THROW(TransferCoordinator(config, nullptr), std::invalid_argument);
}

TEST(TransferCoordinatorConstructionTest, InvalidLimitsThrow) {
  TransferConfig config;
  config.limits.max_parts = 0;
  auto client = std::make_shared<NiceMock<MockPartTransferClient>>();
  EXPECT_THROW(TransferCoordinator(config, client), std::invalid_argument);
}
