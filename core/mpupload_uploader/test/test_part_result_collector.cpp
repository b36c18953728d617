// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for PartResultCollector
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "part_result_collector.hpp"

using namespace mpupload::uploader;

TEST(PartResultCollectorTest, ReturnsResultsInArrivalOrder) {
  PartResultCollector collector(1);
  collector.push(PartResult::Success(3, "etag-3", 10));
  collector.push(PartResult::Success(1, "etag-1", 10));
  collector.producerDone();

  auto first = collector.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->part_number, 3);

  auto second = collector.next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->part_number, 1);

  EXPECT_FALSE(collector.next().has_value());
}

TEST(PartResultCollectorTest, NoProducersMeansImmediateEnd) {
  PartResultCollector collector(0);
  EXPECT_FALSE(collector.next().has_value());
}

TEST(PartResultCollectorTest, DrainsPendingResultsAfterProducersFinish) {
  PartResultCollector collector(2);
  collector.push(PartResult::Failure(2, "boom", "InternalError"));
  collector.producerDone();
  collector.producerDone();

  auto result = collector.next();
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->success);
  EXPECT_EQ(result->error_code, "InternalError");
  EXPECT_FALSE(collector.next().has_value());
}

TEST(PartResultCollectorTest, NextBlocksUntilProducerPushes) {
  PartResultCollector collector(1);
  std::atomic<bool> pushed{false};

  std::thread producer([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pushed.store(true);
    collector.push(PartResult::Success(1, "etag-1", 5));
    collector.producerDone();
  });

  auto result = collector.next();
  EXPECT_TRUE(pushed.load());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->etag, "etag-1");

  producer.join();
  EXPECT_FALSE(collector.next().has_value());
}

TEST(PartResultCollectorTest, CancelIsVisibleToProducers) {
  PartResultCollector collector(1);
  EXPECT_FALSE(collector.cancelled());
  collector.cancel();
  EXPECT_TRUE(collector.cancelled());

  // Cancelling does not drop results that are still pushed.
  collector.push(PartResult::Success(4, "etag-4", 1));
  collector.producerDone();
  auto result = collector.next();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->part_number, 4);
}

TEST(PartResultCollectorTest, ManyProducersEveryResultDeliveredOnce) {
  constexpr int kProducers = 8;
  constexpr int kPerProducer = 50;
  PartResultCollector collector(kProducers);

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&collector, p]() {
      for (int i = 0; i < kPerProducer; ++i) {
        const int part = p * kPerProducer + i + 1;
        collector.push(PartResult::Success(part, "etag", 1));
      }
      collector.producerDone();
    });
  }

  std::set<int> seen;
  while (auto result = collector.next()) {
    EXPECT_TRUE(seen.insert(result->part_number).second);
  }
  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(seen.size(), static_cast<size_t>(kProducers * kPerProducer));
}
