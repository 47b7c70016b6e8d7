//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "ReplayMemory/DropOffQueue.h"
#include "ReplayMemory/BatchQueue.h"

#include <gtest/gtest.h>
#include <thread>

using namespace seedrl;

TEST(DropOffQueue, EvictsOldestWhenFull)
{
  DropOffQueue<int> queue(3);
  for(int i=0; i<5; ++i) queue.push(std::move(i));
  EXPECT_EQ(queue.size(), 3u);
  EXPECT_EQ(queue.nTotalPushed(), 5);
  EXPECT_EQ(queue.nTotalEvicted(), 2);

  std::vector<int> out;
  ASSERT_TRUE(queue.popMany(3, out));
  EXPECT_EQ(out, std::vector<int>({2, 3, 4}));
}

TEST(DropOffQueue, PopManyIsAllOrNothing)
{
  DropOffQueue<int> queue(4);
  queue.push(1);
  queue.push(2);
  std::vector<int> out;
  EXPECT_FALSE(queue.popMany(3, out));
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(queue.size(), 2u);
  EXPECT_FALSE(queue.popMany(0, out));
  EXPECT_TRUE(queue.popMany(2, out));
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_THROW(DropOffQueue<int>(0), std::invalid_argument);
}

TEST(DropOffQueue, ConcurrentProducersNeverExceedCapacity)
{
  DropOffQueue<int> queue(16);
  std::vector<std::thread> producers;
  for(int p=0; p<4; ++p)
    producers.emplace_back([&queue, p] () {
      for(int i=0; i<1000; ++i) queue.push(p*1000 + i);
    });
  for(auto& t : producers) t.join();
  EXPECT_EQ(queue.size(), 16u);
  EXPECT_EQ(queue.nTotalPushed(), 4000);
  EXPECT_EQ(queue.nTotalEvicted(), 4000 - 16);
}

TEST(BatchQueue, SecondBatchIsDroppedWhenNobodyDrains)
{
  BatchQueue<std::vector<double>> queue(1);
  EXPECT_TRUE(queue.push(std::vector<double>(4, 1.0), 3, 100));
  EXPECT_FALSE(queue.push(std::vector<double>(4, 2.0), 3, 100));
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_EQ(queue.nTotalDropped(), 1);

  std::vector<double> batch;
  ASSERT_TRUE(queue.tryPop(batch));
  EXPECT_EQ(batch[0], 1.0);
  EXPECT_FALSE(queue.tryPop(batch));
}

TEST(BatchQueue, FailedTryPushKeepsItem)
{
  BatchQueue<std::vector<int>> queue(1);
  std::vector<int> first {1}, second {2, 3};
  EXPECT_TRUE(queue.tryPush(std::move(first)));
  EXPECT_FALSE(queue.tryPush(std::move(second)));
  EXPECT_EQ(second.size(), 2u);
}

TEST(BatchQueue, PushSucceedsOnceConsumerDrains)
{
  BatchQueue<int> queue(1);
  queue.tryPush(1);
  std::thread consumer([&queue] () {
    usleep(5000);
    int item;
    queue.tryPop(item);
  });
  EXPECT_TRUE(queue.push(2, 1000, 1000));
  consumer.join();
  EXPECT_EQ(queue.nTotalDropped(), 0);
}

TEST(BatchQueue, AbortFlagStopsRetrying)
{
  BatchQueue<int> queue(1);
  queue.tryPush(1);
  const std::atomic<bool> stop {true};
  EXPECT_FALSE(queue.push(2, 1000000, 1000000, &stop));
  EXPECT_EQ(queue.nTotalDropped(), 1);
}
