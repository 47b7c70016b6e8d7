//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "ReplayMemory/Prefetcher.h"
#include "Fakes.h"

#include <gtest/gtest.h>
#include <unistd.h>

using namespace seedrl;

namespace
{

const StepLayout layout = {
  {"observation", 1}, {"done", 1}, {"episode_step", 1},
  {"episode_return", 1}, {"latency", 1}
};

// one episode of `length` steps ending on the last row
Trajectory episode(const Uint sourceID, const Uint length, const Fval latency)
{
  Trajectory traj(layout, length, sourceID, sourceID);
  for(Uint t=0; t<length; ++t) {
    const bool last = t+1 == length;
    const FieldMap state = {
      {"observation",    (Fval) t},
      {"done",           last ? 1.0 : 0.0},
      {"episode_step",   (Fval) t},
      {"episode_return", 2.0 * t}
    };
    traj.append(state, {{"latency", latency}});
  }
  traj.complete = true;
  return traj;
}

struct PrefetcherTest : public ::testing::Test
{
  fakes::MemoryLogger logger;
  fakes::CountingRecorder recorder;
  EpisodeTracker tracker {&logger, &recorder};
  DropOffQueue<Trajectory> dropOff {16};
  BatchQueue<TrainingBatch> batches {4};
  std::atomic<bool> shutdown {false};
};

}

TEST_F(PrefetcherTest, NeverAssemblesPartialBatches)
{
  Prefetcher prefetch(dropOff, batches, tracker, shutdown, 3, 0, 1);
  dropOff.push(episode(0, 4, 0));
  dropOff.push(episode(1, 4, 0));
  EXPECT_FALSE(prefetch.assembleOnce());
  EXPECT_EQ(dropOff.size(), 2u);
  EXPECT_EQ(tracker.trajectoriesSeen(), 0);

  dropOff.push(episode(2, 4, 0));
  EXPECT_TRUE(prefetch.assembleOnce());
  EXPECT_EQ(dropOff.size(), 0u);
  EXPECT_EQ(prefetch.batchesAssembled(), 1);
  EXPECT_EQ(prefetch.batchesEnqueued(), 1);

  TrainingBatch batch;
  ASSERT_TRUE(batches.tryPop(batch));
  EXPECT_EQ(batch.nTrajectories, 3u);
  EXPECT_EQ(batch.sourceIDs, std::vector<Uint>({0, 1, 2}));
}

TEST_F(PrefetcherTest, LogsFinishedEpisodes)
{
  Prefetcher prefetch(dropOff, batches, tracker, shutdown, 2, 0, 1);
  dropOff.push(episode(0, 3, 0.5));
  dropOff.push(episode(1, 5, 1.5));
  ASSERT_TRUE(prefetch.assembleOnce());

  EXPECT_EQ(tracker.trajectoriesSeen(), 2);
  EXPECT_EQ(tracker.episodesSeen(), 2);
  EXPECT_EQ(recorder.nRecorded.load(), 2);
  EXPECT_DOUBLE_EQ(tracker.meanInferenceLatency(), 1.0);
  ASSERT_EQ(logger.count("episodes"), 2u);
  const MetricRecord& second = logger.records["episodes"][1];
  EXPECT_EQ(fakes::value(second, "return"), 8.0);
  EXPECT_EQ(fakes::value(second, "length"), 4.0);
  EXPECT_EQ(fakes::value(second, "source_id"), 1.0);
}

TEST_F(PrefetcherTest, RecorderFailureIsCountedNotThrown)
{
  recorder.bFail = true;
  Prefetcher prefetch(dropOff, batches, tracker, shutdown, 1, 0, 1);
  dropOff.push(episode(0, 2, 0));
  EXPECT_NO_THROW(prefetch.assembleOnce());
  EXPECT_EQ(tracker.errorsReported(), 1);
  EXPECT_EQ(batches.size(), 1u);
}

TEST_F(PrefetcherTest, FullTrainingQueueDropsTheNewBatch)
{
  BatchQueue<TrainingBatch> single(1);
  Prefetcher prefetch(dropOff, single, tracker, shutdown, 1, 0, 2);
  dropOff.push(episode(0, 2, 0));
  dropOff.push(episode(1, 2, 0));
  EXPECT_TRUE(prefetch.assembleOnce());
  EXPECT_TRUE(prefetch.assembleOnce());
  EXPECT_EQ(prefetch.batchesAssembled(), 2);
  EXPECT_EQ(prefetch.batchesEnqueued(), 1);
  EXPECT_EQ(single.size(), 1u);
  EXPECT_EQ(single.nTotalDropped(), 1);

  TrainingBatch batch;
  ASSERT_TRUE(single.tryPop(batch));
  EXPECT_EQ(batch.sourceIDs[0], 0u);
}

TEST_F(PrefetcherTest, ThreadsStopOnShutdown)
{
  Prefetcher prefetch(dropOff, batches, tracker, shutdown, 2, 1, 1);
  prefetch.start(2);
  for(Uint i=0; i<6; ++i) dropOff.push(episode(i, 2, 0));
  for(int wait=0; wait<5000 && prefetch.batchesEnqueued() < 3; ++wait)
    usleep(1000);
  shutdown = true;
  prefetch.join();
  EXPECT_EQ(prefetch.batchesEnqueued(), 3);
  EXPECT_EQ(batches.size(), 3u);
  EXPECT_EQ(tracker.trajectoriesSeen(), 6);
}
