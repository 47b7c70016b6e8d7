//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Core/Master.h"
#include "Core/Worker.h"
#include "Fakes.h"

#include <gtest/gtest.h>
#include <thread>

using namespace seedrl;

namespace
{

Settings quickSettings()
{
  Settings S;
  S.rolloutLength = 5;
  S.batchSizeTraining = 2;
  S.batchSizeInference = 4;
  S.prefetchWaitMs = 1;
  S.prefetchMaxTries = 5;
  S.loopSleepMs = 1;
  S.stallThreshold = 100000;
  S.checkoutTimeout = 5;
  S.maxWallTime = 60;
  return S;
}

// nActors actors with nEnvs environments each, stepping in their own threads
struct ActorPool
{
  std::vector<std::thread> threads;
  std::atomic<int> nFailed {0};
  std::atomic<Sint> nSteps {0};

  ActorPool(Callee& callee, const Uint nActors, const Uint nEnvs,
            const Uint episodeLength)
  {
    Callee * const C = &callee;
    for(Uint a=0; a<nActors; ++a)
      threads.emplace_back([this, C, a, nEnvs, episodeLength] () {
        std::vector<std::unique_ptr<Environment>> envs;
        for(Uint i=0; i<nEnvs; ++i)
          envs.emplace_back(new fakes::CountingEnv(a*nEnvs + i, episodeLength));
        Worker actor(*C, std::move(envs), a, a+1, a*nEnvs);
        try {
          actor.run();
        } catch(const std::exception&) {
          ++nFailed;
        }
        nSteps += actor.stepsDone();
      });
  }

  void join() { for(auto& t : threads) t.join(); }
};

const FieldMap placeholder = fakes::CountingEnv(0, 4).initial();

}

TEST(Master, TrainsUntilMaxEpochs)
{
  Settings S = quickSettings();
  S.maxEpochs = 3;
  fakes::EchoModel model;
  fakes::MemoryLogger logger;
  Master master(S, model, placeholder, {0, 1, 2, 3}, &logger);
  EXPECT_EQ(master.status(), Master::IDLE);

  master.start();
  ActorPool actors(master, 2, 2, 4);
  master.run();
  actors.join();

  EXPECT_EQ(master.status(), Master::STOPPED);
  EXPECT_EQ(actors.nFailed.load(), 0);
  EXPECT_GE(master.trainingEpoch(), 3);
  EXPECT_EQ(model.nTrained.load(), master.trainingEpoch());
  EXPECT_EQ(model.nSyncs.load(), model.nTrained.load());
  EXPECT_EQ(model.lastBatchSize.load(), 2u);
  EXPECT_GT(master.trainingSteps(), 0);
  EXPECT_EQ(master.shutdownCause(), "reached maximum number of training epochs");
  EXPECT_EQ(master.sessions().size(), 0u);
  EXPECT_EQ(master.sessions().nTotalCheckedIn(), 2u);
  EXPECT_EQ(master.inferenceBatcher().requestsInFlight(), 0u);
  EXPECT_GT(master.episodeTracker().episodesSeen(), 0);

  EXPECT_GE(logger.count("training"), 3u);
  EXPECT_GE(logger.count("system"), 1u);
  EXPECT_GE(logger.count("episodes"), 1u);
  EXPECT_EQ(logger.records["system"].back().size(), 12u);
  EXPECT_GE(logger.nFlushes, 1);
  EXPECT_NE(master.report().find("reached maximum number of training epochs"),
            std::string::npos);
}

TEST(Master, StopsAfterTotalSteps)
{
  Settings S = quickSettings();
  S.totNumSteps = 20;
  fakes::EchoModel model;
  Master master(S, model, placeholder, {0, 1});
  ActorPool actors(master, 1, 2, 3);
  master.run();
  actors.join();
  EXPECT_GE(master.trainingSteps(), 20);
  EXPECT_EQ(master.shutdownCause(), "reached maximum number of training steps");
  EXPECT_EQ(actors.nFailed.load(), 0);
}

TEST(Master, StoredStepsCarryModelOutputs)
{
  fakes::EchoModel model;
  const StepLayout layout = Master::placeholderLayout(model, placeholder);
  EXPECT_EQ(layout.at("observation"), 2u);
  EXPECT_EQ(layout.at("action"), 1u);
  EXPECT_EQ(layout.at("training_steps"), 1u);
  EXPECT_EQ(layout.at("latency"), 1u);
  EXPECT_EQ(layout.at("timestamp"), 1u);
  EXPECT_EQ(layout.at("episode_step"), 1u);
}

TEST(Master, WatchdogEndsAFrozenPipeline)
{
  Settings S = quickSettings();
  S.stallThreshold = 5;
  fakes::EchoModel model;
  Master master(S, model, placeholder, {0});
  master.run();
  EXPECT_TRUE(master.watchdog().hasTriggered());
  EXPECT_EQ(master.shutdownCause(), "CLOSING DUE TO DEAD QUEUES");
  EXPECT_EQ(master.status(), Master::STOPPED);
  EXPECT_EQ(master.trainingEpoch(), 0);
  const TaskQueue& tasks = master.housekeeping();
  EXPECT_EQ(tasks.runs("watchdog"), 1);
  EXPECT_EQ(tasks.runs("stop_criteria"), tasks.iterations());
  EXPECT_EQ(tasks.runs("system_log"), tasks.iterations());
}

TEST(Master, ModelFailureStopsTraining)
{
  Settings S = quickSettings();
  S.checkoutTimeout = 0.2;
  fakes::EchoModel model;
  Master master(S, model, placeholder, {0, 1});
  model.bFail = true;
  ActorPool actors(master, 1, 2, 4);
  EXPECT_THROW(master.run(), std::runtime_error);
  actors.join();
  EXPECT_EQ(actors.nFailed.load(), 1);
  EXPECT_EQ(master.status(), Master::STOPPED);
  EXPECT_EQ(master.shutdownCause(), "model evaluation failed");
}

TEST(Master, RejectsDuplicateSessions)
{
  fakes::EchoModel model;
  Master master(quickSettings(), model, placeholder, {0});
  master.checkIn(4, 1);
  EXPECT_THROW(master.checkIn(4, 1), DuplicateSessionError);
  master.checkOut(4);
  EXPECT_THROW(master.checkOut(4), UnknownSessionError);
}

TEST(Master, FewSourcesStillFillTrainingBatches)
{
  Settings S = quickSettings();
  S.rolloutLength = 2;
  S.batchSizeTraining = 4;
  S.maxEpochs = 2;
  fakes::EchoModel model;
  Master master(S, model, placeholder, {0});
  EXPECT_EQ(master.trajectoryStore().dropOff().maxSize(), 4u);

  ActorPool actors(master, 1, 1, 3);
  master.run();
  actors.join();
  EXPECT_EQ(master.shutdownCause(), "reached maximum number of training epochs");
  EXPECT_GE(master.trainingEpoch(), 2);
  EXPECT_EQ(model.lastBatchSize.load(), 4u);
  EXPECT_EQ(actors.nFailed.load(), 0);
}

TEST(Settings, DropOffCapacityFitsOneBatch)
{
  Settings S;
  S.batchSizeTraining = 4;
  EXPECT_EQ(S.dropOffCapacity(1), 4u);
  EXPECT_EQ(S.dropOffCapacity(16), 16u);
  S.maxQueuedDrops = 8;
  EXPECT_EQ(S.dropOffCapacity(1), 8u);
  S.maxQueuedDrops = 2;
  EXPECT_EQ(S.dropOffCapacity(32), 4u);
}
