//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Settings_h
#define seedrl_Settings_h

#include "Utils/Definitions.h"
#include "Utils/MPIUtilities.h"

#include <random>
#include <string>

namespace CLI { class App; }

namespace seedrl
{

struct DistributionInfo
{
  DistributionInfo(int argc, char** argv);
  ~DistributionInfo();

  void initializeOpts(CLI::App & parser);
  void figureOutRoles();
  void initialzePRNG();

  int argc;
  char** argv;

  Uint world_rank;
  Uint world_size;

  int threadSafety = -1;

  bool bIsLearner = false;
  // index of this rank among the learners or among the actors
  Uint learnerIndex = 0;
  Uint actorIndex = 0;
  Uint nActors = 0;
  // world rank of the learner that serves this actor
  Uint learnerRank = 0;

  // global ids of the environments stepped by the actors of this learner
  std::vector<Uint> ownedSourceIDs() const;
  // global id of the first environment stepped by this actor
  Uint firstSourceID() const { return actorIndex * nEnvironments; }

  std::mt19937 generator;

#define COMMENT_nLearners "Number of learner ranks (batched inference and \
training). The first nLearners ranks are learners, all others are actors."
#define DEFAULT_nLearners 1
  Uint nLearners = DEFAULT_nLearners;

#define COMMENT_nEnvironments "Number of environments stepped by each actor \
rank. Each environment is one source of trajectories."
#define DEFAULT_nEnvironments 1
  Uint nEnvironments = DEFAULT_nEnvironments;

#define COMMENT_randSeed "Random seed. If 0, rank 0 draws one and broadcasts it."
#define DEFAULT_randSeed 0
  Uint randSeed = DEFAULT_randSeed;
};

struct Settings
{
  void check();
  void initializeOpts(CLI::App & parser);

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO DATA COLLECTION
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_rolloutLength "Maximum number of steps in one trajectory."
#define DEFAULT_rolloutLength 80
  Uint rolloutLength = DEFAULT_rolloutLength;

#define COMMENT_batchSizeTraining "Number of trajectories per training batch."
#define DEFAULT_batchSizeTraining 4
  Uint batchSizeTraining = DEFAULT_batchSizeTraining;

#define COMMENT_batchSizeInference "Maximum number of requests evaluated \
together by one call to the model."
#define DEFAULT_batchSizeInference 16
  Uint batchSizeInference = DEFAULT_batchSizeInference;

#define COMMENT_maxQueuedBatches "Capacity of the queue of training batches. \
Batches assembled while it is full are dropped after prefetchMaxTries."
#define DEFAULT_maxQueuedBatches 128
  Uint maxQueuedBatches = DEFAULT_maxQueuedBatches;

#define COMMENT_maxQueuedDrops "Capacity of the queue of completed \
trajectories, the oldest is evicted when full. If 0, one per source, but \
never fewer than batchSizeTraining."
#define DEFAULT_maxQueuedDrops 0
  Uint maxQueuedDrops = DEFAULT_maxQueuedDrops;

  // Drop-off capacity of a learner that serves nSources environments.
  // Must fit one training batch, otherwise trajectories are only evicted.
  Uint dropOffCapacity(const Uint nSources) const
  {
    const Uint capacity = maxQueuedDrops>0 ? maxQueuedDrops : nSources;
    return capacity<batchSizeTraining ? batchSizeTraining : capacity;
  }

#define COMMENT_nPrefetchers "Number of threads assembling training batches."
#define DEFAULT_nPrefetchers 1
  Uint nPrefetchers = DEFAULT_nPrefetchers;

#define COMMENT_nInferenceThreads "Number of threads evaluating requests."
#define DEFAULT_nInferenceThreads 1
  Uint nInferenceThreads = DEFAULT_nInferenceThreads;

#define COMMENT_prefetchWaitMs "Milliseconds a batch-assembly thread sleeps \
when it finds too few trajectories or a full training queue."
#define DEFAULT_prefetchWaitMs 100
  Uint prefetchWaitMs = DEFAULT_prefetchWaitMs;

#define COMMENT_prefetchMaxTries "Attempts to enqueue a training batch before \
it is dropped."
#define DEFAULT_prefetchMaxTries 50
  Uint prefetchMaxTries = DEFAULT_prefetchMaxTries;

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO THE TRAINING LOOP AND SHUTDOWN
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_loopSleepMs "Milliseconds the training loop sleeps when no \
batch is ready."
#define DEFAULT_loopSleepMs 10
  Uint loopSleepMs = DEFAULT_loopSleepMs;

#define COMMENT_stallThreshold "Number of consecutive training-loop iterations \
with unchanged queues after which the pipeline is declared dead."
#define DEFAULT_stallThreshold 100
  Uint stallThreshold = DEFAULT_stallThreshold;

#define COMMENT_maxEpochs "Stop after this many training steps. Off if <= 0."
#define DEFAULT_maxEpochs -1
  Sint maxEpochs = DEFAULT_maxEpochs;

#define COMMENT_totNumSteps "Stop after training on this many environment \
steps. Off if <= 0."
#define DEFAULT_totNumSteps -1
  Sint totNumSteps = DEFAULT_totNumSteps;

#define COMMENT_maxWallTime "Stop after this many seconds. Off if <= 0."
#define DEFAULT_maxWallTime -1
  Real maxWallTime = DEFAULT_maxWallTime;

#define COMMENT_checkoutTimeout "Seconds to wait at shutdown for actors to \
check out."
#define DEFAULT_checkoutTimeout 10
  Real checkoutTimeout = DEFAULT_checkoutTimeout;

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO OUTPUT
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_systemLogInterval "Training-loop iterations between two \
records of the system channel."
#define DEFAULT_systemLogInterval 1
  Uint systemLogInterval = DEFAULT_systemLogInterval;

#define COMMENT_printInterval "Training steps between two printouts of the \
system metrics, if verbose."
#define DEFAULT_printInterval 10
  Uint printInterval = DEFAULT_printInterval;

#define COMMENT_verbose "Whether to print system metrics during training."
#define DEFAULT_verbose false
  bool verbose = DEFAULT_verbose;

#define COMMENT_savePath "Folder where metric logs are written."
#define DEFAULT_savePath "."
  std::string savePath = DEFAULT_savePath;

#define COMMENT_expName "Name of the experiment, subfolder of savePath."
#define DEFAULT_expName ""
  std::string expName = DEFAULT_expName;

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO THE DEMO POLICY
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_learnrate "Learning rate."
#define DEFAULT_learnrate 0.0006
  Real learnrate = DEFAULT_learnrate;

#define COMMENT_gamma "Discount factor."
#define DEFAULT_gamma 0.99
  Real gamma = DEFAULT_gamma;
};

} // end namespace seedrl
#endif // seedrl_Settings_h
