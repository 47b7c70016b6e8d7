//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Prefetcher_h
#define seedrl_Prefetcher_h

#include "Learners/EpisodeTracker.h"
#include "ReplayMemory/BatchQueue.h"
#include "ReplayMemory/DropOffQueue.h"
#include "ReplayMemory/TrainingBatch.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

namespace seedrl
{

// Background assembly of training batches. All threads share prefetch_mutex
// around the pop from the drop-off queue, so every trajectory is taken once.
// Stacking and enqueueing happen outside of it.
class Prefetcher
{
  DropOffQueue<Trajectory>& dropOff;
  BatchQueue<TrainingBatch>& batchQueue;
  EpisodeTracker& tracker;
  const std::atomic<bool>& shutdown;

  const Uint batchSize;
  const Uint waitUs;
  const Uint maxTries;

  std::mutex prefetch_mutex;
  std::vector<std::thread> threads;

  std::atomic<Sint> nAssembled {0};
  std::atomic<Sint> nEnqueued {0};
  std::atomic<int64_t> fetchingTimeNs {0};

  void loop();

public:
  Prefetcher(DropOffQueue<Trajectory>& dropOff,
             BatchQueue<TrainingBatch>& batchQueue, EpisodeTracker& tracker,
             const std::atomic<bool>& shutdown, const Uint batchSize,
             const Uint waitMs, const Uint maxTries);
  ~Prefetcher();

  void start(const Uint nThreads);
  // threads exit at their next loop boundary once shutdown is set
  void join();

  // One assembly attempt on the calling thread. Returns false, without
  // popping anything, if fewer than batchSize trajectories are queued.
  bool assembleOnce();

  Sint batchesAssembled() const { return nAssembled.load(); }
  Sint batchesEnqueued() const { return nEnqueued.load(); }
  Real fetchingTime() const { return fetchingTimeNs.load() * 1e-9; }
};

} // end namespace seedrl
#endif // seedrl_Prefetcher_h
