//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Prefetcher.h"
#include "Utils/Warnings.h"

#include <chrono>
#include <unistd.h>

namespace seedrl
{

Prefetcher::Prefetcher(DropOffQueue<Trajectory>& D,
  BatchQueue<TrainingBatch>& B, EpisodeTracker& T,
  const std::atomic<bool>& shut, const Uint batch, const Uint waitMs,
  const Uint tries) : dropOff(D), batchQueue(B), tracker(T), shutdown(shut),
  batchSize(batch), waitUs(waitMs * 1000), maxTries(tries)
{
  if(batchSize == 0) throw std::invalid_argument("training batch size 0");
}

Prefetcher::~Prefetcher()
{
  join();
}

void Prefetcher::start(const Uint nThreads)
{
  for(Uint i=0; i<nThreads; ++i) threads.emplace_back([this] () { loop(); });
}

void Prefetcher::join()
{
  for(auto& t : threads) t.join();
  threads.clear();
}

void Prefetcher::loop()
{
  while(not shutdown.load())
    if(not assembleOnce()) usleep(waitUs);
}

bool Prefetcher::assembleOnce()
{
  const auto start = std::chrono::high_resolution_clock::now();
  std::vector<Trajectory> trajectories;
  {
    std::lock_guard<std::mutex> lock(prefetch_mutex);
    if(not dropOff.popMany(batchSize, trajectories)) return false;
    for(const auto& traj : trajectories) tracker.logTrajectory(traj);
  }

  TrainingBatch batch = TrainingBatch::stack(trajectories);
  ++nAssembled;
  fetchingTimeNs += std::chrono::duration_cast<std::chrono::nanoseconds>
    (std::chrono::high_resolution_clock::now() - start).count();

  if(batchQueue.push(std::move(batch), maxTries, waitUs, &shutdown))
    ++nEnqueued;
  else
    debugS("training queue full: dropped a batch of %u trajectories", batchSize);
  return true;
}

} // end namespace seedrl
