//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_EpisodeTracker_h
#define seedrl_EpisodeTracker_h

#include "ReplayMemory/Trajectory.h"
#include "Utils/MetricLogger.h"
#include <atomic>
#include <mutex>

namespace seedrl
{

// Turns completed trajectories into a visual artifact (video, plot, ...).
class EpisodeRecorder
{
public:
  virtual ~EpisodeRecorder() {}
  virtual void record(const Trajectory& trajectory) = 0;
};

// Bookkeeping of trajectories handed to training: counts them, logs one
// "episodes" record per finished episode and forwards them to the recorder.
// Logger and recorder errors are reported and never propagate.
class EpisodeTracker
{
  MetricLogger * const logger;
  EpisodeRecorder * const recorder;

  std::atomic<Sint> nTrajectories {0};
  std::atomic<Sint> nEpisodes {0};
  std::atomic<Sint> nErrors {0};

  mutable std::mutex stats_mutex;
  Real meanLatency = 0;
  Sint nLatencySamples = 0;

  void logEpisode(const Trajectory& traj, const Uint t);

public:
  EpisodeTracker(MetricLogger * const logger = nullptr,
                 EpisodeRecorder * const recorder = nullptr);

  void logTrajectory(const Trajectory& trajectory);

  Sint trajectoriesSeen() const { return nTrajectories.load(); }
  Sint episodesSeen() const { return nEpisodes.load(); }
  Sint errorsReported() const { return nErrors.load(); }
  // running mean of the "latency" metric of finished episodes
  Real meanInferenceLatency() const;
};

} // end namespace seedrl
#endif // seedrl_EpisodeTracker_h
