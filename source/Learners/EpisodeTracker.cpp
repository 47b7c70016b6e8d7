//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "EpisodeTracker.h"
#include "Utils/Warnings.h"

namespace seedrl
{

EpisodeTracker::EpisodeTracker(MetricLogger * const L,
  EpisodeRecorder * const R) : logger(L), recorder(R) { }

void EpisodeTracker::logTrajectory(const Trajectory& traj)
{
  ++nTrajectories;

  if(traj.has("done") && traj.has("episode_step"))
    for(Uint t=0; t<traj.currentLength; ++t)
      if(traj.at("done", t) not_eq 0 && traj.at("episode_step", t) > 0)
        logEpisode(traj, t);

  if(recorder == nullptr) return;
  try {
    recorder->record(traj);
  } catch(const std::exception& e) {
    ++nErrors;
    _warn("recording trajectory %ld of source %u failed: %s",
      traj.ID, traj.sourceID, e.what());
  }
}

void EpisodeTracker::logEpisode(const Trajectory& traj, const Uint t)
{
  ++nEpisodes;
  const auto value = [&](const char* key) -> double {
    return traj.has(key) ? traj.at(key, t) : 0.0;
  };

  if(traj.has("latency")) {
    std::lock_guard<std::mutex> lock(stats_mutex);
    ++nLatencySamples;
    meanLatency += (value("latency") - meanLatency) / nLatencySamples;
  }

  if(logger == nullptr) return;
  const MetricRecord record = {
    {"episode_id",     value("episode_id")},
    {"return",         value("episode_return")},
    {"length",         value("episode_step")},
    {"training_steps", value("training_steps")},
    {"source_id",      (double) traj.sourceID}
  };
  try {
    logger->log("episodes", record);
  } catch(const std::exception& e) {
    ++nErrors;
    _warn("logging episode of source %u failed: %s", traj.sourceID, e.what());
  }
}

Real EpisodeTracker::meanInferenceLatency() const
{
  std::lock_guard<std::mutex> lock(stats_mutex);
  return meanLatency;
}

} // end namespace seedrl
