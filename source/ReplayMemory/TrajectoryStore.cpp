//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "TrajectoryStore.h"
#include "Utils/Warnings.h"

namespace seedrl
{

TrajectoryStore::TrajectoryStore(const SourceIndex& S, const StepLayout& L,
  const Uint rollout, const Uint dropOffCapacity) : sources(S), layout(L),
  rolloutLength(rollout),
  dropOffQueue(dropOffCapacity>0 ? dropOffCapacity : S.size())
{
  if(rolloutLength == 0)
    throw std::invalid_argument("trajectories need a positive rollout length");
  slots.reserve(sources.size());
  for(Uint i=0; i<sources.size(); ++i) {
    slots.emplace_back(new Slot());
    slots[i]->trajectory = Trajectory(layout, rolloutLength,
                                      sources.sourceID(i), trajectoryCounter++);
  }
}

void TrajectoryStore::addToEntry(const Uint sourceID, const FieldMap& state,
                                 const FieldMap& metrics)
{
  Slot& slot = * slots[sources.slot(sourceID)];
  std::lock_guard<std::mutex> lock(slot.slot_mutex);
  Trajectory& traj = slot.trajectory;

  traj.append(state, metrics);

  const bool done = scalarOr(state, "done", 0) not_eq 0;
  const bool inEpisode = scalarOr(state, "episode_step", 0) > 0;
  if(done && inEpisode) traj.complete = true;

  if(traj.complete || traj.isFull())
  {
    debugS("source %u drops off trajectory %ld of length %u",
      sourceID, traj.ID, traj.currentLength);
    Trajectory copy = traj;
    dropOffQueue.push(std::move(copy));
    traj.reset(trajectoryCounter++);
  }
}

Trajectory TrajectoryStore::live(const Uint sourceID) const
{
  Slot& slot = * slots[sources.slot(sourceID)];
  std::lock_guard<std::mutex> lock(slot.slot_mutex);
  return slot.trajectory;
}

Uint TrajectoryStore::currentLength(const Uint sourceID) const
{
  Slot& slot = * slots[sources.slot(sourceID)];
  std::lock_guard<std::mutex> lock(slot.slot_mutex);
  return slot.trajectory.currentLength;
}

} // end namespace seedrl
