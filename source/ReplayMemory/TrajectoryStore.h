//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_TrajectoryStore_h
#define seedrl_TrajectoryStore_h

#include "Core/SourceIndex.h"
#include "ReplayMemory/DropOffQueue.h"
#include "ReplayMemory/Trajectory.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace seedrl
{

// One live trajectory per source, allocated once and reused. A completed
// trajectory is copied into the drop-off queue and its slot is reset.
class TrajectoryStore
{
  struct Slot
  {
    std::mutex slot_mutex;
    Trajectory trajectory;
  };

  const SourceIndex& sources;
  const StepLayout layout;
  const Uint rolloutLength;

  std::vector<std::unique_ptr<Slot>> slots;
  std::atomic<Sint> trajectoryCounter {0};
  DropOffQueue<Trajectory> dropOffQueue;

public:
  // dropOffCapacity = 0 means one entry per owned source
  TrajectoryStore(const SourceIndex& sources, const StepLayout& layout,
                  const Uint rolloutLength, const Uint dropOffCapacity = 0);

  // Appends one step to the live trajectory of sourceID. It is complete if
  // done is set with episode_step > 0; complete or full trajectories are
  // dropped off and the slot is reset. Steps of one source are serialized,
  // different sources proceed in parallel.
  void addToEntry(const Uint sourceID, const FieldMap& state,
                  const FieldMap& metrics);

  DropOffQueue<Trajectory>& dropOff() { return dropOffQueue; }
  const DropOffQueue<Trajectory>& dropOff() const { return dropOffQueue; }

  // copy of the live trajectory of sourceID
  Trajectory live(const Uint sourceID) const;
  Uint currentLength(const Uint sourceID) const;

  const StepLayout& stepLayout() const { return layout; }
  Uint maxLength() const { return rolloutLength; }
  // number of trajectories created so far, live ones included
  Sint nTrajectories() const { return trajectoryCounter.load(); }
};

} // end namespace seedrl
#endif // seedrl_TrajectoryStore_h
