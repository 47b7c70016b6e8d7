//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Watchdog_h
#define seedrl_Watchdog_h

#include "Utils/Definitions.h"

namespace seedrl
{

// Detects a pipeline in which nothing moves: queued training batches,
// queued trajectories and requests in flight all keep the same value.
class Watchdog
{
  const Uint threshold;
  Uint stallCounter = 0;
  Uint lastBatches = 0, lastDropOffs = 0, lastRequests = 0;
  bool triggered = false;

public:
  explicit Watchdog(const Uint stallThreshold) : threshold(stallThreshold) {}

  // Called once per training-loop iteration. Returns true, and keeps
  // returning true, once the three depths were unchanged for more than
  // `threshold` consecutive calls.
  bool check(const Uint nBatches, const Uint nDropOffs, const Uint nRequests);

  Uint stallCount() const { return stallCounter; }
  bool hasTriggered() const { return triggered; }
};

} // end namespace seedrl
#endif // seedrl_Watchdog_h
