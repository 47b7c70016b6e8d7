//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Watchdog.h"
#include "Utils/Warnings.h"

namespace seedrl
{

bool Watchdog::check(const Uint nBatches, const Uint nDropOffs,
                     const Uint nRequests)
{
  if(nBatches == lastBatches && nDropOffs == lastDropOffs &&
     nRequests == lastRequests)
    ++stallCounter;
  else {
    stallCounter = 0;
    lastBatches = nBatches;
    lastDropOffs = nDropOffs;
    lastRequests = nRequests;
  }

  if(stallCounter > threshold && not triggered) {
    triggered = true;
    _warn("queues unchanged for %u iterations (batches:%u drop-offs:%u "
      "requests:%u)", stallCounter, nBatches, nDropOffs, nRequests);
  }
  return triggered;
}

} // end namespace seedrl
