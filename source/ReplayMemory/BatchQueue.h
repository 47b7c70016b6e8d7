//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_BatchQueue_h
#define seedrl_BatchQueue_h

#include "Utils/Definitions.h"
#include <atomic>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <unistd.h>

namespace seedrl
{

// Bounded FIFO between batch assembly and training. Nobody blocks on it:
// a producer that finds it full retries a bounded number of times and then
// discards its item.
template<typename T>
class BatchQueue
{
  const Uint capacity;
  mutable std::mutex queue_mutex;
  std::deque<T> queue;
  std::atomic<long> nDropped {0};

public:
  BatchQueue(const Uint _capacity) : capacity(_capacity)
  {
    if(capacity == 0) throw std::invalid_argument("BatchQueue of capacity 0");
  }

  // item is left untouched if the queue is full
  bool tryPush(T && item)
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if(queue.size() >= capacity) return false;
    queue.push_back(std::move(item));
    return true;
  }

  bool tryPop(T & item)
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if(queue.empty()) return false;
    item = std::move(queue.front());
    queue.pop_front();
    return true;
  }

  // Up to maxTries attempts separated by backoffUs microseconds. Stops
  // retrying early if abort becomes true. Returns false if item was dropped.
  bool push(T && item, const Uint maxTries, const Uint backoffUs,
            const std::atomic<bool> * const abort = nullptr)
  {
    for(Uint i=0; i<maxTries; ++i) {
      if(tryPush(std::move(item))) return true;
      if(abort not_eq nullptr && abort->load()) break;
      if(i+1 < maxTries && backoffUs > 0) usleep(backoffUs);
    }
    ++nDropped;
    return false;
  }

  Uint size() const
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return queue.size();
  }

  Uint maxSize() const { return capacity; }
  long nTotalDropped() const { return nDropped.load(); }
};

} // end namespace seedrl
#endif // seedrl_BatchQueue_h
