//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_DropOffQueue_h
#define seedrl_DropOffQueue_h

#include "Utils/Definitions.h"
#include <atomic>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace seedrl
{

// Bounded FIFO of completed trajectories. When full, pushing evicts the
// oldest entry: producers never wait and a slow consumer sees fresh data.
template<typename T>
class DropOffQueue
{
  const Uint capacity;
  mutable std::mutex queue_mutex;
  std::deque<T> queue;
  std::atomic<long> nPushed {0};
  std::atomic<long> nEvicted {0};

public:
  DropOffQueue(const Uint _capacity) : capacity(_capacity)
  {
    if(capacity == 0) throw std::invalid_argument("DropOffQueue of capacity 0");
  }

  void push(T && item)
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if(queue.size() >= capacity) {
      queue.pop_front();
      ++nEvicted;
    }
    queue.push_back(std::move(item));
    ++nPushed;
  }

  // Pops exactly n oldest entries into out, or nothing if fewer are queued.
  bool popMany(const Uint n, std::vector<T>& out)
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if(n == 0 || queue.size() < n) return false;
    out.reserve(out.size() + n);
    for(Uint i=0; i<n; ++i) {
      out.push_back(std::move(queue.front()));
      queue.pop_front();
    }
    return true;
  }

  Uint size() const
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return queue.size();
  }

  Uint maxSize() const { return capacity; }
  long nTotalPushed() const { return nPushed.load(); }
  long nTotalEvicted() const { return nEvicted.load(); }
};

} // end namespace seedrl
#endif // seedrl_DropOffQueue_h
