//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Sessions.h"
#include "Utils/Warnings.h"
#include <chrono>

namespace seedrl
{

void SessionRegistry::checkIn(const Uint callerID, const Uint rank)
{
  std::lock_guard<std::mutex> lock(sessions_mutex);
  if(sessions.count(callerID)) throw DuplicateSessionError(callerID);
  sessions[callerID] = Session{callerID, rank, true};
  ++nCheckedIn;
  debugS("caller %u from rank %u checked in", callerID, rank);
}

void SessionRegistry::checkOut(const Uint callerID)
{
  {
    std::lock_guard<std::mutex> lock(sessions_mutex);
    const auto it = sessions.find(callerID);
    if(it == sessions.end()) throw UnknownSessionError(callerID);
    sessions.erase(it);
    debugS("caller %u checked out, %zu left", callerID, sessions.size());
  }
  sessions_cv.notify_all();
}

Uint SessionRegistry::size() const
{
  std::lock_guard<std::mutex> lock(sessions_mutex);
  return sessions.size();
}

Uint SessionRegistry::nTotalCheckedIn() const
{
  std::lock_guard<std::mutex> lock(sessions_mutex);
  return nCheckedIn;
}

bool SessionRegistry::contains(const Uint callerID) const
{
  std::lock_guard<std::mutex> lock(sessions_mutex);
  return sessions.count(callerID) > 0;
}

bool SessionRegistry::waitUntilEmpty(const Real seconds) const
{
  std::unique_lock<std::mutex> lock(sessions_mutex);
  const auto timeout = std::chrono::duration<Real>(seconds);
  return sessions_cv.wait_for(lock, timeout, [&]() { return sessions.empty(); });
}

} // end namespace seedrl
