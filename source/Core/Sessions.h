//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Sessions_h
#define seedrl_Sessions_h

#include "Utils/Definitions.h"
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace seedrl
{

// Logic errors in the caller/callee protocol.
struct ProtocolError : public std::runtime_error
{
  explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

struct DuplicateSessionError : public ProtocolError
{
  explicit DuplicateSessionError(const Uint callerID) : ProtocolError(
    "caller " + std::to_string(callerID) + " is already checked in") {}
};

struct UnknownSessionError : public ProtocolError
{
  explicit UnknownSessionError(const Uint callerID) : ProtocolError(
    "caller " + std::to_string(callerID) + " is not checked in") {}
};

struct Session
{
  Uint callerID;
  Uint rank;
  bool alive;
};

class SessionRegistry
{
  mutable std::mutex sessions_mutex;
  mutable std::condition_variable sessions_cv;
  std::map<Uint, Session> sessions;
  Uint nCheckedIn = 0;

public:
  void checkIn(const Uint callerID, const Uint rank);
  void checkOut(const Uint callerID);

  Uint size() const;
  // number of check-ins since construction
  Uint nTotalCheckedIn() const;
  bool contains(const Uint callerID) const;

  // Waits for every session to check out, at most `seconds`.
  // Returns false on timeout.
  bool waitUntilEmpty(const Real seconds) const;
};

} // end namespace seedrl
#endif // seedrl_Sessions_h
