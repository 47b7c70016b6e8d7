//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Worker_h
#define seedrl_Worker_h

#include "Core/Callee.h"
#include "Core/Environment.h"
#include <memory>

namespace seedrl
{

// The actor: steps its environments with the actions chosen by a learner.
// Environment i is the source firstSourceID + i.
class Worker
{
public:
  Worker(Callee& callee, std::vector<std::unique_ptr<Environment>> envs,
         const Uint callerID, const Uint rank, const Uint firstSourceID);
  virtual ~Worker() {}

  // Check in, act until the learner answers KILL, check out, close envs.
  // If a cycle throws (bad answer, failed model evaluation, transport error)
  // the session is still closed and the environments released, then the
  // error is rethrown.
  virtual void run();

  // One cycle: a request for every environment, then every answer in order.
  // Throws ProtocolError if an answer is for another source.
  // Returns false once the learner asked to stop.
  bool act();

  Uint nEnvironments() const { return envs.size(); }
  Sint stepsDone() const { return nSteps; }

protected:
  Callee& callee;
  std::vector<std::unique_ptr<Environment>> envs;
  const Uint callerID;
  const Uint rank;
  const Uint firstSourceID;

  std::vector<FieldMap> states;
  std::vector<Real> latencies;
  Sint nSteps = 0;
  bool bInitialized = false;

  void abortSession();
  void closeEnvironments();
};

} // end namespace seedrl
#endif // seedrl_Worker_h
