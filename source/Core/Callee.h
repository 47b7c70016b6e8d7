//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Callee_h
#define seedrl_Callee_h

#include "Core/StepFields.h"
#include <future>

namespace seedrl
{

// Answer to one submitted step.
struct Response
{
  Uint sourceID = 0;           // echo of the id the request was made for
  learnerStatus status = WORK; // KILL asks the caller to stop its loop
  Sint trainingSteps = 0;      // model version that chose the action
  Rvec action;

  bool shutdown() const { return status == KILL; }
};

// Remote operations that a learner offers to its actors. Implemented by the
// coordinator itself and by the MPI proxy that actors talk to.
class Callee
{
public:
  virtual ~Callee() {}

  virtual void checkIn(const Uint callerID, const Uint rank) = 0;
  virtual void checkOut(const Uint callerID) = 0;

  // At most one request per source may be outstanding: the caller must have
  // obtained the previous response of sourceID before submitting again.
  virtual std::future<Response> submit(const Uint sourceID,
    const FieldMap& observation, const FieldMap& metrics) = 0;
};

} // end namespace seedrl
#endif // seedrl_Callee_h
