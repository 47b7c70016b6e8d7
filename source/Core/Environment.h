//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Environment_h
#define seedrl_Environment_h

#include "Core/StepFields.h"

namespace seedrl
{

// A simulation stepped by an actor. Every state carries at least the fields
// observation, reward, done, episode_id, episode_step and episode_return.
// The state returned by initial() has done set and episode_step 0. When an
// episode ends, step() returns done set with the step count and return of
// the finished episode, and the observation that starts the next one.
class Environment
{
public:
  virtual ~Environment() {}
  virtual FieldMap initial() = 0;
  virtual FieldMap step(const Rvec& action) = 0;
  virtual void close() = 0;
};

} // end namespace seedrl
#endif // seedrl_Environment_h
