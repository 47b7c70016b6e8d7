//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_TrainingBatch_h
#define seedrl_TrainingBatch_h

#include "ReplayMemory/Trajectory.h"

namespace seedrl
{

// nTrajectories trajectories stacked along the batch dimension. Each field
// is stored time-major: element (t, b, c) is at (t*nTrajectories + b)*dim + c
struct TrainingBatch
{
  Uint nTrajectories = 0;
  Uint maxLength = 0;
  std::vector<Sint> trajectoryIDs;
  std::vector<Uint> sourceIDs;
  std::vector<Uint> currentLength;

  std::map<std::string, Uint> dims;
  std::map<std::string, Fvec> data;

  // all trajectories must share maxLength and layout
  static TrainingBatch stack(const std::vector<Trajectory>& trajectories);

  Uint totalLength() const;

  Uint dim(const std::string& key) const { return dims.at(key); }
  bool has(const std::string& key) const { return dims.count(key) > 0; }

  const Fval* ptr(const std::string& key, const Uint t, const Uint b) const
  {
    return data.at(key).data() + (t*nTrajectories + b) * dims.at(key);
  }
  Fval at(const std::string& key, const Uint t, const Uint b,
          const Uint comp = 0) const
  {
    return ptr(key, t, b)[comp];
  }
};

} // end namespace seedrl
#endif // seedrl_TrainingBatch_h
