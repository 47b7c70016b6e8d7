//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "TrainingBatch.h"
#include <algorithm>
#include <numeric>

namespace seedrl
{

TrainingBatch TrainingBatch::stack(const std::vector<Trajectory>& trajectories)
{
  TrainingBatch ret;
  if(trajectories.empty()) return ret;

  const Uint B = trajectories.size(), T = trajectories[0].maxLength;
  ret.nTrajectories = B;
  ret.maxLength = T;
  ret.dims = trajectories[0].dims;
  for(const auto& traj : trajectories) {
    if(traj.maxLength not_eq T || traj.dims not_eq ret.dims)
      throw std::invalid_argument("cannot stack trajectories of different shape");
    ret.trajectoryIDs.push_back(traj.ID);
    ret.sourceIDs.push_back(traj.sourceID);
    ret.currentLength.push_back(traj.currentLength);
  }

  for(const auto& f : ret.dims)
  {
    const std::string& key = f.first;
    const Uint D = f.second;
    Fvec& out = ret.data[key];
    out.resize(T * B * D);
    std::vector<const Fval*> sources(B);
    for(Uint b=0; b<B; ++b) sources[b] = trajectories[b].data.at(key).data();
    #pragma omp parallel for schedule(static)
    for(Uint b=0; b<B; ++b) {
      const Fval* const src = sources[b];
      for(Uint t=0; t<T; ++t)
        std::copy(src + t*D, src + (t+1)*D, out.begin() + (t*B + b)*D);
    }
  }
  return ret;
}

Uint TrainingBatch::totalLength() const
{
  return std::accumulate(currentLength.begin(), currentLength.end(), (Uint) 0);
}

} // end namespace seedrl
