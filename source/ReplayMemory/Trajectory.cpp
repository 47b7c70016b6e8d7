//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Trajectory.h"
#include <algorithm>

namespace seedrl
{

Trajectory::Trajectory(const StepLayout& layout, const Uint _maxLength,
  const Uint _sourceID, const Sint _ID) : maxLength(_maxLength),
  sourceID(_sourceID), ID(_ID), dims(layout)
{
  for(const auto& f : dims) data[f.first] = Fvec(maxLength * f.second, 0);
}

void Trajectory::write(const FieldMap& fields, const Uint t)
{
  for(const auto& f : fields)
  {
    if(not f.second.numeric) continue;
    const auto D = dims.find(f.first);
    if(D == dims.end()) continue;
    if(f.second.dim() not_eq D->second)
      throw std::invalid_argument("field '" + f.first + "' has width "
        + std::to_string(f.second.dim()) + ", trajectory stores "
        + std::to_string(D->second));
    std::copy(f.second.values.begin(), f.second.values.end(),
              data[f.first].begin() + t * D->second);
  }
}

void Trajectory::append(const FieldMap& state, const FieldMap& metrics)
{
  if(currentLength >= maxLength)
    throw std::overflow_error("append to full trajectory of source "
      + std::to_string(sourceID) + " (length " + std::to_string(maxLength) + ")");
  write(state, currentLength);
  write(metrics, currentLength);
  ++currentLength;
}

void Trajectory::reset(const Sint newID)
{
  for(auto& f : data) std::fill(f.second.begin(), f.second.end(), 0);
  ID = newID;
  currentLength = 0;
  complete = false;
}

} // end namespace seedrl
