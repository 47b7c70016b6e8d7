//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Trajectory_h
#define seedrl_Trajectory_h

#include "Core/StepFields.h"

namespace seedrl
{

// Fixed length window of consecutive steps of one source. Each field of the
// layout is stored as a flat maxLength x dim array, zero where not written.
struct Trajectory
{
  Uint maxLength = 0;
  Uint sourceID = 0;
  Sint ID = 0;
  Uint currentLength = 0;
  bool complete = false;

  std::map<std::string, Uint> dims;
  std::map<std::string, Fvec> data;

  Trajectory() {}
  Trajectory(const StepLayout& layout, const Uint maxLength,
             const Uint sourceID, const Sint ID);

  bool isFull() const { return currentLength >= maxLength; }

  // Writes state and metrics at row currentLength, then increments it.
  // Throws std::overflow_error if full and std::invalid_argument if a
  // numeric field of the layout is written with a different width.
  // Numeric fields outside the layout and non-numeric fields are ignored.
  void append(const FieldMap& state, const FieldMap& metrics);

  // in place: zero data, currentLength = 0, complete = false, new ID
  void reset(const Sint newID);

  Uint dim(const std::string& key) const { return dims.at(key); }
  bool has(const std::string& key) const { return dims.count(key) > 0; }

  const Fval* row(const std::string& key, const Uint t) const
  {
    return data.at(key).data() + t * dims.at(key);
  }
  Fval at(const std::string& key, const Uint t, const Uint comp = 0) const
  {
    return data.at(key)[t * dims.at(key) + comp];
  }

private:
  void write(const FieldMap& fields, const Uint t);
};

} // end namespace seedrl
#endif // seedrl_Trajectory_h
