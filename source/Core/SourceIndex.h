//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_SourceIndex_h
#define seedrl_SourceIndex_h

#include "Utils/Definitions.h"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace seedrl
{

// Maps the global ids of the sources owned by one learner onto dense slots.
// Immutable after construction, therefore read concurrently without locks.
class SourceIndex
{
  std::vector<Uint> IDs;
  std::unordered_map<Uint, Uint> slots;

public:
  SourceIndex(const std::vector<Uint>& sourceIDs) : IDs(sourceIDs)
  {
    for(Uint i=0; i<IDs.size(); ++i)
      if(not slots.emplace(IDs[i], i).second)
        throw std::invalid_argument("source id " + std::to_string(IDs[i])
                                    + " listed twice");
  }

  static SourceIndex contiguous(const Uint nSources, const Uint first = 0)
  {
    std::vector<Uint> ret(nSources);
    for(Uint i=0; i<nSources; ++i) ret[i] = first + i;
    return SourceIndex(ret);
  }

  Uint size() const { return IDs.size(); }
  Uint sourceID(const Uint slot) const { return IDs.at(slot); }
  const std::vector<Uint>& sourceIDs() const { return IDs; }

  bool contains(const Uint sourceID) const
  {
    return slots.find(sourceID) not_eq slots.end();
  }

  Uint slot(const Uint sourceID) const
  {
    const auto it = slots.find(sourceID);
    if(it == slots.end())
      throw std::out_of_range("source id " + std::to_string(sourceID)
                              + " is not served here");
    return it->second;
  }
};

} // end namespace seedrl
#endif // seedrl_SourceIndex_h
