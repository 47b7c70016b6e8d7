//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_ParameterBlob_h
#define seedrl_ParameterBlob_h

#include "Utils/Definitions.h"
#include <cstring>
#include <stdexcept>
#include <vector>

namespace seedrl
{

// Each model that keeps a training copy and an inference copy of its
// parameters registers both memory regions here. The coordinator calls
// sync() while it holds the model lock, after every training step, so that
// the inference copy is never read while it is being overwritten.
class ParameterBlob
{
  struct dataInfo
  {
    Uint size;
    const Real * source;
    Real * target;
  };
  std::vector<dataInfo> dataList;
  Uint nSyncs = 0;

public:
  void add(const Uint size, const Real * const source, Real * const target)
  {
    if(source == nullptr || target == nullptr)
      throw std::invalid_argument("ParameterBlob: null parameter array");
    dataList.push_back({size, source, target});
  }

  void add(const Rvec& source, Rvec& target)
  {
    if(source.size() not_eq target.size())
      throw std::invalid_argument("ParameterBlob: mismatched parameter sizes");
    add(source.size(), source.data(), target.data());
  }

  void sync()
  {
    for(const auto& data : dataList)
      memcpy(data.target, data.source, data.size * sizeof(Real));
    ++nSyncs;
  }

  Uint nParameters() const
  {
    Uint ret = 0;
    for(const auto& data : dataList) ret += data.size;
    return ret;
  }

  Uint nSynchronizations() const { return nSyncs; }
};

} // end namespace seedrl
#endif // seedrl_ParameterBlob_h
