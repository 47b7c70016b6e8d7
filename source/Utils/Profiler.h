//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//
//  Created by Diego Rossinelli.
//

#ifndef seedrl_Profiler_h
#define seedrl_Profiler_h

#include "Utils/Definitions.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace seedrl
{

// Wall time spent in mutually exclusive phases of one loop: starting a
// phase ends the ongoing one. Not thread safe: each thread owns its own.
class Profiler
{
  using clock_t = std::chrono::steady_clock;

  struct Phase
  {
    int64_t totalNs = 0;
    Sint calls = 0;
  };

  std::map<std::string, Phase> phases;
  std::string ongoing;
  clock_t::time_point phaseStart;

public:
  void start(const std::string& name);
  void stop();
  void stop_start(const std::string& name);

  // seconds accumulated by a phase, ongoing time excluded
  Real total(const std::string& name) const;
  Sint calls(const std::string& name) const;

  // one line per phase: share of the profiled time, mean duration, calls
  std::string printStatAndReset();
  void reset();
};

} // end namespace seedrl
#endif // seedrl_Profiler_h
