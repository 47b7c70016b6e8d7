//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//
//  Created by Diego Rossinelli.
//

#include "Profiler.h"

#include <algorithm>
#include <cstdio>

namespace seedrl
{

void Profiler::start(const std::string& name)
{
  stop();
  ongoing = name;
  phaseStart = clock_t::now();
}

void Profiler::stop()
{
  if(ongoing.empty()) return;
  Phase& phase = phases[ongoing];
  phase.totalNs += std::chrono::duration_cast<std::chrono::nanoseconds>
                    (clock_t::now() - phaseStart).count();
  phase.calls++;
  ongoing.clear();
}

void Profiler::stop_start(const std::string& name)
{
  start(name);
}

Real Profiler::total(const std::string& name) const
{
  const auto it = phases.find(name);
  return it == phases.end() ? 0 : it->second.totalNs * 1e-9;
}

Sint Profiler::calls(const std::string& name) const
{
  const auto it = phases.find(name);
  return it == phases.end() ? 0 : it->second.calls;
}

std::string Profiler::printStatAndReset()
{
  int64_t sum = 0;
  size_t longest = 0;
  for(const auto& p : phases) {
    sum += p.second.totalNs;
    longest = std::max(longest, p.first.size());
  }

  std::string ret;
  char BUF[256];
  for(const auto& p : phases) {
    const Phase& phase = p.second;
    snprintf(BUF, 256, "[%-*s] %6.2f%%  %10.3e s/call  (%ld calls)\n",
      (int) longest, p.first.c_str(),
      sum > 0 ? 100.0 * phase.totalNs / sum : 0.0,
      phase.totalNs * 1e-9 / std::max(phase.calls, (Sint) 1), phase.calls);
    ret += BUF;
  }
  reset();
  return ret;
}

void Profiler::reset()
{
  phases.clear();
}

} // end namespace seedrl
