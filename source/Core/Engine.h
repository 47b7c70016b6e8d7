//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//
#ifndef seedrl_Engine_h
#define seedrl_Engine_h

#include "Settings.h"

namespace seedrl
{

#define VISIBLE __attribute__((visibility("default")))

// Entry point of a run: the first nLearners ranks coordinate inference and
// training, all other ranks are actors stepping CartPole environments.
class Engine
{
  DistributionInfo * const distrib;
  Settings settings;

  void runLearner();
  void runActor();

public:
  VISIBLE Engine(int argc, char** argv);

  VISIBLE ~Engine();

  // returns non-zero if the command line could not be parsed
  VISIBLE int parse();

  VISIBLE void init();

  VISIBLE void run();
};

#undef VISIBLE

} // end namespace seedrl
#endif // seedrl_Engine_h
