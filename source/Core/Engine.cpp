//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Engine.h"
#include "Master.h"
#include "Worker.h"
#include "Communicators/CommunicatorMPI.h"
#include "Communicators/Dispatcher.h"
#include "Communicators/Message.h"
#include "Learners/LinearPolicy.h"
#include "Utils/Warnings.h"
#include "CartPole.h"

#include "CLI/CLI.hpp"

namespace seedrl
{

Engine::Engine(int argc, char** argv) :
  distrib(new DistributionInfo(argc, argv)) { }

Engine::~Engine()
{
  delete distrib;
}

int Engine::parse()
{
  CLI::App parser("seedrl : centralized inference actor-learner training");
  settings.initializeOpts(parser);
  distrib->initializeOpts(parser);
  try {
    parser.parse(distrib->argc, distrib->argv);
  }
  catch (const CLI::ParseError &e) {
    if(distrib->world_rank == 0) return parser.exit(e);
    else return 1;
  }
  return 0;
}

void Engine::init()
{
  distrib->initialzePRNG();
  distrib->figureOutRoles();
  settings.check();

  const Uint nSources = distrib->ownedSourceIDs().size();
  if(nSources > 0 && nSources < settings.batchSizeTraining &&
     settings.maxQueuedDrops == 0)
    _warn("%u sources cannot fill a batch of %u trajectories at once: "
          "the drop-off queue will hold %u trajectories.", nSources,
          settings.batchSizeTraining, settings.dropOffCapacity(nSources));

  // action replies are tagged per environment
  int * tagUpperBound = nullptr, flag = 0;
  MPI(Comm_get_attr, MPI_COMM_WORLD, MPI_TAG_UB, &tagUpperBound, &flag);
  const Sint maxTag = flag ? * tagUpperBound : 32767;
  if(TAG_STATE > maxTag || TAG_ACTION + (Sint) distrib->nEnvironments > maxTag)
    _die("%u environments per actor exceed the MPI tag upper bound %ld",
         distrib->nEnvironments, maxTag);

  MPI_Barrier(MPI_COMM_WORLD);
}

void Engine::run()
{
  if(distrib->bIsLearner) runLearner();
  else runActor();
  MPI_Barrier(MPI_COMM_WORLD);
}

void Engine::runLearner()
{
  const std::vector<Uint> sourceIDs = distrib->ownedSourceIDs();
  if(sourceIDs.empty()) {
    warn("no actor to serve, learner exits");
    return;
  }

  CartPole placeholderEnv(distrib->randSeed);
  const FieldMap placeholder = placeholderEnv.initial();

  LinearPolicy model(CartPole::obsDim, CartPole::nActions, settings.learnrate,
                     settings.gamma, distrib->generator());
  FileLogger logger(settings.savePath, settings.expName, distrib->world_rank);

  Master master(settings, model, placeholder, sourceIDs, &logger);
  Dispatcher dispatcher(master, distrib->nEnvironments);

  master.start();
  dispatcher.start();
  try {
    master.run();
  }
  catch (const std::exception& e) {
    dispatcher.stop();
    _die("training stopped by an error: %s", e.what());
  }
  dispatcher.stop();
}

void Engine::runActor()
{
  std::vector<std::unique_ptr<Environment>> envs;
  for(Uint i=0; i<distrib->nEnvironments; ++i)
    envs.emplace_back(new CartPole(distrib->generator()));

  CommunicatorMPI comm(distrib->learnerRank, distrib->firstSourceID(),
                       distrib->nEnvironments);
  Worker actor(comm, std::move(envs), distrib->actorIndex,
               distrib->world_rank, distrib->firstSourceID());
  actor.run();
  printf("Actor %u stepped %ld times.\n", distrib->actorIndex, actor.stepsDone());
  fflush(0);
}

} // end namespace seedrl
