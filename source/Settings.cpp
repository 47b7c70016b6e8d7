//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Utils/Warnings.h"
#include "Settings.h"
#include "CLI/CLI.hpp"
#include <cstdio>

namespace seedrl
{

DistributionInfo::DistributionInfo(int _argc, char** _argv) :
  argc(_argc), argv(_argv)
{
  MPI_Init_thread(&argc, &argv, MPI_THREAD_MULTIPLE, & threadSafety);
  MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN);
  if (threadSafety < MPI_THREAD_SERIALIZED)
    die("The MPI implementation does not have required thread support");
  world_size = MPICommSize(MPI_COMM_WORLD);
  world_rank = MPICommRank(MPI_COMM_WORLD);

  if (threadSafety < MPI_THREAD_MULTIPLE and world_rank == 0)
    printf("MPI implementation does not support MULTIPLE thread safety!\n");
}

DistributionInfo::~DistributionInfo()
{
  MPI_Finalize();
}

void DistributionInfo::initializeOpts(CLI::App & parser)
{
  parser.add_option("--nLearners",     nLearners,     COMMENT_nLearners);
  parser.add_option("--nEnvironments", nEnvironments, COMMENT_nEnvironments);
  parser.add_option("--randSeed",      randSeed,      COMMENT_randSeed);
}

void DistributionInfo::figureOutRoles()
{
  if(nLearners < 1) die("Need at least one learner rank.");
  if(nEnvironments < 1) die("Each actor needs at least one environment.");
  if(world_size <= nLearners)
    _die("%u ranks cannot host %u learners and at least one actor: "
         "increase the number of mpi processes.", world_size, nLearners);

  nActors = world_size - nLearners;
  bIsLearner = world_rank < nLearners;
  char role[64];
  if(bIsLearner) snprintf(role, 64, "learner %u", world_rank);
  else snprintf(role, 64, "actor %u", world_rank - nLearners);
  Warnings::setProcessRole(role);
  if(bIsLearner) {
    learnerIndex = world_rank;
    learnerRank = world_rank;
    const auto sources = ownedSourceIDs();
    if(sources.empty())
      _warn("learner %u serves no actor: more learners than actors", world_rank);
    printf("Rank %u is learner %u serving %zu environments.\n",
      world_rank, learnerIndex, sources.size());
  } else {
    actorIndex = world_rank - nLearners;
    learnerRank = actorIndex % nLearners;
    printf("Rank %u is actor %u with environments [%u, %u) served by rank %u.\n",
      world_rank, actorIndex, firstSourceID(), firstSourceID()+nEnvironments,
      learnerRank);
  }
  fflush(0);
}

std::vector<Uint> DistributionInfo::ownedSourceIDs() const
{
  std::vector<Uint> ret;
  if(not bIsLearner) return ret;
  for(Uint a = learnerIndex; a < nActors; a += nLearners)
    for(Uint i=0; i<nEnvironments; ++i) ret.push_back(a*nEnvironments + i);
  return ret;
}

void DistributionInfo::initialzePRNG()
{
  if(randSeed<=0)
  {
    std::random_device rdev; const Uint rdSeed = rdev();
    randSeed = rdSeed;
    MPI_Bcast(&randSeed, 1, MPI_UNSIGNED, 0, MPI_COMM_WORLD);
    if(world_rank==0) printf("Using seed %u\n", randSeed);
  }
  // every rank draws different numbers from the same seed
  generator = std::mt19937(randSeed + world_rank);
}

void Settings::initializeOpts (CLI::App & parser)
{
  parser.add_option("--rolloutLength",      rolloutLength,      COMMENT_rolloutLength);
  parser.add_option("--batchSizeTraining",  batchSizeTraining,  COMMENT_batchSizeTraining);
  parser.add_option("--batchSizeInference", batchSizeInference, COMMENT_batchSizeInference);
  parser.add_option("--maxQueuedBatches",   maxQueuedBatches,   COMMENT_maxQueuedBatches);
  parser.add_option("--maxQueuedDrops",     maxQueuedDrops,     COMMENT_maxQueuedDrops);
  parser.add_option("--nPrefetchers",       nPrefetchers,       COMMENT_nPrefetchers);
  parser.add_option("--nInferenceThreads",  nInferenceThreads,  COMMENT_nInferenceThreads);
  parser.add_option("--prefetchWaitMs",     prefetchWaitMs,     COMMENT_prefetchWaitMs);
  parser.add_option("--prefetchMaxTries",   prefetchMaxTries,   COMMENT_prefetchMaxTries);

  parser.add_option("--loopSleepMs",        loopSleepMs,        COMMENT_loopSleepMs);
  parser.add_option("--stallThreshold",     stallThreshold,     COMMENT_stallThreshold);
  parser.add_option("--maxEpochs",          maxEpochs,          COMMENT_maxEpochs);
  parser.add_option("--totNumSteps",        totNumSteps,        COMMENT_totNumSteps);
  parser.add_option("--maxWallTime",        maxWallTime,        COMMENT_maxWallTime);
  parser.add_option("--checkoutTimeout",    checkoutTimeout,    COMMENT_checkoutTimeout);

  parser.add_option("--systemLogInterval",  systemLogInterval,  COMMENT_systemLogInterval);
  parser.add_option("--printInterval",      printInterval,      COMMENT_printInterval);
  parser.add_option("--verbose",            verbose,            COMMENT_verbose);
  parser.add_option("--savePath",           savePath,           COMMENT_savePath);
  parser.add_option("--expName",            expName,            COMMENT_expName);

  parser.add_option("--learnrate",          learnrate,          COMMENT_learnrate);
  parser.add_option("--gamma",              gamma,              COMMENT_gamma);
}

void Settings::check()
{
  if(rolloutLength<=0)      die("rolloutLength<=0");
  if(batchSizeTraining<=0)  die("batchSizeTraining<=0");
  if(batchSizeInference<=0) die("batchSizeInference<=0");
  if(maxQueuedBatches<=0)   die("maxQueuedBatches<=0");
  if(stallThreshold<=0)     die("stallThreshold<=0");
  if(nInferenceThreads<=0)  die("nInferenceThreads<=0");
  if(systemLogInterval<=0)  die("systemLogInterval<=0");
  if(printInterval<=0)      die("printInterval<=0");
  if(checkoutTimeout<0)     die("checkoutTimeout<0");
  if(learnrate>1)           die("learnrate>1");
  if(learnrate<0)           die("learnrate<0");
  if(gamma<0)               die("gamma<0");
  if(gamma>1)               die("gamma>1");

  if(nPrefetchers<=0) {
    warn("nPrefetchers must be positive. It will be set to 1 for this run.");
    nPrefetchers = 1;
  }
  if(maxQueuedDrops>0 && maxQueuedDrops<batchSizeTraining) {
    warn("maxQueuedDrops is smaller than batchSizeTraining: no batch could "
         "ever be assembled. It will be set to batchSizeTraining.");
    maxQueuedDrops = batchSizeTraining;
  }
}

} // end namespace seedrl
