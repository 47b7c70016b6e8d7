//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Worker.h"
#include "Core/Sessions.h"
#include "Utils/Warnings.h"
#include <chrono>

namespace seedrl
{

Worker::Worker(Callee& C, std::vector<std::unique_ptr<Environment>> E,
  const Uint caller, const Uint _rank, const Uint first) : callee(C),
  envs(std::move(E)), callerID(caller), rank(_rank), firstSourceID(first),
  states(envs.size()), latencies(envs.size(), 0) { }

void Worker::run()
{
  callee.checkIn(callerID, rank);
  try {
    while(act()) { }
  } catch(const std::exception& e) {
    _warn("actor %u aborts its session: %s", callerID, e.what());
    abortSession();
    throw;
  }
  callee.checkOut(callerID);
  closeEnvironments();
  debugS("actor %u done after %ld steps", callerID, nSteps);
}

bool Worker::act()
{
  using clock = std::chrono::steady_clock;
  const Uint N = envs.size();
  if(not bInitialized) {
    for(Uint i=0; i<N; ++i) states[i] = envs[i]->initial();
    bInitialized = true;
  }

  std::vector<std::future<Response>> answers;
  std::vector<clock::time_point> sent(N);
  answers.reserve(N);
  for(Uint i=0; i<N; ++i) {
    const FieldMap metrics = { {"latency", Field((Fval) latencies[i])} };
    sent[i] = clock::now();
    answers.push_back(callee.submit(firstSourceID + i, states[i], metrics));
  }

  bool bContinue = true;
  for(Uint i=0; i<N; ++i)
  {
    const Response resp = answers[i].get();
    latencies[i] = std::chrono::duration<Real>(clock::now() - sent[i]).count();
    if(resp.sourceID not_eq firstSourceID + i)
      throw ProtocolError("environment " + std::to_string(firstSourceID + i)
        + " received the answer for " + std::to_string(resp.sourceID));
    if(resp.shutdown()) {
      bContinue = false;
      continue;
    }
    states[i] = envs[i]->step(resp.action);
    ++nSteps;
  }
  return bContinue;
}

void Worker::abortSession()
{
  try {
    callee.checkOut(callerID);
  } catch(const std::exception& e) {
    _warn("actor %u could not check out: %s", callerID, e.what());
  }
  closeEnvironments();
}

void Worker::closeEnvironments()
{
  for(auto& env : envs) env->close();
}

} // end namespace seedrl
