//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Core/Worker.h"
#include "Core/Sessions.h"
#include "Fakes.h"

#include <gtest/gtest.h>

using namespace seedrl;

namespace
{

// Answers synchronously with the first observation component, asks to stop
// after nCycles requests per source. Optionally answers for the wrong source.
class ScriptedCallee : public Callee
{
public:
  const Uint nCycles;
  bool bWrongSource = false;
  std::vector<Uint> checkedIn, checkedOut;
  std::map<Uint, Uint> nRequests;
  std::vector<FieldMap> metricsSeen;

  explicit ScriptedCallee(const Uint cycles) : nCycles(cycles) {}

  void checkIn(const Uint callerID, const Uint) override
  {
    checkedIn.push_back(callerID);
  }
  void checkOut(const Uint callerID) override
  {
    checkedOut.push_back(callerID);
  }
  std::future<Response> submit(const Uint sourceID,
    const FieldMap& observation, const FieldMap& metrics) override
  {
    metricsSeen.push_back(metrics);
    Response resp;
    resp.sourceID = bWrongSource ? sourceID + 1 : sourceID;
    resp.status = ++nRequests[sourceID] > nCycles ? KILL : WORK;
    resp.action = Rvec(1, observation.at("observation").values[0]);
    std::promise<Response> promise;
    promise.set_value(resp);
    return promise.get_future();
  }
};

// Every answer carries the error of a failed model evaluation.
class FailingCallee : public ScriptedCallee
{
public:
  FailingCallee() : ScriptedCallee(10) {}

  std::future<Response> submit(const Uint, const FieldMap&,
    const FieldMap&) override
  {
    std::promise<Response> promise;
    promise.set_exception(std::make_exception_ptr(
      std::runtime_error("model exploded")));
    return promise.get_future();
  }
};

}

TEST(Worker, StepsEnvironmentsUntilKilled)
{
  ScriptedCallee callee(3);
  std::vector<std::unique_ptr<Environment>> envs;
  envs.emplace_back(new fakes::CountingEnv(10, 100));
  envs.emplace_back(new fakes::CountingEnv(20, 100));
  const auto * const first = static_cast<fakes::CountingEnv*>(envs[0].get());
  const auto * const second = static_cast<fakes::CountingEnv*>(envs[1].get());

  Worker actor(callee, std::move(envs), 5, 2, 40);
  EXPECT_EQ(actor.nEnvironments(), 2u);
  actor.run();

  EXPECT_EQ(callee.checkedIn, std::vector<Uint>({5}));
  EXPECT_EQ(callee.checkedOut, std::vector<Uint>({5}));
  EXPECT_EQ(callee.nRequests[40], 4u);
  EXPECT_EQ(callee.nRequests[41], 4u);
  EXPECT_EQ(actor.stepsDone(), 6);
  EXPECT_EQ(first->nSteps, 3u);
  EXPECT_EQ(second->lastAction, Rvec({20}));
  EXPECT_TRUE(first->bClosed);
  EXPECT_TRUE(second->bClosed);
}

TEST(Worker, ReportsLatencyOfThePreviousAnswer)
{
  ScriptedCallee callee(2);
  std::vector<std::unique_ptr<Environment>> envs;
  envs.emplace_back(new fakes::CountingEnv(1, 100));
  Worker actor(callee, std::move(envs), 0, 1, 0);
  actor.run();
  ASSERT_EQ(callee.metricsSeen.size(), 3u);
  for(const auto& metrics : callee.metricsSeen) {
    ASSERT_EQ(metrics.count("latency"), 1u);
    EXPECT_GE(metrics.at("latency").scalar(), 0);
  }
  EXPECT_EQ(callee.metricsSeen[0].at("latency").scalar(), 0);
}

TEST(Worker, AnswerForAnotherSourceAbortsTheSession)
{
  ScriptedCallee callee(10);
  callee.bWrongSource = true;
  std::vector<std::unique_ptr<Environment>> envs;
  envs.emplace_back(new fakes::CountingEnv(1, 100));
  const auto * const env = static_cast<fakes::CountingEnv*>(envs[0].get());

  Worker actor(callee, std::move(envs), 3, 1, 0);
  EXPECT_THROW(actor.run(), ProtocolError);
  EXPECT_EQ(callee.checkedOut, std::vector<Uint>({3}));
  EXPECT_TRUE(env->bClosed);
  EXPECT_EQ(actor.stepsDone(), 0);
}

TEST(Worker, FailedEvaluationStillClosesTheSession)
{
  FailingCallee callee;
  std::vector<std::unique_ptr<Environment>> envs;
  envs.emplace_back(new fakes::CountingEnv(1, 100));
  envs.emplace_back(new fakes::CountingEnv(2, 100));
  const auto * const first = static_cast<fakes::CountingEnv*>(envs[0].get());
  const auto * const second = static_cast<fakes::CountingEnv*>(envs[1].get());

  Worker actor(callee, std::move(envs), 4, 1, 0);
  EXPECT_THROW(actor.run(), std::runtime_error);
  EXPECT_EQ(callee.checkedIn, std::vector<Uint>({4}));
  EXPECT_EQ(callee.checkedOut, std::vector<Uint>({4}));
  EXPECT_TRUE(first->bClosed);
  EXPECT_TRUE(second->bClosed);
  EXPECT_EQ(actor.stepsDone(), 0);
}
