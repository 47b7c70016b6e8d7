//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Communicators/Message.h"

#include <gtest/gtest.h>

using namespace seedrl;

TEST(Message, StateKeepsNumericAndTextFields)
{
  const FieldMap obs = {
    {"observation", Fvec{0.5, -1.25, 3}},
    {"done",        1.0},
    {"info",        "reset by timeout"},
    {"empty",       Fvec{}}
  };
  const FieldMap metrics = { {"latency", 0.002} };

  const StateMessage msg = unpackStateMsg(packStateMsg(17, obs, metrics));
  EXPECT_EQ(msg.sourceID, 17u);
  ASSERT_EQ(msg.observation.size(), 4u);
  EXPECT_EQ(msg.observation.at("observation").values, Fvec({0.5, -1.25, 3}));
  EXPECT_EQ(msg.observation.at("done").scalar(), 1.0);
  EXPECT_FALSE(msg.observation.at("info").numeric);
  EXPECT_EQ(msg.observation.at("info").text, "reset by timeout");
  EXPECT_TRUE(msg.observation.at("empty").numeric);
  EXPECT_EQ(msg.observation.at("empty").dim(), 0u);
  EXPECT_EQ(msg.metrics.at("latency").scalar(), 0.002);
}

TEST(Message, ActionKeepsStatusAndModelVersion)
{
  Response resp;
  resp.sourceID = 3;
  resp.status = KILL;
  resp.trainingSteps = 123456789012;
  resp.action = Rvec({1, 0, -2});

  const Response back = unpackActionMsg(packActionMsg(resp));
  EXPECT_EQ(back.sourceID, 3u);
  EXPECT_TRUE(back.shutdown());
  EXPECT_EQ(back.trainingSteps, 123456789012);
  EXPECT_EQ(back.action, resp.action);
}

TEST(Message, TruncatedBuffersAreRejected)
{
  std::vector<char> state = packStateMsg(1, {{"observation", Fvec{1, 2}}}, {});
  state.resize(state.size() - 3);
  EXPECT_THROW(unpackStateMsg(state), std::runtime_error);

  Response resp;
  resp.action = Rvec(4, 1.0);
  std::vector<char> action = packActionMsg(resp);
  action.resize(action.size() - sizeof(Real));
  EXPECT_THROW(unpackActionMsg(action), std::runtime_error);

  EXPECT_THROW(unpackActionMsg(std::vector<char>()), std::runtime_error);
}

TEST(Message, TrailingBytesAreRejected)
{
  std::vector<char> state = packStateMsg(1, {}, {});
  state.push_back(0);
  EXPECT_THROW(unpackStateMsg(state), std::runtime_error);
}
