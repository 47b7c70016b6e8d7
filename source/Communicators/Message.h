//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Message_h
#define seedrl_Message_h

#include "Core/Callee.h"
#include <vector>

namespace seedrl
{

// MPI tags of the actor/learner protocol. The answer to environment i of an
// actor is sent with tag TAG_ACTION + i so that answers never overtake each
// other's receives.
enum messageTag {
  TAG_CHECKIN  = 10301,
  TAG_CHECKOUT = 10302,
  TAG_ACK      = 10303,
  TAG_STATE    = 78283,
  TAG_ACTION   = 22846
};

// payload of TAG_ACK
enum ackStatus { ACK_OK = 0, ACK_DUPLICATE = 1, ACK_UNKNOWN = 2 };

struct StateMessage
{
  Uint sourceID = 0;
  FieldMap observation;
  FieldMap metrics;
};

// sourceID, observation, metrics. A field map is its size followed, per
// field, by name length, name, numeric flag and either the values or text.
std::vector<char> packStateMsg(const Uint sourceID, const FieldMap& observation,
                               const FieldMap& metrics);
// throws std::runtime_error on a truncated or malformed buffer
StateMessage unpackStateMsg(const std::vector<char>& buffer);

// sourceID, learnerStatus, trainingSteps, action dimension, action
std::vector<char> packActionMsg(const Response& response);
Response unpackActionMsg(const std::vector<char>& buffer);

} // end namespace seedrl
#endif // seedrl_Message_h
