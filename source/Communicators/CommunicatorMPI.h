//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_CommunicatorMPI_h
#define seedrl_CommunicatorMPI_h

#include "Communicators/Message.h"
#include "Utils/MPIUtilities.h"

namespace seedrl
{

// Actor side proxy of a learner rank. submit sends the state right away and
// returns a deferred future: the action is received when the future is read.
// Used by one thread only.
class CommunicatorMPI : public Callee
{
  const int learnerRank;
  const Uint firstSourceID;
  const Uint nEnvironments;
  const MPI_Comm comm;

  void sendRecvAck(const int tag, const Uint callerID) const;
  Response recvAction(const Uint localID) const;

public:
  CommunicatorMPI(const Uint learnerRank, const Uint firstSourceID,
                  const Uint nEnvironments, const MPI_Comm comm = MPI_COMM_WORLD);

  void checkIn(const Uint callerID, const Uint rank) override;
  void checkOut(const Uint callerID) override;
  std::future<Response> submit(const Uint sourceID,
    const FieldMap& observation, const FieldMap& metrics) override;
};

} // end namespace seedrl
#endif // seedrl_CommunicatorMPI_h
