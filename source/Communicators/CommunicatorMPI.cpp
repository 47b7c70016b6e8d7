//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "CommunicatorMPI.h"
#include "Core/Sessions.h"
#include "Utils/Warnings.h"

namespace seedrl
{

CommunicatorMPI::CommunicatorMPI(const Uint learner, const Uint first,
  const Uint nEnvs, const MPI_Comm C) : learnerRank(learner),
  firstSourceID(first), nEnvironments(nEnvs), comm(C) { }

void CommunicatorMPI::sendRecvAck(const int tag, const Uint callerID) const
{
  unsigned ID = callerID;
  int ack = ACK_OK;
  MPI(Send, &ID, 1, MPI_UNSIGNED, learnerRank, tag, comm);
  MPI(Recv, &ack, 1, MPI_INT, learnerRank, TAG_ACK, comm, MPI_STATUS_IGNORE);
  if(ack == ACK_DUPLICATE) throw DuplicateSessionError(callerID);
  if(ack == ACK_UNKNOWN) throw UnknownSessionError(callerID);
}

void CommunicatorMPI::checkIn(const Uint callerID, const Uint rank)
{
  debugC("actor %u on rank %u checks in with rank %d", callerID, rank, learnerRank);
  sendRecvAck(TAG_CHECKIN, callerID);
}

void CommunicatorMPI::checkOut(const Uint callerID)
{
  debugC("actor %u checks out from rank %d", callerID, learnerRank);
  sendRecvAck(TAG_CHECKOUT, callerID);
}

std::future<Response> CommunicatorMPI::submit(const Uint sourceID,
  const FieldMap& observation, const FieldMap& metrics)
{
  if(sourceID < firstSourceID || sourceID >= firstSourceID + nEnvironments)
    throw std::out_of_range("source " + std::to_string(sourceID)
                            + " does not belong to this actor");
  const Uint localID = sourceID - firstSourceID;
  std::vector<char> buffer = packStateMsg(sourceID, observation, metrics);
  MPI(Send, buffer.data(), buffer.size(), MPI_CHAR, learnerRank, TAG_STATE, comm);
  return std::async(std::launch::deferred,
                    [this, localID] () { return recvAction(localID); });
}

Response CommunicatorMPI::recvAction(const Uint localID) const
{
  const int tag = TAG_ACTION + localID;
  MPI_Status status;
  int count = 0;
  MPI(Probe, learnerRank, tag, comm, &status);
  MPI(Get_count, &status, MPI_CHAR, &count);
  std::vector<char> buffer(count);
  MPI(Recv, buffer.data(), count, MPI_CHAR, learnerRank, tag, comm,
    MPI_STATUS_IGNORE);
  return unpackActionMsg(buffer);
}

} // end namespace seedrl
