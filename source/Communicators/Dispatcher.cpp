//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Dispatcher.h"
#include "Core/Sessions.h"
#include "Utils/Warnings.h"

#include <chrono>
#include <unistd.h>

namespace seedrl
{

Dispatcher::Dispatcher(Callee& C, const Uint nEnvs, const MPI_Comm comm_) :
  callee(C), nEnvironments(nEnvs), comm(comm_) { }

Dispatcher::~Dispatcher()
{
  if(thread.joinable()) {
    bRunning = false;
    thread.join();
  }
}

void Dispatcher::start()
{
  if(bRunning.exchange(true)) return;
  thread = std::thread( [this] () { loop(); } );
}

void Dispatcher::stop()
{
  bRunning = false;
  if(thread.joinable()) thread.join();
  pollReplies(true);
}

void Dispatcher::loop()
{
  try {
    while(bRunning.load()) {
      const bool bReceived = pollRequest();
      pollReplies(false);
      if(not bReceived) usleep(1); // wait for actors without burning a cpu
    }
  } catch(const std::exception& e) {
    _die("learner lost its actors: %s", e.what());
  }
}

bool Dispatcher::pollRequest()
{
  int flag = 0;
  MPI_Status status;
  MPI(Iprobe, MPI_ANY_SOURCE, MPI_ANY_TAG, comm, &flag, &status);
  if(flag == 0) return false;

  const int rank = status.MPI_SOURCE, tag = status.MPI_TAG;
  if(tag == TAG_CHECKIN || tag == TAG_CHECKOUT)
  {
    unsigned callerID = 0;
    int ack = ACK_OK;
    MPI(Recv, &callerID, 1, MPI_UNSIGNED, rank, tag, comm, MPI_STATUS_IGNORE);
    try {
      if(tag == TAG_CHECKIN) callee.checkIn(callerID, rank);
      else callee.checkOut(callerID);
    } catch(const DuplicateSessionError& e) {
      _warn("%s", e.what());
      ack = ACK_DUPLICATE;
    } catch(const UnknownSessionError& e) {
      _warn("%s", e.what());
      ack = ACK_UNKNOWN;
    }
    MPI(Send, &ack, 1, MPI_INT, rank, TAG_ACK, comm);
  }
  else if(tag == TAG_STATE)
  {
    int count = 0;
    MPI(Get_count, &status, MPI_CHAR, &count);
    std::vector<char> buffer(count);
    MPI(Recv, buffer.data(), count, MPI_CHAR, rank, tag, comm, MPI_STATUS_IGNORE);
    StateMessage msg = unpackStateMsg(buffer);
    ++nRequests;
    pending.push_back( PendingReply{ rank, msg.sourceID,
      callee.submit(msg.sourceID, msg.observation, msg.metrics) } );
  }
  else _die("unexpected message with tag %d from rank %d", tag, rank);
  return true;
}

void Dispatcher::pollReplies(const bool bBlocking)
{
  for(auto it = pending.begin(); it not_eq pending.end(); )
  {
    if(bBlocking) it->answer.wait();
    else if(it->answer.wait_for(std::chrono::seconds(0)) not_eq
            std::future_status::ready) {
      ++it;
      continue;
    }

    Response response;
    try {
      response = it->answer.get();
    } catch(const std::exception& e) {
      // The coordinator rethrows evaluation errors from its training loop.
      // The actor is told to stop so that it checks out during finalize.
      _warn("no answer for source %u of rank %d: %s",
        it->sourceID, it->rank, e.what());
      response.sourceID = it->sourceID;
      response.status = KILL;
    }
    sendReply(it->rank, response);
    it = pending.erase(it);
  }
}

void Dispatcher::sendReply(const int rank, const Response& response) const
{
  std::vector<char> buffer = packActionMsg(response);
  const int tag = TAG_ACTION + response.sourceID % nEnvironments;
  MPI(Send, buffer.data(), buffer.size(), MPI_CHAR, rank, tag, comm);
}

} // end namespace seedrl
