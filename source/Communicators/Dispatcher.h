//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Dispatcher_h
#define seedrl_Dispatcher_h

#include "Communicators/Message.h"
#include "Utils/MPIUtilities.h"

#include <atomic>
#include <thread>

namespace seedrl
{

// Learner side of the MPI protocol: one thread receives check-ins,
// check-outs and states from any actor, hands them to the callee and sends
// back each answer as soon as its future is ready. A failed answer is sent
// as KILL. It is the only thread of the learner that calls MPI.
class Dispatcher
{
  struct PendingReply
  {
    int rank;
    Uint sourceID;
    std::future<Response> answer;
  };

  Callee& callee;
  const Uint nEnvironments;
  const MPI_Comm comm;

  std::vector<PendingReply> pending;
  std::thread thread;
  std::atomic<bool> bRunning {false};
  std::atomic<Sint> nRequests {0};

  void loop();
  bool pollRequest();
  void pollReplies(const bool bBlocking);
  void sendReply(const int rank, const Response& response) const;

public:
  Dispatcher(Callee& callee, const Uint nEnvironments,
             const MPI_Comm comm = MPI_COMM_WORLD);
  ~Dispatcher();

  void start();
  // joins the thread, then sends the answers that are still pending
  void stop();

  Sint requestsReceived() const { return nRequests.load(); }
};

} // end namespace seedrl
#endif // seedrl_Dispatcher_h
