//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_InferenceBatcher_h
#define seedrl_InferenceBatcher_h

#include "Core/Callee.h"
#include "Core/SourceIndex.h"
#include "Learners/Model.h"
#include "ReplayMemory/TrajectoryStore.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

namespace seedrl
{

// Collects the requests that arrived since the last evaluation, evaluates
// them with one call to the model while holding the model mutex, and hands
// every source its own row: as response, as batch entry and as a new step of
// its trajectory.
class InferenceBatcher
{
  struct Request
  {
    Uint sourceID;
    Uint slot;
    FieldMap observation;
    FieldMap metrics;
    std::promise<Response> promise;
  };

  struct Entry
  {
    std::mutex entry_mutex;
    FieldMap state;
    FieldMap metrics;
  };

  Model& model;
  std::mutex& model_mutex;
  TrajectoryStore& store;
  const SourceIndex& sources;
  const std::atomic<Sint>& trainingSteps;
  const std::atomic<bool>& shutdown;
  const Uint maxBatchSize;

  mutable std::mutex pending_mutex;
  std::condition_variable pending_cv;
  std::deque<Request> pending;
  std::vector<char> outstanding; // one flag per source slot
  std::exception_ptr fatalError;
  bool bRunning = false, bStopped = false;
  std::vector<std::thread> threads;

  std::vector<std::unique_ptr<Entry>> entries;

  std::atomic<Uint> nInFlight {0};
  std::atomic<Sint> nInferenceSteps {0};
  std::atomic<Sint> nBatchCycles {0};
  std::atomic<int64_t> inferenceTimeNs {0};

  void loop();
  void processCycle(std::vector<Request>& cycle);
  void complete(Request& req, const Response& resp);
  void fail(Request& req, const std::exception_ptr& error);
  void addToStore(const Uint sourceID, const FieldMap& state, FieldMap metrics);

public:
  InferenceBatcher(Model& model, std::mutex& model_mutex,
    TrajectoryStore& store, const SourceIndex& sources,
    const std::atomic<Sint>& trainingSteps, const std::atomic<bool>& shutdown,
    const Uint maxBatchSize);
  ~InferenceBatcher();

  // Queues one request. Throws ProtocolError if sourceID already has a
  // request in flight and std::out_of_range if it is not served here.
  // After a fatal error the returned future holds that error, after stop()
  // it holds an immediate shutdown answer.
  std::future<Response> submit(const Uint sourceID,
    const FieldMap& observation, const FieldMap& metrics);

  void start(const Uint nThreads);
  // joins the threads, then answers whatever is still queued
  void stop();

  // Evaluates up to maxBatchSize queued requests on the calling thread.
  // Returns false if nothing was queued.
  bool processOnce();

  // Numeric fields present with the same width in every observation are
  // concatenated in request order, all others pass through per request.
  static BatchedFields concatenate(const std::vector<FieldMap>& observations);

  // most recent evaluated step of sourceID
  FieldMap batchEntry(const Uint sourceID) const;

  std::exception_ptr error() const;
  Uint requestsInFlight() const { return nInFlight.load(); }
  Sint inferenceSteps() const { return nInferenceSteps.load(); }
  Sint batchCycles() const { return nBatchCycles.load(); }
  Real inferenceTime() const { return inferenceTimeNs.load() * 1e-9; }
};

} // end namespace seedrl
#endif // seedrl_InferenceBatcher_h
