//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "InferenceBatcher.h"
#include "Core/Sessions.h"
#include "Utils/Warnings.h"

#include <chrono>
#include <set>

namespace seedrl
{

InferenceBatcher::InferenceBatcher(Model& M, std::mutex& M_mutex,
  TrajectoryStore& S, const SourceIndex& I, const std::atomic<Sint>& steps,
  const std::atomic<bool>& shut, const Uint maxBatch) : model(M),
  model_mutex(M_mutex), store(S), sources(I), trainingSteps(steps),
  shutdown(shut), maxBatchSize(maxBatch), outstanding(I.size(), 0)
{
  if(maxBatchSize == 0) throw std::invalid_argument("inference batch size 0");
  for(Uint i=0; i<sources.size(); ++i) entries.emplace_back(new Entry());
}

InferenceBatcher::~InferenceBatcher()
{
  stop();
}

std::future<Response> InferenceBatcher::submit(const Uint sourceID,
  const FieldMap& observation, const FieldMap& metrics)
{
  Request req;
  req.sourceID = sourceID;
  req.slot = sources.slot(sourceID);
  req.observation = observation;
  req.metrics = metrics;
  std::future<Response> ret = req.promise.get_future();
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    if(fatalError) {
      req.promise.set_exception(fatalError);
      return ret;
    }
    if(bStopped) {
      Response resp;
      resp.sourceID = sourceID;
      resp.status = KILL;
      resp.trainingSteps = trainingSteps.load();
      req.promise.set_value(resp);
      return ret;
    }
    if(outstanding[req.slot])
      throw ProtocolError("source " + std::to_string(sourceID)
                          + " submitted while its previous request is pending");
    outstanding[req.slot] = 1;
    ++nInFlight;
    pending.push_back(std::move(req));
  }
  pending_cv.notify_one();
  return ret;
}

void InferenceBatcher::start(const Uint nThreads)
{
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    if(bRunning) return;
    bRunning = true;
  }
  for(Uint i=0; i<nThreads; ++i) threads.emplace_back([this] () { loop(); });
}

void InferenceBatcher::stop()
{
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    bRunning = false;
    bStopped = true;
  }
  pending_cv.notify_all();
  for(auto& t : threads) t.join();
  threads.clear();
  // nobody may wait forever on a request that was accepted
  while(processOnce()) { }
}

void InferenceBatcher::loop()
{
  while(true)
  {
    {
      std::unique_lock<std::mutex> lock(pending_mutex);
      pending_cv.wait(lock, [&]() { return not pending.empty() || not bRunning; });
      if(not bRunning) break;
    }
    processOnce();
  }
}

bool InferenceBatcher::processOnce()
{
  std::vector<Request> cycle;
  std::exception_ptr poisoned;
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    while(not pending.empty() && cycle.size() < maxBatchSize) {
      cycle.push_back(std::move(pending.front()));
      pending.pop_front();
    }
    poisoned = fatalError;
  }
  if(cycle.empty()) return false;

  if(poisoned) for(auto& req : cycle) fail(req, poisoned);
  else processCycle(cycle);
  return true;
}

BatchedFields InferenceBatcher::concatenate(const std::vector<FieldMap>& obs)
{
  BatchedFields ret;
  ret.nRows = obs.size();

  std::set<std::string> keys;
  for(const auto& o : obs) for(const auto& f : o) keys.insert(f.first);

  for(const auto& key : keys)
  {
    bool stackable = true;
    Uint D = 0;
    for(Uint i=0; i<obs.size() && stackable; ++i) {
      const auto it = obs[i].find(key);
      if(it == obs[i].end() || not it->second.numeric) stackable = false;
      else if(i == 0) D = it->second.dim();
      else if(it->second.dim() not_eq D) stackable = false;
    }

    if(stackable) {
      Fvec& column = ret.columns[key];
      column.reserve(obs.size() * D);
      for(const auto& o : obs) {
        const Fvec& vals = o.at(key).values;
        column.insert(column.end(), vals.begin(), vals.end());
      }
    } else {
      auto& column = ret.passthrough[key];
      column.reserve(obs.size());
      for(const auto& o : obs) {
        const auto it = o.find(key);
        column.push_back(it == o.end() ? Field() : it->second);
      }
    }
  }
  return ret;
}

void InferenceBatcher::processCycle(std::vector<Request>& cycle)
{
  const auto start = std::chrono::high_resolution_clock::now();
  const Uint N = cycle.size();

  std::vector<FieldMap> observations(N);
  for(Uint i=0; i<N; ++i) observations[i] = cycle[i].observation;
  const BatchedFields inputs = concatenate(observations);

  BatchedFields outputs;
  Sint modelVersion = 0;
  try
  {
    std::lock_guard<std::mutex> lock(model_mutex);
    outputs = model.evaluate(inputs);
    modelVersion = trainingSteps.load();
    if(outputs.nRows not_eq N)
      throw std::runtime_error("model answered " + std::to_string(outputs.nRows)
        + " rows to a batch of " + std::to_string(N));
    if(outputs.columns.count("action") == 0)
      throw std::runtime_error("model did not produce a numeric action");
  }
  catch(...) // forwarded to every caller of this cycle and to the coordinator
  {
    const std::exception_ptr error = std::current_exception();
    {
      std::lock_guard<std::mutex> lock(pending_mutex);
      if(not fatalError) fatalError = error;
    }
    for(auto& req : cycle) fail(req, error);
    return;
  }

  const auto end = std::chrono::high_resolution_clock::now();
  inferenceTimeNs += std::chrono::duration_cast<std::chrono::nanoseconds>
                      (end - start).count();
  nInferenceSteps += N;
  ++nBatchCycles;
  debugL("evaluated %u requests with model version %ld", N, modelVersion);

  for(Uint i=0; i<N; ++i)
  {
    Request& req = cycle[i];
    FieldMap state = inputs.row(i);
    for(const auto& out : outputs.row(i)) state[out.first] = out.second;
    state["training_steps"] = Field((Fval) modelVersion);

    Response resp;
    resp.sourceID = req.sourceID;
    resp.status = shutdown.load() ? KILL : WORK;
    resp.trainingSteps = modelVersion;
    const Fvec& action = state["action"].values;
    resp.action = Rvec(action.begin(), action.end());

    {
      Entry& entry = * entries[req.slot];
      std::lock_guard<std::mutex> lock(entry.entry_mutex);
      entry.state = state;
      entry.metrics = req.metrics;
    }

    try {
      addToStore(req.sourceID, state, req.metrics);
    } catch(...) { // broken store invariant, as fatal as a model failure
      const std::exception_ptr error = std::current_exception();
      {
        std::lock_guard<std::mutex> lock(pending_mutex);
        if(not fatalError) fatalError = error;
      }
      fail(req, error);
      continue;
    }
    complete(req, resp);
  }
}

void InferenceBatcher::addToStore(const Uint sourceID, const FieldMap& state,
                                  FieldMap metrics)
{
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  metrics["timestamp"] = Field((Fval)
    std::chrono::duration_cast<std::chrono::microseconds>(now).count() * 1e-6);
  store.addToEntry(sourceID, state, metrics);
}

void InferenceBatcher::complete(Request& req, const Response& resp)
{
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    outstanding[req.slot] = 0;
  }
  --nInFlight;
  req.promise.set_value(resp);
}

void InferenceBatcher::fail(Request& req, const std::exception_ptr& error)
{
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    outstanding[req.slot] = 0;
  }
  --nInFlight;
  req.promise.set_exception(error);
}

FieldMap InferenceBatcher::batchEntry(const Uint sourceID) const
{
  Entry& entry = * entries[sources.slot(sourceID)];
  std::lock_guard<std::mutex> lock(entry.entry_mutex);
  return entry.state;
}

std::exception_ptr InferenceBatcher::error() const
{
  std::lock_guard<std::mutex> lock(pending_mutex);
  return fatalError;
}

} // end namespace seedrl
