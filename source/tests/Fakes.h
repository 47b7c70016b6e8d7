//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_tests_Fakes_h
#define seedrl_tests_Fakes_h

#include "Core/Environment.h"
#include "Learners/Model.h"
#include "Learners/EpisodeTracker.h"

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace seedrl
{
namespace fakes
{

// Answers every request with the first component of its observation.
class EchoModel : public Model
{
public:
  std::atomic<int> nEvaluations {0};
  std::atomic<int> nTrained {0};
  std::atomic<int> nSyncs {0};
  std::atomic<bool> bFail {false};
  std::atomic<Uint> lastBatchSize {0};
  std::atomic<Uint> largestEvaluation {0};

  BatchedFields evaluate(const BatchedFields& inputs) override
  {
    if(bFail) throw std::runtime_error("model exploded");
    ++nEvaluations;
    if(inputs.nRows > largestEvaluation) largestEvaluation = inputs.nRows;
    BatchedFields out;
    out.nRows = inputs.nRows;
    Fvec& action = out.columns["action"];
    action.resize(inputs.nRows, 0);
    if(inputs.columns.count("observation"))
      for(Uint i=0; i<inputs.nRows; ++i)
        action[i] = inputs.rowPtr("observation", i)[0];
    return out;
  }

  MetricRecord train(const TrainingBatch& batch) override
  {
    ++nTrained;
    lastBatchSize = batch.nTrajectories;
    return MetricRecord { {"loss", 1.0} };
  }

  void syncInferenceParameters() override { ++nSyncs; }
};

// Observation [tag, step]. Episodes last episodeLength steps.
class CountingEnv : public Environment
{
  const Fval tag;
  const Uint episodeLength;
  Uint episodeStep = 0;
  Sint episodeID = 0;

public:
  std::atomic<bool> bClosed {false};
  Uint nSteps = 0;
  Rvec lastAction;

  CountingEnv(const Fval _tag, const Uint length) :
    tag(_tag), episodeLength(length) {}

  FieldMap initial() override
  {
    return FieldMap {
      {"observation",    Fvec{tag, 0.0}},
      {"reward",         0.0},
      {"done",           1.0},
      {"episode_id",     (Fval) episodeID},
      {"episode_step",   0.0},
      {"episode_return", 0.0}
    };
  }

  FieldMap step(const Rvec& action) override
  {
    lastAction = action;
    ++nSteps;
    ++episodeStep;
    const bool done = episodeStep >= episodeLength;
    FieldMap ret {
      {"reward",         1.0},
      {"done",           done ? 1.0 : 0.0},
      {"episode_id",     (Fval) episodeID},
      {"episode_step",   (Fval) episodeStep},
      {"episode_return", (Fval) episodeStep}
    };
    if(done) {
      episodeStep = 0;
      ++episodeID;
    }
    ret["observation"] = Fvec{tag, (Fval) episodeStep};
    return ret;
  }

  void close() override { bClosed = true; }
};

class CountingRecorder : public EpisodeRecorder
{
public:
  std::atomic<int> nRecorded {0};
  bool bFail = false;
  void record(const Trajectory&) override
  {
    if(bFail) throw std::runtime_error("disk full");
    ++nRecorded;
  }
};

class MemoryLogger : public MetricLogger
{
public:
  mutable std::mutex log_mutex;
  std::map<std::string, std::vector<MetricRecord>> records;
  int nFlushes = 0;

  void log(const std::string& channel, const MetricRecord& record) override
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    records[channel].push_back(record);
  }
  void flush() override { ++nFlushes; }

  size_t count(const std::string& channel) const
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    const auto it = records.find(channel);
    return it == records.end() ? 0 : it->second.size();
  }
};

inline double value(const MetricRecord& record, const std::string& key)
{
  for(const auto& m : record) if(m.first == key) return m.second;
  throw std::out_of_range("no metric " + key);
}

inline FieldMap makeStep(const Fval obs0, const bool done, const Fval step)
{
  return FieldMap {
    {"observation",  Fvec{obs0, step}},
    {"reward",       1.0},
    {"done",         done ? 1.0 : 0.0},
    {"episode_step", step}
  };
}

} // end namespace fakes
} // end namespace seedrl
#endif // seedrl_tests_Fakes_h
