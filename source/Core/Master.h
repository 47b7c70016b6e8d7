//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Master_h
#define seedrl_Master_h

#include "Core/Callee.h"
#include "Core/Sessions.h"
#include "Core/SourceIndex.h"
#include "Core/Watchdog.h"
#include "Learners/EpisodeTracker.h"
#include "Learners/InferenceBatcher.h"
#include "Learners/Model.h"
#include "ReplayMemory/BatchQueue.h"
#include "ReplayMemory/Prefetcher.h"
#include "ReplayMemory/TrajectoryStore.h"
#include "Utils/MetricLogger.h"
#include "Utils/Profiler.h"
#include "Utils/TaskQueue.h"
#include "Settings.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace seedrl
{

// The learner side: serves the actor sessions, batches their requests for
// the model, collects trajectories and trains on them.
class Master : public Callee
{
public:
  enum Status {IDLE, TRAINING, SHUTTING_DOWN, STOPPED};

  Master(const Settings& settings, Model& model, const FieldMap& placeholder,
         const std::vector<Uint>& sourceIDs, MetricLogger * const logger = nullptr,
         EpisodeRecorder * const recorder = nullptr);
  ~Master() override;

  void checkIn(const Uint callerID, const Uint rank) override;
  void checkOut(const Uint callerID) override;
  std::future<Response> submit(const Uint sourceID,
    const FieldMap& observation, const FieldMap& metrics) override;

  // spawns the inference and batch-assembly threads
  void start();
  // One iteration of the training loop. Rethrows a model evaluation error.
  Status stepTrainingLoop();
  // start, loop until shutting down, finalize
  void run();
  // Bounded wait for actors to check out, joins all threads, flushes the
  // metrics and prints the final report. Leaves the coordinator STOPPED.
  void finalize();
  // first caller sets the reason, later calls are ignored
  void requestShutdown(const std::string& reason);

  std::string report() const;
  MetricRecord systemMetrics() const;

  // layout of a trajectory step: observation, model outputs and metrics
  static StepLayout placeholderLayout(Model& model, const FieldMap& observation);

  Status status() const { return (Status) currentStatus.load(); }
  bool isShuttingDown() const { return bShutdown.load(); }
  std::string shutdownCause() const;
  Sint trainingEpoch() const { return nTrainingEpochs.load(); }
  Sint trainingSteps() const { return nTrainingSteps.load(); }
  Real runtime() const;

  const SessionRegistry& sessions() const { return sessionRegistry; }
  TrajectoryStore& trajectoryStore() { return store; }
  BatchQueue<TrainingBatch>& trainingQueue() { return batchQueue; }
  InferenceBatcher& inferenceBatcher() { return batcher; }
  Prefetcher& prefetcher() { return prefetch; }
  const EpisodeTracker& episodeTracker() const { return tracker; }
  const Watchdog& watchdog() const { return dog; }
  const TaskQueue& housekeeping() const { return loopTasks; }

private:
  const Settings settings;
  Model& model;
  MetricLogger * const logger;

  std::mutex model_mutex;
  std::atomic<bool> bShutdown {false};
  std::atomic<Sint> nTrainingSteps {0};
  std::atomic<Sint> nTrainingEpochs {0};
  std::atomic<int> currentStatus {IDLE};

  const std::chrono::steady_clock::time_point startTime;
  Real finalRuntime = -1;
  Real trainingTime = 0;

  mutable std::mutex reason_mutex;
  std::string reason;

  const SourceIndex sources;
  SessionRegistry sessionRegistry;
  TrajectoryStore store;
  BatchQueue<TrainingBatch> batchQueue;
  EpisodeTracker tracker;
  Watchdog dog;
  InferenceBatcher batcher;
  Prefetcher prefetch;

  Profiler profiler;
  TaskQueue loopTasks;
  Sint lastPrintedEpoch = -1;
  bool bStarted = false;
  bool bFinalized = false;

  void learnFromBatch(const TrainingBatch& batch);
  void logSystemMetrics();
  void checkShutdownCriteria();
};

} // end namespace seedrl
#endif // seedrl_Master_h
