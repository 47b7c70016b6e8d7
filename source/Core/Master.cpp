//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Master.h"
#include "Utils/Warnings.h"

#include <cstdio>
#include <unistd.h>

namespace seedrl
{

StepLayout Master::placeholderLayout(Model& model, const FieldMap& observation)
{
  const BatchedFields inputs = InferenceBatcher::concatenate({observation});
  const BatchedFields outputs = model.evaluate(inputs);
  if(outputs.nRows not_eq 1)
    throw std::runtime_error("model must answer one row per request");

  FieldMap step = observation;
  for(const auto& out : outputs.row(0)) step[out.first] = out.second;
  step["training_steps"] = Field(0.0);
  step["latency"] = Field(0.0);
  step["timestamp"] = Field(0.0);
  return layoutOf(step);
}

Master::Master(const Settings& S, Model& M, const FieldMap& placeholder,
  const std::vector<Uint>& sourceIDs, MetricLogger * const L,
  EpisodeRecorder * const R) : settings(S), model(M), logger(L),
  startTime(std::chrono::steady_clock::now()), sources(sourceIDs),
  store(sources, placeholderLayout(M, placeholder), S.rolloutLength,
        S.dropOffCapacity(sourceIDs.size())),
  batchQueue(S.maxQueuedBatches), tracker(L, R), dog(S.stallThreshold),
  batcher(M, model_mutex, store, sources, nTrainingSteps, bShutdown,
          S.batchSizeInference),
  prefetch(store.dropOff(), batchQueue, tracker, bShutdown,
           S.batchSizeTraining, S.prefetchWaitMs, S.prefetchMaxTries)
{
  if(settings.systemLogInterval > 0)
    loopTasks.addPeriodic("system_log", settings.systemLogInterval,
      [this] () { logSystemMetrics(); } );

  if(settings.verbose)
    loopTasks.add("print",
      [this] () { return trainingEpoch() % settings.printInterval == 0
                         && trainingEpoch() not_eq lastPrintedEpoch; },
      [this] () {
        lastPrintedEpoch = trainingEpoch();
        printf("[epoch %ld]", lastPrintedEpoch);
        for(const auto& m : systemMetrics())
          printf(" %s:%g", m.first.c_str(), m.second);
        printf("\n"); fflush(0);
      } );

  loopTasks.add("watchdog",
    [this] () { return dog.check(batchQueue.size(), store.dropOff().size(),
                                 batcher.requestsInFlight()); },
    [this] () { requestShutdown("CLOSING DUE TO DEAD QUEUES"); } );

  loopTasks.add("stop_criteria", [this] () { checkShutdownCriteria(); } );
}

Master::~Master()
{
  if(bStarted && not bFinalized) {
    requestShutdown("coordinator destroyed");
    batcher.stop();
    prefetch.join();
  }
}

void Master::checkIn(const Uint callerID, const Uint rank)
{
  sessionRegistry.checkIn(callerID, rank);
}

void Master::checkOut(const Uint callerID)
{
  sessionRegistry.checkOut(callerID);
}

std::future<Response> Master::submit(const Uint sourceID,
  const FieldMap& observation, const FieldMap& metrics)
{
  return batcher.submit(sourceID, observation, metrics);
}

void Master::start()
{
  if(bStarted) return;
  bStarted = true;
  batcher.start(settings.nInferenceThreads);
  prefetch.start(settings.nPrefetchers);
  profiler.start("SLP");
}

Master::Status Master::stepTrainingLoop()
{
  if(status() == SHUTTING_DOWN || status() == STOPPED) return status();

  const std::exception_ptr error = batcher.error();
  if(error) {
    requestShutdown("model evaluation failed");
    currentStatus = SHUTTING_DOWN;
    std::rethrow_exception(error);
  }

  TrainingBatch batch;
  if(batchQueue.tryPop(batch))
  {
    currentStatus = TRAINING;
    learnFromBatch(batch);
    currentStatus = IDLE;
  }
  else
  {
    profiler.stop_start("SLP");
    usleep(settings.loopSleepMs * 1000);
  }

  loopTasks.run();

  if(bShutdown.load()) currentStatus = SHUTTING_DOWN;
  return status();
}

void Master::learnFromBatch(const TrainingBatch& batch)
{
  const auto start = std::chrono::steady_clock::now();
  MetricRecord metrics;
  {
    std::lock_guard<std::mutex> lock(model_mutex);
    profiler.stop_start("TRAIN");
    metrics = model.train(batch);
    profiler.stop_start("SYNC");
    model.syncInferenceParameters();
    profiler.stop();
  }
  trainingTime += std::chrono::duration<Real>(
    std::chrono::steady_clock::now() - start).count();
  ++nTrainingEpochs;
  nTrainingSteps += batch.totalLength();

  if(logger == nullptr) return;
  MetricRecord record = {
    {"runtime",        runtime()},
    {"training_time",  trainingTime},
    {"training_epoch", (double) trainingEpoch()},
    {"training_steps", (double) trainingSteps()}
  };
  record.insert(record.end(), metrics.begin(), metrics.end());
  try {
    logger->log("training", record);
  } catch(const std::exception& e) {
    _warn("logging training metrics failed: %s", e.what());
  }
}

void Master::checkShutdownCriteria()
{
  if(settings.maxEpochs > 0 && trainingEpoch() >= settings.maxEpochs)
    requestShutdown("reached maximum number of training epochs");
  if(settings.totNumSteps > 0 && trainingSteps() >= settings.totNumSteps)
    requestShutdown("reached maximum number of training steps");
  if(settings.maxWallTime > 0 && runtime() >= settings.maxWallTime)
    requestShutdown("reached maximum wall time");
}

void Master::requestShutdown(const std::string& why)
{
  std::lock_guard<std::mutex> lock(reason_mutex);
  if(bShutdown.exchange(true)) return;
  reason = why;
  printf("\n============== %s ==============\n", why.c_str());
  fflush(0);
}

std::string Master::shutdownCause() const
{
  std::lock_guard<std::mutex> lock(reason_mutex);
  return reason;
}

void Master::run()
{
  start();
  try {
    while(stepTrainingLoop() not_eq SHUTTING_DOWN) { }
  } catch(const std::exception& e) {
    _warn("training loop failed: %s", e.what());
    finalize();
    throw;
  }
  finalize();
}

void Master::finalize()
{
  if(bFinalized) return;
  requestShutdown("shutdown requested");
  currentStatus = SHUTTING_DOWN;

  if(not sessionRegistry.waitUntilEmpty(settings.checkoutTimeout))
    _warn("%u actors did not check out within %g seconds",
      sessionRegistry.size(), settings.checkoutTimeout);

  batcher.stop();
  prefetch.join();
  profiler.stop();
  finalRuntime = runtime();

  if(logger not_eq nullptr) {
    try {
      logSystemMetrics();
      logger->flush();
    } catch(const std::exception& e) {
      _warn("flushing metrics failed: %s", e.what());
    }
  }

  printf("%s", report().c_str());
  printf("%s", profiler.printStatAndReset().c_str());
  fflush(0);
  bFinalized = true;
  currentStatus = STOPPED;
}

Real Master::runtime() const
{
  if(finalRuntime >= 0) return finalRuntime;
  return std::chrono::duration<Real>(
    std::chrono::steady_clock::now() - startTime).count();
}

MetricRecord Master::systemMetrics() const
{
  return MetricRecord {
    {"runtime",                runtime()},
    {"trajectories_seen",      (double) tracker.trajectoriesSeen()},
    {"episodes_seen",          (double) tracker.episodesSeen()},
    {"mean_inference_latency", tracker.meanInferenceLatency()},
    {"fetching_time",          prefetch.fetchingTime()},
    {"inference_time",         batcher.inferenceTime()},
    {"inference_steps",        (double) batcher.inferenceSteps()},
    {"training_time",          trainingTime},
    {"training_steps",         (double) trainingSteps()},
    {"queue_batches",          (double) batchQueue.size()},
    {"queue_drop_off",         (double) store.dropOff().size()},
    {"queue_rpcs",             (double) batcher.requestsInFlight()}
  };
}

void Master::logSystemMetrics()
{
  if(logger == nullptr) return;
  try {
    logger->log("system", systemMetrics());
  } catch(const std::exception& e) {
    _warn("logging system metrics failed: %s", e.what());
  }
}

std::string Master::report() const
{
  const Real T = runtime();
  const Sint nInfer = batcher.inferenceSteps(), nTrain = trainingSteps();
  char BUF[2048];
  snprintf(BUF, 2048,
    "\n============== REPORT ==============\n"
    "shutdown cause: %s\n"
    "inferred %ld steps in %.3f seconds ==> %.2f steps/s\n"
    "trained %ld steps (%ld epochs) in %.3f seconds ==> %.2f steps/s\n"
    "total inference time: %.3f seconds\n"
    "total training time: %.3f seconds\n"
    "total fetching time: %.3f seconds\n"
    "mean inference latency: %g seconds\n"
    "trajectories seen: %ld, episodes seen: %ld\n"
    "dropped batches: %ld, evicted trajectories: %ld\n",
    shutdownCause().c_str(),
    nInfer, T, T>0 ? nInfer/T : 0.0,
    nTrain, trainingEpoch(), T, T>0 ? nTrain/T : 0.0,
    batcher.inferenceTime(), trainingTime, prefetch.fetchingTime(),
    tracker.meanInferenceLatency(),
    tracker.trajectoriesSeen(), tracker.episodesSeen(),
    batchQueue.nTotalDropped(), store.dropOff().nTotalEvicted());
  return std::string(BUF);
}

} // end namespace seedrl
