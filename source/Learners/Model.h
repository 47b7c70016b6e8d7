//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Model_h
#define seedrl_Model_h

#include "Core/StepFields.h"
#include "ReplayMemory/TrainingBatch.h"
#include "Utils/MetricLogger.h"

namespace seedrl
{

// The learnable policy. The coordinator serializes every call with one
// mutex, implementations need not be thread safe.
class Model
{
public:
  virtual ~Model() {}

  // Pure function of the inference parameters: one output row per input
  // row. Must produce a numeric "action" field. Exceptions propagate to the
  // callers of the whole batch cycle.
  virtual BatchedFields evaluate(const BatchedFields& inputs) = 0;

  // One update of the training parameters, returns training metrics.
  virtual MetricRecord train(const TrainingBatch& batch) = 0;

  // Copy training parameters into the inference copy used by evaluate.
  virtual void syncInferenceParameters() = 0;
};

} // end namespace seedrl
#endif // seedrl_Model_h
