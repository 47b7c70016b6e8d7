//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_LinearPolicy_h
#define seedrl_LinearPolicy_h

#include "Learners/Model.h"
#include "Utils/ParameterBlob.h"
#include <random>

namespace seedrl
{

// Softmax policy over nActions discrete actions and a state-value baseline,
// both linear in [observation, 1]. Trained by advantage policy gradient on
// the n-step discounted returns of each trajectory.
// Inputs: "observation". Outputs: "action" (label), "policy", "baseline".
class LinearPolicy : public Model
{
  const Uint obsDim, nActions, nInputs;
  const Real learnrate, gamma;
  std::mt19937 generator;

  Rvec policyW, valueW;       // training parameters
  Rvec policyWinf, valueWinf; // inference parameters
  ParameterBlob parameters;

  void forward(const Fval * const obs, const Rvec& pW, const Rvec& vW,
               Real * const policy, Real & value) const;

public:
  LinearPolicy(const Uint obsDim, const Uint nActions, const Real learnrate,
               const Real gamma, const Uint seed);

  BatchedFields evaluate(const BatchedFields& inputs) override;
  MetricRecord train(const TrainingBatch& batch) override;
  void syncInferenceParameters() override;

  const Rvec& trainingPolicyWeights() const { return policyW; }
  const Rvec& inferencePolicyWeights() const { return policyWinf; }
};

} // end namespace seedrl
#endif // seedrl_LinearPolicy_h
