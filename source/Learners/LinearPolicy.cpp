//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "LinearPolicy.h"
#include <algorithm>
#include <cmath>

namespace seedrl
{

#define EXP_CUT 16 //prevent under/over flow with exponentials

LinearPolicy::LinearPolicy(const Uint dimObs, const Uint nAct, const Real lr,
  const Real discount, const Uint seed) : obsDim(dimObs), nActions(nAct),
  nInputs(dimObs+1), learnrate(lr), gamma(discount), generator(seed),
  policyW(nActions*nInputs, 0), valueW(nInputs, 0),
  policyWinf(nActions*nInputs, 0), valueWinf(nInputs, 0)
{
  if(nActions < 1) throw std::invalid_argument("policy needs one action");
  parameters.add(policyW, policyWinf);
  parameters.add(valueW, valueWinf);
}

void LinearPolicy::forward(const Fval * const obs, const Rvec& pW,
  const Rvec& vW, Real * const policy, Real & value) const
{
  Real maxLogit = -1e300;
  for(Uint a=0; a<nActions; ++a) {
    const Real* const W = pW.data() + a*nInputs;
    Real logit = W[obsDim];
    for(Uint i=0; i<obsDim; ++i) logit += W[i] * obs[i];
    policy[a] = logit;
    maxLogit = std::max(maxLogit, logit);
  }
  Real norm = 0;
  for(Uint a=0; a<nActions; ++a) {
    policy[a] = std::exp(std::max(policy[a] - maxLogit, (Real) -EXP_CUT));
    norm += policy[a];
  }
  for(Uint a=0; a<nActions; ++a) policy[a] /= norm;

  value = vW[obsDim];
  for(Uint i=0; i<obsDim; ++i) value += vW[i] * obs[i];
}

BatchedFields LinearPolicy::evaluate(const BatchedFields& inputs)
{
  if(inputs.columns.count("observation") == 0)
    throw std::invalid_argument("LinearPolicy needs a numeric observation");
  if(inputs.dim("observation") not_eq obsDim)
    throw std::invalid_argument("LinearPolicy built for observations of size "
      + std::to_string(obsDim) + ", got " + std::to_string(inputs.dim("observation")));

  const Uint N = inputs.nRows;
  BatchedFields ret;
  ret.nRows = N;
  Fvec& action = ret.columns["action"];
  Fvec& policy = ret.columns["policy"];
  Fvec& baseline = ret.columns["baseline"];
  action.resize(N);
  policy.resize(N * nActions);
  baseline.resize(N);

  const Fval * const obs = inputs.columns.at("observation").data();
  #pragma omp parallel for schedule(static)
  for(Uint i=0; i<N; ++i) {
    Rvec pol(nActions);
    Real val = 0;
    forward(obs + i*obsDim, policyWinf, valueWinf, pol.data(), val);
    std::copy(pol.begin(), pol.end(), policy.begin() + i*nActions);
    baseline[i] = val;
  }

  // sampling stays serial: one generator
  for(Uint i=0; i<N; ++i) {
    std::discrete_distribution<Uint> dist(policy.begin() + i*nActions,
                                          policy.begin() + (i+1)*nActions);
    action[i] = dist(generator);
  }
  return ret;
}

MetricRecord LinearPolicy::train(const TrainingBatch& batch)
{
  for(const char* key : {"observation", "action", "reward", "done"})
    if(not batch.has(key))
      throw std::invalid_argument(std::string("training batch lacks ") + key);

  const Uint B = batch.nTrajectories;
  std::vector<Rvec> gradP(B, Rvec(policyW.size(), 0));
  std::vector<Rvec> gradV(B, Rvec(valueW.size(), 0));
  Rvec sumPolLoss(B, 0), sumValLoss(B, 0), sumEntropy(B, 0);
  std::vector<Uint> nSamples(B, 0);

  #pragma omp parallel for schedule(dynamic)
  for(Uint b=0; b<B; ++b)
  {
    const Uint T = batch.currentLength[b];
    if(T < 2) continue;
    Rvec pol(nActions);
    Real value = 0;
    // bootstrap from the last recorded step
    forward(batch.ptr("observation", T-1, b), policyW, valueW, pol.data(), value);
    Real G = value;
    for(Sint t = (Sint) T-2; t >= 0; --t)
    {
      const Real reward = batch.at("reward", t+1, b);
      const bool done = batch.at("done", t+1, b) not_eq 0;
      G = reward + (done ? 0 : gamma * G);

      const Fval * const obs = batch.ptr("observation", t, b);
      forward(obs, policyW, valueW, pol.data(), value);
      const Uint act = std::min((Uint) batch.at("action", t, b), nActions-1);
      const Real adv = G - value;

      for(Uint a=0; a<nActions; ++a) {
        const Real dlogpi = (a==act ? 1 : 0) - pol[a];
        Real* const gW = gradP[b].data() + a*nInputs;
        for(Uint i=0; i<obsDim; ++i) gW[i] += adv * dlogpi * obs[i];
        gW[obsDim] += adv * dlogpi;
        sumEntropy[b] -= pol[a] * std::log(std::max(pol[a], (Real) 1e-12));
      }
      for(Uint i=0; i<obsDim; ++i) gradV[b][i] += adv * obs[i];
      gradV[b][obsDim] += adv;

      sumPolLoss[b] -= adv * std::log(std::max(pol[act], (Real) 1e-12));
      sumValLoss[b] += 0.5 * adv * adv;
      nSamples[b]++;
    }
  }

  Uint N = 0;
  Real polLoss = 0, valLoss = 0, entropy = 0;
  for(Uint b=0; b<B; ++b) {
    N += nSamples[b];
    polLoss += sumPolLoss[b];
    valLoss += sumValLoss[b];
    entropy += sumEntropy[b];
  }
  if(N > 0) {
    const Real eta = learnrate / N;
    for(Uint b=0; b<B; ++b) {
      for(size_t j=0; j<policyW.size(); ++j) policyW[j] += eta * gradP[b][j];
      for(size_t j=0; j<valueW.size(); ++j) valueW[j] += eta * gradV[b][j];
    }
  }

  const Real invN = N > 0 ? 1.0 / N : 0.0;
  return MetricRecord {
    {"policy_loss",   polLoss * invN},
    {"baseline_loss", valLoss * invN},
    {"entropy",       entropy * invN},
    {"n_samples",     (double) N}
  };
}

void LinearPolicy::syncInferenceParameters()
{
  parameters.sync();
}

} // end namespace seedrl
