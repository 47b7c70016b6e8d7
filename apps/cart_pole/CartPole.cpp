//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//
//  Created by Dmitry Alexeev on 04/06/15.
//

#include "CartPole.h"
#include <cmath>

namespace seedrl
{

constexpr Uint CartPole::obsDim;
constexpr Uint CartPole::nActions;

CartPole::CartPole(const Uint seed, const Uint _maxSteps) :
  maxSteps(_maxSteps), gen(seed)
{
  reset();
}

void CartPole::reset()
{
  std::uniform_real_distribution<double> dist(-0.05, 0.05);
  u = Vec4(dist(gen), dist(gen), dist(gen), dist(gen));
  F = t = episodeReturn = 0;
  episodeStep = 0;
}

Fvec CartPole::observation() const
{
  return Fvec { u.y1, u.y2, u.y4, u.y3, std::cos(u.y3), std::sin(u.y3) };
}

Vec4 CartPole::D(const Vec4& state, const double) const
{
  Vec4 res;
  const double cosy = std::cos(state.y3), siny = std::sin(state.y3);
  const double w = state.y4;
  const double fac1 = 1./(mp+mc);
  const double fac2 = l*(4./3. - fac1*(mp*cosy*cosy));
  const double F1 = F + mp * l * w * w * siny;
  res.y4 = (g*siny - fac1*F1*cosy)/fac2;
  res.y2 = fac1*(F1 - mp*l*res.y4*cosy);
  res.y1 = state.y2;
  res.y3 = state.y4;
  return res;
}

bool CartPole::failed() const
{
  return std::fabs(u.y3) > M_PI/15 || std::fabs(u.y1) > 2.4;
}

FieldMap CartPole::initial()
{
  FieldMap ret;
  ret["observation"] = observation();
  ret["reward"] = 0.0;
  ret["done"] = 1.0;
  ret["episode_id"] = (Fval) episodeID;
  ret["episode_step"] = 0.0;
  ret["episode_return"] = 0.0;
  return ret;
}

FieldMap CartPole::step(const Rvec& action)
{
  if(bClosed) throw std::logic_error("CartPole stepped after close");
  if(action.empty()) throw std::invalid_argument("CartPole needs an action");
  F = action[0] > 0.5 ? force : -force;

  bool terminal = false;
  for (Uint i=0; i<nSubsteps && not terminal; ++i) {
    u = rk46_nl(t, dt, u, [&](const Vec4& s, const double time) {
      return D(s, time);
    });
    t += dt;
    terminal = failed();
  }
  episodeStep++;
  episodeReturn += 1;
  const bool done = terminal || episodeStep >= maxSteps;

  FieldMap ret;
  ret["reward"] = 1.0;
  ret["done"] = done ? 1.0 : 0.0;
  ret["episode_id"] = (Fval) episodeID;
  ret["episode_step"] = (Fval) episodeStep;
  ret["episode_return"] = episodeReturn;
  if(done) {
    reset();
    episodeID++;
  }
  ret["observation"] = observation();
  return ret;
}

void CartPole::close()
{
  bClosed = true;
}

} // end namespace seedrl
