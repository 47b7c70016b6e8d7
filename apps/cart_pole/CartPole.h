//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//
//  Created by Dmitry Alexeev on 04/06/15.
//

#ifndef seedrl_CartPole_h
#define seedrl_CartPole_h

#include "Core/Environment.h"
#include <random>

namespace seedrl
{

// Julien Berland, Christophe Bogey, Christophe Bailly,
// Low-dissipation and low-dispersion fourth-order Runge-Kutta algorithm,
// Computers & Fluids, Volume 35, Issue 10, December 2006, Pages 1459-1463,
// http://dx.doi.org/10.1016/j.compfluid.2005.04.003
template <typename Func, typename Vec>
Vec rk46_nl(double t0, double dt, Vec u0, Func&& Diff)
{
  const double a[] = {0.000000000000, -0.737101392796, -1.634740794341,
                     -0.744739003780, -1.469897351522, -2.813971388035};
  const double b[] = {0.032918605146,  0.823256998200,  0.381530948900,
                      0.200092213184,  1.718581042715,  0.270000000000};
  const double c[] = {0.000000000000,  0.032918605146,  0.249351723343,
                      0.466911705055,  0.582030414044,  0.847252983783};
  const int s = 6;
  Vec w;
  Vec u(u0);
  for (int i=0; i<s; i++) {
    const double t = t0 + dt*c[i];
    w = w*a[i] + Diff(u, t)*dt;
    u = u + w*b[i];
  }
  return u;
}

struct Vec4
{
  double y1, y2, y3, y4;
  Vec4(double _y1=0, double _y2=0, double _y3=0, double _y4=0) :
    y1(_y1), y2(_y2), y3(_y3), y4(_y4) {}
  Vec4 operator*(double v) const { return Vec4(y1*v, y2*v, y3*v, y4*v); }
  Vec4 operator+(const Vec4& v) const {
    return Vec4(y1+v.y1, y2+v.y2, y3+v.y3, y4+v.y4);
  }
};

// Pole balancing on a cart pushed left or right with a constant force.
// Observation: x, v, angular velocity, angle, cos(angle), sin(angle).
// Reward 1 per step. The episode fails when the pole tilts beyond pi/15 or
// the cart leaves [-2.4, 2.4], and is truncated after maxSteps.
class CartPole : public Environment
{
public:
  static constexpr Uint obsDim = 6;
  static constexpr Uint nActions = 2;

  const double mp = 0.1, mc = 1, l = 0.5, g = 9.81;
  const double dt = 4e-4, force = 10;
  const Uint nSubsteps = 50, maxSteps;

private:
  std::mt19937 gen;
  Vec4 u;
  double F = 0, t = 0, episodeReturn = 0;
  Uint episodeStep = 0;
  Sint episodeID = 0;
  bool bClosed = false;

  void reset();
  Fvec observation() const;
  Vec4 D(const Vec4& state, const double time) const;
  bool failed() const;

public:
  CartPole(const Uint seed, const Uint maxSteps = 500);

  FieldMap initial() override;
  FieldMap step(const Rvec& action) override;
  void close() override;

  const Vec4& state() const { return u; }
  bool isClosed() const { return bClosed; }
};

} // end namespace seedrl
#endif // seedrl_CartPole_h
