//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Definitions_h
#define seedrl_Definitions_h

#include <vector>

namespace seedrl
{

typedef unsigned Uint;
typedef long Sint;
////////////////////////////////////////////////////////////////////////////////
using Real = double; // MAIN CODE PRECISION
////////////////////////////////////////////////////////////////////////////////
// Data format for storage in trajectories and on the wire. Switch to float
// when the rollout buffers of all sources do not fit in memory.
#ifndef SINGLE_PREC
using Fval = double;
#else
using Fval = float;
#endif

typedef std::vector<Fval> Fvec;
typedef std::vector<Real> Rvec;

enum learnerStatus {WORK, KILL};

} // end namespace seedrl
#endif // seedrl_Definitions_h
