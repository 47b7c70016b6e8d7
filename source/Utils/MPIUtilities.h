//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_MPIUtilities_h
#define seedrl_MPIUtilities_h

#include <mpi.h>
#include <stdexcept>

namespace seedrl
{

inline bool MPIisInitialized() {
  int flag = 0;
  MPI_Initialized(&flag);
  if(flag == 0) return false;
  MPI_Finalized(&flag);
  return flag == 0;
}
inline unsigned MPICommSize(const MPI_Comm C) {
  int size;
  MPI_Comm_size(C, &size);
  return (unsigned) size;
}
inline unsigned MPICommRank(const MPI_Comm C) {
  int rank;
  MPI_Comm_rank(C, &rank);
  return (unsigned) rank;
}
// components are also run without MPI (unit tests), then we are rank 0
inline unsigned MPIworldRank() {
  return MPIisInitialized() ? MPICommRank(MPI_COMM_WORLD) : 0;
}

// requires Utils/Warnings.h for _warn
#define MPI(NAME, ...)                                   \
do {                                                     \
  const int MPIERR = MPI_ ## NAME ( __VA_ARGS__ );       \
  if(MPIERR not_eq MPI_SUCCESS) {                        \
    _warn("%s %d", #NAME, MPIERR);                       \
    throw std::runtime_error("MPI ERROR");               \
  }                                                      \
} while(0)

} // end namespace seedrl
#endif // seedrl_MPIUtilities_h
