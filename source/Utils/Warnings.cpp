//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Warnings.h"

#ifdef SEEDRL_PRINT_STACK_TRACE
#define BACKWARD_HAS_DW 0
#define BACKWARD_HAS_BFD 1
#define BACKWARD_HAS_DWARF 0
#define BACKWARD_HAS_UNWIND 0
#define BACKWARD_HAS_BACKTRACE 0
#define BACKWARD_HAS_BACKTRACE_SYMBOL 0
#include <backward.hpp>
#include <sstream>
#endif

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdarg.h>

namespace seedrl
{
namespace Warnings
{
static std::mutex warn_mutex;
static char processRole[64] = "";
static const auto processStart = std::chrono::steady_clock::now();

void setProcessRole(const char * role)
{
  std::lock_guard<std::mutex> wlock(warn_mutex);
  snprintf(processRole, sizeof(processRole), "%s", role);
}

void print_warning(const char * funcname, const char * filename,
                   int line, const char * fmt, ...)
{
  std::lock_guard<std::mutex> wlock(warn_mutex);
  const auto wrnk = MPIworldRank();
  const double elapsed = std::chrono::duration<double>(
    std::chrono::steady_clock::now() - processStart).count();
  const char * const slash = strrchr(filename, '/');
  const char * const file = slash ? slash + 1 : filename;

  char BUF[1024];
  va_list args;
  va_start (args, fmt);
  const int len = vsnprintf (BUF, sizeof(BUF), fmt, args);
  va_end (args);
  if(len >= (int) sizeof(BUF)) strcpy(BUF + sizeof(BUF) - 4, "...");

  if(processRole[0] == 0)
    fprintf(stderr, "Rank %u [%.3fs] %s(%s:%d) %s\n",
      wrnk, elapsed, funcname, file, line, BUF);
  else
    fprintf(stderr, "Rank %u (%s) [%.3fs] %s(%s:%d) %s\n",
      wrnk, processRole, elapsed, funcname, file, line, BUF);
  fflush(stdout); fflush(stderr); fflush(0);
}

void print_stacktrace()
{
  #ifdef SEEDRL_PRINT_STACK_TRACE
    std::ostringstream strace;
    using namespace backward;

    StackTrace st;
    st.load_here(64);
    Printer p;
    p.object = true;
    p.color_mode = ColorMode::automatic;
    p.address = true;
    p.print(st, strace);

    fwrite(strace.str().c_str(), sizeof(char), strace.str().size(), stderr);
    fflush(stdout); fflush(stderr); fflush(0);
  #endif
}

// Takes down every rank: an actor that dies alone would leave its learner
// waiting for a check-out, and a learner its actors blocked in a receive.
void abort_all()
{
  if(MPIisInitialized()) MPI_Abort(MPI_COMM_WORLD, 1);
  std::abort();
}

} // end namespace Warnings

} // end namespace seedrl
