//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_Warnings_h
#define seedrl_Warnings_h

#include "MPIUtilities.h"

namespace seedrl
{
namespace Warnings
{
enum Debug_level { SILENT, WARNINGS, SCHEDULER, COMMUNICATOR, LEARNERS };

static constexpr Debug_level level = WARNINGS;
//static constexpr Debug_level level = COMMUNICATOR;
//static constexpr Debug_level level = SCHEDULER;

// Messages read "Rank R (role) [seconds since start] func(file:line) text".
// The role ("learner 0", "actor 3") is set once the rank layout is known.
void setProcessRole(const char * role);
void print_warning(const char * funcname, const char * filename,
                   int line, const char * fmt, ...);
void print_stacktrace();
void abort_all();

#define    die(format)      do {                                               \
  using namespace seedrl::Warnings;                                            \
  print_warning(__func__, __FILE__, __LINE__, format);                         \
  print_stacktrace(); abort_all(); } while(0)

#define   _die(format, ...) do {                                               \
  using namespace seedrl::Warnings;                                            \
  print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);          \
  print_stacktrace(); abort_all(); } while(0)

#define   warn(format)  do { \
  if(seedrl::Warnings::level >= seedrl::Warnings::WARNINGS) {                  \
    using namespace seedrl::Warnings;                                          \
    print_warning(__func__, __FILE__, __LINE__, format);                       \
  } } while(0)

#define  _warn(format, ...)  do { \
  if(seedrl::Warnings::level >= seedrl::Warnings::WARNINGS) {                  \
    using namespace seedrl::Warnings;                                          \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

#define debugS(format, ...)  do { \
  if(seedrl::Warnings::level == seedrl::Warnings::SCHEDULER) {                 \
    using namespace seedrl::Warnings;                                          \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

#define debugC(format, ...)  do { \
  if(seedrl::Warnings::level == seedrl::Warnings::COMMUNICATOR) {              \
    using namespace seedrl::Warnings;                                          \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

#define debugL(format, ...)  do { \
  if(seedrl::Warnings::level == seedrl::Warnings::LEARNERS) {                  \
    using namespace seedrl::Warnings;                                          \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

} // end namespace Warnings

} // end namespace seedrl
#endif
