//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Utils/MetricLogger.h"
#include "Utils/Profiler.h"
#include "Utils/TaskQueue.h"
#include "Utils/Warnings.h"

#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace seedrl;

namespace
{

std::vector<std::string> readLines(const std::string& path)
{
  std::ifstream file(path);
  std::vector<std::string> lines;
  std::string line;
  while(std::getline(file, line)) lines.push_back(line);
  return lines;
}

std::string makeTempFolder()
{
  char name[] = "/tmp/seedrl_logXXXXXX";
  const char * const path = mkdtemp(name);
  if(path == nullptr) throw std::runtime_error("mkdtemp failed");
  return std::string(path);
}

}

TEST(TaskQueue, RunsReadyAndPeriodicTasks)
{
  TaskQueue tasks;
  int iteration = 0;
  std::vector<std::string> order;
  tasks.add("even", [&] () { return iteration % 2 == 0; },
                    [&] () { order.push_back("even"); });
  tasks.addPeriodic("third", 3, [&] () { order.push_back("third"); });
  tasks.add("always", [&] () { order.push_back("always"); });
  EXPECT_EQ(tasks.size(), 3u);

  for(iteration=0; iteration<6; ++iteration) tasks.run();
  EXPECT_EQ(tasks.iterations(), 6);
  EXPECT_EQ(tasks.runs("even"), 3);
  EXPECT_EQ(tasks.runs("third"), 2);
  EXPECT_EQ(tasks.runs("always"), 6);
  EXPECT_THROW(tasks.runs("never"), std::out_of_range);

  // third iteration runs all tasks in the order they were added
  EXPECT_EQ(order[3], "even");
  EXPECT_EQ(order[4], "third");
  EXPECT_EQ(order[5], "always");
  EXPECT_EQ(tasks.run(), 2u); // iteration 7 with iteration == 6
}

TEST(TaskQueue, RejectsZeroPeriod)
{
  TaskQueue tasks;
  EXPECT_THROW(tasks.addPeriodic("log", 0, [] () {}), std::invalid_argument);
  EXPECT_EQ(tasks.size(), 0u);
}

TEST(Profiler, AccumulatesExclusivePhases)
{
  Profiler prof;
  prof.start("A");
  usleep(2000);
  prof.stop_start("B");
  prof.stop_start("A");
  prof.stop();
  prof.stop(); // nothing ongoing
  EXPECT_EQ(prof.calls("A"), 2);
  EXPECT_EQ(prof.calls("B"), 1);
  EXPECT_GE(prof.total("A"), 0.002);
  EXPECT_EQ(prof.total("C"), 0);

  const std::string stats = prof.printStatAndReset();
  EXPECT_NE(stats.find("[A]"), std::string::npos);
  EXPECT_NE(stats.find("(1 calls)"), std::string::npos);
  EXPECT_EQ(prof.calls("A"), 0);
}

TEST(FileLogger, WritesHeaderOncePerChannel)
{
  const std::string root = makeTempFolder();
  {
    FileLogger logger(root, "run", 3, 2);
    logger.log("system", {{"runtime", 1.5}, {"queue_batches", 2}});
    logger.log("system", {{"runtime", 2.5}, {"queue_batches", 0}});
    logger.log("system", {{"runtime", 3.5}, {"queue_batches", 1}});
    logger.log("episodes", {{"return", 10}});
    EXPECT_EQ(logger.directory(), root + "/run");
  } // flushed on destruction

  const auto system = readLines(root + "/run/system_rank03.log");
  ASSERT_EQ(system.size(), 4u);
  EXPECT_EQ(system[0], "runtime queue_batches ");
  EXPECT_EQ(system[1], "1.5 2 ");
  EXPECT_EQ(system[3], "3.5 1 ");
  const auto episodes = readLines(root + "/run/episodes_rank03.log");
  ASSERT_EQ(episodes.size(), 2u);
  EXPECT_EQ(episodes[1], "10 ");
}

TEST(FileLogger, UnwritableFolderThrows)
{
  EXPECT_THROW(FileLogger("/proc/seedrl_no_such_dir", "", 0), std::runtime_error);
}

TEST(Warnings, PrefixCarriesRoleAndLocation)
{
  testing::internal::CaptureStderr();
  _warn("queue depth %d", 3);
  const std::string plain = testing::internal::GetCapturedStderr();
  EXPECT_EQ(plain.find("Rank 0 ["), 0u);
  EXPECT_NE(plain.find("(test_utils.cpp:"), std::string::npos);
  EXPECT_NE(plain.find("queue depth 3\n"), std::string::npos);

  Warnings::setProcessRole("actor 2");
  testing::internal::CaptureStderr();
  _warn("%s", std::string(2000, 'x').c_str());
  const std::string tagged = testing::internal::GetCapturedStderr();
  Warnings::setProcessRole("");
  EXPECT_EQ(tagged.find("Rank 0 (actor 2) ["), 0u);
  EXPECT_NE(tagged.find("x...\n"), std::string::npos);
  EXPECT_LT(tagged.size(), 1200u);
}
