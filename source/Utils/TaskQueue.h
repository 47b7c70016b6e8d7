//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef seedrl_TaskQueue_h
#define seedrl_TaskQueue_h

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace seedrl
{

// Housekeeping of a polling loop (metric logs, prints, liveness and stop
// checks). Every call to run() is one loop iteration: each task whose period
// divides the iteration count and whose condition holds is executed, in the
// order the tasks were added.
class TaskQueue
{
  using cond_t = std::function<bool()>;
  using func_t = std::function<void()>;

  struct Task
  {
    std::string name;
    unsigned period; // 1: every iteration
    cond_t ready;    // empty: always ready
    func_t work;
    long nRuns;
  };
  std::vector<Task> tasks;
  long nIterations = 0;

  void push(const std::string& name, const unsigned period, cond_t && cond,
            func_t && func)
  {
    if(period == 0)
      throw std::invalid_argument("task " + name + " has period 0");
    tasks.push_back(Task{name, period, std::move(cond), std::move(func), 0});
  }

public:
  void add(const std::string& name, cond_t && cond, func_t && func) {
    push(name, 1, std::move(cond), std::move(func));
  }
  void add(const std::string& name, func_t && func) {
    push(name, 1, cond_t(), std::move(func));
  }
  // runs on iterations period, 2*period, ...
  void addPeriodic(const std::string& name, const unsigned period,
                   func_t && func) {
    push(name, period, cond_t(), std::move(func));
  }

  // returns the number of tasks executed in this iteration
  unsigned run()
  {
    ++nIterations;
    unsigned nExecuted = 0;
    for(auto& task : tasks) {
      if(nIterations % task.period not_eq 0) continue;
      if(task.ready && not task.ready()) continue;
      task.work();
      ++task.nRuns;
      ++nExecuted;
    }
    return nExecuted;
  }

  long runs(const std::string& name) const
  {
    for(const auto& task : tasks) if(task.name == name) return task.nRuns;
    throw std::out_of_range("no task named " + name);
  }
  long iterations() const { return nIterations; }
  size_t size() const { return tasks.size(); }
};

} // end namespace seedrl
#endif // seedrl_TaskQueue_h
