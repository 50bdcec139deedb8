#pragma once

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "taskpool/job.h"
#include "taskpool/worker_thread.h"

namespace taskpool {

class ThreadPool;

// Index of the smallest load; ties go to the lowest index.
// Throws std::invalid_argument on an empty input.
std::size_t least_loaded(const std::vector<std::size_t>& loads);

// The worker with the fewest pending private jobs, first one on ties.
std::shared_ptr<WorkerThread> with_min_jobs(
    const std::vector<std::shared_ptr<WorkerThread>>& workers);

// Scheduler: moves jobs from the pool's global queue to the private queue
// of the least loaded alive worker, on its own thread.
class Scheduler {
 public:
  explicit Scheduler(ThreadPool& pool);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Stops the dispatch loop. Jobs still in the global queue are handed to
  // workers before the thread ends. Safe to call more than once.
  void destroy();

 private:
  void run();
  void dispatch(Job job);
  bool wait_for_accepting_worker();

  ThreadPool& pool_;
  bool stopping_{false};  // guarded by the pool's threads mutex
  std::thread thread_;
};

}  // namespace taskpool
