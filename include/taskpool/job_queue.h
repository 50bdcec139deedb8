#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "taskpool/job.h"

namespace taskpool {

// JobQueue: unbounded, thread-safe FIFO of jobs. Serves as the pool's global
// queue and as each worker's private queue.
class JobQueue {
 public:
  JobQueue() = default;

  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  // Appends to the tail and wakes one waiter. Returns false once the queue
  // is closed; `job` is left untouched in that case.
  bool enqueue(Job&& job);

  // Removes the head if there is one. Never blocks.
  std::optional<Job> dequeue_if_any();

  // Blocks until a job is available or the queue is closed. Returns empty
  // after close() even if jobs are still stored.
  std::optional<Job> wait_dequeue();

  std::size_t count() const;

  void close();
  bool closed() const;

  // Closes the queue and hands back whatever was left, in FIFO order.
  std::vector<Job> close_and_drain();

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool closed_{false};
};

}  // namespace taskpool
