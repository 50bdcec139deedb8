#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

#include "taskpool/job_queue.h"

namespace taskpool {

class ThreadPool;

enum class ThreadStatus {
  kInactive,  // not started yet, or terminated
  kWaiting,   // idle, blocked on the private queue
  kWorking,   // executing a job
};

const char* to_string(ThreadStatus status) noexcept;

// WorkerThread: one OS thread draining its own private queue. Created and
// owned by a ThreadPool; once inactive it is never restarted.
class WorkerThread {
 public:
  WorkerThread(ThreadPool& pool, int id, std::string name);
  ~WorkerThread();

  WorkerThread(const WorkerThread&) = delete;
  WorkerThread& operator=(const WorkerThread&) = delete;

  void start();

  // Requests termination. Takes effect at the worker's next wake-up; jobs
  // still in the private queue at that point are abandoned.
  void exit();

  // Waits for the OS thread to finish. From the worker's own thread the
  // thread is detached instead.
  void join();

  int id() const noexcept { return id_; }
  const std::string& name() const noexcept { return name_; }
  ThreadStatus status() const noexcept { return status_.load(); }
  bool alive() const noexcept { return status() != ThreadStatus::kInactive; }

  // Alive and not asked to exit: may still receive jobs.
  bool accepting() const noexcept { return alive() && !exit_requested_.load(); }

  // True once the OS thread has entered its run loop.
  bool started() const noexcept { return started_.load(); }

  std::size_t pending_jobs() const { return private_queue_.count(); }
  JobQueue& private_queue() noexcept { return private_queue_; }

 private:
  void run();
  void execute_loop();

  ThreadPool& pool_;
  const int id_;
  const std::string name_;
  JobQueue private_queue_;
  std::atomic<ThreadStatus> status_{ThreadStatus::kInactive};
  std::atomic<bool> started_{false};
  std::atomic<bool> exit_requested_{false};
  std::mutex thread_mu_;
  std::thread thread_;
};

}  // namespace taskpool
