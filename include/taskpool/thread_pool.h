#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "taskpool/job.h"
#include "taskpool/job_queue.h"
#include "taskpool/worker_thread.h"

namespace taskpool {

class Scheduler;

struct PoolOptions {
  std::size_t num_threads = 1;
  // Worker threads are named "<name_prefix>-worker-<id>".
  std::string name_prefix = "pool";
};

// ThreadPool: worker threads with private queues, fed from one global queue
// by a load-balancing scheduler. Workers can also be created under a key and
// addressed directly.
class ThreadPool {
 public:
  using ThreadHandle = std::shared_ptr<WorkerThread>;

  // Returns once every worker is waiting for jobs.
  explicit ThreadPool(std::size_t num_threads);
  explicit ThreadPool(PoolOptions options);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Process-wide pool with a single worker, created on first use.
  static ThreadPool& default_pool();

  ThreadHandle new_thread();
  ThreadHandle new_thread(const std::string& key);

  // nullptr if no worker is registered under `key`.
  ThreadHandle get_thread(const std::string& key) const;

  // Asks the keyed worker to exit and forgets it. False if `key` is unknown.
  bool destroy_thread(const std::string& key);

  void add_job(std::function<void()> block);
  void add_job(Job::Function function, void* argument);

  // Queues the job on the keyed worker only, bypassing the scheduler.
  bool add_job_to(const std::string& key, std::function<void()> block);

  // Blocks until every submitted job has finished or been abandoned. Must
  // not be called from one of this pool's jobs.
  void wait();

  // Stops the scheduler, then every worker. Later calls do nothing. Like
  // wait(), not meant to be called from this pool's jobs.
  void destroy();

  std::vector<ThreadHandle> alive_threads() const;
  std::vector<ThreadHandle> waiting_threads() const;
  std::vector<ThreadHandle> working_threads() const;

  std::size_t size() const;
  std::size_t queued_jobs() const { return global_queue_.count(); }
  bool draining() const;
  const std::string& name_prefix() const noexcept { return options_.name_prefix; }

 private:
  friend class Scheduler;
  friend class WorkerThread;

  ThreadHandle create_thread(const std::string* key);
  ThreadHandle spawn_thread_locked(const std::string* key);
  std::vector<ThreadHandle> threads_with_status(bool (*keep)(ThreadStatus)) const;
  std::vector<ThreadHandle> accepting_threads() const;
  bool has_accepting_thread_locked() const;
  void replace_faulted_thread(int id);
  void submit(Job job);
  void reap_retired();

  void notify_threads_changed();
  void on_job_added();
  void on_jobs_finished(std::size_t count);

  const PoolOptions options_;
  JobQueue global_queue_;

  // Owns the workers; keys_ only indexes into it.
  mutable std::mutex threads_mu_;
  std::condition_variable threads_cv_;
  std::map<int, ThreadHandle> workers_;
  std::unordered_map<std::string, int> keys_;
  std::vector<ThreadHandle> retired_;
  int next_id_{0};
  bool destroyed_{false};

  // Completion state for wait().
  mutable std::mutex jobs_mu_;
  std::condition_variable jobs_cv_;
  std::size_t unfinished_jobs_{0};
  std::size_t waiters_{0};

  std::unique_ptr<Scheduler> scheduler_;
};

}  // namespace taskpool
