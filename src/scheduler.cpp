#include "taskpool/scheduler.h"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "log.h"
#include "taskpool/thread_pool.h"
#include "thread_name.h"

namespace taskpool {

std::size_t least_loaded(const std::vector<std::size_t>& loads) {
  if (loads.empty()) {
    throw std::invalid_argument("least_loaded: no candidates");
  }
  std::size_t best = 0;
  for (std::size_t i = 1; i < loads.size(); i++) {
    if (loads[i] < loads[best]) best = i;
  }
  return best;
}

std::shared_ptr<WorkerThread> with_min_jobs(
    const std::vector<std::shared_ptr<WorkerThread>>& workers) {
  std::vector<std::size_t> loads;
  loads.reserve(workers.size());
  for (const auto& worker : workers) {
    loads.push_back(worker->pending_jobs());
  }
  return workers[least_loaded(loads)];
}

Scheduler::Scheduler(ThreadPool& pool) : pool_(pool) {
  thread_ = std::thread([this]() { run(); });
}

Scheduler::~Scheduler() {
  destroy();
}

void Scheduler::destroy() {
  {
    std::lock_guard<std::mutex> lk(pool_.threads_mu_);
    stopping_ = true;
  }
  pool_.threads_cv_.notify_all();
  pool_.global_queue_.close();

  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void Scheduler::run() {
  detail::set_current_thread_name(pool_.name_prefix() + "-sched");

  while (std::optional<Job> job = pool_.global_queue_.wait_dequeue()) {
    dispatch(std::move(*job));
  }

  // Closed: hand over what is left instead of dropping it.
  for (Job& job : pool_.global_queue_.close_and_drain()) {
    dispatch(std::move(job));
  }
}

// Workers asked to exit are skipped: their queue is closed but they stay
// alive until their current job returns.
void Scheduler::dispatch(Job job) {
  while (true) {
    std::vector<std::shared_ptr<WorkerThread>> workers = pool_.accepting_threads();
    if (workers.empty()) {
      if (wait_for_accepting_worker()) continue;
      detail::log_warning("scheduler stopped with no worker accepting jobs, job abandoned");
      pool_.on_jobs_finished(1);
      return;
    }
    // A refused enqueue means the worker exited after it was picked; the
    // next round no longer lists it.
    if (with_min_jobs(workers)->private_queue().enqueue(std::move(job))) {
      return;
    }
  }
}

bool Scheduler::wait_for_accepting_worker() {
  std::unique_lock<std::mutex> lk(pool_.threads_mu_);
  pool_.threads_cv_.wait(lk, [this]() {
    return stopping_ || pool_.has_accepting_thread_locked();
  });
  return pool_.has_accepting_thread_locked();
}

}  // namespace taskpool
