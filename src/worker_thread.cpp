#include "taskpool/worker_thread.h"

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

#include "log.h"
#include "taskpool/thread_pool.h"
#include "thread_name.h"

namespace taskpool {

const char* to_string(ThreadStatus status) noexcept {
  switch (status) {
    case ThreadStatus::kInactive:
      return "inactive";
    case ThreadStatus::kWaiting:
      return "waiting";
    case ThreadStatus::kWorking:
      return "working";
  }
  return "unknown";
}

WorkerThread::WorkerThread(ThreadPool& pool, int id, std::string name)
    : pool_(pool), id_(id), name_(std::move(name)) {}

WorkerThread::~WorkerThread() {
  exit();
  join();
}

void WorkerThread::start() {
  std::lock_guard<std::mutex> lk(thread_mu_);
  if (thread_.joinable() || started_.load()) {
    throw std::logic_error("WorkerThread: " + name_ + " already started");
  }
  thread_ = std::thread([this]() { run(); });
}

void WorkerThread::exit() {
  exit_requested_.store(true);
  private_queue_.close();
}

void WorkerThread::join() {
  std::lock_guard<std::mutex> lk(thread_mu_);
  if (!thread_.joinable()) {
    return;
  }
  if (thread_.get_id() == std::this_thread::get_id()) {
    detail::log_warning(name_ + ": join from own thread, detaching");
    thread_.detach();
    return;
  }
  thread_.join();
}

void WorkerThread::run() {
  detail::set_current_thread_name(name_);
  status_.store(ThreadStatus::kWaiting);
  started_.store(true);
  pool_.notify_threads_changed();

  // A throwing job takes down this worker only; the pool starts a
  // replacement. The job still counts as finished so wait() callers are not
  // left hanging.
  std::size_t failed = 0;
  try {
    execute_loop();
  } catch (const std::exception& e) {
    detail::log_error(name_ + ": job threw, worker terminating: " + e.what());
    failed = 1;
  } catch (...) {
    detail::log_error(name_ + ": job threw a non-standard exception, worker terminating");
    failed = 1;
  }

  status_.store(ThreadStatus::kInactive);
  const std::size_t abandoned = private_queue_.close_and_drain().size();
  if (abandoned > 0) {
    detail::log_warning(name_ + ": abandoned " + std::to_string(abandoned) +
                        " queued job(s) on exit");
  }
  if (failed > 0) {
    pool_.replace_faulted_thread(id_);
  }
  pool_.on_jobs_finished(failed + abandoned);
  pool_.notify_threads_changed();
}

void WorkerThread::execute_loop() {
  while (std::optional<Job> job = private_queue_.wait_dequeue()) {
    status_.store(ThreadStatus::kWorking);
    job->execute();
    status_.store(ThreadStatus::kWaiting);
    pool_.on_jobs_finished(1);
  }
}

}  // namespace taskpool
