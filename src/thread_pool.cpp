#include "taskpool/thread_pool.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "log.h"
#include "taskpool/scheduler.h"

namespace taskpool {

namespace {

PoolOptions options_with_threads(std::size_t num_threads) {
  PoolOptions options;
  options.num_threads = num_threads;
  return options;
}

}  // namespace

ThreadPool::ThreadPool(std::size_t num_threads)
    : ThreadPool(options_with_threads(num_threads)) {}

ThreadPool::ThreadPool(PoolOptions options) : options_(std::move(options)) {
  if (options_.num_threads == 0) {
    throw std::invalid_argument("ThreadPool: num_threads must be > 0");
  }
  if (options_.name_prefix.empty()) {
    throw std::invalid_argument("ThreadPool: name_prefix must not be empty");
  }

  try {
    std::unique_lock<std::mutex> lk(threads_mu_);
    std::vector<ThreadHandle> spawned;
    spawned.reserve(options_.num_threads);
    for (std::size_t i = 0; i < options_.num_threads; i++) {
      spawned.push_back(spawn_thread_locked(nullptr));
    }
    // Jobs submitted right after construction must find waiting workers.
    threads_cv_.wait(lk, [&spawned]() {
      return std::all_of(spawned.begin(), spawned.end(),
                         [](const ThreadHandle& w) { return w->started(); });
    });
    lk.unlock();

    scheduler_ = std::make_unique<Scheduler>(*this);
  } catch (...) {
    destroy();
    throw;
  }
}

ThreadPool::~ThreadPool() {
  destroy();
}

ThreadPool& ThreadPool::default_pool() {
  static ThreadPool pool(1);
  return pool;
}

ThreadPool::ThreadHandle ThreadPool::new_thread() {
  return create_thread(nullptr);
}

ThreadPool::ThreadHandle ThreadPool::new_thread(const std::string& key) {
  return create_thread(&key);
}

ThreadPool::ThreadHandle ThreadPool::get_thread(const std::string& key) const {
  std::lock_guard<std::mutex> lk(threads_mu_);
  auto k = keys_.find(key);
  if (k == keys_.end()) {
    return nullptr;
  }
  auto w = workers_.find(k->second);
  if (w == workers_.end()) {
    return nullptr;
  }
  return w->second;
}

bool ThreadPool::destroy_thread(const std::string& key) {
  ThreadHandle worker;
  {
    std::lock_guard<std::mutex> lk(threads_mu_);
    auto k = keys_.find(key);
    if (k == keys_.end()) {
      return false;
    }
    auto w = workers_.find(k->second);
    keys_.erase(k);
    if (w == workers_.end()) {
      return false;
    }
    worker = w->second;
    workers_.erase(w);
    retired_.push_back(worker);
  }

  worker->exit();
  reap_retired();
  return true;
}

void ThreadPool::add_job(std::function<void()> block) {
  submit(Job(std::move(block)));
}

void ThreadPool::add_job(Job::Function function, void* argument) {
  submit(Job(function, argument));
}

bool ThreadPool::add_job_to(const std::string& key, std::function<void()> block) {
  Job job(std::move(block));
  ThreadHandle worker = get_thread(key);
  if (!worker) {
    return false;
  }
  on_job_added();
  if (!worker->private_queue().enqueue(std::move(job))) {
    on_jobs_finished(1);
    return false;
  }
  return true;
}

void ThreadPool::wait() {
  std::unique_lock<std::mutex> lk(jobs_mu_);
  ++waiters_;
  // A job stays unfinished until its worker is back to waiting, so this
  // also means the global queue is empty and nobody is working.
  jobs_cv_.wait(lk, [this]() { return unfinished_jobs_ == 0; });
  --waiters_;
}

void ThreadPool::destroy() {
  {
    std::lock_guard<std::mutex> lk(threads_mu_);
    if (destroyed_) {
      return;
    }
    destroyed_ = true;
  }

  // Scheduler first, so queued jobs still reach a worker.
  if (scheduler_) {
    scheduler_->destroy();
  } else {
    global_queue_.close();
  }

  std::vector<ThreadHandle> workers;
  {
    std::lock_guard<std::mutex> lk(threads_mu_);
    for (const auto& entry : workers_) {
      workers.push_back(entry.second);
    }
    workers.insert(workers.end(), retired_.begin(), retired_.end());
    retired_.clear();
  }
  for (auto& worker : workers) worker->exit();
  for (auto& worker : workers) worker->join();
}

std::vector<ThreadPool::ThreadHandle> ThreadPool::alive_threads() const {
  return threads_with_status([](ThreadStatus s) { return s != ThreadStatus::kInactive; });
}

std::vector<ThreadPool::ThreadHandle> ThreadPool::waiting_threads() const {
  return threads_with_status([](ThreadStatus s) { return s == ThreadStatus::kWaiting; });
}

std::vector<ThreadPool::ThreadHandle> ThreadPool::working_threads() const {
  return threads_with_status([](ThreadStatus s) { return s == ThreadStatus::kWorking; });
}

std::size_t ThreadPool::size() const {
  std::lock_guard<std::mutex> lk(threads_mu_);
  return workers_.size();
}

bool ThreadPool::draining() const {
  std::lock_guard<std::mutex> lk(jobs_mu_);
  return waiters_ > 0;
}

ThreadPool::ThreadHandle ThreadPool::create_thread(const std::string* key) {
  std::unique_lock<std::mutex> lk(threads_mu_);
  if (destroyed_) {
    throw std::runtime_error("new_thread() on destroyed ThreadPool");
  }
  if (key != nullptr && keys_.count(*key) > 0) {
    throw std::invalid_argument("ThreadPool: key already in use: " + *key);
  }
  ThreadHandle worker = spawn_thread_locked(key);
  threads_cv_.wait(lk, [&worker]() { return worker->started(); });
  return worker;
}

ThreadPool::ThreadHandle ThreadPool::spawn_thread_locked(const std::string* key) {
  const int id = next_id_++;
  auto worker = std::make_shared<WorkerThread>(
      *this, id, options_.name_prefix + "-worker-" + std::to_string(id));
  worker->start();
  workers_.emplace(id, worker);
  if (key != nullptr) {
    keys_[*key] = id;
  }
  return worker;
}

std::vector<ThreadPool::ThreadHandle> ThreadPool::threads_with_status(
    bool (*keep)(ThreadStatus)) const {
  std::vector<ThreadHandle> out;
  std::lock_guard<std::mutex> lk(threads_mu_);
  for (const auto& entry : workers_) {
    if (keep(entry.second->status())) out.push_back(entry.second);
  }
  return out;
}

std::vector<ThreadPool::ThreadHandle> ThreadPool::accepting_threads() const {
  std::vector<ThreadHandle> out;
  std::lock_guard<std::mutex> lk(threads_mu_);
  for (const auto& entry : workers_) {
    if (entry.second->accepting()) out.push_back(entry.second);
  }
  return out;
}

bool ThreadPool::has_accepting_thread_locked() const {
  return std::any_of(workers_.begin(), workers_.end(),
                     [](const auto& entry) { return entry.second->accepting(); });
}

// Called on the faulted worker's own thread. The dead worker is retired and
// an anonymous worker takes over its id slot in the key index.
void ThreadPool::replace_faulted_thread(int id) {
  std::lock_guard<std::mutex> lk(threads_mu_);
  if (destroyed_) {
    return;
  }
  auto w = workers_.find(id);
  if (w == workers_.end()) {
    return;
  }
  retired_.push_back(w->second);
  workers_.erase(w);

  ThreadHandle replacement;
  try {
    replacement = spawn_thread_locked(nullptr);
  } catch (const std::exception& e) {
    detail::log_error("cannot replace faulted worker " + std::to_string(id) + ": " + e.what());
    return;
  }
  for (auto& entry : keys_) {
    if (entry.second == id) entry.second = replacement->id();
  }
  threads_cv_.notify_all();
}

void ThreadPool::submit(Job job) {
  on_job_added();
  if (!global_queue_.enqueue(std::move(job))) {
    on_jobs_finished(1);
    throw std::runtime_error("add_job() on destroyed ThreadPool");
  }
}

void ThreadPool::reap_retired() {
  std::vector<ThreadHandle> finished;
  {
    std::lock_guard<std::mutex> lk(threads_mu_);
    auto done = std::partition(retired_.begin(), retired_.end(),
                               [](const ThreadHandle& w) { return w->alive(); });
    finished.assign(done, retired_.end());
    retired_.erase(done, retired_.end());
  }
  for (auto& worker : finished) worker->join();
}

void ThreadPool::notify_threads_changed() {
  std::lock_guard<std::mutex> lk(threads_mu_);
  threads_cv_.notify_all();
}

void ThreadPool::on_job_added() {
  std::lock_guard<std::mutex> lk(jobs_mu_);
  ++unfinished_jobs_;
}

void ThreadPool::on_jobs_finished(std::size_t count) {
  {
    std::lock_guard<std::mutex> lk(jobs_mu_);
    unfinished_jobs_ -= count;
  }
  jobs_cv_.notify_all();
}

}  // namespace taskpool
