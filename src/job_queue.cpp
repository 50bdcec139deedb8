#include "taskpool/job_queue.h"

#include <utility>

namespace taskpool {

bool JobQueue::enqueue(Job&& job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) {
      return false;
    }
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

std::optional<Job> JobQueue::dequeue_if_any() {
  std::lock_guard<std::mutex> lk(mu_);
  if (jobs_.empty()) {
    return std::nullopt;
  }
  std::optional<Job> job(std::move(jobs_.front()));
  jobs_.pop_front();
  return job;
}

std::optional<Job> JobQueue::wait_dequeue() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this]() { return closed_ || !jobs_.empty(); });
  if (closed_) {
    return std::nullopt;
  }
  std::optional<Job> job(std::move(jobs_.front()));
  jobs_.pop_front();
  return job;
}

std::size_t JobQueue::count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return jobs_.size();
}

void JobQueue::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool JobQueue::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::vector<Job> JobQueue::close_and_drain() {
  std::vector<Job> left;
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    left.reserve(jobs_.size());
    for (auto& job : jobs_) {
      left.push_back(std::move(job));
    }
    jobs_.clear();
  }
  cv_.notify_all();
  return left;
}

}  // namespace taskpool
