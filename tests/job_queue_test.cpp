#include "taskpool/job_queue.h"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "require.h"

using taskpool::Job;
using taskpool::JobQueue;

static void add_to(void* arg) {
  static_cast<std::atomic<int>*>(arg)->fetch_add(10);
}

static void test_job() {
  std::atomic<int> hits{0};

  Job block([&hits]() { hits.fetch_add(1); });
  require(!block.executed(), "fresh job reports executed");
  block.execute();
  require(hits.load() == 1, "closure job did not run");
  require(block.executed(), "job not marked executed");

  bool rejected = false;
  try {
    block.execute();
  } catch (const std::logic_error&) {
    rejected = true;
  }
  require(rejected, "second execute() should throw");
  require(hits.load() == 1, "job ran twice");

  Job fn(&add_to, &hits);
  fn.execute();
  require(hits.load() == 11, "function + argument job did not run");

  bool invalid = false;
  try {
    Job empty{std::function<void()>()};
  } catch (const std::invalid_argument&) {
    invalid = true;
  }
  require(invalid, "empty callable should be rejected");

  invalid = false;
  try {
    Job null_fn(nullptr, &hits);
  } catch (const std::invalid_argument&) {
    invalid = true;
  }
  require(invalid, "null function should be rejected");
}

static void test_fifo_and_count() {
  JobQueue q;
  std::vector<int> order;

  require(q.count() == 0, "new queue not empty");
  require(!q.dequeue_if_any().has_value(), "dequeue on empty queue returned a job");

  for (int i = 0; i < 5; i++) {
    require(q.enqueue(Job([&order, i]() { order.push_back(i); })), "enqueue refused");
  }
  require(q.count() == 5, "count after 5 enqueues");

  while (auto job = q.dequeue_if_any()) job->execute();
  require(q.count() == 0, "count after draining");
  require(order == std::vector<int>({0, 1, 2, 3, 4}), "queue is not FIFO");
}

static void test_close() {
  JobQueue q;
  std::atomic<int> hits{0};
  q.enqueue(Job([&hits]() { hits++; }));
  q.enqueue(Job([&hits]() { hits++; }));

  std::vector<Job> left = q.close_and_drain();
  require(left.size() == 2, "close_and_drain lost jobs");
  require(q.closed(), "queue not closed");
  require(q.count() == 0, "closed queue still counts jobs");

  Job late([&hits]() { hits++; });
  require(!q.enqueue(std::move(late)), "closed queue accepted a job");
  require(!late.executed(), "refused job was consumed");
  late.execute();
  require(hits.load() == 1, "refused job no longer runnable");

  require(!q.wait_dequeue().has_value(), "wait_dequeue on closed queue returned a job");
}

static void test_wait_dequeue_wakes() {
  JobQueue q;

  auto consumer = std::async(std::launch::async, [&q]() { return q.wait_dequeue().has_value(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  q.enqueue(Job([]() {}));
  require(consumer.wait_for(std::chrono::seconds(5)) == std::future_status::ready,
          "enqueue did not wake the waiter");
  require(consumer.get(), "waiter got no job");

  auto closer = std::async(std::launch::async, [&q]() { return q.wait_dequeue().has_value(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  q.close();
  require(closer.wait_for(std::chrono::seconds(5)) == std::future_status::ready,
          "close did not wake the waiter");
  require(!closer.get(), "waiter got a job from a closed queue");
}

static void test_concurrent_no_loss() {
  JobQueue q;
  const int producers = 4;
  const int per_producer = 5000;
  const int total = producers * per_producer;

  std::vector<std::atomic<int>> runs(total);
  for (auto& r : runs) r.store(0);

  std::atomic<int> consumed{0};
  std::vector<std::thread> threads;
  for (int p = 0; p < producers; p++) {
    threads.emplace_back([&q, &runs, p]() {
      for (int i = 0; i < per_producer; i++) {
        const int slot = p * per_producer + i;
        q.enqueue(Job([&runs, slot]() { runs[slot].fetch_add(1); }));
      }
    });
  }
  for (int c = 0; c < 3; c++) {
    threads.emplace_back([&q, &consumed]() {
      while (consumed.load() < total) {
        if (auto job = q.dequeue_if_any()) {
          job->execute();
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  require(consumed.load() == total, "consumed count mismatch");
  require(q.count() == 0, "jobs left behind");
  for (auto& r : runs) require(r.load() == 1, "job lost or duplicated");
}

int main() {
  test_job();
  test_fifo_and_count();
  test_close();
  test_wait_dequeue_wakes();
  test_concurrent_no_loss();

  std::cout << "OK: job queue\n";
  return 0;
}
