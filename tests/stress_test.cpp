#include "taskpool/thread_pool.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

#include "require.h"

using taskpool::ThreadPool;

int main() {
  const std::size_t nthreads = std::max<std::size_t>(2, std::thread::hardware_concurrency());
  ThreadPool pool(nthreads);

  // Test 1: several producers, every job runs exactly once.
  const int producers = 4;
  const int per_producer = 5000;
  const int N = producers * per_producer;
  std::vector<std::atomic<int>> runs(N);
  for (auto& r : runs) r.store(0);

  std::vector<std::thread> submitters;
  for (int p = 0; p < producers; p++) {
    submitters.emplace_back([&pool, &runs, p]() {
      for (int i = 0; i < per_producer; i++) {
        const int slot = p * per_producer + i;
        pool.add_job([&runs, slot]() { runs[slot].fetch_add(1, std::memory_order_relaxed); });
      }
    });
  }
  for (auto& t : submitters) t.join();
  pool.wait();

  for (auto& r : runs) require(r.load() == 1, "job lost or duplicated");
  require(pool.queued_jobs() == 0, "global queue not drained");
  require(pool.working_threads().empty(), "worker still working after wait()");

  // Test 2: randomized stress, CPU work mixed with small sleeps; the pool
  // grows by a keyed worker midway.
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> work_dist(1, 200);
  std::uniform_int_distribution<int> sleep_dist(0, 50);

  std::atomic<std::int64_t> checksum{0};
  std::int64_t expected = 0;
  const int M = 10000;

  for (int i = 0; i < M; i++) {
    int work = work_dist(rng);
    int slp = sleep_dist(rng);
    std::int64_t local = 0;
    for (int k = 1; k <= work; k++) local += k;
    expected += local;

    pool.add_job([work, slp, &checksum]() {
      std::int64_t sum = 0;
      for (int k = 1; k <= work; k++) sum += k;
      if (slp > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(slp));
      }
      checksum.fetch_add(sum, std::memory_order_relaxed);
    });

    if (i == M / 4) pool.new_thread("extra");
  }
  pool.wait();

  require(checksum.load(std::memory_order_relaxed) == expected, "checksum mismatch");
  require(pool.destroy_thread("extra"), "keyed worker missing");
  require(pool.get_thread("extra") == nullptr, "retired worker still registered");

  // Test 3: wait() from several callers at once while jobs keep coming.
  std::atomic<int> late{0};
  std::vector<std::thread> waiters;
  for (int w = 0; w < 3; w++) {
    waiters.emplace_back([&pool, &late]() {
      for (int i = 0; i < 500; i++) pool.add_job([&late]() { late.fetch_add(1); });
      pool.wait();
    });
  }
  for (auto& t : waiters) t.join();
  pool.wait();
  require(late.load() == 1500, "concurrent wait() lost jobs");

  std::cout << "OK: thread pool stress (producers + wait + keyed workers)\n";
  return 0;
}
